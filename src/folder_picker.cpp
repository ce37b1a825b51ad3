#include "folder_picker.h"

#include <shlobj.h>

#include <spdlog/spdlog.h>

#include "capture_files.h"
#include "win_utils.h"

#pragma comment(lib, "ole32.lib")

bool BrowseForFolder(HWND owner, std::filesystem::path& selected)
{
    HRESULT hrInit = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);

    BROWSEINFOW bi = {};
    bi.hwndOwner = owner;
    bi.lpszTitle = L"Select the folder to save captures in";
    bi.ulFlags   = BIF_NEWDIALOGSTYLE | BIF_RETURNONLYFSDIRS;

    bool ok = false;
    PIDLIST_ABSOLUTE pidl = SHBrowseForFolderW(&bi);
    if (pidl) {
        wchar_t path[MAX_PATH] = {};
        if (SHGetPathFromIDListW(pidl, path)) {
            selected = path;
            ok = true;
        } else {
            spdlog::warn("folder picker: selection is not a file-system folder");
        }
        CoTaskMemFree(pidl);
    }

    if (SUCCEEDED(hrInit)) CoUninitialize();
    return ok;
}

std::filesystem::path DefaultOutputFolder()
{
    std::wstring profile = GetEnv(L"USERPROFILE");
    std::wstring pub     = GetEnv(L"PUBLIC");
    if (pub.empty()) pub = L"C:\\Users\\Public";

    auto candidates = OutputFolderCandidates(profile, pub, L"C:\\");
    return DiscoverOutputFolder(candidates);
}

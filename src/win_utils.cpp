#include "win_utils.h"

#include <vector>

std::string WtoU8(const std::wstring& ws)
{
    if (ws.empty()) return {};
    int sz = WideCharToMultiByte(CP_UTF8, 0, ws.c_str(), -1,
                                 nullptr, 0, nullptr, nullptr);
    if (sz <= 1) return {};
    std::string result(static_cast<size_t>(sz) - 1, '\0');
    WideCharToMultiByte(CP_UTF8, 0, ws.c_str(), -1,
                        &result[0], sz, nullptr, nullptr);
    return result;
}

std::wstring U8toW(const std::string& s)
{
    if (s.empty()) return {};
    int sz = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), -1, nullptr, 0);
    if (sz <= 1) return {};
    std::wstring result(static_cast<size_t>(sz) - 1, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.c_str(), -1, &result[0], sz);
    return result;
}

std::filesystem::path ExeDir()
{
    wchar_t buf[MAX_PATH] = {};
    GetModuleFileNameW(nullptr, buf, MAX_PATH);
    return std::filesystem::path(buf).parent_path();
}

std::wstring GetEnv(const wchar_t* name)
{
    DWORD needed = GetEnvironmentVariableW(name, nullptr, 0);
    if (needed == 0) return {};
    std::wstring value(needed, L'\0');
    DWORD written = GetEnvironmentVariableW(name, &value[0], needed);
    value.resize(written);
    return value;
}

std::wstring GetDlgItemString(HWND hDlg, int id)
{
    HWND hCtrl = GetDlgItem(hDlg, id);
    if (!hCtrl) return {};
    int len = GetWindowTextLengthW(hCtrl);
    if (len <= 0) return {};
    std::vector<wchar_t> buf(static_cast<size_t>(len) + 1, L'\0');
    GetWindowTextW(hCtrl, buf.data(), len + 1);
    return std::wstring(buf.data());
}

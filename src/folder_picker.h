#pragma once

#include <windows.h>
#include <filesystem>

/// SHBrowseForFolder (new dialog style).  Returns false when cancelled.
bool BrowseForFolder(HWND owner, std::filesystem::path& selected);

/// Output folder picked from %USERPROFILE% / %PUBLIC% candidates at startup.
std::filesystem::path DefaultOutputFolder();

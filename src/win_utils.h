#pragma once

#include <windows.h>
#include <filesystem>
#include <string>

/// Narrow (UTF-8) representation of a wide string – used for spdlog messages
/// and for handing text to the portable core.
std::string WtoU8(const std::wstring& ws);

/// Wide representation of a UTF-8 string – used for Win32 text APIs.
std::wstring U8toW(const std::string& s);

/// Directory that contains the running executable.
std::filesystem::path ExeDir();

/// Value of an environment variable, or an empty string when unset.
std::wstring GetEnv(const wchar_t* name);

/// Text of a dialog control.
std::wstring GetDlgItemString(HWND hDlg, int id);

#pragma once

#include <windows.h>
#include <string>
#include <vector>

/// Call once at application startup (before any logging).
/// Creates (or truncates) "click_capture.log" next to the executable and
/// registers the spdlog default logger with three sinks: that file, the
/// debugger output (OutputDebugString) and the in-dialog log view.
/// SPDLOG_LEVEL in the environment overrides the default debug level.
void InitLogger();

/// Route formatted log lines to `hDlg`: each record queues a line and posts
/// `notifyMsg`.  Pass nullptr to detach (lines are then dropped).
void AttachLogWindow(HWND hDlg, UINT notifyMsg);

/// Take the lines queued since the last call.  UI thread only.
std::vector<std::wstring> DrainLogLines();

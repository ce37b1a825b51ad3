#include "send_input_click_sink.h"

#include <spdlog/spdlog.h>

bool SendInputClickSink::InjectClick(ScreenPoint pt)
{
    // Normalized absolute coordinates (0..65535) on the primary display.
    const int cx = GetSystemMetrics(SM_CXSCREEN);
    const int cy = GetSystemMetrics(SM_CYSCREEN);
    if (cx <= 1 || cy <= 1) return false;
    const LONG nx = static_cast<LONG>((pt.x * 65535LL) / (cx - 1));
    const LONG ny = static_cast<LONG>((pt.y * 65535LL) / (cy - 1));

    INPUT in[2] = {};
    in[0].type       = INPUT_MOUSE;
    in[0].mi.dx      = nx;
    in[0].mi.dy      = ny;
    in[0].mi.dwFlags = MOUSEEVENTF_LEFTDOWN | MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE;
    in[1].type       = INPUT_MOUSE;
    in[1].mi.dx      = nx;
    in[1].mi.dy      = ny;
    in[1].mi.dwFlags = MOUSEEVENTF_LEFTUP | MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE;

    UINT sent = SendInput(2, in, sizeof(INPUT));
    if (sent != 2) {
        spdlog::error("SendInput inserted {}/2 events ({})", sent, GetLastError());
        return false;
    }
    return true;
}

void SendInputClickSink::RequestOverlayRefresh()
{
    if (HWND h = hDlg_.load())
        PostMessageW(h, WM_APP_OVERLAY_REFRESH, 0, 0);
}

void SendInputClickSink::NotifyComplete()
{
    HWND h = hDlg_.load();
    if (!h || !PostMessageW(h, WM_APP_AUTO_CLICK_COMPLETE, 0, 0))
        spdlog::error("auto-click: could not post completion ({})", GetLastError());
}

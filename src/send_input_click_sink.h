#pragma once

#include <windows.h>
#include <atomic>

#include "auto_clicker.h"

// ============================================================================
// Custom window messages posted to the dialog from other threads
// ============================================================================
#define WM_APP_AUTO_CLICK_COMPLETE  (WM_APP + 1)   // worker: session loop exited
#define WM_APP_OVERLAY_REFRESH      (WM_APP + 2)   // worker: progress changed
#define WM_APP_LOG_UPDATED          (WM_APP + 3)   // logger: lines queued

/// Worker-side effects for the auto-clicker: SendInput for clicks, everything
/// else is a PostMessage to the dialog so the worker never touches a window.
class SendInputClickSink : public AutoClickSink {
public:
    void SetTarget(HWND hDlg) { hDlg_.store(hDlg); }

    bool InjectClick(ScreenPoint pt) override;
    void RequestOverlayRefresh() override;
    void NotifyComplete() override;

private:
    std::atomic<HWND> hDlg_{nullptr};
};

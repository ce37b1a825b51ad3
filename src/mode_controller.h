#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "app_state.h"
#include "overlay.h"

/// System-wide mouse + keyboard interception (both hooks as one unit).
class InputHook {
public:
    virtual ~InputHook() = default;
    virtual bool Install() = 0;
    virtual void Uninstall() = 0;
    virtual bool IsInstalled() const = 0;
};

enum class NoticeLevel { Info, Warning, Error };

/// The main dialog as seen by the mode logic.
class HostWindow {
public:
    virtual ~HostWindow() = default;
    virtual void Minimize() = 0;
    virtual void Restore() = 0;
    /// Re-apply control enable states for the current mode.
    virtual void RefreshControls() = 0;
    virtual void ShowNotice(NoticeLevel level, const std::string& title, const std::string& text) = 0;
    /// OK/Cancel question; true on OK.
    virtual bool Confirm(const std::string& title, const std::string& text) = 0;
    virtual void SetBusy(bool busy) = 0;
};

/// Grabs a screen rectangle, scales it and writes a JPEG.
class RegionCapturer {
public:
    virtual ~RegionCapturer() = default;
    virtual bool CaptureToJpeg(const ScreenRect& rect, int scalePercent, int jpegQuality,
                               const std::filesystem::path& target) = 0;
};

// ============================================================================
// ModeController
//
// Idle <-> AreaSelecting, Idle <-> Capturing, Idle <-> ExportingPdf.
// Every entry installs its resources in order and rolls back to Idle if any
// step fails; every exit releases them in reverse.  All calls are made on the
// UI thread (dialog procedure or low-level hook callback).
// ============================================================================
class ModeController {
public:
    ModeController(ApplicationState& state, InputHook& hook,
                   Overlay& areaOverlay, Overlay& captureOverlay,
                   HostWindow& host, RegionCapturer& capturer);

    ApplicationState&       State()       { return state_; }
    const ApplicationState& State() const { return state_; }

    // ---- UI commands -------------------------------------------------------
    bool RequestAreaSelect();
    bool RequestCapture();
    bool RequestPdfExport();
    void RequestClose();

    bool SetScale(int percent);
    bool SetJpegQuality(int quality);
    bool SetPdfMaxSize(int megabytes);
    void SetAutoClickEnabled(bool enabled);
    bool SetAutoClickInterval(uint32_t ms);
    void SetAutoClickCount(uint32_t count);
    void SetOutputFolder(const std::filesystem::path& folder);

    // ---- Input-driven transitions (called by InputHookBridge) -------------
    void BeginDrag(ScreenPoint anchor);
    void UpdateDrag(ScreenPoint current);
    void FinishAreaSelect();
    void CancelActiveMode();
    void MoveCaptureOverlay(ScreenPoint pt);
    bool StartAutoClick(ScreenPoint pt);
    /// Capture the selection into the next sequential file.
    bool CaptureOnce();

    // ---- Asynchronous notifications ---------------------------------------
    void OnAutoClickComplete();

    void ExitAreaSelect();
    void ExitCapture();

private:
    bool RejectIfBusy(const char* requested);

    ApplicationState& state_;
    InputHook&        hook_;
    Overlay&          areaOverlay_;
    Overlay&          captureOverlay_;
    HostWindow&       host_;
    RegionCapturer&   capturer_;
};

#include "mode_controller.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "pdf_export.h"

ModeController::ModeController(ApplicationState& state, InputHook& hook,
                               Overlay& areaOverlay, Overlay& captureOverlay,
                               HostWindow& host, RegionCapturer& capturer)
    : state_(state)
    , hook_(hook)
    , areaOverlay_(areaOverlay)
    , captureOverlay_(captureOverlay)
    , host_(host)
    , capturer_(capturer)
{
}

bool ModeController::RejectIfBusy(const char* requested)
{
    if (state_.IsIdle()) return false;
    std::string text = std::string("Cannot start ") + requested + ": already in " +
                       ToString(state_.Mode()) + " mode.";
    if (state_.IsAreaSelecting() || state_.IsCapturing())
        text += "\nPress Esc to leave the current mode first.";
    spdlog::warn("{}", text);
    host_.ShowNotice(NoticeLevel::Warning, "Already running", text);
    return true;
}

// ============================================================================
// Area selection
// ============================================================================

bool ModeController::RequestAreaSelect()
{
    if (RejectIfBusy("area selection")) return false;

    state_.SetMode(AppMode::AreaSelecting);
    if (!hook_.Install()) {
        spdlog::error("area select: failed to install input hooks");
        state_.SetMode(AppMode::Idle);
        host_.ShowNotice(NoticeLevel::Error, "Area selection",
                         "Could not install the mouse/keyboard hooks.");
        host_.RefreshControls();
        return false;
    }
    if (!areaOverlay_.Show()) {
        spdlog::error("area select: failed to show selection overlay");
        hook_.Uninstall();
        state_.SetMode(AppMode::Idle);
        host_.ShowNotice(NoticeLevel::Error, "Area selection",
                         "Could not create the selection overlay.");
        host_.RefreshControls();
        return false;
    }
    host_.Minimize();
    host_.RefreshControls();
    spdlog::info("area select started: drag to select, Esc to cancel");
    return true;
}

void ModeController::BeginDrag(ScreenPoint anchor)
{
    if (!state_.BeginDrag(anchor)) return;
    spdlog::debug("drag start at ({}, {})", anchor.x, anchor.y);
    areaOverlay_.Refresh();
}

void ModeController::UpdateDrag(ScreenPoint current)
{
    if (!state_.IsDragging()) return;
    state_.UpdateDrag(current);
    areaOverlay_.Refresh();
}

void ModeController::FinishAreaSelect()
{
    if (!state_.IsAreaSelecting() || !state_.IsDragging()) return;

    ScreenRect r = state_.FinishDrag();
    if (r.IsEmpty()) {
        spdlog::warn("area select: empty selection ({}, {})-({}, {}) ignored",
                     r.left, r.top, r.right, r.bottom);
    } else {
        state_.SetSelection(r);
        spdlog::info("area selected: ({}, {})-({}, {}) {}x{}",
                     r.left, r.top, r.right, r.bottom, r.Width(), r.Height());
    }
    ExitAreaSelect();
}

void ModeController::ExitAreaSelect()
{
    if (!state_.IsAreaSelecting()) return;
    hook_.Uninstall();
    areaOverlay_.Hide();
    state_.SetMode(AppMode::Idle);
    host_.Restore();
    host_.RefreshControls();
    spdlog::info("area select finished");
}

// ============================================================================
// Capture mode
// ============================================================================

bool ModeController::RequestCapture()
{
    if (RejectIfBusy("capture")) return false;

    if (!state_.Selection()) {
        spdlog::warn("capture: no area selected");
        host_.ShowNotice(NoticeLevel::Warning, "No area selected",
                         "Select an area first.\n\n"
                         "1. Click \"Select area\"\n"
                         "2. Drag over the region to capture\n"
                         "3. Click \"Start capture\"");
        return false;
    }

    AutoClicker& clicker = state_.AutoClick();
    if (clicker.IsEnabled()) {
        if (clicker.MaxCount() == 0) {
            spdlog::warn("capture: auto-click enabled with a count of 0");
            host_.ShowNotice(NoticeLevel::Warning, "Auto-click",
                             "The click count is 0 or empty. Enter a value of 1 or more.");
            return false;
        }
        bool ok = host_.Confirm("Start auto-click capture",
            "Capture will run in auto-click mode.\n\n"
            "To start: click once on the spot to repeat (for example a \"Next\" button).\n\n"
            "The same spot is then clicked and captured at the configured "
            "interval and count.\n\n"
            "Press Esc at any time to stop.");
        if (!ok) {
            spdlog::info("capture: auto-click start cancelled by user");
            return false;
        }
    }

    state_.SetMode(AppMode::Capturing);
    if (!hook_.Install()) {
        spdlog::error("capture: failed to install input hooks");
        state_.SetMode(AppMode::Idle);
        host_.ShowNotice(NoticeLevel::Error, "Capture",
                         "Could not install the mouse/keyboard hooks.");
        host_.RefreshControls();
        return false;
    }
    captureOverlay_.Reposition(state_.PointerPosition());
    if (!captureOverlay_.Show()) {
        spdlog::error("capture: failed to show capture overlay");
        hook_.Uninstall();
        state_.SetMode(AppMode::Idle);
        host_.ShowNotice(NoticeLevel::Error, "Capture",
                         "Could not create the capture overlay.");
        host_.RefreshControls();
        return false;
    }
    host_.Minimize();
    host_.RefreshControls();
    spdlog::info("capture mode started (Esc to stop)");
    return true;
}

void ModeController::MoveCaptureOverlay(ScreenPoint pt)
{
    if (state_.IsCapturing()) captureOverlay_.Reposition(pt);
}

bool ModeController::StartAutoClick(ScreenPoint pt)
{
    if (!state_.IsCapturing()) return false;
    if (!state_.AutoClick().Start(pt)) return false;
    captureOverlay_.Refresh();
    return true;
}

bool ModeController::CaptureOnce()
{
    if (!state_.Selection()) {
        spdlog::error("capture: no area selected");
        return false;
    }
    const ScreenRect rect = *state_.Selection();
    const auto& folder = state_.OutputFolder();
    if (folder.empty()) {
        spdlog::error("capture: no output folder");
        return false;
    }
    if (!EnsureFolderExists(folder)) return false;

    const auto target = state_.Files().NextPath(folder);
    const auto& s = state_.Settings();

    state_.SetProcessing(true);
    captureOverlay_.Refresh();
    const bool wasVisible = captureOverlay_.IsVisible();
    if (wasVisible) captureOverlay_.Hide();

    bool ok = capturer_.CaptureToJpeg(rect, s.scalePercent, s.jpegQuality, target);

    if (wasVisible && state_.IsCapturing() && !captureOverlay_.Show())
        spdlog::warn("capture: could not re-show the capture overlay");
    state_.SetProcessing(false);
    captureOverlay_.Refresh();

    if (!ok) {
        spdlog::error("capture: failed to save {}", target.filename().u8string());
        return false;
    }
    const std::string name = target.filename().u8string();
    if (!state_.Files().CommitIfSaved(target)) return false;

    spdlog::info("saved {} ({}x{}) (scale {}%, quality {}%)", name,
                 std::max(1, rect.Width() * s.scalePercent / 100),
                 std::max(1, rect.Height() * s.scalePercent / 100),
                 s.scalePercent, s.jpegQuality);
    return true;
}

void ModeController::ExitCapture()
{
    if (!state_.IsCapturing()) return;
    // Reached from the hook callback on Esc: never join here.  The worker
    // posts its completion and OnAutoClickComplete reaps it.
    state_.AutoClick().RequestStop();
    hook_.Uninstall();
    captureOverlay_.Hide();
    state_.SetMode(AppMode::Idle);
    host_.Restore();
    host_.RefreshControls();
    spdlog::info("capture mode finished");
}

void ModeController::CancelActiveMode()
{
    if (state_.IsAreaSelecting()) {
        spdlog::info("area select cancelled");
        ExitAreaSelect();
    } else if (state_.IsCapturing()) {
        spdlog::info("capture cancelled");
        ExitCapture();
    }
}

void ModeController::OnAutoClickComplete()
{
    AutoClicker& clicker = state_.AutoClick();
    spdlog::info("auto-click complete: {}/{}", clicker.Progress(), clicker.MaxCount());
    // No-op when Esc or the Stop button already left the mode.
    ExitCapture();
    // The worker has posted its last message, so this join is immediate.
    clicker.Stop();
}

// ============================================================================
// PDF export
// ============================================================================

bool ModeController::RequestPdfExport()
{
    if (state_.IsExportingPdf()) {
        spdlog::warn("pdf export already running");
        host_.ShowNotice(NoticeLevel::Warning, "PDF export", "An export is already running.");
        return false;
    }
    if (RejectIfBusy("PDF export")) return false;

    const auto folder = state_.OutputFolder();
    if (folder.empty()) {
        host_.ShowNotice(NoticeLevel::Warning, "PDF export", "No output folder is set.");
        return false;
    }
    const int limitMb = state_.Settings().pdfMaxSizeMb;
    if (!host_.Confirm("PDF export",
            "Convert the JPEG files in\n" + folder.u8string() + "\ninto PDF?\n\n"
            "Files larger than " + std::to_string(limitMb) + "MB are split.")) {
        spdlog::info("pdf export cancelled by user");
        return false;
    }

    state_.SetMode(AppMode::ExportingPdf);
    host_.SetBusy(true);
    host_.RefreshControls();

    PdfExportResult result =
        ExportJpegFolderToPdf(folder, static_cast<uint64_t>(limitMb) * 1024 * 1024);

    state_.SetMode(AppMode::Idle);
    host_.SetBusy(false);
    host_.RefreshControls();

    if (!result.ok) {
        host_.ShowNotice(NoticeLevel::Error, "PDF export", "Export failed: " + result.error);
        return false;
    }
    if (result.imageCount == 0) {
        host_.ShowNotice(NoticeLevel::Warning, "PDF export", "No JPEG files were found.");
        return true;
    }
    host_.ShowNotice(NoticeLevel::Info, "PDF export",
                     std::to_string(result.imageCount) + " image(s) exported to " +
                     std::to_string(result.written.size()) + " PDF file(s).");
    return true;
}

// ============================================================================
// Shutdown and settings
// ============================================================================

void ModeController::RequestClose()
{
    CancelActiveMode();
    state_.AutoClick().Stop();
    hook_.Uninstall();
    spdlog::info("close requested");
}

bool ModeController::SetScale(int percent)
{
    if (!IsValidScale(percent)) {
        spdlog::warn("invalid scale {}%, keeping {}%", percent, state_.Settings().scalePercent);
        return false;
    }
    state_.Settings().scalePercent = percent;
    spdlog::info("scale set to {}%", percent);
    return true;
}

bool ModeController::SetJpegQuality(int quality)
{
    if (!IsValidQuality(quality)) {
        spdlog::warn("invalid JPEG quality {}, keeping {}", quality, state_.Settings().jpegQuality);
        return false;
    }
    state_.Settings().jpegQuality = quality;
    spdlog::info("JPEG quality set to {}", quality);
    return true;
}

bool ModeController::SetPdfMaxSize(int megabytes)
{
    if (!IsValidPdfMaxSize(megabytes)) {
        spdlog::warn("invalid PDF size {}MB, keeping {}MB", megabytes, state_.Settings().pdfMaxSizeMb);
        return false;
    }
    state_.Settings().pdfMaxSizeMb = megabytes;
    spdlog::info("PDF max size set to {}MB", megabytes);
    return true;
}

void ModeController::SetAutoClickEnabled(bool enabled)
{
    state_.Settings().autoClickEnabled = enabled;
    state_.AutoClick().SetEnabled(enabled);
    spdlog::info("auto-click {}", enabled ? "enabled" : "disabled");
}

bool ModeController::SetAutoClickInterval(uint32_t ms)
{
    if (!IsValidAutoClickInterval(ms)) {
        spdlog::warn("invalid auto-click interval {} ms", ms);
        return false;
    }
    state_.Settings().autoClickIntervalMs = ms;
    state_.AutoClick().SetInterval(std::chrono::milliseconds(ms));
    spdlog::info("auto-click interval set to {} ms", ms);
    return true;
}

void ModeController::SetAutoClickCount(uint32_t count)
{
    state_.Settings().autoClickCount = count;
    state_.AutoClick().SetMaxCount(count);
    if (count > AutoClicker::MAX_CLICK_COUNT)
        spdlog::warn("auto-click count {} exceeds the ceiling, at most {} clicks will run",
                     count, AutoClicker::MAX_CLICK_COUNT);
    else
        spdlog::info("auto-click count set to {}", count);
}

void ModeController::SetOutputFolder(const std::filesystem::path& folder)
{
    state_.SetOutputFolder(folder);
    spdlog::info("output folder: {}", folder.u8string());
}

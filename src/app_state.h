#pragma once

#include <filesystem>
#include <optional>

#include "auto_clicker.h"
#include "capture_files.h"
#include "capture_settings.h"
#include "geometry.h"

enum class AppMode { Idle, AreaSelecting, Capturing, ExportingPdf };

const char* ToString(AppMode mode);

// ============================================================================
// ApplicationState
//
// Owned by the dialog for its lifetime and handed by reference to everything
// that needs it.  Threading rule: every member is read and written only on the
// UI thread (dialog procedure and low-level hook callbacks run there).  The one
// exception is the AutoClicker, whose worker touches only its own atomics.
// ============================================================================
class ApplicationState {
public:
    explicit ApplicationState(AutoClickSink& clickSink);

    AppMode Mode() const { return mode_; }
    void    SetMode(AppMode mode);

    bool IsIdle()          const { return mode_ == AppMode::Idle; }
    bool IsAreaSelecting() const { return mode_ == AppMode::AreaSelecting; }
    bool IsCapturing()     const { return mode_ == AppMode::Capturing; }
    bool IsExportingPdf()  const { return mode_ == AppMode::ExportingPdf; }
    bool IsDragging()      const { return dragging_; }

    // Drag tracking (AreaSelecting only).
    bool        BeginDrag(ScreenPoint anchor);
    void        UpdateDrag(ScreenPoint current);
    ScreenRect  FinishDrag();
    ScreenPoint DragAnchor() const { return dragAnchor_; }
    ScreenPoint DragCurrent() const { return dragCurrent_; }
    /// Rectangle currently being dragged; empty rect when not dragging.
    ScreenRect  DragRect() const;

    ScreenPoint PointerPosition() const { return pointer_; }
    void        SetPointerPosition(ScreenPoint pt) { pointer_ = pt; }

    const std::optional<ScreenRect>& Selection() const { return selection_; }
    void SetSelection(const ScreenRect& rect) { selection_ = rect; }

    const std::filesystem::path& OutputFolder() const { return outputFolder_; }
    void SetOutputFolder(const std::filesystem::path& folder) { outputFolder_ = folder; }

    CaptureFileSequence&       Files()       { return files_; }
    const CaptureFileSequence& Files() const { return files_; }

    CaptureSettings&       Settings()       { return settings_; }
    const CaptureSettings& Settings() const { return settings_; }

    bool IsProcessing() const { return processing_; }
    void SetProcessing(bool processing) { processing_ = processing; }

    AutoClicker&       AutoClick()       { return autoClicker_; }
    const AutoClicker& AutoClick() const { return autoClicker_; }

private:
    AppMode                   mode_     = AppMode::Idle;
    bool                      dragging_ = false;
    ScreenPoint               dragAnchor_;
    ScreenPoint               dragCurrent_;
    ScreenPoint               pointer_;
    std::optional<ScreenRect> selection_;
    std::filesystem::path     outputFolder_;
    CaptureFileSequence       files_;
    CaptureSettings           settings_;
    bool                      processing_ = false;
    AutoClicker               autoClicker_;
};

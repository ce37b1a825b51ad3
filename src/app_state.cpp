#include "app_state.h"

#include <spdlog/spdlog.h>

const char* ToString(AppMode mode)
{
    switch (mode) {
    case AppMode::Idle:          return "idle";
    case AppMode::AreaSelecting: return "area-selecting";
    case AppMode::Capturing:     return "capturing";
    case AppMode::ExportingPdf:  return "exporting-pdf";
    }
    return "unknown";
}

ApplicationState::ApplicationState(AutoClickSink& clickSink)
    : autoClicker_(clickSink)
{
    autoClicker_.SetEnabled(settings_.autoClickEnabled);
    autoClicker_.SetInterval(std::chrono::milliseconds(settings_.autoClickIntervalMs));
    autoClicker_.SetMaxCount(settings_.autoClickCount);
}

void ApplicationState::SetMode(AppMode mode)
{
    if (mode == mode_) return;
    spdlog::debug("mode: {} -> {}", ToString(mode_), ToString(mode));
    mode_ = mode;
    // Dragging only exists inside area selection.
    if (mode_ != AppMode::AreaSelecting) dragging_ = false;
}

bool ApplicationState::BeginDrag(ScreenPoint anchor)
{
    if (mode_ != AppMode::AreaSelecting) return false;
    dragging_    = true;
    dragAnchor_  = anchor;
    dragCurrent_ = anchor;
    return true;
}

void ApplicationState::UpdateDrag(ScreenPoint current)
{
    if (dragging_) dragCurrent_ = current;
}

ScreenRect ApplicationState::FinishDrag()
{
    ScreenRect r = NormalizeRect(dragAnchor_, dragCurrent_);
    dragging_ = false;
    return r;
}

ScreenRect ApplicationState::DragRect() const
{
    if (!dragging_) return ScreenRect{};
    return NormalizeRect(dragAnchor_, dragCurrent_);
}

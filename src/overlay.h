#pragma once

#include "geometry.h"

/// Always-on-top feedback window driven by ModeController.  The controller
/// never draws; it only tells the overlay when visible state has changed.
class Overlay {
public:
    virtual ~Overlay() = default;

    /// Create on first use, then display.  Returns false if the window
    /// could not be created.
    virtual bool Show() = 0;
    /// Hide without destroying; the window is reused by the next session.
    virtual void Hide() = 0;
    /// Repaint from current application state.
    virtual void Refresh() = 0;
    virtual void Reposition(ScreenPoint pt) = 0;
    virtual bool IsVisible() const = 0;
};

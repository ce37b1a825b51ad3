#pragma once

#include <cstdint>

#include "geometry.h"

class ModeController;

enum class InputEventKind {
    PointerMove,
    PrimaryDown,
    PrimaryUp,
    KeyDown,
    KeyUp,
};

struct InputEvent {
    InputEventKind kind       = InputEventKind::PointerMove;
    ScreenPoint    pt;
    uint32_t       virtualKey = 0;   // key events only
};

enum class HookDecision { Forward, Swallow };

// Virtual-key code of the cancel key (VK_ESCAPE).
static const uint32_t CANCEL_KEY_CODE = 0x1B;

/// Translates low-level input into mode transitions.  Runs inside the hook
/// callback: it never blocks and never waits on the auto-click worker.
class InputHookBridge {
public:
    explicit InputHookBridge(ModeController& controller);

    /// Never throws.  A failure while handling an event is logged and the
    /// event is forwarded unmodified.
    HookDecision Dispatch(const InputEvent& evt) noexcept;

private:
    HookDecision Handle(const InputEvent& evt);
    HookDecision OnPrimaryDown();
    HookDecision OnPrimaryUp();
    HookDecision OnKeyDown(uint32_t vk);

    ModeController& controller_;
};

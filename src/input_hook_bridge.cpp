#include "input_hook_bridge.h"

#include <exception>

#include <spdlog/spdlog.h>

#include "mode_controller.h"

InputHookBridge::InputHookBridge(ModeController& controller)
    : controller_(controller)
{
}

HookDecision InputHookBridge::Dispatch(const InputEvent& evt) noexcept
{
    try {
        return Handle(evt);
    } catch (const std::exception& ex) {
        spdlog::error("input hook: exception while handling event {}: {}",
                      static_cast<int>(evt.kind), ex.what());
        return HookDecision::Forward;
    }
}

HookDecision InputHookBridge::Handle(const InputEvent& evt)
{
    ApplicationState& state = controller_.State();

    switch (evt.kind) {
    case InputEventKind::PointerMove:
        state.SetPointerPosition(evt.pt);
        if (state.IsCapturing())
            controller_.MoveCaptureOverlay(evt.pt);
        else if (state.IsDragging())
            controller_.UpdateDrag(evt.pt);
        return HookDecision::Forward;

    case InputEventKind::PrimaryDown:
        state.SetPointerPosition(evt.pt);
        return OnPrimaryDown();

    case InputEventKind::PrimaryUp:
        state.SetPointerPosition(evt.pt);
        return OnPrimaryUp();

    case InputEventKind::KeyDown:
        return OnKeyDown(evt.virtualKey);

    case InputEventKind::KeyUp:
        return HookDecision::Forward;
    }
    return HookDecision::Forward;
}

HookDecision InputHookBridge::OnPrimaryDown()
{
    const ApplicationState& state = controller_.State();
    if (!state.IsAreaSelecting()) return HookDecision::Forward;

    if (!state.IsDragging())
        controller_.BeginDrag(state.PointerPosition());
    // Nothing underneath may see a selection click.
    return HookDecision::Swallow;
}

HookDecision InputHookBridge::OnPrimaryUp()
{
    const ApplicationState& state = controller_.State();

    if (state.IsAreaSelecting()) {
        if (!state.IsDragging()) return HookDecision::Swallow;
        controller_.UpdateDrag(state.PointerPosition());
        controller_.FinishAreaSelect();
        return HookDecision::Forward;
    }

    if (state.IsCapturing()) {
        const AutoClicker& clicker = state.AutoClick();
        if (clicker.IsEnabled() && !clicker.IsRunning()) {
            if (controller_.StartAutoClick(state.PointerPosition()))
                return HookDecision::Swallow;
            spdlog::warn("input hook: auto-click did not start, capturing once instead");
        }
        // The click also reaches the application underneath.
        if (!controller_.CaptureOnce())
            spdlog::warn("input hook: capture failed, counter unchanged");
        return HookDecision::Forward;
    }

    return HookDecision::Forward;
}

HookDecision InputHookBridge::OnKeyDown(uint32_t vk)
{
    if (vk != CANCEL_KEY_CODE) return HookDecision::Forward;

    const ApplicationState& state = controller_.State();
    if (!state.IsAreaSelecting() && !state.IsCapturing()) return HookDecision::Forward;

    controller_.CancelActiveMode();
    return HookDecision::Swallow;
}

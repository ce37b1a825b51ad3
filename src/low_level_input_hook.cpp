#include "low_level_input_hook.h"

#include <spdlog/spdlog.h>

InputHookBridge* LowLevelInputHook::s_bridge = nullptr;

LowLevelInputHook::LowLevelInputHook(InputHookBridge& bridge)
    : bridge_(bridge)
{
}

LowLevelInputHook::~LowLevelInputHook()
{
    Uninstall();
}

bool LowLevelInputHook::Install()
{
    if (IsInstalled()) return true;
    if (s_bridge && s_bridge != &bridge_) {
        spdlog::error("input hook: another hook instance is already installed");
        return false;
    }

    s_bridge = &bridge_;
    HINSTANCE hInst = GetModuleHandleW(nullptr);

    mouseHook_ = SetWindowsHookExW(WH_MOUSE_LL, &LowLevelInputHook::MouseProc, hInst, 0);
    if (!mouseHook_) {
        spdlog::error("input hook: WH_MOUSE_LL failed ({})", GetLastError());
        s_bridge = nullptr;
        return false;
    }
    keyboardHook_ = SetWindowsHookExW(WH_KEYBOARD_LL, &LowLevelInputHook::KeyboardProc, hInst, 0);
    if (!keyboardHook_) {
        spdlog::error("input hook: WH_KEYBOARD_LL failed ({})", GetLastError());
        UnhookWindowsHookEx(mouseHook_);
        mouseHook_ = nullptr;
        s_bridge = nullptr;
        return false;
    }
    spdlog::debug("input hooks installed");
    return true;
}

void LowLevelInputHook::Uninstall()
{
    if (keyboardHook_) {
        UnhookWindowsHookEx(keyboardHook_);
        keyboardHook_ = nullptr;
    }
    if (mouseHook_) {
        UnhookWindowsHookEx(mouseHook_);
        mouseHook_ = nullptr;
        spdlog::debug("input hooks removed");
    }
    if (s_bridge == &bridge_) s_bridge = nullptr;
}

LRESULT CALLBACK LowLevelInputHook::MouseProc(int code, WPARAM wParam, LPARAM lParam)
{
    if (code == HC_ACTION && s_bridge) {
        const auto* ms = reinterpret_cast<const MSLLHOOKSTRUCT*>(lParam);
        InputEvent evt;
        evt.pt = ScreenPoint{ ms->pt.x, ms->pt.y };

        bool relevant = true;
        switch (wParam) {
        case WM_MOUSEMOVE:   evt.kind = InputEventKind::PointerMove; break;
        case WM_LBUTTONDOWN: evt.kind = InputEventKind::PrimaryDown; break;
        case WM_LBUTTONUP:   evt.kind = InputEventKind::PrimaryUp;   break;
        default:             relevant = false; break;
        }

        if (relevant && s_bridge->Dispatch(evt) == HookDecision::Swallow)
            return 1;
    }
    return CallNextHookEx(nullptr, code, wParam, lParam);
}

LRESULT CALLBACK LowLevelInputHook::KeyboardProc(int code, WPARAM wParam, LPARAM lParam)
{
    if (code == HC_ACTION && s_bridge) {
        const auto* kb = reinterpret_cast<const KBDLLHOOKSTRUCT*>(lParam);
        InputEvent evt;
        evt.virtualKey = kb->vkCode;
        evt.kind = (wParam == WM_KEYDOWN || wParam == WM_SYSKEYDOWN)
                 ? InputEventKind::KeyDown : InputEventKind::KeyUp;

        if (s_bridge->Dispatch(evt) == HookDecision::Swallow)
            return 1;
    }
    return CallNextHookEx(nullptr, code, wParam, lParam);
}

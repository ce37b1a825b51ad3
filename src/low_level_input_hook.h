#pragma once

#include <windows.h>

#include "input_hook_bridge.h"
#include "mode_controller.h"

/// WH_MOUSE_LL + WH_KEYBOARD_LL on the UI thread.  The bridge passed in is
/// the single dispatch target while the hooks are installed; only one
/// instance may be installed at a time.
class LowLevelInputHook : public InputHook {
public:
    explicit LowLevelInputHook(InputHookBridge& bridge);
    ~LowLevelInputHook() override;

    LowLevelInputHook(const LowLevelInputHook&) = delete;
    LowLevelInputHook& operator=(const LowLevelInputHook&) = delete;

    bool Install() override;
    void Uninstall() override;
    bool IsInstalled() const override { return mouseHook_ != nullptr; }

private:
    static LRESULT CALLBACK MouseProc(int code, WPARAM wParam, LPARAM lParam);
    static LRESULT CALLBACK KeyboardProc(int code, WPARAM wParam, LPARAM lParam);

    static InputHookBridge* s_bridge;

    InputHookBridge& bridge_;
    HHOOK            mouseHook_    = nullptr;
    HHOOK            keyboardHook_ = nullptr;
};

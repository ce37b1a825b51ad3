/**
 * main.cpp  –  ClickCapture: click-to-capture screen region tool
 *
 * Features:
 *  - Dark theme (DWM immersive dark mode + custom WM_CTLCOLOR handling)
 *  - Drag-select a screen region on a dimmed full-screen overlay
 *  - Capture mode: every left click saves the region as 0001.jpg, 0002.jpg, ...
 *  - Optional auto-click: a worker thread re-clicks the first clicked spot at a
 *    fixed interval for a fixed count, each click producing a capture
 *  - Low-level mouse/keyboard hooks (Esc cancels any mode)
 *  - Export every JPEG in the save folder into size-limited PDF files
 *  - spdlog output mirrored into the in-dialog log view
 */

#include <windows.h>
#include <commctrl.h>
#include <dwmapi.h>
#include <uxtheme.h>
#include <algorithm>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "resource.h"
#include "app_state.h"
#include "capture_settings.h"
#include "folder_picker.h"
#include "gdiplus_session.h"
#include "input_hook_bridge.h"
#include "logger.h"
#include "low_level_input_hook.h"
#include "mode_controller.h"
#include "overlay_window.h"
#include "screen_capture.h"
#include "send_input_click_sink.h"
#include "win_utils.h"

#pragma comment(lib, "comctl32.lib")
#pragma comment(lib, "shell32.lib")
#pragma comment(lib, "dwmapi.lib")
#pragma comment(lib, "uxtheme.lib")

// ============================================================================
// Forward declarations
// ============================================================================
INT_PTR CALLBACK DlgProc(HWND, UINT, WPARAM, LPARAM);
static void UpdateControlStates(HWND hDlg);

// ============================================================================
// Theme colours
// ============================================================================
static const COLORREF CLR_BG        = RGB(0x1e, 0x1e, 0x2e);
static const COLORREF CLR_TEXT      = RGB(0xe0, 0xe0, 0xe0);
static const COLORREF CLR_SUBTEXT   = RGB(0x88, 0x88, 0xaa);
static const COLORREF CLR_EDIT_BG   = RGB(0x22, 0x22, 0x35);
static const COLORREF CLR_BTN_BG    = RGB(0x31, 0x32, 0x4a);
static const COLORREF CLR_BTN_PRESS = RGB(0x45, 0x47, 0x6b);
static const COLORREF CLR_BTN_BORDER= RGB(0x58, 0x5b, 0x70);
static const COLORREF CLR_BTN_FOCUS = RGB(0x89, 0xb4, 0xfa);

// The log view keeps only the most recent lines.
static const int LOG_MAX_LINES = 200;

// ============================================================================
// DialogHost – the dialog as seen by ModeController
// ============================================================================
class DialogHost : public HostWindow {
public:
    void SetWindow(HWND hDlg) { hDlg_ = hDlg; }

    void Minimize() override
    {
        if (hDlg_) ShowWindow(hDlg_, SW_MINIMIZE);
    }

    void Restore() override
    {
        if (!hDlg_) return;
        ShowWindow(hDlg_, SW_RESTORE);
        SetForegroundWindow(hDlg_);
    }

    void RefreshControls() override
    {
        if (hDlg_) UpdateControlStates(hDlg_);
    }

    void ShowNotice(NoticeLevel level, const std::string& title, const std::string& text) override
    {
        UINT icon = MB_ICONINFORMATION;
        if (level == NoticeLevel::Warning) icon = MB_ICONWARNING;
        else if (level == NoticeLevel::Error) icon = MB_ICONERROR;
        MessageBoxW(hDlg_, U8toW(text).c_str(), U8toW(title).c_str(), MB_OK | icon);
    }

    bool Confirm(const std::string& title, const std::string& text) override
    {
        return MessageBoxW(hDlg_, U8toW(text).c_str(), U8toW(title).c_str(),
                           MB_OKCANCEL | MB_ICONINFORMATION) == IDOK;
    }

    void SetBusy(bool busy) override
    {
        busy_ = busy;
        SetCursor(LoadCursorW(nullptr, busy ? IDC_WAIT : IDC_ARROW));
    }

    bool IsBusy() const { return busy_; }

private:
    HWND hDlg_ = nullptr;
    bool busy_ = false;
};

// ============================================================================
// Application objects, created in WM_INITDIALOG and destroyed in WM_DESTROY.
// Members are declared in dependency order; the controller, bridge and hook
// refer to each other and only store the references while constructing.
// ============================================================================
struct AppContext {
    explicit AppContext(HINSTANCE hInst)
        : state(clickSink)
        , areaOverlay(hInst, state)
        , captureOverlay(hInst, state)
        , controller(state, hook, areaOverlay, captureOverlay, host, capturer)
        , bridge(controller)
        , hook(bridge)
    {
    }

    SendInputClickSink   clickSink;
    DialogHost           host;
    GdiRegionCapturer    capturer;
    ApplicationState     state;
    AreaSelectOverlay    areaOverlay;
    CaptureStatusOverlay captureOverlay;
    ModeController       controller;
    InputHookBridge      bridge;
    LowLevelInputHook    hook;
};

// ============================================================================
// Global state
// ============================================================================
static HINSTANCE                   g_hInst = nullptr;
static HWND                        g_hDlg  = nullptr;
static std::unique_ptr<AppContext> g_app;

// GDI objects for the dark theme
static HBRUSH g_hbrBg     = nullptr;
static HBRUSH g_hbrEditBg = nullptr;

// Suppresses the EN_KILLFOCUS handlers while the dialog rewrites an edit.
static bool g_updatingEdits = false;

// ============================================================================
// WinMain
// ============================================================================
int WINAPI wWinMain(HINSTANCE hInstance, HINSTANCE, LPWSTR, int)
{
    InitLogger();

    g_hInst = hInstance;

    GdiplusSession gdiplus;
    if (!gdiplus.Ok()) {
        MessageBoxW(nullptr, L"GDI+ could not be initialised.", L"ClickCapture", MB_OK | MB_ICONERROR);
        return 1;
    }

    INITCOMMONCONTROLSEX icc = {};
    icc.dwSize = sizeof(icc);
    icc.dwICC  = ICC_STANDARD_CLASSES;
    InitCommonControlsEx(&icc);

    if (DialogBoxW(hInstance, MAKEINTRESOURCEW(IDD_MAIN_DIALOG), nullptr, DlgProc) == -1) {
        spdlog::critical("DialogBoxW failed ({})", GetLastError());
        return 1;
    }
    spdlog::info("click_capture exiting");
    spdlog::shutdown();
    return 0;
}

// ============================================================================
// Control helpers
// ============================================================================

static void EnableControl(HWND hDlg, int id, bool enable)
{
    if (HWND h = GetDlgItem(hDlg, id)) EnableWindow(h, enable ? TRUE : FALSE);
}

// Enable table: Idle enables everything; AreaSelecting leaves area select
// and Close; Capturing leaves the capture toggle and Close; ExportingPdf
// disables everything.
static void UpdateControlStates(HWND hDlg)
{
    if (!g_app) return;
    const ApplicationState& st = g_app->state;

    const bool idle      = st.IsIdle();
    const bool autoClick = st.Settings().autoClickEnabled;

    EnableControl(hDlg, IDC_AREA_SELECT_BUTTON,   idle || st.IsAreaSelecting());
    EnableControl(hDlg, IDC_CAPTURE_START_BUTTON, idle || st.IsCapturing());
    EnableControl(hDlg, IDC_CLOSE_BUTTON,         !st.IsExportingPdf());

    for (int id : { IDC_EXPORT_PDF_BUTTON, IDC_BROWSE_BUTTON, IDC_PATH_EDIT,
                    IDC_SCALE_COMBO, IDC_QUALITY_COMBO, IDC_PDF_SIZE_COMBO,
                    IDC_AUTO_CLICK_CHECKBOX })
        EnableControl(hDlg, id, idle);

    EnableControl(hDlg, IDC_AUTO_CLICK_INTERVAL_COMBO, idle && autoClick);
    EnableControl(hDlg, IDC_AUTO_CLICK_COUNT_EDIT,     idle && autoClick);

    SetDlgItemTextW(hDlg, IDC_CAPTURE_START_BUTTON,
                    st.IsCapturing() ? L"Stop capture" : L"Start capture");
}

static void SetEditText(HWND hDlg, int id, const std::wstring& text)
{
    g_updatingEdits = true;
    SetDlgItemTextW(hDlg, id, text.c_str());
    g_updatingEdits = false;
}

static void FillCombos(HWND hDlg)
{
    HWND hScale = GetDlgItem(hDlg, IDC_SCALE_COMBO);
    for (int p : ScaleOptions()) {
        std::wstring label = std::to_wstring(p) + L"%";
        SendMessageW(hScale, CB_ADDSTRING, 0, reinterpret_cast<LPARAM>(label.c_str()));
    }
    SendMessageW(hScale, CB_SETCURSEL, DefaultScaleIndex(), 0);

    HWND hQuality = GetDlgItem(hDlg, IDC_QUALITY_COMBO);
    for (int q : QualityOptions()) {
        std::wstring label = std::to_wstring(q);
        SendMessageW(hQuality, CB_ADDSTRING, 0, reinterpret_cast<LPARAM>(label.c_str()));
    }
    SendMessageW(hQuality, CB_SETCURSEL, DefaultQualityIndex(), 0);

    HWND hPdf = GetDlgItem(hDlg, IDC_PDF_SIZE_COMBO);
    for (const auto& o : PdfSizeOptions()) {
        std::wstring label = U8toW(o.label);
        SendMessageW(hPdf, CB_ADDSTRING, 0, reinterpret_cast<LPARAM>(label.c_str()));
    }
    SendMessageW(hPdf, CB_SETCURSEL, DefaultPdfSizeIndex(), 0);

    HWND hInterval = GetDlgItem(hDlg, IDC_AUTO_CLICK_INTERVAL_COMBO);
    for (uint32_t ms : AutoClickIntervalOptions()) {
        std::wstring label = std::to_wstring(ms / 1000) + L" sec";
        SendMessageW(hInterval, CB_ADDSTRING, 0, reinterpret_cast<LPARAM>(label.c_str()));
    }
    SendMessageW(hInterval, CB_SETCURSEL, DefaultIntervalIndex(), 0);

    for (HWND h : { hScale, hQuality, hPdf, hInterval })
        SetWindowTheme(h, L"DarkMode_CFD", nullptr);
}

// Selected index of a combo, or -1 when nothing valid is selected.
static int ComboSelection(HWND hDlg, int id, size_t optionCount)
{
    LRESULT sel = SendDlgItemMessageW(hDlg, id, CB_GETCURSEL, 0, 0);
    if (sel == CB_ERR || sel < 0 || static_cast<size_t>(sel) >= optionCount) return -1;
    return static_cast<int>(sel);
}

static void OnComboChanged(HWND hDlg, int id)
{
    ModeController& ctl = g_app->controller;
    int sel = -1;
    switch (id) {
    case IDC_SCALE_COMBO:
        sel = ComboSelection(hDlg, id, ScaleOptions().size());
        if (sel >= 0) ctl.SetScale(ScaleOptions()[sel]);
        break;
    case IDC_QUALITY_COMBO:
        sel = ComboSelection(hDlg, id, QualityOptions().size());
        if (sel >= 0) ctl.SetJpegQuality(QualityOptions()[sel]);
        break;
    case IDC_PDF_SIZE_COMBO:
        sel = ComboSelection(hDlg, id, PdfSizeOptions().size());
        if (sel >= 0) ctl.SetPdfMaxSize(PdfSizeOptions()[sel].megabytes);
        break;
    case IDC_AUTO_CLICK_INTERVAL_COMBO:
        sel = ComboSelection(hDlg, id, AutoClickIntervalOptions().size());
        if (sel >= 0) ctl.SetAutoClickInterval(AutoClickIntervalOptions()[sel]);
        break;
    }
}

// Count edit lost focus: commit a valid number, otherwise put the last
// accepted value back.
static void CommitAutoClickCount(HWND hDlg)
{
    const std::string text = WtoU8(GetDlgItemString(hDlg, IDC_AUTO_CLICK_COUNT_EDIT));
    auto count = ParseAutoClickCount(text);
    if (!count) {
        spdlog::warn("invalid auto-click count '{}', keeping {}",
                     text, g_app->state.Settings().autoClickCount);
        SetEditText(hDlg, IDC_AUTO_CLICK_COUNT_EDIT,
                    std::to_wstring(g_app->state.Settings().autoClickCount));
        return;
    }
    if (*count != g_app->state.Settings().autoClickCount)
        g_app->controller.SetAutoClickCount(*count);
}

// Path edit lost focus: an empty edit keeps the current folder.
static void CommitOutputFolder(HWND hDlg)
{
    std::wstring text = GetDlgItemString(hDlg, IDC_PATH_EDIT);
    const auto& current = g_app->state.OutputFolder();
    if (text.empty()) {
        SetEditText(hDlg, IDC_PATH_EDIT, current.wstring());
        return;
    }
    std::filesystem::path folder(text);
    if (folder != current) g_app->controller.SetOutputFolder(folder);
}

static void OnBrowse(HWND hDlg)
{
    std::filesystem::path selected;
    if (!BrowseForFolder(hDlg, selected)) return;
    g_app->controller.SetOutputFolder(selected);
    SetEditText(hDlg, IDC_PATH_EDIT, selected.wstring());
}

// Append queued log lines to the log edit, trimming the oldest so that at
// most LOG_MAX_LINES remain.
static void AppendLogLines(HWND hDlg)
{
    auto lines = DrainLogLines();
    if (lines.empty()) return;

    HWND hLog = GetDlgItem(hDlg, IDC_LOG_EDIT);
    if (!hLog) return;

    std::wstring text;
    for (const auto& l : lines) {
        text += l;
        text += L"\r\n";
    }
    int len = GetWindowTextLengthW(hLog);
    SendMessageW(hLog, EM_SETSEL, len, len);
    SendMessageW(hLog, EM_REPLACESEL, FALSE, reinterpret_cast<LPARAM>(text.c_str()));

    // The trailing "\r\n" leaves an empty last line.
    int lineCount = static_cast<int>(SendMessageW(hLog, EM_GETLINECOUNT, 0, 0)) - 1;
    if (lineCount > LOG_MAX_LINES) {
        LRESULT cut = SendMessageW(hLog, EM_LINEINDEX, lineCount - LOG_MAX_LINES, 0);
        if (cut > 0) {
            SendMessageW(hLog, EM_SETSEL, 0, cut);
            SendMessageW(hLog, EM_REPLACESEL, FALSE, reinterpret_cast<LPARAM>(L""));
        }
    }
    len = GetWindowTextLengthW(hLog);
    SendMessageW(hLog, EM_SETSEL, len, len);
    SendMessageW(hLog, EM_SCROLLCARET, 0, 0);
}

// Flat owner-drawn push button matching the dark palette.
static void DrawFlatButton(const DRAWITEMSTRUCT* di)
{
    HDC  hDC = di->hDC;
    RECT rc  = di->rcItem;
    const bool pressed  = (di->itemState & ODS_SELECTED) != 0;
    const bool focused  = (di->itemState & ODS_FOCUS)    != 0;
    const bool disabled = (di->itemState & ODS_DISABLED) != 0;

    int bw = rc.right - rc.left, bh = rc.bottom - rc.top;
    HDC     hBuf    = CreateCompatibleDC(hDC);
    HBITMAP hBufBmp = CreateCompatibleBitmap(hDC, bw, bh);
    HGDIOBJ hBufOld = SelectObject(hBuf, hBufBmp);

    RECT rcBuf = { 0, 0, bw, bh };
    HBRUSH hBrBg = CreateSolidBrush(pressed ? CLR_BTN_PRESS : CLR_BTN_BG);
    FillRect(hBuf, &rcBuf, hBrBg);
    DeleteObject(hBrBg);

    HPEN hPen = CreatePen(PS_SOLID, 1, focused ? CLR_BTN_FOCUS : CLR_BTN_BORDER);
    HGDIOBJ oldPen   = SelectObject(hBuf, hPen);
    HGDIOBJ oldBrush = SelectObject(hBuf, GetStockObject(NULL_BRUSH));
    Rectangle(hBuf, 0, 0, bw, bh);
    SelectObject(hBuf, oldPen);
    SelectObject(hBuf, oldBrush);
    DeleteObject(hPen);

    wchar_t text[128] = {};
    GetWindowTextW(di->hwndItem, text, 128);
    SetBkMode(hBuf, TRANSPARENT);
    SetTextColor(hBuf, disabled ? CLR_SUBTEXT : CLR_TEXT);
    HFONT hFont = reinterpret_cast<HFONT>(SendMessageW(di->hwndItem, WM_GETFONT, 0, 0));
    HGDIOBJ oldFont = SelectObject(hBuf, hFont ? hFont : GetStockObject(DEFAULT_GUI_FONT));
    DrawTextW(hBuf, text, -1, &rcBuf, DT_CENTER | DT_VCENTER | DT_SINGLELINE);
    SelectObject(hBuf, oldFont);

    BitBlt(hDC, rc.left, rc.top, bw, bh, hBuf, 0, 0, SRCCOPY);
    SelectObject(hBuf, hBufOld);
    DeleteObject(hBufBmp);
    DeleteDC(hBuf);
}

static void CloseDialog(HWND hDlg)
{
    if (g_app) {
        if (g_app->state.IsExportingPdf()) return;
        g_app->controller.RequestClose();
    }
    EndDialog(hDlg, 0);
}

// ============================================================================
// Dialog procedure
// ============================================================================

INT_PTR CALLBACK DlgProc(HWND hDlg, UINT msg, WPARAM wParam, LPARAM lParam)
{
    switch (msg)
    {
    // --------------------------------------------------------------------
    case WM_INITDIALOG:
    {
        g_hDlg = hDlg;

        // Dark title bar (Windows 10 v2004+ uses value 20; older builds used 19)
        BOOL dark = TRUE;
        HRESULT hr = DwmSetWindowAttribute(hDlg,
            20 /*DWMWA_USE_IMMERSIVE_DARK_MODE*/, &dark, sizeof(dark));
        if (FAILED(hr))
            DwmSetWindowAttribute(hDlg, 19, &dark, sizeof(dark));

        g_hbrBg     = CreateSolidBrush(CLR_BG);
        g_hbrEditBg = CreateSolidBrush(CLR_EDIT_BG);

        // Owner-draw style for the push buttons
        for (int btnId : { IDC_BROWSE_BUTTON, IDC_AREA_SELECT_BUTTON, IDC_CAPTURE_START_BUTTON,
                           IDC_EXPORT_PDF_BUTTON, IDC_CLOSE_BUTTON }) {
            HWND hBtn = GetDlgItem(hDlg, btnId);
            LONG_PTR style = GetWindowLongPtrW(hBtn, GWL_STYLE);
            style = (style & ~static_cast<LONG_PTR>(BS_TYPEMASK))
                  | static_cast<LONG_PTR>(BS_OWNERDRAW);
            SetWindowLongPtrW(hBtn, GWL_STYLE, style);
        }
        SetWindowTheme(GetDlgItem(hDlg, IDC_LOG_EDIT), L"DarkMode_Explorer", nullptr);

        g_app = std::make_unique<AppContext>(g_hInst);
        g_app->host.SetWindow(hDlg);
        g_app->clickSink.SetTarget(hDlg);
        AttachLogWindow(hDlg, WM_APP_LOG_UPDATED);

        FillCombos(hDlg);
        CheckDlgButton(hDlg, IDC_AUTO_CLICK_CHECKBOX, BST_UNCHECKED);
        SetEditText(hDlg, IDC_AUTO_CLICK_COUNT_EDIT,
                    std::to_wstring(g_app->state.Settings().autoClickCount));

        std::filesystem::path folder = DefaultOutputFolder();
        g_app->controller.SetOutputFolder(folder);
        SetEditText(hDlg, IDC_PATH_EDIT, folder.wstring());

        UpdateControlStates(hDlg);
        AppendLogLines(hDlg);
        spdlog::info("ready: select an area, then start capture");
        return TRUE;
    }

    // --------------------------------------------------------------------
    case WM_DRAWITEM:
    {
        auto* di = reinterpret_cast<LPDRAWITEMSTRUCT>(lParam);
        if (di->CtlType == ODT_BUTTON) {
            DrawFlatButton(di);
            return TRUE;
        }
        break;
    }

    // --------------------------------------------------------------------
    // Dark theme: dialog background
    case WM_CTLCOLORDLG:
        return reinterpret_cast<INT_PTR>(g_hbrBg);

    // --------------------------------------------------------------------
    // Dark theme: labels, group boxes, check box and the read-only log
    case WM_CTLCOLORSTATIC:
    {
        HDC  hDC   = reinterpret_cast<HDC>(wParam);
        HWND hCtrl = reinterpret_cast<HWND>(lParam);
        if (GetDlgCtrlID(hCtrl) == IDC_LOG_EDIT) {
            SetBkColor(hDC, CLR_EDIT_BG);
            SetTextColor(hDC, CLR_SUBTEXT);
            return reinterpret_cast<INT_PTR>(g_hbrEditBg);
        }
        SetBkMode(hDC, TRANSPARENT);
        SetTextColor(hDC, IsWindowEnabled(hCtrl) ? CLR_TEXT : CLR_SUBTEXT);
        return reinterpret_cast<INT_PTR>(g_hbrBg);
    }

    // --------------------------------------------------------------------
    // Dark theme: edits and combo drop-down lists
    case WM_CTLCOLOREDIT:
    case WM_CTLCOLORLISTBOX:
    {
        HDC hDC = reinterpret_cast<HDC>(wParam);
        SetBkColor(hDC, CLR_EDIT_BG);
        SetTextColor(hDC, CLR_TEXT);
        return reinterpret_cast<INT_PTR>(g_hbrEditBg);
    }

    // --------------------------------------------------------------------
    case WM_CTLCOLORBTN:
    {
        HDC hDC = reinterpret_cast<HDC>(wParam);
        SetBkMode(hDC, TRANSPARENT);
        SetTextColor(hDC, CLR_TEXT);
        return reinterpret_cast<INT_PTR>(g_hbrBg);
    }

    // --------------------------------------------------------------------
    // Wait cursor while a PDF export runs.
    case WM_SETCURSOR:
        if (g_app && g_app->host.IsBusy()) {
            SetCursor(LoadCursorW(nullptr, IDC_WAIT));
            SetWindowLongPtrW(hDlg, DWLP_MSGRESULT, TRUE);
            return TRUE;
        }
        break;

    // --------------------------------------------------------------------
    case WM_COMMAND:
    {
        if (!g_app) break;
        const int  id   = LOWORD(wParam);
        const UINT code = HIWORD(wParam);

        switch (id) {
        case IDC_AREA_SELECT_BUTTON:
            if (code == BN_CLICKED) g_app->controller.RequestAreaSelect();
            return TRUE;

        case IDC_CAPTURE_START_BUTTON:
            if (code != BN_CLICKED) return TRUE;
            if (g_app->state.IsCapturing())
                g_app->controller.ExitCapture();
            else
                g_app->controller.RequestCapture();
            return TRUE;

        case IDC_EXPORT_PDF_BUTTON:
            if (code == BN_CLICKED) g_app->controller.RequestPdfExport();
            return TRUE;

        case IDC_BROWSE_BUTTON:
            if (code == BN_CLICKED) OnBrowse(hDlg);
            return TRUE;

        case IDC_CLOSE_BUTTON:
            if (code == BN_CLICKED) CloseDialog(hDlg);
            return TRUE;

        case IDC_AUTO_CLICK_CHECKBOX:
            if (code == BN_CLICKED) {
                bool on = IsDlgButtonChecked(hDlg, IDC_AUTO_CLICK_CHECKBOX) == BST_CHECKED;
                g_app->controller.SetAutoClickEnabled(on);
                UpdateControlStates(hDlg);
            }
            return TRUE;

        case IDC_SCALE_COMBO:
        case IDC_QUALITY_COMBO:
        case IDC_PDF_SIZE_COMBO:
        case IDC_AUTO_CLICK_INTERVAL_COMBO:
            if (code == CBN_SELCHANGE) OnComboChanged(hDlg, id);
            return TRUE;

        case IDC_AUTO_CLICK_COUNT_EDIT:
            if (code == EN_KILLFOCUS && !g_updatingEdits) CommitAutoClickCount(hDlg);
            return TRUE;

        case IDC_PATH_EDIT:
            if (code == EN_KILLFOCUS && !g_updatingEdits) CommitOutputFolder(hDlg);
            return TRUE;

        // Esc / Enter inside the dialog: Esc is the mode-cancel key, never "close".
        case IDCANCEL:
        case IDOK:
            return TRUE;
        }
        break;
    }

    // --------------------------------------------------------------------
    // Auto-click worker finished (count reached, cancelled or failed).
    case WM_APP_AUTO_CLICK_COMPLETE:
        if (g_app) g_app->controller.OnAutoClickComplete();
        return TRUE;

    // --------------------------------------------------------------------
    // Auto-click worker progressed – repaint the status overlay.
    case WM_APP_OVERLAY_REFRESH:
        if (g_app && g_app->state.IsCapturing()) g_app->captureOverlay.Refresh();
        return TRUE;

    // --------------------------------------------------------------------
    case WM_APP_LOG_UPDATED:
        AppendLogLines(hDlg);
        return TRUE;

    // --------------------------------------------------------------------
    case WM_CLOSE:
        CloseDialog(hDlg);
        return TRUE;

    // --------------------------------------------------------------------
    case WM_DESTROY:
        // Stop routing log lines and worker messages before the window goes.
        AttachLogWindow(nullptr, 0);
        if (g_app) {
            g_app->clickSink.SetTarget(nullptr);
            g_app->controller.RequestClose();
            g_app.reset();   // overlays hold GDI+ objects: release before GdiplusShutdown
        }
        g_hDlg = nullptr;
        if (g_hbrBg)     { DeleteObject(g_hbrBg);     g_hbrBg     = nullptr; }
        if (g_hbrEditBg) { DeleteObject(g_hbrEditBg); g_hbrEditBg = nullptr; }
        break;
    }

    return FALSE;
}

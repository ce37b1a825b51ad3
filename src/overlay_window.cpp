#include "overlay_window.h"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

// ============================================================================
// LayeredOverlayWindow
// ============================================================================

LayeredOverlayWindow::LayeredOverlayWindow(HINSTANCE hInst, const wchar_t* className,
                                           DWORD extraExStyle, LPCWSTR cursor)
    : hInst_(hInst)
    , className_(className)
    , extraExStyle_(extraExStyle)
    , cursor_(cursor)
{
}

LayeredOverlayWindow::~LayeredOverlayWindow()
{
    ReleaseSurface();
    if (hwnd_) {
        DestroyWindow(hwnd_);
        hwnd_ = nullptr;
    }
}

bool LayeredOverlayWindow::Create()
{
    WNDCLASSEXW wc = {};
    wc.cbSize        = sizeof(wc);
    wc.lpfnWndProc   = &LayeredOverlayWindow::WndProc;
    wc.hInstance     = hInst_;
    wc.lpszClassName = className_;
    wc.hCursor       = LoadCursorW(nullptr, cursor_);
    wc.hbrBackground = reinterpret_cast<HBRUSH>(GetStockObject(NULL_BRUSH));
    if (!RegisterClassExW(&wc) && GetLastError() != ERROR_CLASS_ALREADY_EXISTS) {
        spdlog::error("overlay: RegisterClassEx failed ({})", GetLastError());
        return false;
    }

    RECT b = Bounds();
    hwnd_ = CreateWindowExW(WS_EX_LAYERED | WS_EX_TOOLWINDOW | WS_EX_TOPMOST | WS_EX_NOACTIVATE | extraExStyle_,
                            className_, L"", WS_POPUP,
                            b.left, b.top, b.right - b.left, b.bottom - b.top,
                            nullptr, nullptr, hInst_, nullptr);
    if (!hwnd_) {
        spdlog::error("overlay: CreateWindowEx failed ({})", GetLastError());
        return false;
    }
    CreateResources();
    return true;
}

bool LayeredOverlayWindow::Show()
{
    if (!hwnd_ && !Create()) return false;
    Render();
    RECT b = Bounds();
    SetWindowPos(hwnd_, HWND_TOPMOST, b.left, b.top, b.right - b.left, b.bottom - b.top,
                 SWP_NOACTIVATE | SWP_SHOWWINDOW);
    return true;
}

void LayeredOverlayWindow::Hide()
{
    if (hwnd_) ShowWindow(hwnd_, SW_HIDE);
}

void LayeredOverlayWindow::Refresh()
{
    if (hwnd_ && IsWindowVisible(hwnd_)) Render();
}

void LayeredOverlayWindow::Reposition(ScreenPoint pt)
{
    OnReposition(pt);
    if (!hwnd_) return;
    RECT b = Bounds();
    SetWindowPos(hwnd_, HWND_TOPMOST, b.left, b.top, 0, 0,
                 SWP_NOSIZE | SWP_NOACTIVATE);
}

bool LayeredOverlayWindow::IsVisible() const
{
    return hwnd_ && IsWindowVisible(hwnd_);
}

bool LayeredOverlayWindow::EnsureSurface(int width, int height)
{
    if (surfaceDC_ && surfaceW_ == width && surfaceH_ == height) return true;
    ReleaseSurface();

    HDC hScreen = GetDC(nullptr);
    surfaceDC_ = CreateCompatibleDC(hScreen);
    ReleaseDC(nullptr, hScreen);
    if (!surfaceDC_) return false;

    BITMAPINFO bmi = {};
    bmi.bmiHeader.biSize        = sizeof(BITMAPINFOHEADER);
    bmi.bmiHeader.biWidth       = width;
    bmi.bmiHeader.biHeight      = -height;   // top-down
    bmi.bmiHeader.biPlanes      = 1;
    bmi.bmiHeader.biBitCount    = 32;
    bmi.bmiHeader.biCompression = BI_RGB;
    surfaceBmp_ = CreateDIBSection(surfaceDC_, &bmi, DIB_RGB_COLORS, &surfaceBits_, nullptr, 0);
    if (!surfaceBmp_) {
        spdlog::error("overlay: CreateDIBSection {}x{} failed", width, height);
        ReleaseSurface();
        return false;
    }
    surfaceOld_ = SelectObject(surfaceDC_, surfaceBmp_);
    surfaceW_ = width;
    surfaceH_ = height;
    return true;
}

void LayeredOverlayWindow::ReleaseSurface()
{
    if (surfaceDC_ && surfaceOld_) SelectObject(surfaceDC_, surfaceOld_);
    if (surfaceBmp_) DeleteObject(surfaceBmp_);
    if (surfaceDC_)  DeleteDC(surfaceDC_);
    surfaceDC_ = nullptr;
    surfaceBmp_ = nullptr;
    surfaceOld_ = nullptr;
    surfaceBits_ = nullptr;
    surfaceW_ = surfaceH_ = 0;
}

void LayeredOverlayWindow::Render()
{
    RECT b = Bounds();
    const int w = b.right - b.left;
    const int h = b.bottom - b.top;
    if (w <= 0 || h <= 0 || !EnsureSurface(w, h)) return;

    {
        // Wrap the DIB bits so GDI+ keeps per-pixel (premultiplied) alpha.
        Gdiplus::Bitmap canvas(w, h, w * 4, PixelFormat32bppPARGB,
                               static_cast<BYTE*>(surfaceBits_));
        Gdiplus::Graphics g(&canvas);
        g.SetSmoothingMode(Gdiplus::SmoothingModeAntiAlias);
        g.SetTextRenderingHint(Gdiplus::TextRenderingHintAntiAliasGridFit);
        g.Clear(Gdiplus::Color(0, 0, 0, 0));
        Paint(g, w, h);
    }

    HDC hScreen = GetDC(nullptr);
    POINT dst = { b.left, b.top };
    SIZE  size = { w, h };
    POINT src = { 0, 0 };
    BLENDFUNCTION blend = { AC_SRC_OVER, 0, 255, AC_SRC_ALPHA };
    if (!UpdateLayeredWindow(hwnd_, hScreen, &dst, &size, surfaceDC_, &src, 0, &blend, ULW_ALPHA))
        spdlog::warn("overlay: UpdateLayeredWindow failed ({})", GetLastError());
    ReleaseDC(nullptr, hScreen);
}

LRESULT CALLBACK LayeredOverlayWindow::WndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    switch (msg) {
    case WM_MOUSEACTIVATE:
        return MA_NOACTIVATE;
    case WM_ERASEBKGND:
        return 1;
    }
    return DefWindowProcW(hwnd, msg, wParam, lParam);
}

// ============================================================================
// AreaSelectOverlay
// ============================================================================

static const int AREA_BORDER_WIDTH = 2;
static const int AREA_HANDLE_LEN   = 16;

AreaSelectOverlay::AreaSelectOverlay(HINSTANCE hInst, const ApplicationState& state)
    : LayeredOverlayWindow(hInst, L"ClickCaptureAreaOverlay", 0, IDC_CROSS)
    , state_(state)
{
}

RECT AreaSelectOverlay::Bounds() const
{
    RECT r = { 0, 0, GetSystemMetrics(SM_CXSCREEN), GetSystemMetrics(SM_CYSCREEN) };
    return r;
}

void AreaSelectOverlay::CreateResources()
{
    dimBrush_  = std::make_unique<Gdiplus::SolidBrush>(Gdiplus::Color(0x99, 0, 0, 0));
    // Alpha 1 keeps the hole hit-testable so the cross cursor stays.
    holeBrush_ = std::make_unique<Gdiplus::SolidBrush>(Gdiplus::Color(1, 0, 0, 0));
    borderPen_ = std::make_unique<Gdiplus::Pen>(Gdiplus::Color(255, 255, 0, 0),
                                                static_cast<Gdiplus::REAL>(AREA_BORDER_WIDTH));
    handlePen_ = std::make_unique<Gdiplus::Pen>(Gdiplus::Color(255, 255, 0, 0), 4.0f);
    sizeFont_  = std::make_unique<Gdiplus::Font>(L"Segoe UI", 11.0f, Gdiplus::FontStyleBold,
                                                 Gdiplus::UnitPoint);
    textBrush_ = std::make_unique<Gdiplus::SolidBrush>(Gdiplus::Color(255, 255, 255, 255));
}

void AreaSelectOverlay::Paint(Gdiplus::Graphics& g, int width, int height)
{
    g.FillRectangle(dimBrush_.get(), 0, 0, width, height);
    if (!state_.IsDragging()) return;

    ScreenRect r = state_.DragRect();
    if (r.IsEmpty()) return;

    g.SetCompositingMode(Gdiplus::CompositingModeSourceCopy);
    g.FillRectangle(holeBrush_.get(), r.left, r.top, r.Width(), r.Height());
    g.SetCompositingMode(Gdiplus::CompositingModeSourceOver);

    g.DrawRectangle(borderPen_.get(), r.left, r.top, r.Width(), r.Height());

    const int hl = (std::min)(AREA_HANDLE_LEN, (std::min)(r.Width(), r.Height()) / 2);
    const int L = r.left, T = r.top, R = r.right, B = r.bottom;
    Gdiplus::Pen* p = handlePen_.get();
    g.DrawLine(p, L, T, L + hl, T);  g.DrawLine(p, L, T, L, T + hl);
    g.DrawLine(p, R, T, R - hl, T);  g.DrawLine(p, R, T, R, T + hl);
    g.DrawLine(p, L, B, L + hl, B);  g.DrawLine(p, L, B, L, B - hl);
    g.DrawLine(p, R, B, R - hl, B);  g.DrawLine(p, R, B, R, B - hl);

    std::wstring label = std::to_wstring(r.Width()) + L" x " + std::to_wstring(r.Height());
    Gdiplus::PointF at(static_cast<Gdiplus::REAL>(L),
                       static_cast<Gdiplus::REAL>(T > 24 ? T - 24 : B + 4));
    g.DrawString(label.c_str(), -1, sizeFont_.get(), at, textBrush_.get());
}

// ============================================================================
// CaptureStatusOverlay
// ============================================================================

CaptureStatusOverlay::CaptureStatusOverlay(HINSTANCE hInst, const ApplicationState& state)
    : LayeredOverlayWindow(hInst, L"ClickCaptureStatusOverlay", WS_EX_TRANSPARENT, IDC_ARROW)
    , state_(state)
{
}

RECT CaptureStatusOverlay::Bounds() const
{
    RECT r;
    r.left   = anchor_.x - CURSOR_OFFSET;
    r.top    = anchor_.y - CURSOR_OFFSET;
    r.right  = r.left + WIDTH;
    r.bottom = r.top + HEIGHT;
    return r;
}

void CaptureStatusOverlay::CreateResources()
{
    backBrush_       = std::make_unique<Gdiplus::SolidBrush>(Gdiplus::Color(0xB0, 0x1e, 0x1e, 0x2e));
    waitingBrush_    = std::make_unique<Gdiplus::SolidBrush>(Gdiplus::Color(255, 0x4c, 0xaf, 0x50));
    processingBrush_ = std::make_unique<Gdiplus::SolidBrush>(Gdiplus::Color(255, 0xff, 0x98, 0x00));
    textBrush_       = std::make_unique<Gdiplus::SolidBrush>(Gdiplus::Color(255, 0xe0, 0xe0, 0xe0));
    glyphPen_        = std::make_unique<Gdiplus::Pen>(Gdiplus::Color(255, 255, 255, 255), 2.0f);
    titleFont_       = std::make_unique<Gdiplus::Font>(L"Segoe UI", 11.0f, Gdiplus::FontStyleBold,
                                                       Gdiplus::UnitPoint);
    detailFont_      = std::make_unique<Gdiplus::Font>(L"Segoe UI", 9.0f, Gdiplus::FontStyleRegular,
                                                       Gdiplus::UnitPoint);
}

void CaptureStatusOverlay::Paint(Gdiplus::Graphics& g, int width, int height)
{
    // Leave the top-left corner (where the pointer sits) uncovered.
    const int x0 = CURSOR_OFFSET + 8;
    const int y0 = CURSOR_OFFSET - 24;
    g.FillRectangle(backBrush_.get(), x0, y0, width - x0 - 2, height - y0 - 2);

    const bool processing = state_.IsProcessing();
    const int gx = x0 + 8, gy = y0 + 10, gs = 28;
    g.FillEllipse(processing ? processingBrush_.get() : waitingBrush_.get(), gx, gy, gs, gs);
    if (processing) {
        // Hourglass.
        g.DrawLine(glyphPen_.get(), gx + 8, gy + 7, gx + 20, gy + 7);
        g.DrawLine(glyphPen_.get(), gx + 8, gy + 21, gx + 20, gy + 21);
        g.DrawLine(glyphPen_.get(), gx + 8, gy + 7, gx + 20, gy + 21);
        g.DrawLine(glyphPen_.get(), gx + 20, gy + 7, gx + 8, gy + 21);
    } else {
        // Lens.
        g.DrawEllipse(glyphPen_.get(), gx + 8, gy + 8, 12, 12);
    }

    const Gdiplus::REAL tx = static_cast<Gdiplus::REAL>(gx + gs + 8);
    g.DrawString(processing ? L"Processing..." : L"Click to capture", -1, titleFont_.get(),
                 Gdiplus::PointF(tx, static_cast<Gdiplus::REAL>(gy)), textBrush_.get());

    std::wstring detail;
    const AutoClicker& clicker = state_.AutoClick();
    if (clicker.IsRunning()) {
        detail = L"auto-clicking (" + std::to_wstring(clicker.Progress()) + L"/" +
                 std::to_wstring(clicker.MaxCount()) + L")";
    } else {
        detail = L"Esc to stop";
    }
    g.DrawString(detail.c_str(), -1, detailFont_.get(),
                 Gdiplus::PointF(tx, static_cast<Gdiplus::REAL>(gy + 22)), textBrush_.get());
}

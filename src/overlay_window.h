#pragma once

#include <windows.h>
#include <objidl.h>
#include <gdiplus.h>
#include <memory>

#include "app_state.h"
#include "overlay.h"

// ============================================================================
// LayeredOverlayWindow
// Topmost WS_EX_LAYERED popup painted with GDI+ into a premultiplied 32bpp
// DIB and pushed with UpdateLayeredWindow.  The window is created on first
// Show(), hidden between sessions and destroyed with the object.  UI thread only.
// ============================================================================
class LayeredOverlayWindow : public Overlay {
public:
    LayeredOverlayWindow(HINSTANCE hInst, const wchar_t* className, DWORD extraExStyle,
                         LPCWSTR cursor);
    ~LayeredOverlayWindow() override;

    LayeredOverlayWindow(const LayeredOverlayWindow&) = delete;
    LayeredOverlayWindow& operator=(const LayeredOverlayWindow&) = delete;

    bool Show() override;
    void Hide() override;
    void Refresh() override;
    void Reposition(ScreenPoint pt) override;
    bool IsVisible() const override;

    HWND Handle() const { return hwnd_; }

protected:
    /// Window placement in screen coordinates for the current state.
    virtual RECT Bounds() const = 0;
    /// Called once after the window exists; allocate pens, brushes, fonts.
    virtual void CreateResources() = 0;
    virtual void Paint(Gdiplus::Graphics& g, int width, int height) = 0;
    /// Default: ignore.  The capture overlay follows the pointer.
    virtual void OnReposition(ScreenPoint) {}

private:
    bool Create();
    bool EnsureSurface(int width, int height);
    void ReleaseSurface();
    void Render();

    static LRESULT CALLBACK WndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam);

    HINSTANCE      hInst_;
    const wchar_t* className_;
    DWORD          extraExStyle_;
    LPCWSTR        cursor_;
    HWND           hwnd_ = nullptr;

    // Cached paint surface, rebuilt only when the size changes.
    HDC     surfaceDC_  = nullptr;
    HBITMAP surfaceBmp_ = nullptr;
    HGDIOBJ surfaceOld_ = nullptr;
    void*   surfaceBits_ = nullptr;
    int     surfaceW_ = 0;
    int     surfaceH_ = 0;
};

// ============================================================================
// Full-screen dimmer with the dragged rectangle cut out.
// ============================================================================
class AreaSelectOverlay : public LayeredOverlayWindow {
public:
    AreaSelectOverlay(HINSTANCE hInst, const ApplicationState& state);

protected:
    RECT Bounds() const override;
    void CreateResources() override;
    void Paint(Gdiplus::Graphics& g, int width, int height) override;

private:
    const ApplicationState&               state_;
    std::unique_ptr<Gdiplus::SolidBrush>  dimBrush_;
    std::unique_ptr<Gdiplus::SolidBrush>  holeBrush_;
    std::unique_ptr<Gdiplus::Pen>         borderPen_;
    std::unique_ptr<Gdiplus::Pen>         handlePen_;
    std::unique_ptr<Gdiplus::Font>        sizeFont_;
    std::unique_ptr<Gdiplus::SolidBrush>  textBrush_;
};

// ============================================================================
// Small click-through badge next to the pointer while capturing.
// ============================================================================
class CaptureStatusOverlay : public LayeredOverlayWindow {
public:
    static const int WIDTH  = 230;
    static const int HEIGHT = 90;
    static const int CURSOR_OFFSET = 32;

    CaptureStatusOverlay(HINSTANCE hInst, const ApplicationState& state);

protected:
    RECT Bounds() const override;
    void CreateResources() override;
    void Paint(Gdiplus::Graphics& g, int width, int height) override;
    void OnReposition(ScreenPoint pt) override { anchor_ = pt; }

private:
    const ApplicationState&               state_;
    ScreenPoint                           anchor_;
    std::unique_ptr<Gdiplus::SolidBrush>  backBrush_;
    std::unique_ptr<Gdiplus::SolidBrush>  waitingBrush_;
    std::unique_ptr<Gdiplus::SolidBrush>  processingBrush_;
    std::unique_ptr<Gdiplus::SolidBrush>  textBrush_;
    std::unique_ptr<Gdiplus::Pen>         glyphPen_;
    std::unique_ptr<Gdiplus::Font>        titleFont_;
    std::unique_ptr<Gdiplus::Font>        detailFont_;
};

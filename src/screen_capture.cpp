#include "screen_capture.h"

#include <objidl.h>
#include <gdiplus.h>
#include <algorithm>
#include <memory>

#include <spdlog/spdlog.h>

#include "win_utils.h"

#pragma comment(lib, "gdiplus.lib")

bool GetEncoderClsid(const wchar_t* mimeType, CLSID* clsid)
{
    UINT num = 0, size = 0;
    if (Gdiplus::GetImageEncodersSize(&num, &size) != Gdiplus::Ok || size == 0)
        return false;

    auto buf = std::make_unique<uint8_t[]>(size);
    auto* codecs = reinterpret_cast<Gdiplus::ImageCodecInfo*>(buf.get());
    if (Gdiplus::GetImageEncoders(num, size, codecs) != Gdiplus::Ok)
        return false;

    for (UINT i = 0; i < num; ++i) {
        if (wcscmp(codecs[i].MimeType, mimeType) == 0) {
            *clsid = codecs[i].Clsid;
            return true;
        }
    }
    return false;
}

static bool SaveBitmapAsJpeg(HBITMAP hBmp, int quality, const std::filesystem::path& target)
{
    CLSID jpegClsid;
    if (!GetEncoderClsid(L"image/jpeg", &jpegClsid)) {
        spdlog::error("capture: JPEG encoder not available");
        return false;
    }

    Gdiplus::Bitmap bitmap(hBmp, nullptr);
    if (bitmap.GetLastStatus() != Gdiplus::Ok) {
        spdlog::error("capture: Gdiplus::Bitmap from HBITMAP failed ({})",
                      static_cast<int>(bitmap.GetLastStatus()));
        return false;
    }

    ULONG q = static_cast<ULONG>(quality);
    Gdiplus::EncoderParameters params;
    params.Count = 1;
    params.Parameter[0].Guid           = Gdiplus::EncoderQuality;
    params.Parameter[0].Type           = Gdiplus::EncoderParameterValueTypeLong;
    params.Parameter[0].NumberOfValues = 1;
    params.Parameter[0].Value          = &q;

    Gdiplus::Status st = bitmap.Save(target.wstring().c_str(), &jpegClsid, &params);
    if (st != Gdiplus::Ok) {
        spdlog::error("capture: saving {} failed (GDI+ status {})",
                      WtoU8(target.wstring()), static_cast<int>(st));
        return false;
    }
    return true;
}

bool GdiRegionCapturer::CaptureToJpeg(const ScreenRect& rect, int scalePercent, int jpegQuality,
                                      const std::filesystem::path& target)
{
    const int w = rect.Width();
    const int h = rect.Height();
    if (w <= 0 || h <= 0) {
        spdlog::error("capture: empty rectangle {}x{}", w, h);
        return false;
    }
    const int dw = (std::max)(1, w * scalePercent / 100);
    const int dh = (std::max)(1, h * scalePercent / 100);

    HDC hScreen = GetDC(nullptr);
    if (!hScreen) {
        spdlog::error("capture: GetDC failed ({})", GetLastError());
        return false;
    }
    HDC     hFull    = CreateCompatibleDC(hScreen);
    HBITMAP hFullBmp = CreateCompatibleBitmap(hScreen, w, h);
    HDC     hScaled  = CreateCompatibleDC(hScreen);
    HBITMAP hScaledBmp = CreateCompatibleBitmap(hScreen, dw, dh);

    bool ok = false;
    if (hFull && hFullBmp && hScaled && hScaledBmp) {
        HGDIOBJ oldFull   = SelectObject(hFull, hFullBmp);
        HGDIOBJ oldScaled = SelectObject(hScaled, hScaledBmp);

        if (!BitBlt(hFull, 0, 0, w, h, hScreen, rect.left, rect.top, SRCCOPY | CAPTUREBLT)) {
            spdlog::error("capture: BitBlt failed ({})", GetLastError());
        } else {
            SetStretchBltMode(hScaled, HALFTONE);
            SetBrushOrgEx(hScaled, 0, 0, nullptr);
            if (!StretchBlt(hScaled, 0, 0, dw, dh, hFull, 0, 0, w, h, SRCCOPY))
                spdlog::error("capture: StretchBlt failed ({})", GetLastError());
            else
                ok = true;
        }

        SelectObject(hScaled, oldScaled);
        SelectObject(hFull, oldFull);
    } else {
        spdlog::error("capture: GDI resource allocation failed for {}x{}", w, h);
    }

    if (ok) ok = SaveBitmapAsJpeg(hScaledBmp, jpegQuality, target);

    if (hScaledBmp) DeleteObject(hScaledBmp);
    if (hScaled)    DeleteDC(hScaled);
    if (hFullBmp)   DeleteObject(hFullBmp);
    if (hFull)      DeleteDC(hFull);
    ReleaseDC(nullptr, hScreen);
    return ok;
}

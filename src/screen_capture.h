#pragma once

#include <windows.h>
#include <filesystem>

#include "mode_controller.h"

/// Look up the GDI+ encoder for a MIME type ("image/jpeg").
bool GetEncoderClsid(const wchar_t* mimeType, CLSID* clsid);

/// BitBlt + HALFTONE StretchBlt from the screen DC, encoded with GDI+.
class GdiRegionCapturer : public RegionCapturer {
public:
    bool CaptureToJpeg(const ScreenRect& rect, int scalePercent, int jpegQuality,
                       const std::filesystem::path& target) override;
};

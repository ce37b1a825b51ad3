#pragma once

#include <windows.h>

/// Keeps GDI+ started for its lifetime.  One instance lives in wWinMain;
/// JPEG encoding and overlay painting both need it.
class GdiplusSession {
public:
    GdiplusSession();
    ~GdiplusSession();

    GdiplusSession(const GdiplusSession&) = delete;
    GdiplusSession& operator=(const GdiplusSession&) = delete;

    bool Ok() const { return ok_; }

private:
    ULONG_PTR token_ = 0;
    bool      ok_    = false;
};

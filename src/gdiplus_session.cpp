#include "gdiplus_session.h"

#include <objidl.h>
#include <gdiplus.h>

#include <spdlog/spdlog.h>

GdiplusSession::GdiplusSession()
{
    Gdiplus::GdiplusStartupInput input;
    Gdiplus::Status st = Gdiplus::GdiplusStartup(&token_, &input, nullptr);
    ok_ = (st == Gdiplus::Ok);
    if (!ok_)
        spdlog::error("GdiplusStartup failed (status {})", static_cast<int>(st));
}

GdiplusSession::~GdiplusSession()
{
    if (ok_) Gdiplus::GdiplusShutdown(token_);
}

#pragma once

#include <algorithm>

/// Absolute screen coordinates (primary display, no DPI virtualization).
struct ScreenPoint {
    int x = 0;
    int y = 0;
};

inline bool operator==(const ScreenPoint& a, const ScreenPoint& b)
{
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const ScreenPoint& a, const ScreenPoint& b)
{
    return !(a == b);
}

struct ScreenRect {
    int left   = 0;
    int top    = 0;
    int right  = 0;
    int bottom = 0;

    int Width()  const { return right - left; }
    int Height() const { return bottom - top; }
    bool IsEmpty() const { return Width() <= 0 || Height() <= 0; }
};

inline bool operator==(const ScreenRect& a, const ScreenRect& b)
{
    return a.left == b.left && a.top == b.top &&
           a.right == b.right && a.bottom == b.bottom;
}

/// Rectangle spanned by two drag points, independent of drag direction.
inline ScreenRect NormalizeRect(ScreenPoint a, ScreenPoint b)
{
    ScreenRect r;
    r.left   = std::min(a.x, b.x);
    r.top    = std::min(a.y, b.y);
    r.right  = std::max(a.x, b.x);
    r.bottom = std::max(a.y, b.y);
    return r;
}

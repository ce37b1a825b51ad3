#include "capture_settings.h"

#include <algorithm>
#include <cctype>
#include <limits>

const std::vector<int>& ScaleOptions()
{
    static const std::vector<int> options = [] {
        std::vector<int> v;
        for (int p = 55; p <= 100; p += 5) v.push_back(p);
        return v;
    }();
    return options;
}

const std::vector<int>& QualityOptions()
{
    static const std::vector<int> options = [] {
        std::vector<int> v;
        for (int q = 70; q <= 100; q += 5) v.push_back(q);
        return v;
    }();
    return options;
}

const std::vector<PdfSizeOption>& PdfSizeOptions()
{
    static const std::vector<PdfSizeOption> options = {
        {  20, "20MB"  },
        {  40, "40MB"  },
        {  60, "60MB"  },
        {  80, "80MB"  },
        { 100, "100MB" },
        { PDF_SIZE_UNLIMITED_MB, "Unlimited (1GB)" },
    };
    return options;
}

const std::vector<uint32_t>& AutoClickIntervalOptions()
{
    static const std::vector<uint32_t> options = { 1000, 2000, 3000, 4000, 5000 };
    return options;
}

template <typename T>
static int IndexOf(const std::vector<T>& v, const T& value)
{
    auto it = std::find(v.begin(), v.end(), value);
    return it == v.end() ? 0 : static_cast<int>(it - v.begin());
}

int DefaultScaleIndex()
{
    return IndexOf(ScaleOptions(), CaptureSettings{}.scalePercent);
}

int DefaultQualityIndex()
{
    return IndexOf(QualityOptions(), CaptureSettings{}.jpegQuality);
}

// The state default (500MB) is not one of the combo entries; the combo
// starts on its first entry and the state keeps 500MB until the user picks one.
int DefaultPdfSizeIndex()
{
    return 0;
}

int DefaultIntervalIndex()
{
    return IndexOf(AutoClickIntervalOptions(), CaptureSettings{}.autoClickIntervalMs);
}

bool IsValidScale(int percent)
{
    const auto& v = ScaleOptions();
    return std::find(v.begin(), v.end(), percent) != v.end();
}

bool IsValidQuality(int quality)
{
    const auto& v = QualityOptions();
    return std::find(v.begin(), v.end(), quality) != v.end();
}

bool IsValidPdfMaxSize(int megabytes)
{
    const auto& v = PdfSizeOptions();
    return std::any_of(v.begin(), v.end(),
                       [megabytes](const PdfSizeOption& o) { return o.megabytes == megabytes; });
}

bool IsValidAutoClickInterval(uint32_t ms)
{
    const auto& v = AutoClickIntervalOptions();
    return std::find(v.begin(), v.end(), ms) != v.end();
}

std::optional<uint32_t> ParseAutoClickCount(const std::string& text)
{
    size_t first = 0, last = text.size();
    while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
    if (first == last) return 0u;

    uint64_t value = 0;
    for (size_t i = first; i < last; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return std::nullopt;
        value = value * 10 + (c - '0');
        if (value > std::numeric_limits<uint32_t>::max()) return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

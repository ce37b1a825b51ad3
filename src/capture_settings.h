#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// User-tunable capture options.  Nothing is persisted: every start
/// begins from these defaults.
struct CaptureSettings {
    int      scalePercent        = 65;
    int      jpegQuality         = 95;
    int      pdfMaxSizeMb        = 500;
    bool     autoClickEnabled    = false;
    uint32_t autoClickIntervalMs = 1000;
    uint32_t autoClickCount      = 0;
};

struct PdfSizeOption {
    int         megabytes;
    const char* label;
};

// PDF size value that stands for "no practical limit".
static const int PDF_SIZE_UNLIMITED_MB = 1024;

/// Combo-box option tables, in display order.
const std::vector<int>&           ScaleOptions();          // 55..100 step 5
const std::vector<int>&           QualityOptions();        // 70..100 step 5
const std::vector<PdfSizeOption>& PdfSizeOptions();        // 20..100 step 20, then unlimited
const std::vector<uint32_t>&      AutoClickIntervalOptions(); // 1000..5000 ms step 1000

/// Index pre-selected in the combo boxes at startup.
int DefaultScaleIndex();
int DefaultQualityIndex();
int DefaultPdfSizeIndex();
int DefaultIntervalIndex();

bool IsValidScale(int percent);
bool IsValidQuality(int quality);
bool IsValidPdfMaxSize(int megabytes);
bool IsValidAutoClickInterval(uint32_t ms);

/// Parse the auto-click count edit text.  Surrounding whitespace is ignored
/// and an empty string means 0.  Returns nullopt for anything that is not a
/// plain unsigned 32-bit decimal.
std::optional<uint32_t> ParseAutoClickCount(const std::string& text);

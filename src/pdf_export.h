#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/// Image-per-page PDF built with libharu.  Each JPEG is embedded unmodified
/// (DCTDecode) on its own page, sized at 300 DPI.
class PdfDocumentBuilder {
public:
    static constexpr double IMAGE_DPI = 300.0;

    /// Returns false (and adds nothing) for empty data.
    bool AddJpegPage(std::vector<uint8_t> jpeg);
    std::vector<uint8_t> PopLastPage();

    size_t PageCount() const { return pages_.size(); }
    bool   Empty() const { return pages_.empty(); }

    /// Serialize every page into one document.  nullopt when libharu rejects
    /// a page (not a JPEG, unsupported frame or component count); the reason
    /// goes to `error` when given.
    std::optional<std::vector<uint8_t>> Render(std::string* error = nullptr) const;

private:
    std::vector<std::vector<uint8_t>> pages_;
};

/// Page edge in points for an image edge in pixels, at IMAGE_DPI and never
/// below the smallest page libharu accepts.
double PagePointsForPixels(uint32_t pixels);

struct PdfExportResult {
    bool                               ok         = false;
    size_t                             imageCount = 0;
    std::vector<std::filesystem::path> written;
    std::string                        error;
};

/// *.jpg / *.jpeg in `folder` (case-insensitive), sorted by path.
std::vector<std::filesystem::path> ListJpegFiles(const std::filesystem::path& folder);

/// Bundle every JPEG in `folder` into 0001.pdf, 0002.pdf ... in the same
/// folder, starting a new file whenever a multi-page document would exceed
/// `maxBytes`.  A single oversized page still gets its own file.
PdfExportResult ExportJpegFolderToPdf(const std::filesystem::path& folder, uint64_t maxBytes);

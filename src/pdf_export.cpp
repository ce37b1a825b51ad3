#include "pdf_export.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <system_error>
#include <type_traits>

#include <hpdf.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "capture_files.h"

namespace fs = std::filesystem;

// ============================================================================
// Document rendering
// ============================================================================

// First libharu error raised while building one document.
struct HpdfErrorState {
    HPDF_STATUS error  = HPDF_OK;
    HPDF_STATUS detail = 0;
};

struct HpdfDocDeleter {
    void operator()(HPDF_Doc doc) const { HPDF_Free(doc); }
};

using HpdfDocPtr = std::unique_ptr<std::remove_pointer_t<HPDF_Doc>, HpdfDocDeleter>;

static void HPDF_STDCALL OnHpdfError(HPDF_STATUS errorNo, HPDF_STATUS detailNo, void* userData)
{
    auto* state = static_cast<HpdfErrorState*>(userData);
    if (state->error == HPDF_OK) {
        state->error  = errorNo;
        state->detail = detailNo;
    }
    spdlog::debug("pdf: libharu error 0x{:04X} (detail {})", errorNo, detailNo);
}

double PagePointsForPixels(uint32_t pixels)
{
    const double points = pixels * 72.0 / PdfDocumentBuilder::IMAGE_DPI;
    return std::clamp(points, static_cast<double>(HPDF_MIN_PAGE_SIZE),
                      static_cast<double>(HPDF_MAX_PAGE_SIZE));
}

bool PdfDocumentBuilder::AddJpegPage(std::vector<uint8_t> jpeg)
{
    if (jpeg.empty()) {
        spdlog::error("pdf: empty JPEG data");
        return false;
    }
    pages_.push_back(std::move(jpeg));
    return true;
}

std::vector<uint8_t> PdfDocumentBuilder::PopLastPage()
{
    std::vector<uint8_t> last = std::move(pages_.back());
    pages_.pop_back();
    return last;
}

std::optional<std::vector<uint8_t>> PdfDocumentBuilder::Render(std::string* error) const
{
    HpdfErrorState state;
    auto fail = [&](const std::string& what) -> std::optional<std::vector<uint8_t>> {
        std::string msg = fmt::format("{} (libharu error 0x{:04X}, detail {})",
                                      what, state.error, state.detail);
        spdlog::error("pdf: {}", msg);
        if (error) *error = msg;
        return std::nullopt;
    };

    HpdfDocPtr doc(HPDF_New(OnHpdfError, &state));
    if (!doc) return fail("cannot create document");
    if (HPDF_SetInfoAttr(doc.get(), HPDF_INFO_CREATOR, "ClickCapture") != HPDF_OK)
        return fail("cannot set document info");

    for (size_t i = 0; i < pages_.size(); ++i) {
        const std::vector<uint8_t>& jpeg = pages_[i];
        const std::string label = "page " + std::to_string(i + 1);

        // libharu copies the stream as is and only reads the frame header.
        HPDF_Image image = HPDF_LoadJpegImageFromMem(doc.get(), jpeg.data(),
                                                     static_cast<HPDF_UINT>(jpeg.size()));
        if (!image) return fail(label + " is not a usable JPEG");

        const HPDF_UINT px = HPDF_Image_GetWidth(image);
        const HPDF_UINT py = HPDF_Image_GetHeight(image);
        if (px == 0 || py == 0) return fail(label + " has a zero image dimension");

        const auto w = static_cast<HPDF_REAL>(PagePointsForPixels(px));
        const auto h = static_cast<HPDF_REAL>(PagePointsForPixels(py));
        HPDF_Page page = HPDF_AddPage(doc.get());
        if (!page) return fail("cannot add " + label);
        if (HPDF_Page_SetWidth(page, w) != HPDF_OK ||
            HPDF_Page_SetHeight(page, h) != HPDF_OK ||
            HPDF_Page_DrawImage(page, image, 0, 0, w, h) != HPDF_OK)
            return fail("cannot lay out " + label);
    }

    if (HPDF_SaveToStream(doc.get()) != HPDF_OK) return fail("cannot serialize document");

    std::vector<uint8_t> bytes(HPDF_GetStreamSize(doc.get()));
    if (!bytes.empty()) {
        auto size = static_cast<HPDF_UINT32>(bytes.size());
        const HPDF_STATUS st = HPDF_ReadFromStream(doc.get(), bytes.data(), &size);
        if (st != HPDF_OK && st != HPDF_STREAM_EOF) return fail("cannot read back document");
        bytes.resize(size);
    }
    return bytes;
}

// ============================================================================
// Folder export
// ============================================================================

static std::string LowerExtension(const fs::path& p)
{
    std::string ext = p.extension().u8string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::vector<fs::path> ListJpegFiles(const fs::path& folder)
{
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string ext = LowerExtension(it->path());
        if (ext == ".jpg" || ext == ".jpeg")
            files.push_back(it->path());
    }
    if (ec)
        spdlog::warn("pdf: error while listing {}: {}", folder.u8string(), ec.message());
    std::sort(files.begin(), files.end());
    return files;
}

static bool ReadFileBytes(const fs::path& path, std::vector<uint8_t>& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

static bool WriteFileBytes(const fs::path& path, const std::vector<uint8_t>& bytes)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    return static_cast<bool>(out);
}

static bool SaveChunk(const std::vector<uint8_t>& pdf, size_t pageCount, const fs::path& folder,
                      uint32_t index, PdfExportResult& result)
{
    fs::path target = folder / FormatSequenceFileName(index, "pdf");
    if (!WriteFileBytes(target, pdf)) {
        result.error = "failed to write " + target.u8string();
        spdlog::error("pdf: {}", result.error);
        return false;
    }
    spdlog::info("pdf: saved {} ({} page(s), {} bytes)",
                 target.filename().u8string(), pageCount, pdf.size());
    result.written.push_back(target);
    return true;
}

PdfExportResult ExportJpegFolderToPdf(const fs::path& folder, uint64_t maxBytes)
{
    PdfExportResult result;
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        result.error = "folder does not exist: " + folder.u8string();
        spdlog::error("pdf: {}", result.error);
        return result;
    }

    auto files = ListJpegFiles(folder);
    if (files.empty()) {
        spdlog::warn("pdf: no JPEG files in {}", folder.u8string());
        result.ok = true;
        return result;
    }
    spdlog::info("pdf: exporting {} image(s) from {}, limit {} bytes",
                 files.size(), folder.u8string(), maxBytes);

    PdfDocumentBuilder   doc;
    std::vector<uint8_t> committed;   // rendering of `doc` as last accepted
    uint32_t             pdfIndex = 1;

    for (size_t i = 0; i < files.size(); ++i) {
        const fs::path& path = files[i];
        const std::string name = path.filename().u8string();
        spdlog::info("pdf: adding {} ({}/{})", name, i + 1, files.size());

        std::vector<uint8_t> jpeg;
        if (!ReadFileBytes(path, jpeg)) {
            result.error = "cannot read " + name;
            spdlog::error("pdf: {}", result.error);
            return result;
        }
        if (!doc.AddJpegPage(std::move(jpeg))) {
            result.error = "empty image file: " + name;
            return result;
        }

        std::string why;
        auto rendered = doc.Render(&why);
        if (!rendered) {
            result.error = "not a readable JPEG: " + name + ": " + why;
            return result;
        }
        ++result.imageCount;

        if (doc.PageCount() > 1 && rendered->size() > maxBytes) {
            std::vector<uint8_t> overflow = doc.PopLastPage();
            if (!SaveChunk(committed, doc.PageCount(), folder, pdfIndex++, result)) return result;
            doc = PdfDocumentBuilder();
            if (!doc.AddJpegPage(std::move(overflow))) {
                result.error = "cannot carry page over to the next file";
                return result;
            }
            rendered = doc.Render(&why);
            if (!rendered) {
                result.error = "cannot render " + name + ": " + why;
                return result;
            }
        }
        committed = std::move(*rendered);
    }

    if (!doc.Empty() && !SaveChunk(committed, doc.PageCount(), folder, pdfIndex, result))
        return result;

    result.ok = true;
    spdlog::info("pdf: export finished, {} image(s) into {} file(s)",
                 result.imageCount, result.written.size());
    return result;
}

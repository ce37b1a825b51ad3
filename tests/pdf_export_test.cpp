#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "capture_files.h"
#include "fakes.h"
#include "pdf_export.h"

namespace fs = std::filesystem;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::StartsWith;

// Minimal baseline JPEG: SOI, APP0, optional DHT, SOFn, SOS, filler, EOI.
static std::vector<uint8_t> MakeJpeg(uint16_t width, uint16_t height, uint8_t components,
                                     size_t filler = 64, uint8_t sof = 0xC0, bool withDht = false)
{
    std::vector<uint8_t> d = { 0xFF, 0xD8 };
    const uint8_t app0[] = { 0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00,
                             0x01, 0x01, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00 };
    d.insert(d.end(), std::begin(app0), std::end(app0));
    if (withDht) {
        const uint8_t dht[] = { 0xFF, 0xC4, 0x00, 0x05, 0x00, 0x00, 0x00 };
        d.insert(d.end(), std::begin(dht), std::end(dht));
    }
    const uint16_t sofLen = static_cast<uint16_t>(8 + 3 * components);
    d.push_back(0xFF);
    d.push_back(sof);
    d.push_back(static_cast<uint8_t>(sofLen >> 8));
    d.push_back(static_cast<uint8_t>(sofLen & 0xFF));
    d.push_back(8);
    d.push_back(static_cast<uint8_t>(height >> 8));
    d.push_back(static_cast<uint8_t>(height & 0xFF));
    d.push_back(static_cast<uint8_t>(width >> 8));
    d.push_back(static_cast<uint8_t>(width & 0xFF));
    d.push_back(components);
    for (uint8_t c = 0; c < components; ++c) {
        d.push_back(c + 1);
        d.push_back(0x11);
        d.push_back(0x00);
    }
    const uint8_t sos[] = { 0xFF, 0xDA, 0x00, 0x08, 0x01, 0x01, 0x00, 0x00, 0x3F, 0x00 };
    d.insert(d.end(), std::begin(sos), std::end(sos));
    d.insert(d.end(), filler, 0x55);
    d.push_back(0xFF);
    d.push_back(0xD9);
    return d;
}

static void WriteBytes(const fs::path& p, const std::vector<uint8_t>& bytes)
{
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

static std::string ReadText(const fs::path& p)
{
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static size_t CountOccurrences(const std::string& haystack, const std::string& needle)
{
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size()))
        ++count;
    return count;
}

// Every embedded image is a verbatim JPEG stream starting with SOI + APP0.
static size_t ImageCountOf(const std::string& pdf)
{
    static const std::string jfif("\xFF\xD8\xFF\xE0\x00\x10JFIF", 10);
    return CountOccurrences(pdf, jfif);
}

static std::string AsText(const std::vector<uint8_t>& bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

// ============================================================================
// Page geometry
// ============================================================================

TEST(PagePointsTest, ThreeHundredDpi)
{
    EXPECT_DOUBLE_EQ(PagePointsForPixels(600), 144.0);
    EXPECT_DOUBLE_EQ(PagePointsForPixels(300), 72.0);
    EXPECT_DOUBLE_EQ(PagePointsForPixels(1920), 460.8);
}

TEST(PagePointsTest, ClampedToSmallestPage)
{
    EXPECT_DOUBLE_EQ(PagePointsForPixels(1), 3.0);
    EXPECT_DOUBLE_EQ(PagePointsForPixels(12), 3.0);
}

// ============================================================================
// Document rendering
// ============================================================================

TEST(PdfDocumentBuilderTest, RejectsEmptyData)
{
    PdfDocumentBuilder doc;
    EXPECT_FALSE(doc.AddJpegPage({}));
    EXPECT_TRUE(doc.Empty());
}

TEST(PdfDocumentBuilderTest, RendersOnePagePerImage)
{
    PdfDocumentBuilder doc;
    ASSERT_TRUE(doc.AddJpegPage(MakeJpeg(600, 300, 3)));
    ASSERT_TRUE(doc.AddJpegPage(MakeJpeg(300, 600, 1)));
    ASSERT_EQ(doc.PageCount(), 2u);

    auto bytes = doc.Render();
    ASSERT_TRUE(bytes.has_value());
    const std::string pdf = AsText(*bytes);

    EXPECT_THAT(pdf, StartsWith("%PDF-1."));
    EXPECT_THAT(pdf, HasSubstr("%%EOF"));
    EXPECT_THAT(pdf, HasSubstr("DCTDecode"));
    EXPECT_THAT(pdf, HasSubstr("DeviceRGB"));
    EXPECT_THAT(pdf, HasSubstr("DeviceGray"));
    EXPECT_EQ(ImageCountOf(pdf), 2u);
}

TEST(PdfDocumentBuilderTest, EmbedsJpegBytesUnmodified)
{
    const auto jpeg = MakeJpeg(50, 40, 3, 200);
    PdfDocumentBuilder doc;
    ASSERT_TRUE(doc.AddJpegPage(jpeg));
    auto bytes = doc.Render();
    ASSERT_TRUE(bytes.has_value());
    EXPECT_NE(AsText(*bytes).find(AsText(jpeg)), std::string::npos);
}

TEST(PdfDocumentBuilderTest, ProgressiveFrameAfterHuffmanTable)
{
    PdfDocumentBuilder doc;
    ASSERT_TRUE(doc.AddJpegPage(MakeJpeg(1920, 1080, 1, 16, 0xC2, true)));
    EXPECT_TRUE(doc.Render().has_value());
}

TEST(PdfDocumentBuilderTest, RenderFailsOnNonJpegData)
{
    PdfDocumentBuilder doc;
    ASSERT_TRUE(doc.AddJpegPage(MakeJpeg(100, 100, 3)));
    ASSERT_TRUE(doc.AddJpegPage({ 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A }));
    std::string error;
    EXPECT_FALSE(doc.Render(&error).has_value());
    EXPECT_THAT(error, HasSubstr("page 2"));
}

TEST(PdfDocumentBuilderTest, RenderFailsOnUnsupportedComponentCount)
{
    PdfDocumentBuilder doc;
    ASSERT_TRUE(doc.AddJpegPage(MakeJpeg(100, 100, 2)));
    EXPECT_FALSE(doc.Render().has_value());
}

TEST(PdfDocumentBuilderTest, PopLastPageShrinksDocument)
{
    PdfDocumentBuilder doc;
    ASSERT_TRUE(doc.AddJpegPage(MakeJpeg(100, 100, 3)));
    const auto second = MakeJpeg(200, 100, 3);
    ASSERT_TRUE(doc.AddJpegPage(second));
    const auto twoPages = doc.Render();
    ASSERT_TRUE(twoPages.has_value());

    EXPECT_EQ(doc.PopLastPage(), second);
    EXPECT_EQ(doc.PageCount(), 1u);
    const auto onePage = doc.Render();
    ASSERT_TRUE(onePage.has_value());
    EXPECT_LT(onePage->size(), twoPages->size());
    EXPECT_EQ(ImageCountOf(AsText(*onePage)), 1u);
}

// ============================================================================
// Folder export
// ============================================================================

TEST(ListJpegFilesTest, CaseInsensitiveAndSorted)
{
    TempDir dir;
    WriteBytes(dir.Path() / "b.JPG", MakeJpeg(10, 10, 3));
    WriteBytes(dir.Path() / "a.jpeg", MakeJpeg(10, 10, 3));
    WriteBytes(dir.Path() / "c.png", { 1, 2, 3 });
    WriteBytes(dir.Path() / "d.txt", { 1, 2, 3 });
    fs::create_directories(dir.Path() / "e.jpg");

    EXPECT_THAT(ListJpegFiles(dir.Path()),
                ElementsAre(dir.Path() / "a.jpeg", dir.Path() / "b.JPG"));
}

TEST(ExportJpegFolderTest, MissingFolderIsAnError)
{
    TempDir dir;
    auto result = ExportJpegFolderToPdf(dir.Path() / "missing", 1024 * 1024);
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
}

TEST(ExportJpegFolderTest, EmptyFolderWritesNothing)
{
    TempDir dir;
    auto result = ExportJpegFolderToPdf(dir.Path(), 1024 * 1024);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.imageCount, 0u);
    EXPECT_TRUE(result.written.empty());
    EXPECT_TRUE(fs::is_empty(dir.Path()));
}

TEST(ExportJpegFolderTest, UnreadableJpegAbortsExport)
{
    TempDir dir;
    WriteBytes(dir.Path() / "0001.jpg", { 'n', 'o', 't', ' ', 'j', 'p', 'e', 'g' });
    auto result = ExportJpegFolderToPdf(dir.Path(), 1024 * 1024);
    EXPECT_FALSE(result.ok);
    EXPECT_THAT(result.error, HasSubstr("0001.jpg"));
    EXPECT_FALSE(fs::exists(dir.Path() / "0001.pdf"));
}

TEST(ExportJpegFolderTest, EverythingFitsInOneFile)
{
    TempDir dir;
    for (int i = 1; i <= 3; ++i)
        WriteBytes(dir.Path() / FormatSequenceFileName(i, "jpg"), MakeJpeg(300, 300, 3));

    auto result = ExportJpegFolderToPdf(dir.Path(), 1024 * 1024);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.imageCount, 3u);
    ASSERT_THAT(result.written, ElementsAre(dir.Path() / "0001.pdf"));
    EXPECT_EQ(ImageCountOf(ReadText(dir.Path() / "0001.pdf")), 3u);
}

TEST(ExportJpegFolderTest, SplitsWhenLimitIsExceeded)
{
    // Limit sized so that two pages fit and three do not.
    PdfDocumentBuilder doc;
    ASSERT_TRUE(doc.AddJpegPage(MakeJpeg(300, 300, 3, 4000)));
    ASSERT_TRUE(doc.AddJpegPage(MakeJpeg(300, 300, 3, 4000)));
    const auto two = doc.Render();
    ASSERT_TRUE(doc.AddJpegPage(MakeJpeg(300, 300, 3, 4000)));
    const auto three = doc.Render();
    ASSERT_TRUE(two.has_value());
    ASSERT_TRUE(three.has_value());
    const uint64_t limit = (two->size() + three->size()) / 2;

    TempDir dir;
    for (int i = 1; i <= 5; ++i)
        WriteBytes(dir.Path() / FormatSequenceFileName(i, "jpg"), MakeJpeg(300, 300, 3, 4000));

    auto result = ExportJpegFolderToPdf(dir.Path(), limit);
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.imageCount, 5u);
    ASSERT_THAT(result.written, ElementsAre(dir.Path() / "0001.pdf",
                                            dir.Path() / "0002.pdf",
                                            dir.Path() / "0003.pdf"));
    EXPECT_EQ(ImageCountOf(ReadText(dir.Path() / "0001.pdf")), 2u);
    EXPECT_EQ(ImageCountOf(ReadText(dir.Path() / "0002.pdf")), 2u);
    EXPECT_EQ(ImageCountOf(ReadText(dir.Path() / "0003.pdf")), 1u);
    for (const auto& p : result.written)
        EXPECT_LE(fs::file_size(p), limit);
}

TEST(ExportJpegFolderTest, OversizedSinglePageStillGetsItsOwnFile)
{
    TempDir dir;
    WriteBytes(dir.Path() / "0001.jpg", MakeJpeg(300, 300, 3, 2000));
    WriteBytes(dir.Path() / "0002.jpg", MakeJpeg(300, 300, 3, 2000));

    auto result = ExportJpegFolderToPdf(dir.Path(), 100);
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.written.size(), 2u);
    EXPECT_EQ(ImageCountOf(ReadText(result.written[0])), 1u);
    EXPECT_EQ(ImageCountOf(ReadText(result.written[1])), 1u);
}

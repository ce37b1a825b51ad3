#include "capture_files.h"

#include <cstdio>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static const char* OUTPUT_SUBFOLDER  = "clickcapture";
static const char* WRITE_PROBE_NAME  = ".clickcapture_write_test";

std::string FormatSequenceFileName(uint32_t number, const char* extension)
{
    char buf[32] = {};
    std::snprintf(buf, sizeof(buf), "%04u.%s", number, extension);
    return buf;
}

std::string CaptureFileSequence::NextFileName() const
{
    return FormatSequenceFileName(next_, "jpg");
}

fs::path CaptureFileSequence::NextPath(const fs::path& folder) const
{
    return folder / NextFileName();
}

bool CaptureFileSequence::CommitIfSaved(const fs::path& written)
{
    std::error_code ec;
    if (!fs::is_regular_file(written, ec)) {
        spdlog::error("capture file missing after save: {}", written.u8string());
        return false;
    }
    auto size = fs::file_size(written, ec);
    if (ec || size == 0) {
        spdlog::error("capture file is empty or unreadable: {}", written.u8string());
        return false;
    }
    ++next_;
    return true;
}

bool IsFolderWritable(const fs::path& folder)
{
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) return false;

    fs::path probe = folder / WRITE_PROBE_NAME;
    {
        std::ofstream out(probe, std::ios::binary | std::ios::trunc);
        if (!out) return false;
        out << "probe";
        if (!out) return false;
    }
    fs::remove(probe, ec);
    if (ec)
        spdlog::warn("could not remove write probe {}: {}", probe.u8string(), ec.message());
    return true;
}

std::vector<fs::path> OutputFolderCandidates(const fs::path& userProfile,
                                             const fs::path& publicDir,
                                             const fs::path& systemRoot)
{
    std::vector<fs::path> candidates;
    if (!userProfile.empty()) {
        candidates.push_back(userProfile / "OneDrive" / fs::u8path(u8"画像"));
        candidates.push_back(userProfile / "OneDrive" / "Pictures");
        candidates.push_back(userProfile / "Pictures");
        candidates.push_back(userProfile / fs::u8path(u8"画像"));
        candidates.push_back(userProfile / "Documents");
        candidates.push_back(userProfile / "Desktop");
    }
    candidates.push_back(publicDir / "Pictures");
    candidates.push_back(publicDir / "Documents");
    candidates.push_back(systemRoot);
    return candidates;
}

fs::path DiscoverOutputFolder(const std::vector<fs::path>& candidates)
{
    for (const auto& c : candidates) {
        if (IsFolderWritable(c)) {
            spdlog::info("output folder: {}", c.u8string());
            return c / OUTPUT_SUBFOLDER;
        }
        spdlog::debug("not writable: {}", c.u8string());
    }
    if (candidates.empty()) return fs::path(OUTPUT_SUBFOLDER);
    spdlog::warn("no writable output folder found, falling back to {}",
                 candidates.back().u8string());
    return candidates.back() / OUTPUT_SUBFOLDER;
}

bool EnsureFolderExists(const fs::path& folder)
{
    std::error_code ec;
    if (fs::is_directory(folder, ec)) return true;
    fs::create_directories(folder, ec);
    if (ec) {
        spdlog::error("failed to create folder {}: {}", folder.u8string(), ec.message());
        return false;
    }
    spdlog::info("created folder {}", folder.u8string());
    return true;
}

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/// "0001.jpg" style names.  Widens past four digits rather than wrapping.
std::string FormatSequenceFileName(uint32_t number, const char* extension);

/// Sequential JPEG file numbering for capture output.  The counter only moves
/// after a save has been verified on disk, so a failed save never leaves a gap.
class CaptureFileSequence {
public:
    uint32_t Next() const { return next_; }
    std::string NextFileName() const;
    std::filesystem::path NextPath(const std::filesystem::path& folder) const;

    /// Advance if `written` exists and is non-empty.  Returns whether it advanced.
    bool CommitIfSaved(const std::filesystem::path& written);

private:
    uint32_t next_ = 1;
};

/// Existing directory in which a probe file can be created and removed.
bool IsFolderWritable(const std::filesystem::path& folder);

/// Save-folder candidates in priority order.  `userProfile` may be empty
/// (then its entries are skipped); `publicDir` is %PUBLIC%.
std::vector<std::filesystem::path> OutputFolderCandidates(const std::filesystem::path& userProfile,
                                                          const std::filesystem::path& publicDir,
                                                          const std::filesystem::path& systemRoot);

/// First writable candidate with "clickcapture" appended.  Falls back to the
/// last candidate when none is writable.
std::filesystem::path DiscoverOutputFolder(const std::vector<std::filesystem::path>& candidates);

/// Create `folder` (and parents) if needed.  Returns false on failure.
bool EnsureFolderExists(const std::filesystem::path& folder);

#pragma once

#include <docdrop/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace docdrop::download {

namespace fs = std::filesystem;

// Replace / \ : * ? " < > | with '_', trim leading/trailing spaces and dots.
// Empty results become "unnamed_file".
std::string sanitizeFilename(std::string_view name);

// Final extension of name, lower-cased, without the dot ("" when there is none).
// "report.PDF" -> "pdf", "archive.tar.gz" -> "gz", "README" -> "".
std::string extensionOf(std::string_view name);

// path when it does not exist, otherwise the first free stem_N.ext with N = 1, 2, ...
// Advisory only: another writer may claim the result before it is opened.
fs::path makeUniquePath(const fs::path& path);

/**
 * Write-only handle to a file this process created exclusively. Closes on destruction;
 * call close() to observe close errors.
 */
class ExclusiveFile {
public:
    ExclusiveFile() = default;
    ExclusiveFile(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}
    ~ExclusiveFile();

    ExclusiveFile(ExclusiveFile&& other) noexcept;
    ExclusiveFile& operator=(ExclusiveFile&& other) noexcept;
    ExclusiveFile(const ExclusiveFile&) = delete;
    ExclusiveFile& operator=(const ExclusiveFile&) = delete;

    // Writes the whole span, retrying short writes and EINTR.
    Result<void> write(ByteSpan data);
    Result<void> close();

    bool isOpen() const noexcept { return fd_ >= 0; }
    const fs::path& path() const noexcept { return path_; }
    std::uint64_t bytesWritten() const noexcept { return written_; }

private:
    int fd_{-1};
    fs::path path_;
    std::uint64_t written_{0};
};

inline constexpr int kMaxCreateAttempts = 1000;

/**
 * Resolve a unique name for path and create it with O_CREAT | O_EXCL. When another writer wins
 * the race the name is re-resolved from the original path, up to kMaxCreateAttempts times.
 */
Result<ExclusiveFile> createExclusive(const fs::path& path);

} // namespace docdrop::download

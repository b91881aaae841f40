#include <docdrop/download/filename_resolver.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace docdrop::download {

namespace {

constexpr std::string_view kInvalidChars = "/\\:*?\"<>|";
constexpr std::string_view kTrimChars = " .";

bool pathExists(const fs::path& p) {
    std::error_code ec;
    // symlink_status so a dangling link still counts as taken
    return fs::exists(fs::symlink_status(p, ec)) && !ec;
}

} // namespace

std::string sanitizeFilename(std::string_view name) {
    std::string out(name);
    std::replace_if(
        out.begin(), out.end(),
        [](char c) { return kInvalidChars.find(c) != std::string_view::npos; }, '_');

    const auto first = out.find_first_not_of(kTrimChars);
    if (first == std::string::npos) {
        return "unnamed_file";
    }
    const auto last = out.find_last_not_of(kTrimChars);
    return out.substr(first, last - first + 1);
}

std::string extensionOf(std::string_view name) {
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos) {
        return {};
    }
    std::string ext(name.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

fs::path makeUniquePath(const fs::path& path) {
    if (!pathExists(path)) {
        return path;
    }
    const auto dir = path.parent_path();
    const auto ext = path.extension().string();
    const auto stem = path.stem().string();
    for (std::uint64_t i = 1;; ++i) {
        auto candidate = dir / (stem + "_" + std::to_string(i) + ext);
        if (!pathExists(candidate)) {
            return candidate;
        }
    }
}

// ---------- ExclusiveFile ----------

ExclusiveFile::~ExclusiveFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

ExclusiveFile::ExclusiveFile(ExclusiveFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)),
      written_(std::exchange(other.written_, 0)) {}

ExclusiveFile& ExclusiveFile::operator=(ExclusiveFile&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
        written_ = std::exchange(other.written_, 0);
    }
    return *this;
}

Result<void> ExclusiveFile::write(ByteSpan data) {
    if (fd_ < 0) {
        return Error{ErrorCode::InvalidState, "write on closed file: " + path_.string()};
    }
    const auto* p = reinterpret_cast<const char*>(data.data());
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Error{ErrorCode::WriteError,
                         "write failed for " + path_.string() + ": " + std::strerror(errno)};
        }
        p += n;
        remaining -= static_cast<std::size_t>(n);
        written_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

Result<void> ExclusiveFile::close() {
    if (fd_ < 0) {
        return {};
    }
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0) {
        return Error{ErrorCode::WriteError,
                     "close failed for " + path_.string() + ": " + std::strerror(errno)};
    }
    return {};
}

// ---------- createExclusive ----------

Result<ExclusiveFile> createExclusive(const fs::path& path) {
    for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
        fs::path candidate = makeUniquePath(path);
        const int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd >= 0) {
            return ExclusiveFile{fd, std::move(candidate)};
        }
        if (errno == EEXIST) {
            spdlog::debug("createExclusive: {} claimed concurrently, re-resolving",
                          candidate.string());
            continue;
        }
        const int err = errno;
        const auto code = (err == EACCES || err == EPERM) ? ErrorCode::PermissionDenied
                                                           : ErrorCode::IoError;
        return Error{code, "cannot create " + candidate.string() + ": " + std::strerror(err)};
    }
    return Error{ErrorCode::IoError,
                 "no free file name for " + path.string() + " after " +
                     std::to_string(kMaxCreateAttempts) + " attempts"};
}

} // namespace docdrop::download

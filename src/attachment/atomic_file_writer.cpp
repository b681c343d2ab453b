/*
 * AtomicFileWriter implementation (POSIX):
 * - Temporary file created with mkstemp() in the destination directory (0600)
 * - fsync + rename onto the destination, then fsync of the directory entry
 * - Published files are made world-readable (0644), best-effort
 */

#include <chatport/attachment/atomic_file_writer.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace chatport::attachment {

namespace fs = std::filesystem;

namespace {

std::string errnoMessage(int err) {
    return std::generic_category().message(err);
}

Result<void> fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return {};
}

void set_file_shared_read(const fs::path& p) noexcept {
    std::error_code ec;
    fs::permissions(p,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                        fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set permissions for {}: {}", p.string(), ec.message());
    }
}

} // namespace

AtomicFileWriter::AtomicFileWriter(fs::path destPath, fs::path tempPath, int fd)
    : destPath_(std::move(destPath)), tempPath_(std::move(tempPath)), fd_(fd) {}

Result<std::unique_ptr<AtomicFileWriter>> AtomicFileWriter::open(const fs::path& destPath) {
    if (destPath.empty() || !destPath.has_filename()) {
        return Error{ErrorCode::InvalidArgument, "Invalid destination path: " + destPath.string()};
    }

    fs::path dir = destPath.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    // mkstemp needs a mutable, NUL-terminated template
    std::string tmpl =
        (dir / (std::string(kTempFilePrefix) + destPath.filename().string() + "-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        const int err = errno;
        return Error{ErrorCode::IoError, "Failed to create temporary file in " + dir.string() +
                                             ": " + errnoMessage(err)};
    }

    return std::unique_ptr<AtomicFileWriter>(
        new AtomicFileWriter(destPath, fs::path(buf.data()), fd));
}

AtomicFileWriter::~AtomicFileWriter() {
    if (!committed_) {
        abandon();
    }
}

Result<void> AtomicFileWriter::write(std::span<const std::byte> data) {
    if (fd_ < 0) {
        return Error{ErrorCode::InvalidState, "Writer is closed: " + destPath_.string()};
    }

    const auto* p = reinterpret_cast<const char*>(data.data());
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            return Error{ErrorCode::IoError,
                         "write failed on " + tempPath_.string() + ": " + errnoMessage(err)};
        }
        p += n;
        remaining -= static_cast<std::size_t>(n);
        written_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

Result<void> AtomicFileWriter::write(std::string_view text) {
    return write(std::as_bytes(std::span{text.data(), text.size()}));
}

Result<void> AtomicFileWriter::close() {
    if (committed_) {
        return {};
    }
    if (fd_ < 0) {
        return Error{ErrorCode::InvalidState, "Writer was abandoned: " + destPath_.string()};
    }
    const fs::path tmp = tempPath_; // abandon() clears tempPath_

    if (::fsync(fd_) != 0) {
        const int err = errno;
        abandon();
        return Error{ErrorCode::IoError, "fsync() failed for " + tmp.string() + ": " +
                                             errnoMessage(err)};
    }

    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        const int err = errno;
        abandon();
        return Error{ErrorCode::IoError, "close() failed for " + tmp.string() + ": " +
                                             errnoMessage(err)};
    }

    std::error_code ec;
    fs::rename(tmp, destPath_, ec);
    if (ec) {
        abandon();
        return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                             tmp.string() + " to " + destPath_.string()};
    }
    committed_ = true;

    set_file_shared_read(destPath_);

    auto dirSync = fsync_dir(destPath_.has_parent_path() ? destPath_.parent_path() : fs::path("."));
    if (!dirSync) {
        spdlog::debug("fsync on directory failed (continuing): {}", dirSync.error().message);
    }
    return {};
}

void AtomicFileWriter::abandon() noexcept {
    if (committed_) {
        return;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (tempPath_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(tempPath_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temporary file {}: {}", tempPath_.string(), ec.message());
    }
    tempPath_.clear();
}

} // namespace chatport::attachment

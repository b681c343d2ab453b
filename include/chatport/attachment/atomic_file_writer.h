#pragma once

#include <chatport/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>

namespace chatport::attachment {

/**
 * Scoped write-then-publish file writer.
 *
 * Bytes are written to a private temporary file ("tmp-<name>-XXXXXX") created next to the
 * destination. close() syncs the temporary file and renames it onto the destination, so the
 * destination holds either nothing or the complete file. Any failure in close(), an explicit
 * abandon(), or destruction before a successful close() removes the temporary file.
 *
 * Two writers for the same destination are not coordinated here; the AttachmentStore claim
 * prevents that upstream.
 */
class AtomicFileWriter {
public:
    static Result<std::unique_ptr<AtomicFileWriter>> open(const std::filesystem::path& destPath);

    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    Result<void> write(std::span<const std::byte> data);
    Result<void> write(std::string_view text);

    // Publish the file at path(). The writer cannot be used afterwards.
    Result<void> close();

    // Drop the temporary file without publishing. Safe to call more than once.
    void abandon() noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return destPath_; }
    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return written_; }
    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    AtomicFileWriter(std::filesystem::path destPath, std::filesystem::path tempPath, int fd);

    std::filesystem::path destPath_;
    std::filesystem::path tempPath_;
    int fd_{-1};
    std::uint64_t written_{0};
    bool committed_{false};
};

// Prefix of the temporary files created by AtomicFileWriter.
inline constexpr std::string_view kTempFilePrefix = "tmp-";

} // namespace chatport::attachment

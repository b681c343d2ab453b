#pragma once

#include <chatport/bulkimport/records.h>
#include <chatport/core/types.h>

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string_view>

namespace chatport::attachment {
class AtomicFileWriter;
}

namespace chatport::bulkimport {

// Receives one serialized line, including the trailing '\n'
using LineSink = std::function<Result<void>(std::string_view)>;

/**
 * Append-only JSON Lines writer for bulk-import records.
 *
 * Records must arrive in non-decreasing kind order (version, team, channel, user, post,
 * direct_channel, direct_post). Kinds may be skipped. A record that would move the order
 * backwards is rejected with OrderingViolation and nothing is written.
 * Not thread-safe.
 */
class BulkImportWriter {
public:
    explicit BulkImportWriter(std::ostream& out);
    explicit BulkImportWriter(LineSink sink);

    Result<void> add(const Record& record);

    [[nodiscard]] RecordKind lastKind() const noexcept { return last_; }
    [[nodiscard]] std::size_t recordsWritten() const noexcept { return written_; }

private:
    LineSink sink_;
    RecordKind last_{RecordKind::Version};
    std::size_t written_{0};
};

/**
 * Export file published atomically: nothing appears at the destination until commit().
 * Once a line fails to write, further add() calls and commit() return InvalidState and the
 * partial file is discarded.
 */
class BulkImportFile {
public:
    static Result<std::unique_ptr<BulkImportFile>> open(const std::filesystem::path& destPath);

    ~BulkImportFile();

    BulkImportFile(const BulkImportFile&) = delete;
    BulkImportFile& operator=(const BulkImportFile&) = delete;

    Result<void> add(const Record& record);
    Result<void> commit();

    [[nodiscard]] const std::filesystem::path& path() const noexcept;
    [[nodiscard]] std::size_t recordsWritten() const noexcept { return writer_.recordsWritten(); }

private:
    explicit BulkImportFile(std::unique_ptr<attachment::AtomicFileWriter> file);

    std::unique_ptr<attachment::AtomicFileWriter> file_;
    BulkImportWriter writer_;
    bool failed_{false};
};

} // namespace chatport::bulkimport

#include <chatport/attachment/atomic_file_writer.h>
#include <chatport/bulkimport/bulk_import_writer.h>

#include <spdlog/spdlog.h>

#include <ostream>

namespace chatport::bulkimport {

BulkImportWriter::BulkImportWriter(std::ostream& out)
    : sink_([&out](std::string_view line) -> Result<void> {
          out.write(line.data(), static_cast<std::streamsize>(line.size()));
          if (!out) {
              return Error{ErrorCode::IoError, "failed to write bulk import line"};
          }
          return {};
      }) {}

BulkImportWriter::BulkImportWriter(LineSink sink) : sink_(std::move(sink)) {}

Result<void> BulkImportWriter::add(const Record& record) {
    const RecordKind kind = kindOf(record);
    if (ordinalOf(kind) < ordinalOf(last_)) {
        return Error{ErrorCode::OrderingViolation,
                     fmt::format("container type {} must occur before {}", recordKindName(kind),
                                 recordKindName(last_))};
    }

    // Invalid UTF-8 in chat text becomes U+FFFD rather than failing the line
    std::string line =
        toJson(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line.push_back('\n');
    if (auto r = sink_(line); !r) {
        return r;
    }
    last_ = kind;
    ++written_;
    return {};
}

// ---- BulkImportFile ----

BulkImportFile::BulkImportFile(std::unique_ptr<attachment::AtomicFileWriter> file)
    : file_(std::move(file)), writer_([w = file_.get()](std::string_view line) {
          return w->write(line);
      }) {}

BulkImportFile::~BulkImportFile() = default;

Result<std::unique_ptr<BulkImportFile>>
BulkImportFile::open(const std::filesystem::path& destPath) {
    auto file = attachment::AtomicFileWriter::open(destPath);
    if (!file) {
        return file.error();
    }
    return std::unique_ptr<BulkImportFile>(new BulkImportFile(std::move(file).value()));
}

Result<void> BulkImportFile::add(const Record& record) {
    if (file_->committed()) {
        return Error{ErrorCode::InvalidState, "bulk import file already committed"};
    }
    if (failed_) {
        return Error{ErrorCode::InvalidState, "bulk import file has a failed write"};
    }
    auto r = writer_.add(record);
    if (!r && r.error().code != ErrorCode::OrderingViolation) {
        failed_ = true;
    }
    return r;
}

Result<void> BulkImportFile::commit() {
    if (file_->committed()) {
        return {};
    }
    if (failed_) {
        file_->abandon();
        return Error{ErrorCode::InvalidState,
                     "refusing to publish " + file_->path().string() + " after a failed write"};
    }
    if (auto r = file_->close(); !r) {
        return r;
    }
    spdlog::info("Wrote {} bulk import record(s) to {}", writer_.recordsWritten(),
                 file_->path().string());
    return {};
}

const std::filesystem::path& BulkImportFile::path() const noexcept {
    return file_->path();
}

} // namespace chatport::bulkimport

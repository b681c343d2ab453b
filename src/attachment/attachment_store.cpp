#include <chatport/attachment/attachment_store.h>
#include <chatport/attachment/media_type.h>
#include <chatport/crypto/hasher.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <system_error>
#include <vector>

namespace chatport::attachment {

namespace fs = std::filesystem;
using nlohmann::json;

AttachmentStore::AttachmentStore(AttachmentStoreConfig config) : config_(std::move(config)) {}

bool AttachmentStore::hasMapping(std::string_view key) const {
    std::shared_lock lk(mutex_);
    return entries_.find(std::string(key)) != entries_.end();
}

fs::path AttachmentStore::destinationFor(std::string_view key, std::string_view mediaType) const {
    std::string name = crypto::fingerprintForKey(key);
    if (auto ext = extensionForMediaType(mediaType); !ext.empty()) {
        name.push_back('.');
        name += ext;
    }
    return config_.basePath / name;
}

Result<std::unique_ptr<AtomicFileWriter>> AttachmentStore::reserveWrite(std::string_view key,
                                                                        std::string_view mediaType) {
    if (config_.basePath.empty()) {
        return Error{ErrorCode::InvalidState, "cannot write files, no base path set"};
    }

    const fs::path dest = destinationFor(key, mediaType);
    {
        std::unique_lock lk(mutex_);
        auto it = entries_.find(std::string(key));
        if (it != entries_.end()) {
            return Error{ErrorCode::AlreadyExists,
                         "key already mapped: " + std::string(key) + " -> " + it->second.string()};
        }

        if (!config_.overwrite) {
            std::error_code ec;
            auto st = fs::status(dest, ec);
            if (ec && ec != std::errc::no_such_file_or_directory) {
                return Error{ErrorCode::IoError,
                             "checking for " + dest.string() + ": " + ec.message()};
            }
            if (fs::exists(st)) {
                entries_.emplace(std::string(key), dest);
                return Error{ErrorCode::AlreadyExists, "destination exists: " + dest.string()};
            }
        }

        entries_.emplace(std::string(key), dest);
    }

    auto writer = AtomicFileWriter::open(dest);
    if (!writer) {
        std::unique_lock lk(mutex_);
        entries_.erase(std::string(key));
        return writer.error();
    }
    return std::move(writer).value();
}

void AttachmentStore::releaseClaim(std::string_view key) {
    std::unique_lock lk(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return;
    }
    std::error_code ec;
    if (fs::exists(it->second, ec)) {
        return;
    }
    spdlog::debug("Releasing claim for {} ({} was never written)", key, it->second.string());
    entries_.erase(it);
}

std::optional<fs::path> AttachmentStore::getPath(std::string_view key) const {
    std::shared_lock lk(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<fs::path> AttachmentStore::scanForKey(std::string_view key) {
    if (auto path = getPath(key)) {
        return *path;
    }

    if (config_.basePath.empty()) {
        return Error{ErrorCode::NotFound, "no base path to scan for " + std::string(key)};
    }

    // <hash> or <hash>.<ext>
    const std::string hash = crypto::fingerprintForKey(key);
    std::vector<fs::path> matches;

    std::error_code ec;
    fs::directory_iterator it(config_.basePath, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return Error{ErrorCode::NotFound, "base path does not exist"};
        }
        return Error{ErrorCode::IoError,
                     "failed to scan " + config_.basePath.string() + ": " + ec.message()};
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Error{ErrorCode::IoError,
                         "failed to scan " + config_.basePath.string() + ": " + ec.message()};
        }
        const std::string name = it->path().filename().string();
        if (name == hash || (name.size() > hash.size() && name.compare(0, hash.size(), hash) == 0 &&
                             name[hash.size()] == '.')) {
            matches.push_back(it->path());
        }
    }
    if (ec) {
        return Error{ErrorCode::IoError,
                     "failed to scan " + config_.basePath.string() + ": " + ec.message()};
    }

    if (matches.empty()) {
        return Error{ErrorCode::NotFound, "no stored file for " + std::string(key)};
    }
    std::sort(matches.begin(), matches.end());

    std::unique_lock lk(mutex_);
    auto [pos, inserted] = entries_.emplace(std::string(key), matches.front());
    if (inserted) {
        spdlog::debug("Recovered {} from disk: {}", key, pos->second.string());
    }
    return pos->second;
}

Result<void> AttachmentStore::loadSnapshot(const json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidData, "attachment snapshot is not a JSON object"};
    }
    auto field = doc.find(kSnapshotEntriesField);
    if (field == doc.end()) {
        field = doc.find("entries");
    }
    if (field == doc.end() || field->is_null()) {
        return {};
    }
    if (!field->is_object()) {
        return Error{ErrorCode::InvalidData, "attachment snapshot entries must be an object"};
    }

    std::size_t loaded = 0;
    for (auto it = field->begin(); it != field->end(); ++it) {
        if (!it.value().is_string()) {
            spdlog::warn("Entry for {} is not a path; discarding", it.key());
            continue;
        }
        fs::path path = it.value().get<std::string>();

        std::error_code ec;
        auto st = fs::status(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return Error{ErrorCode::IoError, "failed to stat key " + it.key() + ", path " +
                                                 path.string() + ": " + ec.message()};
        }
        if (!fs::exists(st)) {
            spdlog::warn("Entry for {} does not exist; discarding: {}", it.key(), path.string());
            continue;
        }

        std::unique_lock lk(mutex_);
        auto [pos, inserted] = entries_.emplace(it.key(), path);
        if (!inserted && pos->second != path) {
            spdlog::debug("Keeping existing mapping for {} ({}), snapshot had {}", it.key(),
                          pos->second.string(), path.string());
        }
        ++loaded;
    }
    spdlog::debug("Loaded {} attachment mapping(s) from snapshot", loaded);
    return {};
}

json AttachmentStore::saveSnapshot() const {
    json entries = json::object();
    {
        std::shared_lock lk(mutex_);
        for (const auto& [key, path] : entries_) {
            entries[key] = path.string();
        }
    }
    json doc = json::object();
    doc[kSnapshotEntriesField] = std::move(entries);
    return doc;
}

Result<void> AttachmentStore::loadSnapshotFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return Error{ErrorCode::IoError, "could not stat " + path.string() + ": " + ec.message()};
        }
        return {};
    }

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::IoError, "could not open " + path.string()};
    }
    json doc = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::InvalidData, "malformed attachment snapshot: " + path.string()};
    }
    return loadSnapshot(doc);
}

Result<void> AttachmentStore::saveSnapshotFile(const fs::path& path) const {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "could not create " + path.parent_path().string() + ": " + ec.message()};
        }
    }

    auto writer = AtomicFileWriter::open(path);
    if (!writer) {
        return writer.error();
    }
    auto& w = writer.value();
    // Keys are arbitrary chat data; invalid UTF-8 is written as U+FFFD
    const std::string text = saveSnapshot().dump(2, ' ', false, json::error_handler_t::replace);
    if (auto r = w->write(text + "\n"); !r) {
        return r;
    }
    return w->close();
}

std::size_t AttachmentStore::removeStaleTempFiles() {
    if (config_.basePath.empty()) {
        return 0;
    }

    std::size_t removed = 0;
    std::error_code ec;
    for (fs::directory_iterator it(config_.basePath, ec), end; !ec && it != end;
         it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.compare(0, kTempFilePrefix.size(), kTempFilePrefix) != 0) {
            continue;
        }
        std::error_code rm;
        if (fs::remove(it->path(), rm)) {
            ++removed;
        } else if (rm) {
            spdlog::warn("Failed to remove stale temporary file {}: {}", it->path().string(),
                         rm.message());
        }
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        spdlog::warn("Could not scan {} for temporary files: {}", config_.basePath.string(),
                     ec.message());
    }
    if (removed > 0) {
        spdlog::info("Removed {} stale temporary file(s) from {}", removed,
                     config_.basePath.string());
    }
    return removed;
}

std::size_t AttachmentStore::size() const {
    std::shared_lock lk(mutex_);
    return entries_.size();
}

} // namespace chatport::attachment

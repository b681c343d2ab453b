#pragma once

#include <chatport/attachment/atomic_file_writer.h>
#include <chatport/core/types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace chatport::attachment {

struct AttachmentStoreConfig {
    // Directory artifacts are written to. Empty: the store can only hold mappings.
    std::filesystem::path basePath;
    // When false, an existing file at the destination is never replaced.
    bool overwrite{false};
};

/**
 * Content-addressed attachment store.
 *
 * Maps logical keys to files named after the key's fingerprint under basePath. A key is claimed
 * in the index before any I/O happens, so concurrent callers can never both write the same key.
 * Recorded mappings are immutable for the lifetime of the store. All methods are thread-safe.
 */
class AttachmentStore {
public:
    explicit AttachmentStore(AttachmentStoreConfig config);

    AttachmentStore(const AttachmentStore&) = delete;
    AttachmentStore& operator=(const AttachmentStore&) = delete;

    [[nodiscard]] bool hasMapping(std::string_view key) const;

    /**
     * Claim key and open a writer for basePath/<fingerprint>[.ext].
     *
     * Fails with AlreadyExists when the key is already claimed, or when overwrite is disabled
     * and the destination already exists (the key is then mapped to that file). A stat error
     * other than "not found" yields IoError and claims nothing. If the writer cannot be
     * created the claim is released again.
     */
    Result<std::unique_ptr<AtomicFileWriter>> reserveWrite(std::string_view key,
                                                           std::string_view mediaType);

    // Drop a claim whose destination was never published. Published mappings are kept.
    void releaseClaim(std::string_view key);

    [[nodiscard]] std::optional<std::filesystem::path> getPath(std::string_view key) const;

    /**
     * Resolve key, rediscovering artifacts from earlier runs by content address when the
     * index has no entry. Returns NotFound when nothing matches.
     */
    Result<std::filesystem::path> scanForKey(std::string_view key);

    // Merge a snapshot document; entries whose file is gone are dropped with a warning.
    Result<void> loadSnapshot(const nlohmann::json& doc);
    [[nodiscard]] nlohmann::json saveSnapshot() const;

    // File variants. A missing snapshot file loads as empty; saves are atomic.
    Result<void> loadSnapshotFile(const std::filesystem::path& path);
    Result<void> saveSnapshotFile(const std::filesystem::path& path) const;

    // Remove temporary files left behind by interrupted writers. Returns the count removed.
    std::size_t removeStaleTempFiles();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const AttachmentStoreConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::filesystem::path destinationFor(std::string_view key,
                                                       std::string_view mediaType) const;

private:
    AttachmentStoreConfig config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::filesystem::path> entries_;
};

// Top-level field of the snapshot document.
inline constexpr const char* kSnapshotEntriesField = "Entries";

} // namespace chatport::attachment

#pragma once

#include <chatport/config/migrate_config.h>
#include <chatport/core/types.h>
#include <chatport/downloader/downloader.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace chatport::cli {

// One attachment to fetch: logical key and candidate URLs in preference order
struct DownloadItem {
    std::string key;
    std::vector<std::string> urls;
};

/**
 * Parse a download list: [{"key": "...", "urls": ["...", ...]}, ...].
 * Entries without a key are an InvalidData error naming the entry index.
 */
Result<std::vector<DownloadItem>> parseDownloadList(const nlohmann::json& doc);
Result<std::vector<DownloadItem>> loadDownloadList(const std::filesystem::path& path);

struct DownloadAttachmentsRun {
    config::MigrateConfig config;
    std::filesystem::path listPath;
    std::filesystem::path cookiePath; // empty = no cookies
};

/**
 * Fetch every listed attachment into config.attachmentPath and record the key -> file mapping
 * in config.snapshotPath.
 *
 * The previous snapshot is loaded first unless config.overwrite is set; the snapshot is
 * checkpointed every config.flushInterval submissions and written once more after all fetches
 * have finished. Per-item download failures are logged and counted, not returned.
 */
Result<downloader::DownloadStats>
runDownloadAttachments(const DownloadAttachmentsRun& run,
                       std::unique_ptr<downloader::IHttpAdapter> http = nullptr);

} // namespace chatport::cli

#pragma once

#include <chatport/core/types.h>
#include <chatport/downloader/downloader.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace chatport::config {

/**
 * Settings for an attachment migration run.
 *
 * Precedence: environment (CHATPORT_ATTACHMENT_PATH, CHATPORT_LOG_LEVEL), then the config
 * file, then these defaults. Command-line flags are applied on top by the CLI.
 */
struct MigrateConfig {
    // [storage]
    std::filesystem::path attachmentPath;
    bool overwrite{false};
    std::filesystem::path snapshotPath;

    // [downloader]
    downloader::DownloaderConfig downloader;

    // [snapshot] checkpoint the store every N submitted items
    std::size_t flushInterval{100};

    // [logging] trace, debug, info, warn, error, critical, off
    std::string logLevel{"info"};
};

/**
 * Load settings from a TOML config file. A missing file yields the defaults; a value that
 * does not parse is an InvalidData error naming the section and key.
 */
Result<MigrateConfig> loadMigrateConfig(const std::filesystem::path& path);

} // namespace chatport::config

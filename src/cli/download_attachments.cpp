#include <chatport/attachment/attachment_store.h>
#include <chatport/cli/download_attachments.h>
#include <chatport/downloader/cookie_jar.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace chatport::cli {

namespace fs = std::filesystem;
using nlohmann::json;

Result<std::vector<DownloadItem>> parseDownloadList(const json& doc) {
    if (!doc.is_array()) {
        return Error{ErrorCode::InvalidData, "download list must be a JSON array"};
    }

    std::vector<DownloadItem> items;
    items.reserve(doc.size());
    for (std::size_t i = 0; i < doc.size(); ++i) {
        const auto& entry = doc[i];
        if (!entry.is_object() || !entry.contains("key") || !entry["key"].is_string()) {
            return Error{ErrorCode::InvalidData,
                         "download list entry #" + std::to_string(i) + " has no key"};
        }

        DownloadItem item;
        item.key = entry["key"].get<std::string>();
        if (auto it = entry.find("urls"); it != entry.end() && !it->is_null()) {
            if (!it->is_array()) {
                return Error{ErrorCode::InvalidData, "urls for " + item.key + " must be an array"};
            }
            for (const auto& url : *it) {
                if (!url.is_string()) {
                    return Error{ErrorCode::InvalidData,
                                 "urls for " + item.key + " must be strings"};
                }
                item.urls.push_back(url.get<std::string>());
            }
        }
        items.push_back(std::move(item));
    }
    return items;
}

Result<std::vector<DownloadItem>> loadDownloadList(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "could not open download list " + path.string()};
    }
    json doc = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::InvalidData, "malformed download list: " + path.string()};
    }
    return parseDownloadList(doc);
}

Result<downloader::DownloadStats>
runDownloadAttachments(const DownloadAttachmentsRun& run,
                       std::unique_ptr<downloader::IHttpAdapter> http) {
    const auto& cfg = run.config;
    if (cfg.attachmentPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "no attachment path configured"};
    }
    if (cfg.snapshotPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "no snapshot output path configured"};
    }

    auto items = loadDownloadList(run.listPath);
    if (!items) {
        return items.error();
    }

    auto dlConfig = cfg.downloader;
    if (!run.cookiePath.empty()) {
        auto cookies = downloader::loadCookieJar(run.cookiePath);
        if (!cookies) {
            spdlog::error("Could not load cookie jar from {}: {}", run.cookiePath.string(),
                          cookies.error().message);
            return cookies.error();
        }
        dlConfig.cookies = std::move(cookies).value();
    }

    auto store = std::make_shared<attachment::AttachmentStore>(
        attachment::AttachmentStoreConfig{cfg.attachmentPath, cfg.overwrite});

    if (!cfg.overwrite) {
        if (auto r = store->loadSnapshotFile(cfg.snapshotPath); !r) {
            spdlog::error("Could not load attachments from {}: {}", cfg.snapshotPath.string(),
                          r.error().message);
            return r.error();
        }
        spdlog::info("Loaded {} attachment mapping(s) from {}", store->size(),
                     cfg.snapshotPath.string());
    }

    std::error_code ec;
    fs::create_directories(cfg.attachmentPath, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "could not create attachment path " +
                                             cfg.attachmentPath.string() + ": " + ec.message()};
    }
    store->removeStaleTempFiles();

    auto flushSnapshot = [&]() -> Result<void> {
        auto r = store->saveSnapshotFile(cfg.snapshotPath);
        if (!r) {
            spdlog::error("Failed to flush attachments to {}: {}", cfg.snapshotPath.string(),
                          r.error().message);
        }
        return r;
    };

    downloader::DownloadStats stats;
    {
        downloader::AttachmentDownloader downloads(store, std::move(dlConfig), std::move(http));

        std::size_t added = 0;
        std::size_t nextFlush = cfg.flushInterval;
        for (auto& item : items.value()) {
            if (downloads.submit(item.key, std::move(item.urls))) {
                ++added;
            }
            if (cfg.flushInterval > 0 && added > nextFlush) {
                if (auto r = flushSnapshot(); !r) {
                    downloads.cancel();
                    return r.error();
                }
                nextFlush = added + cfg.flushInterval;
            }
        }

        spdlog::info("Waiting for attachments to download...");
        downloads.awaitIdle();
        stats = downloads.stats();
    }

    if (auto r = flushSnapshot(); !r) {
        return r.error();
    }

    spdlog::info("Finished: {} stored, {} already present, {} skipped, {} failed", stats.stored,
                 stats.alreadyPresent, stats.skipped, stats.failed);
    return stats;
}

} // namespace chatport::cli

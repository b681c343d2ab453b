#include <chatport/config/config_helpers.h>
#include <chatport/config/migrate_config.h>

#include <spdlog/spdlog.h>

#include <system_error>

namespace chatport::config {

namespace {

Error badValue(const std::string& section, const std::string& key, const std::string& raw) {
    return Error{ErrorCode::InvalidData,
                 "invalid value for [" + section + "] " + key + ": \"" + raw + "\""};
}

// Reads one key; leaves `out` untouched when the key is absent
template <typename T, typename Parse>
Result<void> readKey(const std::filesystem::path& path, const std::string& section,
                     const std::string& key, T& out, Parse parse) {
    const std::string raw = parse_config_value(path, section, key);
    if (raw.empty()) {
        return {};
    }
    auto v = parse(raw);
    if (!v) {
        return badValue(section, key, raw);
    }
    out = *v;
    return {};
}

} // namespace

Result<MigrateConfig> loadMigrateConfig(const std::filesystem::path& path) {
    MigrateConfig cfg;

    std::error_code ec;
    const bool present = !path.empty() && std::filesystem::exists(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "could not stat " + path.string() + ": " + ec.message()};
    }

    if (present) {
        spdlog::debug("Loading configuration from {}", path.string());

        if (auto v = parse_config_value(path, "storage", "attachment_path"); !v.empty())
            cfg.attachmentPath = expand_tilde(v);
        if (auto v = parse_config_value(path, "storage", "snapshot_path"); !v.empty())
            cfg.snapshotPath = expand_tilde(v);

        auto& dl = cfg.downloader;
        auto size = [](const std::string& s) { return parse_integer<std::size_t>(s); };
        auto positiveSize = [](const std::string& s) -> std::optional<std::size_t> {
            auto v = parse_integer<std::size_t>(s);
            if (!v || *v == 0)
                return std::nullopt;
            return v;
        };
        auto ms = [](const std::string& s) { return parse_ms(s); };
        auto attempts = [](const std::string& s) -> std::optional<int> {
            auto v = parse_integer<int>(s);
            if (!v || *v < 0)
                return std::nullopt;
            return v;
        };

        for (auto r : {readKey(path, "storage", "overwrite", cfg.overwrite, parse_bool),
                       readKey(path, "downloader", "concurrency", dl.concurrency, positiveSize),
                       readKey(path, "downloader", "copy_buffer_bytes", dl.copyBufferBytes,
                               positiveSize),
                       readKey(path, "downloader", "request_timeout_ms", dl.requestTimeout, ms),
                       readKey(path, "downloader", "retry_min_wait_ms", dl.retry.minWait, ms),
                       readKey(path, "downloader", "retry_max_wait_ms", dl.retry.maxWait, ms),
                       readKey(path, "downloader", "retry_max_attempts", dl.retry.maxRetries,
                               attempts),
                       readKey(path, "downloader", "item_deadline_ms", dl.retry.itemDeadline, ms),
                       readKey(path, "snapshot", "flush_interval", cfg.flushInterval, size)}) {
            if (!r) {
                return r.error();
            }
        }

        if (auto raw = parse_config_value(path, "downloader", "retry_statuses"); !raw.empty()) {
            for (const auto& item : parse_list(raw)) {
                auto status = parse_integer<long>(item);
                if (!status || *status < 100 || *status > 599) {
                    return badValue("downloader", "retry_statuses", raw);
                }
                dl.retry.retryStatuses.push_back(*status);
            }
        }

        if (auto v = parse_config_value(path, "logging", "level"); !v.empty())
            cfg.logLevel = v;
    }

    if (const char* env = std::getenv("CHATPORT_ATTACHMENT_PATH"); env && *env) {
        cfg.attachmentPath = expand_tilde(env);
    }
    if (const char* env = std::getenv("CHATPORT_LOG_LEVEL"); env && *env) {
        cfg.logLevel = env;
    }

    if (cfg.downloader.retry.maxWait < cfg.downloader.retry.minWait) {
        spdlog::warn("retry_max_wait_ms is below retry_min_wait_ms; using {} ms as the ceiling",
                     cfg.downloader.retry.minWait.count());
        cfg.downloader.retry.maxWait = cfg.downloader.retry.minWait;
    }
    return cfg;
}

} // namespace chatport::config

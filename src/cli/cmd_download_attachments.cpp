/*
 * chatport/src/cli/cmd_download_attachments.cpp
 *
 * `chatport download-attachments`
 * - Settings: --config file (or $CHATPORT_CONFIG / XDG default), then command-line flags
 * - Structural failures (bad list, unreadable snapshot, snapshot write failure) exit with 1
 * - Per-item download failures are logged and summarized; they do not change the exit code
 */

#include <chatport/cli/commands.h>
#include <chatport/cli/download_attachments.h>
#include <chatport/config/config_helpers.h>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace chatport::cli {

namespace {

struct DownloadAttachmentsOpts {
    fs::path listPath;
    std::optional<fs::path> attachmentPath;
    std::optional<fs::path> outPath;
    fs::path cookiePath;
    std::string configPath;
    std::optional<std::size_t> concurrency;
    bool overwrite{false};
    bool verbose{false};
    bool quiet{false};
};

void applyLogLevel(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
}

} // namespace

void registerDownloadAttachmentsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand(
        "download-attachments",
        "Download the listed attachments into a content-addressed directory and record the "
        "key -> file mapping in a JSON snapshot.");

    auto opts = std::make_shared<DownloadAttachmentsOpts>();

    sub->add_option("--list", opts->listPath,
                    "Download list: JSON array of {\"key\": ..., \"urls\": [...]}.")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_option("--attachment-path", opts->attachmentPath,
                    "Directory to store attachments in (overrides [storage] attachment_path).");
    sub->add_option("--out", opts->outPath,
                    "Attachment snapshot JSON file (overrides [storage] snapshot_path).");
    sub->add_option("--cookie-path", opts->cookiePath,
                    "Cookie jar: 'name=value; ...' text, or a JSON array when named *.json.")
        ->check(CLI::ExistingFile);
    sub->add_flag("--overwrite", opts->overwrite, "Ignore existing download state.");
    sub->add_option("-c,--concurrency", opts->concurrency,
                    "Parallel downloads (default 5, or [downloader] concurrency).")
        ->check(CLI::Range(1, 64));
    sub->add_option("--config", opts->configPath, "Config file (default: $CHATPORT_CONFIG or "
                                                  "~/.config/chatport/config.toml).");
    sub->add_flag("-v,--verbose", opts->verbose, "Enable debug logging.");
    sub->add_flag("-q,--quiet", opts->quiet, "Only log warnings and errors.");

    sub->callback([opts]() {
        const auto configPath = config::get_config_path(opts->configPath);
        auto loaded = config::loadMigrateConfig(configPath);
        if (!loaded) {
            spdlog::error("Invalid configuration {}: {}", configPath.string(),
                          loaded.error().message);
            throw CLI::RuntimeError(1);
        }

        DownloadAttachmentsRun run;
        run.config = std::move(loaded).value();
        run.listPath = opts->listPath;
        run.cookiePath = opts->cookiePath;
        if (opts->attachmentPath)
            run.config.attachmentPath = *opts->attachmentPath;
        if (opts->outPath)
            run.config.snapshotPath = *opts->outPath;
        if (opts->concurrency)
            run.config.downloader.concurrency = *opts->concurrency;
        if (opts->overwrite)
            run.config.overwrite = true;

        if (opts->verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else if (opts->quiet) {
            spdlog::set_level(spdlog::level::warn);
        } else {
            applyLogLevel(run.config.logLevel);
        }

        if (run.config.attachmentPath.empty()) {
            throw CLI::ValidationError("download-attachments",
                                       "--attachment-path (or [storage] attachment_path) is required.");
        }
        if (run.config.snapshotPath.empty()) {
            throw CLI::ValidationError("download-attachments",
                                       "--out (or [storage] snapshot_path) is required.");
        }

        auto result = runDownloadAttachments(run);
        if (!result) {
            spdlog::error("download-attachments failed: {}", result.error().message);
            throw CLI::RuntimeError(1);
        }
        if (result.value().failed > 0) {
            spdlog::warn("{} attachment(s) could not be downloaded", result.value().failed);
        }
    });

    sub->footer(R"(Behavior:
  - Files are named by the SHA-256 of the key, plus an extension from the media type.
  - Keys already in the snapshot, or already on disk, are not downloaded again.
  - Files are written to a temporary name and renamed into place when complete.
  - Transient failures (timeouts, 429, 5xx) are retried with exponential backoff.)");
}

} // namespace chatport::cli

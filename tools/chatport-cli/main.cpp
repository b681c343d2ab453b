#include <chatport/cli/commands.h>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char* argv[]) {
    // Logs go to stderr so stdout stays clean for piping
    auto logger = spdlog::stderr_color_mt("chatport");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    CLI::App app{"Chat archive migration tools", "chatport"};
    app.require_subcommand(1);

    chatport::cli::registerDownloadAttachmentsCommand(app);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}

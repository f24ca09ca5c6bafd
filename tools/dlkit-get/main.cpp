#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <dlkit/cli/cmd_get.h>

#include <exception>

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"dlkit-get - concurrent HTTP downloads with atomic publish"};
        app.require_subcommand(1);

        int exitCode = 0;
        dlkit::cli::registerGetCommand(app, exitCode);

        CLI11_PARSE(app, argc, argv);
        return exitCode;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

#include "deepseek/cli/app.hpp"
#include "deepseek/cli/commands.hpp"

// Version string; injected by CMake via -DDEEPSEEK_VERSION_STRING=...
#ifndef DEEPSEEK_VERSION_STRING
#define DEEPSEEK_VERSION_STRING "0.1.0-dev"
#endif

namespace deepseek::cli {

App::App()
    : cli_("deepseek-host", "Command-line host for the DeepSeek chat plugin")
{
    cli_.set_version_flag("--version", DEEPSEEK_VERSION_STRING,
                          "Display version information");

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("DEEPSEEK_LOG_LEVEL")
        ->default_val("info");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // The selected subcommand's callback has already been invoked by
    // CLI11's parse(). Return 0 to indicate success.
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

void App::setup_commands() {
    register_chat_command(cli_, log_level_);
    register_config_command(cli_, log_level_);
    register_version_command(cli_);
}

} // namespace deepseek::cli

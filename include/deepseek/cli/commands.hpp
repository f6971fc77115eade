#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace deepseek::cli {

/// Register the `chat` subcommand.
/// Loads the plugin library, sends one message and prints the streamed reply.
void register_chat_command(CLI::App& app, const std::string& log_level);

/// Register the `config` subcommand.
/// Prints the plugin's configuration file with secrets redacted.
void register_config_command(CLI::App& app, const std::string& log_level);

/// Register the `version` subcommand.
/// Prints the build version and exits.
void register_version_command(CLI::App& app);

/// Recursively replaces non-empty secret values (api_key, token, ...)
/// with "***REDACTED***".
void redact_config_json(nlohmann::json& j);

} // namespace deepseek::cli

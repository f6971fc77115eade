#include "deepseek/core/config.hpp"
#include "deepseek/core/logger.hpp"
#include "deepseek/core/utils.hpp"
#include "deepseek/infra/toml.hpp"

#include <cstdlib>
#include <fstream>

namespace deepseek {

void to_json(json& j, const ConfigFile& c) {
    j = json::object();
    j["plugin"] = c.plugin.is_object() ? c.plugin : json::object();
    if (c.user.has_value()) {
        j["user"] = *c.user;
    }
}

void from_json(const json& j, ConfigFile& c) {
    c.plugin = j.value("plugin", json::object());
    if (j.contains("user")) {
        c.user = j.at("user").get<UserConfig>();
    } else {
        c.user.reset();
    }
}

ConfigManager::ConfigManager(std::filesystem::path config_path)
    : config_path_(std::move(config_path)) {}

auto ConfigManager::from_env() -> ConfigManager {
    if (auto* val = std::getenv("DEEPSEEK_PLUGIN_CONFIG"); val && *val) {
        return ConfigManager(val);
    }
    return ConfigManager(std::filesystem::path(kDefaultConfigFile));
}

auto ConfigManager::load_config() const -> Result<ConfigFile> {
    if (!std::filesystem::exists(config_path_)) {
        return std::unexpected(make_error(
            ErrorCode::NotFound,
            "Config file not found: " + config_path_.string()));
    }

    auto doc = infra::toml::parse_file(config_path_);
    if (!doc) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Failed to parse " + config_path_.string(),
            doc.error().what()));
    }

    if (doc->contains("plugin") && !(*doc)["plugin"].is_object()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Invalid configuration in " + config_path_.string(),
            "'plugin' must be a table"));
    }

    try {
        return doc->get<ConfigFile>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Invalid configuration in " + config_path_.string(),
            e.what()));
    }
}

auto ConfigManager::load_user_config() const -> UserConfig {
    auto config = load_config();
    if (!config) {
        LOG_WARN("Failed to load user config: {}", config.error().what());
        return UserConfig{};
    }

    if (!config->user.has_value()) {
        LOG_INFO("No user configuration found, using defaults");
        return UserConfig{};
    }

    LOG_INFO("Loaded user configuration from {}", config_path_.string());
    return *config->user;
}

auto ConfigManager::save_user_config(std::string_view api_key,
                                     std::string_view api_url) const -> VoidResult {
    ConfigFile config;
    if (auto existing = load_config(); existing.has_value()) {
        config = std::move(*existing);
    } else {
        config.user = UserConfig{};
    }

    UserConfig user = config.user.value_or(UserConfig{});
    user.api_key = utils::is_blank(api_key)
        ? std::nullopt : std::optional<std::string>(api_key);
    user.api_url = utils::is_blank(api_url)
        ? std::nullopt : std::optional<std::string>(api_url);
    config.user = std::move(user);

    auto text = infra::toml::dump(json(config));
    if (!text) {
        LOG_ERROR("Failed to serialize config: {}", text.error().what());
        return std::unexpected(text.error());
    }

    std::ofstream file(config_path_, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        LOG_ERROR("Failed to save config to {}: cannot open file", config_path_.string());
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Failed to save config",
            config_path_.string()));
    }
    file << *text;
    file.close();
    if (!file) {
        LOG_ERROR("Failed to save config to {}: write error", config_path_.string());
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Failed to write config",
            config_path_.string()));
    }

    LOG_INFO("User configuration saved successfully to {}", config_path_.string());
    return {};
}

} // namespace deepseek

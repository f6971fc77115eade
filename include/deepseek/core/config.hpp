#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "deepseek/core/error.hpp"

// std::optional serializer for nlohmann/json: lets the NLOHMANN_DEFINE
// macros handle optional fields (absent or null -> nullopt).
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace deepseek {

using json = nlohmann::json;

inline constexpr std::string_view kDefaultApiUrl =
    "https://api.deepseek.com/v1/chat/completions";
inline constexpr std::string_view kDefaultModel = "deepseek-chat";
inline constexpr std::string_view kDefaultConfigFile = "user.toml";

/// The `[user]` table of the plugin configuration file.
struct UserConfig {
    std::optional<std::string> api_key;
    std::optional<std::string> api_url = std::string(kDefaultApiUrl);
    std::optional<std::string> model;
    std::optional<int> history_limit;  // unset = send the whole completed history
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(UserConfig, api_key, api_url, model, history_limit)

/// The whole configuration file. `plugin` is owned by the host and kept as-is.
struct ConfigFile {
    json plugin = json::object();
    std::optional<UserConfig> user;
};

void to_json(json& j, const ConfigFile& c);
void from_json(const json& j, ConfigFile& c);

/// Reads and writes the TOML configuration file of one plugin instance.
class ConfigManager {
public:
    explicit ConfigManager(std::filesystem::path config_path);

    /// Uses $DEEPSEEK_PLUGIN_CONFIG when set, otherwise `user.toml`.
    static auto from_env() -> ConfigManager;

    /// Parses the whole file.
    [[nodiscard]] auto load_config() const -> Result<ConfigFile>;

    /// Returns the `[user]` table, or the defaults when the file is missing,
    /// unreadable, or has no `[user]` table.
    [[nodiscard]] auto load_user_config() const -> UserConfig;

    /// Stores the key and URL in the `[user]` table. Blank values are
    /// written as absent; every other part of the file is preserved.
    auto save_user_config(std::string_view api_key, std::string_view api_url) const
        -> VoidResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return config_path_; }

private:
    std::filesystem::path config_path_;
};

} // namespace deepseek

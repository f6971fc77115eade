#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "deepseek/api/client.hpp"
#include "deepseek/core/config.hpp"
#include "deepseek/infra/runtime.hpp"
#include "deepseek/plugins/handler.hpp"

namespace deepseek {

/// DeepSeek chat plugin.
///
/// Keeps the user's API key and endpoint in the plugin's TOML config file
/// and answers every message by streaming a chat completion back to the
/// host. Requests run on a private runtime so the host thread never blocks.
class DeepSeekPlugin : public plugins::PluginHandler {
public:
    DeepSeekPlugin();
    explicit DeepSeekPlugin(ConfigManager config_manager);
    ~DeepSeekPlugin() override;

    DeepSeekPlugin(const DeepSeekPlugin&) = delete;
    DeepSeekPlugin& operator=(const DeepSeekPlugin&) = delete;

    auto on_mount(const plugins::PluginContext& ctx) -> VoidResult override;
    auto on_dispose(const plugins::PluginContext& ctx) -> VoidResult override;
    auto on_connect(const plugins::PluginContext& ctx) -> VoidResult override;
    auto on_disconnect(const plugins::PluginContext& ctx) -> VoidResult override;

    auto handle_message(std::string_view message, plugins::PluginContext ctx)
        -> Result<std::string> override;

    auto update_setting(std::string_view key, std::string_view value)
        -> VoidResult override;
    [[nodiscard]] auto setting(std::string_view key) const
        -> Result<std::string> override;
    [[nodiscard]] auto status() const -> std::string override;

    /// Number of streaming requests still running.
    [[nodiscard]] auto pending_requests() const -> std::size_t;

    static constexpr auto kShutdownTimeout = std::chrono::milliseconds(100);

private:
    void load_user_config();

    /// Persists key and URL, then replaces the API client. Requires mtx_.
    void apply_config();

    mutable std::mutex mtx_;
    std::string api_key_;
    std::string api_url_ = std::string(kDefaultApiUrl);
    std::string model_ = std::string(kDefaultModel);
    std::optional<int> history_limit_;

    // Requests in flight keep the client they started with.
    std::shared_ptr<api::ApiClient> api_client_;
    std::unique_ptr<infra::Runtime> runtime_;
    ConfigManager config_manager_;
};

} // namespace deepseek

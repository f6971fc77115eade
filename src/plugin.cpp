#include "deepseek/plugin.hpp"

#include "deepseek/core/logger.hpp"
#include "deepseek/core/utils.hpp"
#include "deepseek/history/processor.hpp"

namespace deepseek {

namespace {

/// Completed history (optionally only the most recent `limit` records)
/// followed by the new user message.
auto build_messages(const plugins::PluginContext& ctx, std::string message,
                    std::optional<int> limit) -> std::vector<ChatMessage> {
    std::vector<ChatMessage> messages;

    if (const auto& history = ctx.history()) {
        if (limit && *limit >= 0) {
            messages = history::HistoryProcessor::extract_recent_completed_messages(
                *history, static_cast<std::size_t>(*limit));
        } else {
            messages = history::HistoryProcessor::extract_completed_messages(*history);
        }
        LOG_INFO("Loaded {} completed historical messages", messages.size());
    } else {
        LOG_INFO("No history available");
    }

    messages.push_back(ChatMessage::user(std::move(message)));
    return messages;
}

} // anonymous namespace

DeepSeekPlugin::DeepSeekPlugin()
    : DeepSeekPlugin(ConfigManager::from_env()) {}

DeepSeekPlugin::DeepSeekPlugin(ConfigManager config_manager)
    : config_manager_(std::move(config_manager)) {}

DeepSeekPlugin::~DeepSeekPlugin() {
    std::unique_ptr<infra::Runtime> runtime;
    {
        std::lock_guard lock(mtx_);
        runtime = std::move(runtime_);
    }
    if (runtime) {
        runtime->shutdown(kShutdownTimeout);
    }
}

void DeepSeekPlugin::load_user_config() {
    auto user = config_manager_.load_user_config();

    std::lock_guard lock(mtx_);
    if (user.api_key) {
        api_key_ = *user.api_key;
        LOG_INFO("Loaded API key from config");
    }
    if (user.api_url) {
        api_url_ = *user.api_url;
        LOG_INFO("Loaded API URL from config");
    }
    if (user.model && !utils::is_blank(*user.model)) {
        model_ = *user.model;
    }
    history_limit_ = user.history_limit;
}

void DeepSeekPlugin::apply_config() {
    if (auto saved = config_manager_.save_user_config(api_key_, api_url_); !saved) {
        LOG_WARN("Failed to save user config: {}", saved.error().what());
    }

    if (!runtime_) {
        LOG_DEBUG("Runtime not started yet, API client deferred");
        return;
    }
    api_client_ = std::make_shared<api::ApiClient>(
        runtime_->context(),
        api::ApiClientConfig{
            .api_key = api_key_,
            .api_url = api_url_,
            .model = model_,
        });
}

auto DeepSeekPlugin::on_mount(const plugins::PluginContext& ctx) -> VoidResult {
    Logger::init();
    if (ctx.host_log()) {
        Logger::attach_host_sink(ctx.host_log(), ctx.host_data());
    }

    const auto& metadata = ctx.metadata();
    LOG_INFO("[{}] Plugin mount successfully", metadata.name);
    LOG_INFO("Config Metadata: {}", metadata.describe());

    load_user_config();

    std::lock_guard lock(mtx_);
    if (!runtime_) {
        runtime_ = std::make_unique<infra::Runtime>();
        LOG_INFO("Runtime initialized successfully");
    }
    apply_config();
    return {};
}

auto DeepSeekPlugin::on_dispose(const plugins::PluginContext& ctx) -> VoidResult {
    LOG_INFO("Plugin disposed successfully. Metadata: {}", ctx.metadata().describe());

    std::unique_ptr<infra::Runtime> runtime;
    {
        std::lock_guard lock(mtx_);
        runtime = std::move(runtime_);
        api_client_.reset();
    }

    if (runtime) {
        if (runtime->shutdown(kShutdownTimeout)) {
            LOG_INFO("Runtime shutdown successfully");
        }
    } else {
        LOG_WARN("Runtime not initialized, cannot shutdown");
    }

    Logger::flush();
    Logger::detach_host_sink();
    return {};
}

auto DeepSeekPlugin::on_connect(const plugins::PluginContext& ctx) -> VoidResult {
    LOG_INFO("Plugin connect successfully. Metadata: {}", ctx.metadata().describe());

    std::lock_guard lock(mtx_);
    if (utils::is_blank(api_key_) || utils::is_blank(api_url_)) {
        LOG_WARN("API Key not configured, please set in plugin settings");
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "API Key not configured"));
    }
    return {};
}

auto DeepSeekPlugin::on_disconnect(const plugins::PluginContext& ctx) -> VoidResult {
    LOG_INFO("Plugin disconnect successfully. Metadata: {}", ctx.metadata().describe());
    return {};
}

auto DeepSeekPlugin::handle_message(std::string_view message, plugins::PluginContext ctx)
    -> Result<std::string> {
    LOG_INFO("Plugin Receive Message. Metadata: {}", ctx.metadata().describe());

    std::lock_guard lock(mtx_);
    if (utils::is_blank(api_key_)) {
        return std::unexpected(make_error(
            ErrorCode::Unauthorized, "Please set the API Key in the plugin settings first"));
    }
    if (!runtime_ || !api_client_) {
        return std::unexpected(make_error(ErrorCode::InternalError, "Runtime not initialized"));
    }

    auto sink = std::make_shared<plugins::PluginContext>(std::move(ctx));
    runtime_->spawn(
        [client = api_client_, sink, text = std::string(message), limit = history_limit_](
            std::stop_token stop) -> boost::asio::awaitable<void> {
            auto messages = build_messages(*sink, text, limit);
            LOG_INFO("Sending {} total messages to AI (including current message)",
                     messages.size());

            auto result = co_await client->send_streaming_request(
                std::move(messages), *sink, stop);
            if (!result) {
                LOG_ERROR("Failed to send streaming request: {}", result.error().what());
            }
        });

    return std::string("Processing your request...");
}

auto DeepSeekPlugin::update_setting(std::string_view key, std::string_view value)
    -> VoidResult {
    std::lock_guard lock(mtx_);
    if (key == "api_key") {
        api_key_ = std::string(value);
        LOG_INFO("API Key updated");
    } else if (key == "api_url") {
        api_url_ = std::string(value);
        LOG_INFO("API URL updated");
    } else {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Unknown setting", std::string(key)));
    }
    apply_config();
    return {};
}

auto DeepSeekPlugin::setting(std::string_view key) const -> Result<std::string> {
    std::lock_guard lock(mtx_);
    if (key == "api_key") return api_key_;
    if (key == "api_url") return api_url_;
    return std::unexpected(make_error(
        ErrorCode::InvalidArgument, "Unknown setting", std::string(key)));
}

auto DeepSeekPlugin::status() const -> std::string {
    std::lock_guard lock(mtx_);
    if (utils::is_blank(api_key_) || utils::is_blank(api_url_)) {
        return "Status: please set API Key and URL";
    }
    return "Status: configured, ready to chat";
}

auto DeepSeekPlugin::pending_requests() const -> std::size_t {
    std::lock_guard lock(mtx_);
    return runtime_ ? runtime_->in_flight() : 0;
}

} // namespace deepseek

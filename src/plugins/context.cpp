#include "deepseek/plugins/context.hpp"

#include <array>

#include "deepseek/core/utils.hpp"

namespace deepseek::plugins {

namespace {

auto copy_str(const char* s) -> std::string {
    return s ? std::string(s) : std::string{};
}

constexpr std::size_t kStreamIdBufLen = 128;

} // anonymous namespace

PluginContext::PluginContext(const DeepseekHostContext& raw)
    : host_data_(raw.host_data),
      stream_start_(raw.stream_start),
      stream_chunk_(raw.stream_chunk),
      stream_end_(raw.stream_end),
      log_(raw.log) {
    metadata_.id = copy_str(raw.metadata.id);
    metadata_.name = copy_str(raw.metadata.name);
    metadata_.version = copy_str(raw.metadata.version);
    if (raw.metadata.instance_id) {
        metadata_.instance_id = std::string(raw.metadata.instance_id);
    }

    if (raw.has_history) {
        std::vector<HistoryMessage> history;
        if (raw.history) {
            history.reserve(raw.history_len);
            for (size_t i = 0; i < raw.history_len; ++i) {
                const auto& m = raw.history[i];
                history.push_back(HistoryMessage{
                    .id = copy_str(m.id),
                    .role = copy_str(m.role),
                    .content = copy_str(m.content),
                    .status = copy_str(m.status),
                    .created_at = m.created_at,
                });
            }
        }
        history_ = std::move(history);
    }
}

auto PluginContext::from_raw(const DeepseekHostContext* raw) -> PluginContext {
    return raw ? PluginContext(*raw) : PluginContext();
}

auto PluginContext::start() -> Result<std::string> {
    if (!stream_start_) {
        return "stream_" + utils::generate_id();
    }

    std::array<char, kStreamIdBufLen> buf{};
    int rc = stream_start_(host_data_, buf.data(), buf.size());
    if (rc != DEEPSEEK_OK) {
        return std::unexpected(make_error(
            ErrorCode::PluginError,
            "Host refused to start stream",
            "status=" + std::to_string(rc)));
    }
    buf.back() = '\0';
    std::string id(buf.data());
    if (id.empty()) {
        return std::unexpected(make_error(
            ErrorCode::PluginError, "Host returned an empty stream id"));
    }
    return id;
}

auto PluginContext::send(std::string_view stream_id, std::string_view content,
                         bool is_final) -> VoidResult {
    if (!stream_chunk_) return {};

    std::string id(stream_id);
    std::string text(content);
    int rc = stream_chunk_(host_data_, id.c_str(), text.c_str(), is_final ? 1 : 0);
    switch (rc) {
        case DEEPSEEK_OK:
            return {};
        case DEEPSEEK_STREAM_CANCELLED:
            return std::unexpected(make_error(
                ErrorCode::StreamCancelled, "Stream cancelled by user", id));
        default:
            return std::unexpected(make_error(
                ErrorCode::PluginError,
                "Host rejected stream chunk",
                "status=" + std::to_string(rc)));
    }
}

auto PluginContext::end(std::string_view stream_id, bool success,
                        std::optional<std::string_view> error) -> VoidResult {
    if (!stream_end_) return {};

    std::string id(stream_id);
    std::optional<std::string> message;
    if (error) message = std::string(*error);

    int rc = stream_end_(host_data_, id.c_str(), success ? 1 : 0,
                         message ? message->c_str() : nullptr);
    if (rc != DEEPSEEK_OK) {
        return std::unexpected(make_error(
            ErrorCode::PluginError,
            "Host rejected stream end",
            "status=" + std::to_string(rc)));
    }
    return {};
}

} // namespace deepseek::plugins

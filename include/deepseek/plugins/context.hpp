#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "deepseek/api/client.hpp"
#include "deepseek/core/error.hpp"
#include "deepseek/core/logger.hpp"
#include "deepseek/core/types.hpp"
#include "deepseek/plugins/abi.h"

namespace deepseek::plugins {

/// Owning copy of a DeepseekHostContext.
///
/// Strings and history are copied out of the C structs, so a PluginContext
/// may outlive the ABI call that produced it (the streaming task keeps one).
/// Stream calls are forwarded to the host callbacks.
class PluginContext : public api::StreamSink {
public:
    PluginContext() = default;
    explicit PluginContext(const DeepseekHostContext& raw);

    /// Null-safe variant for ABI entry points.
    static auto from_raw(const DeepseekHostContext* raw) -> PluginContext;

    [[nodiscard]] auto metadata() const -> const PluginMetadata& { return metadata_; }

    /// nullopt when the host keeps no history for this instance.
    [[nodiscard]] auto history() const -> const std::optional<std::vector<HistoryMessage>>& {
        return history_;
    }

    [[nodiscard]] auto host_log() const -> HostLogFn { return log_; }
    [[nodiscard]] auto host_data() const -> void* { return host_data_; }

    auto start() -> Result<std::string> override;
    auto send(std::string_view stream_id, std::string_view content,
              bool is_final) -> VoidResult override;
    auto end(std::string_view stream_id, bool success,
             std::optional<std::string_view> error) -> VoidResult override;

private:
    void* host_data_ = nullptr;
    PluginMetadata metadata_;
    std::optional<std::vector<HistoryMessage>> history_;

    decltype(DeepseekHostContext::stream_start) stream_start_ = nullptr;
    decltype(DeepseekHostContext::stream_chunk) stream_chunk_ = nullptr;
    decltype(DeepseekHostContext::stream_end) stream_end_ = nullptr;
    HostLogFn log_ = nullptr;
};

} // namespace deepseek::plugins

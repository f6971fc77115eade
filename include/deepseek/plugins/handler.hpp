#pragma once

#include <string>
#include <string_view>

#include "deepseek/core/error.hpp"
#include "deepseek/plugins/context.hpp"

namespace deepseek::plugins {

/// Abstract base class for a plugin exposed through the C ABI.
///
/// Lifecycle, as driven by the host:
///   1. on_mount once the library is loaded.
///   2. on_connect / on_disconnect as the user enters and leaves the chat.
///   3. handle_message for every user message; the reply is streamed
///      through the context's StreamSink.
///   4. on_dispose before the library is unloaded.
class PluginHandler {
public:
    virtual ~PluginHandler() = default;

    virtual auto on_mount(const PluginContext& ctx) -> VoidResult = 0;
    virtual auto on_dispose(const PluginContext& ctx) -> VoidResult = 0;
    virtual auto on_connect(const PluginContext& ctx) -> VoidResult = 0;
    virtual auto on_disconnect(const PluginContext& ctx) -> VoidResult = 0;

    /// Returns the immediate reply shown to the user; the full answer
    /// arrives later on the stream.
    virtual auto handle_message(std::string_view message, PluginContext ctx)
        -> Result<std::string> = 0;

    virtual auto update_setting(std::string_view key, std::string_view value)
        -> VoidResult = 0;
    [[nodiscard]] virtual auto setting(std::string_view key) const
        -> Result<std::string> = 0;

    /// One-line human readable status.
    [[nodiscard]] virtual auto status() const -> std::string = 0;
};

} // namespace deepseek::plugins

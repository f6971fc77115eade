#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "deepseek/plugins/abi.h"
#include "deepseek/plugins/handler.hpp"

namespace deepseek::plugins {

/// Wraps a handler in the C ABI. The returned interface owns the handler;
/// release it with destroy_plugin_interface().
auto create_plugin_interface(std::unique_ptr<PluginHandler> handler)
    -> DeepseekPluginInterface*;

/// Destroys the handler and frees the interface. Null is a no-op.
void destroy_plugin_interface(DeepseekPluginInterface* iface);

/// Copies `text` into `buf`, truncating to fit and always NUL-terminating.
/// Returns the untruncated length.
auto copy_to_buffer(std::string_view text, char* buf, std::size_t len) -> std::size_t;

} // namespace deepseek::plugins

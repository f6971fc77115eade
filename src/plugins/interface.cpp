#include "deepseek/plugins/interface.hpp"

#include <algorithm>
#include <cstring>
#include <exception>

#include "deepseek/core/logger.hpp"

namespace deepseek::plugins {

namespace {

auto as_handler(void* plugin) -> PluginHandler* {
    return static_cast<PluginHandler*>(plugin);
}

auto report(const Error& err, char* buf, std::size_t len) -> int {
    copy_to_buffer(err.what(), buf, len);
    return err.code() == ErrorCode::StreamCancelled ? DEEPSEEK_STREAM_CANCELLED
                                                    : DEEPSEEK_ERROR;
}

auto report(const std::exception& e, char* buf, std::size_t len) -> int {
    LOG_ERROR("Unhandled exception at plugin boundary: {}", e.what());
    copy_to_buffer(e.what(), buf, len);
    return DEEPSEEK_ERROR;
}

auto report_unknown(char* buf, std::size_t len) -> int {
    LOG_ERROR("Unhandled non-standard exception at plugin boundary");
    copy_to_buffer("Unknown plugin error", buf, len);
    return DEEPSEEK_ERROR;
}

/// Runs one lifecycle hook, translating errors and exceptions to a status.
template <typename Fn>
auto guarded(void* plugin, char* buf, std::size_t len, Fn&& fn) -> int {
    if (!plugin) {
        copy_to_buffer("Plugin instance is null", buf, len);
        return DEEPSEEK_ERROR;
    }
    try {
        auto result = fn(*as_handler(plugin));
        if (!result) return report(result.error(), buf, len);
        return DEEPSEEK_OK;
    } catch (const std::exception& e) {
        return report(e, buf, len);
    } catch (...) {
        return report_unknown(buf, len);
    }
}

int on_mount(void* plugin, const DeepseekHostContext* ctx, char* err, size_t len) {
    return guarded(plugin, err, len, [ctx](PluginHandler& h) {
        return h.on_mount(PluginContext::from_raw(ctx));
    });
}

int on_dispose(void* plugin, const DeepseekHostContext* ctx, char* err, size_t len) {
    return guarded(plugin, err, len, [ctx](PluginHandler& h) {
        return h.on_dispose(PluginContext::from_raw(ctx));
    });
}

int on_connect(void* plugin, const DeepseekHostContext* ctx, char* err, size_t len) {
    return guarded(plugin, err, len, [ctx](PluginHandler& h) {
        return h.on_connect(PluginContext::from_raw(ctx));
    });
}

int on_disconnect(void* plugin, const DeepseekHostContext* ctx, char* err, size_t len) {
    return guarded(plugin, err, len, [ctx](PluginHandler& h) {
        return h.on_disconnect(PluginContext::from_raw(ctx));
    });
}

int handle_message(void* plugin, const char* message, const DeepseekHostContext* ctx,
                   char* out, size_t len) {
    return guarded(plugin, out, len, [&](PluginHandler& h) -> VoidResult {
        auto reply = h.handle_message(message ? message : "",
                                      PluginContext::from_raw(ctx));
        if (!reply) return std::unexpected(reply.error());
        copy_to_buffer(*reply, out, len);
        return {};
    });
}

int update_setting(void* plugin, const char* key, const char* value,
                   char* err, size_t len) {
    return guarded(plugin, err, len, [&](PluginHandler& h) {
        return h.update_setting(key ? key : "", value ? value : "");
    });
}

int get_setting(void* plugin, const char* key, char* out, size_t len) {
    return guarded(plugin, out, len, [&](PluginHandler& h) -> VoidResult {
        auto value = h.setting(key ? key : "");
        if (!value) return std::unexpected(value.error());
        copy_to_buffer(*value, out, len);
        return {};
    });
}

size_t get_status(void* plugin, char* out, size_t len) {
    if (!plugin) return copy_to_buffer("", out, len);
    try {
        return copy_to_buffer(as_handler(plugin)->status(), out, len);
    } catch (const std::exception& e) {
        report(e, out, len);
        return 0;
    } catch (...) {
        report_unknown(out, len);
        return 0;
    }
}

void destroy(void* plugin) {
    delete as_handler(plugin);
}

} // anonymous namespace

auto copy_to_buffer(std::string_view text, char* buf, std::size_t len) -> std::size_t {
    if (buf && len > 0) {
        auto n = std::min(text.size(), len - 1);
        std::memcpy(buf, text.data(), n);
        buf[n] = '\0';
    }
    return text.size();
}

auto create_plugin_interface(std::unique_ptr<PluginHandler> handler)
    -> DeepseekPluginInterface* {
    auto* iface = new DeepseekPluginInterface{};
    iface->abi_version = DEEPSEEK_PLUGIN_ABI_VERSION;
    iface->plugin_ptr = handler.release();
    iface->on_mount = &on_mount;
    iface->on_dispose = &on_dispose;
    iface->on_connect = &on_connect;
    iface->on_disconnect = &on_disconnect;
    iface->handle_message = &handle_message;
    iface->update_setting = &update_setting;
    iface->get_setting = &get_setting;
    iface->get_status = &get_status;
    iface->destroy = &destroy;
    return iface;
}

void destroy_plugin_interface(DeepseekPluginInterface* iface) {
    if (!iface) return;
    if (iface->destroy && iface->plugin_ptr) {
        iface->destroy(iface->plugin_ptr);
    }
    iface->plugin_ptr = nullptr;
    delete iface;
}

} // namespace deepseek::plugins

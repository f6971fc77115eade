#include <exception>
#include <memory>

#include "deepseek/core/logger.hpp"
#include "deepseek/plugin.hpp"
#include "deepseek/plugins/abi.h"
#include "deepseek/plugins/interface.hpp"

extern "C" {

DEEPSEEK_PLUGIN_EXPORT DeepseekPluginInterface* create_plugin(void) {
    try {
        return deepseek::plugins::create_plugin_interface(
            std::make_unique<deepseek::DeepSeekPlugin>());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create plugin: {}", e.what());
        return nullptr;
    } catch (...) {
        LOG_ERROR("Failed to create plugin: unknown exception");
        return nullptr;
    }
}

DEEPSEEK_PLUGIN_EXPORT void destroy_plugin(DeepseekPluginInterface* iface) {
    deepseek::plugins::destroy_plugin_interface(iface);
}

} // extern "C"

#pragma once

#include <filesystem>
#include <memory>

#include "deepseek/core/error.hpp"
#include "deepseek/plugins/abi.h"

namespace deepseek::plugins {

/// A plugin shared library opened with dlopen (Unix) or LoadLibrary
/// (Windows), together with the interface its create_plugin() returned.
///
/// Owns both the library handle and the interface, and releases them in
/// the right order: destroy_plugin() before the library is closed.
class PluginLibrary {
public:
    ~PluginLibrary();

    // Non-copyable, non-movable (owns the library handle).
    PluginLibrary(const PluginLibrary&) = delete;
    PluginLibrary& operator=(const PluginLibrary&) = delete;
    PluginLibrary(PluginLibrary&&) = delete;
    PluginLibrary& operator=(PluginLibrary&&) = delete;

    /// Loads the library at `path` and creates the plugin interface.
    /// @returns NotFound if the file does not exist, InvalidArgument if it
    ///          is not a shared library, PluginError if loading fails, a
    ///          symbol is missing, or the ABI version does not match.
    static auto open(const std::filesystem::path& path)
        -> Result<std::unique_ptr<PluginLibrary>>;

    [[nodiscard]] auto interface() -> DeepseekPluginInterface& { return *iface_; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    PluginLibrary(void* handle, DeepseekPluginInterface* iface,
                  DeepseekDestroyPluginFn destroy, std::filesystem::path path);

    void* handle_ = nullptr;
    DeepseekPluginInterface* iface_ = nullptr;
    DeepseekDestroyPluginFn destroy_ = nullptr;
    std::filesystem::path path_;
};

} // namespace deepseek::plugins

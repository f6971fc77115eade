#include "deepseek/plugins/loader.hpp"
#include "deepseek/core/logger.hpp"

#include <filesystem>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <dlfcn.h>
#elif defined(_WIN32)
#include <windows.h>
#else
#error "PluginLibrary: unsupported platform."
#endif

namespace deepseek::plugins {

namespace fs = std::filesystem;

namespace {

constexpr const char* kCreateSymbol = "create_plugin";
constexpr const char* kDestroySymbol = "destroy_plugin";

/// Returns true if the path has a platform-appropriate shared library extension.
auto is_shared_library(const fs::path& path) -> bool {
#if defined(__APPLE__)
    auto ext = path.extension().string();
    return ext == ".dylib" || ext == ".so";
#elif defined(_WIN32)
    return path.extension() == ".dll";
#else
    return path.extension() == ".so";
#endif
}

void close_library(void* handle) {
    if (!handle) return;
#ifdef _WIN32
    ::FreeLibrary(static_cast<HMODULE>(handle));
#else
    if (dlclose(handle) != 0) {
        const char* err = dlerror();
        LOG_WARN("dlclose warning: {}", err ? err : "unknown");
    }
#endif
}

/// Looks up `name`, returning nullptr and filling `detail` on failure.
auto find_symbol(void* handle, const char* name, std::string& detail) -> void* {
#ifdef _WIN32
    void* sym = reinterpret_cast<void*>(
        ::GetProcAddress(static_cast<HMODULE>(handle), name));
    if (!sym) {
        detail = "GetLastError=" + std::to_string(::GetLastError());
    }
    return sym;
#else
    // Clear any existing error state.
    dlerror();
    void* sym = dlsym(handle, name);
    if (const char* err = dlerror()) {
        detail = err;
        return nullptr;
    }
    return sym;
#endif
}

} // anonymous namespace

PluginLibrary::PluginLibrary(void* handle, DeepseekPluginInterface* iface,
                             DeepseekDestroyPluginFn destroy, fs::path path)
    : handle_(handle), iface_(iface), destroy_(destroy), path_(std::move(path)) {}

PluginLibrary::~PluginLibrary() {
    LOG_DEBUG("Unloading plugin library {}", path_.filename().string());
    // Destroy the interface before closing the handle.
    if (iface_ && destroy_) {
        destroy_(iface_);
    }
    iface_ = nullptr;
    close_library(handle_);
}

auto PluginLibrary::open(const fs::path& path) -> Result<std::unique_ptr<PluginLibrary>> {
    if (!fs::exists(path)) {
        return std::unexpected(make_error(
            ErrorCode::NotFound,
            "Plugin library not found",
            path.string()));
    }

    if (!is_shared_library(path)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Not a shared library",
            path.string()));
    }

    LOG_INFO("Loading plugin from: {}", path.string());

#ifdef _WIN32
    HMODULE module = ::LoadLibraryA(path.string().c_str());
    if (!module) {
        return std::unexpected(make_error(
            ErrorCode::PluginError,
            "LoadLibrary failed",
            "GetLastError=" + std::to_string(::GetLastError())));
    }
    void* handle = static_cast<void*>(module);
#else
    // RTLD_NOW: resolve all symbols immediately (fail fast on missing deps).
    // RTLD_LOCAL: do not export symbols to other loaded libraries.
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        return std::unexpected(make_error(
            ErrorCode::PluginError,
            "dlopen failed",
            err ? err : "unknown error"));
    }
#endif

    std::string detail;
    void* create_sym = find_symbol(handle, kCreateSymbol, detail);
    void* destroy_sym = create_sym ? find_symbol(handle, kDestroySymbol, detail) : nullptr;
    if (!create_sym || !destroy_sym) {
        close_library(handle);
        return std::unexpected(make_error(
            ErrorCode::PluginError,
            "Plugin symbol not found",
            std::string("Expected symbols '") + kCreateSymbol + "' and '" +
                kDestroySymbol + "' in " + path.filename().string() +
                (detail.empty() ? "" : ": " + detail)));
    }

    auto create = reinterpret_cast<DeepseekCreatePluginFn>(create_sym);
    auto destroy = reinterpret_cast<DeepseekDestroyPluginFn>(destroy_sym);

    DeepseekPluginInterface* iface = create();
    if (!iface) {
        close_library(handle);
        return std::unexpected(make_error(
            ErrorCode::PluginError,
            "create_plugin returned null",
            path.filename().string()));
    }

    if (iface->abi_version != DEEPSEEK_PLUGIN_ABI_VERSION) {
        auto version = iface->abi_version;
        destroy(iface);
        close_library(handle);
        return std::unexpected(make_error(
            ErrorCode::PluginError,
            "Plugin ABI version mismatch",
            "expected " + std::to_string(DEEPSEEK_PLUGIN_ABI_VERSION) +
                ", got " + std::to_string(version)));
    }

    LOG_INFO("Loaded plugin library {} (ABI v{})",
             path.filename().string(), iface->abi_version);

    return std::unique_ptr<PluginLibrary>(
        new PluginLibrary(handle, iface, destroy, path));
}

} // namespace deepseek::plugins

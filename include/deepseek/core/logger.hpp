#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace deepseek {

/// Receives each formatted log record; `level` follows spdlog's numbering
/// (0 = trace ... 5 = critical).
using HostLogFn = void (*)(void* host_data, int level, const char* message);

class Logger {
public:
    static void init(std::string_view name = "deepseek", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();

    /// Forward every record to the host in addition to stderr.
    /// Replaces any previously installed host sink.
    static void attach_host_sink(HostLogFn fn, void* host_data);

    /// Stop forwarding records to the host.
    static void detach_host_sink();
};

} // namespace deepseek

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::deepseek::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::deepseek::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::deepseek::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::deepseek::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::deepseek::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::deepseek::Logger::get(), __VA_ARGS__)

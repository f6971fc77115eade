#include "deepseek/core/logger.hpp"

#include <cstdlib>
#include <mutex>

#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace deepseek {

namespace {

class HostSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    HostSink(HostLogFn fn, void* host_data) : fn_(fn), host_data_(host_data) {}

protected:
    // The host adds its own prefix; only the message text is forwarded.
    void sink_it_(const spdlog::details::log_msg& msg) override {
        std::string text(msg.payload.data(), msg.payload.size());
        fn_(host_data_, static_cast<int>(msg.level), text.c_str());
    }

    void flush_() override {}

private:
    HostLogFn fn_;
    void* host_data_;
};

std::shared_ptr<spdlog::logger> g_logger;
// Fixed member of g_logger's sink list; host sinks come and go inside it.
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_host_sinks;
std::shared_ptr<spdlog::sinks::sink> g_host_sink;
std::mutex g_mutex;

} // anonymous namespace

void Logger::init(std::string_view name, std::string_view level) {
    std::lock_guard lock(g_mutex);
    // Not registered with spdlog: every copy of this code (the plugin and a
    // host that links the same sources) keeps its own logger and host sink.
    if (!g_logger) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
        g_host_sinks = std::make_shared<spdlog::sinks::dist_sink_mt>();
        g_logger = std::make_shared<spdlog::logger>(
            std::string(name), spdlog::sinks_init_list{console, g_host_sinks});
    }

    std::string_view effective = level;
    if (auto* env = std::getenv("DEEPSEEK_LOG_LEVEL")) {
        effective = env;
    }
    set_level(effective);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    auto& logger = g_logger;
    if (!logger) return;
    if (level == "trace") logger->set_level(spdlog::level::trace);
    else if (level == "debug") logger->set_level(spdlog::level::debug);
    else if (level == "info") logger->set_level(spdlog::level::info);
    else if (level == "warn") logger->set_level(spdlog::level::warn);
    else if (level == "error") logger->set_level(spdlog::level::err);
    else if (level == "critical") logger->set_level(spdlog::level::critical);
    else logger->set_level(spdlog::level::info);
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

void Logger::attach_host_sink(HostLogFn fn, void* host_data) {
    get();
    std::lock_guard lock(g_mutex);
    if (g_host_sink) {
        g_host_sinks->remove_sink(g_host_sink);
        g_host_sink.reset();
    }
    if (!fn) return;

    g_host_sink = std::make_shared<HostSink>(fn, host_data);
    g_host_sinks->add_sink(g_host_sink);
}

void Logger::detach_host_sink() {
    std::lock_guard lock(g_mutex);
    if (!g_host_sinks || !g_host_sink) return;
    g_host_sinks->remove_sink(g_host_sink);
    g_host_sink.reset();
}

} // namespace deepseek

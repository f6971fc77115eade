#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "deepseek/core/logger.hpp"

namespace {

struct HostLog {
    std::mutex mtx;
    std::vector<std::pair<int, std::string>> records;
    std::atomic<int> count{0};

    static void on_log(void* data, int level, const char* message) {
        auto* self = static_cast<HostLog*>(data);
        std::lock_guard lock(self->mtx);
        self->records.emplace_back(level, message);
        ++self->count;
    }
};

} // anonymous namespace

TEST_CASE("Logger forwards records to the host sink", "[logger]") {
    deepseek::Logger::init("deepseek", "info");
    HostLog host;

    deepseek::Logger::attach_host_sink(&HostLog::on_log, &host);
    LOG_WARN("Runtime not initialized, cannot shutdown");
    LOG_DEBUG("below the level");
    deepseek::Logger::detach_host_sink();
    LOG_INFO("after detach");

    REQUIRE(host.records.size() == 1);
    CHECK(host.records[0].first == 3);  // spdlog::level::warn
    CHECK(host.records[0].second == "Runtime not initialized, cannot shutdown");
}

TEST_CASE("Logger host sink can be swapped while other threads log", "[logger]") {
    deepseek::Logger::init("deepseek", "info");
    HostLog first;
    HostLog second;

    std::atomic<bool> done{false};
    std::thread writer([&done] {
        while (!done) {
            LOG_INFO("Stream completed");
        }
    });

    for (int i = 0; i < 2000; ++i) {
        deepseek::Logger::attach_host_sink(&HostLog::on_log, (i % 2) ? &first : &second);
        if (i % 3 == 0) deepseek::Logger::detach_host_sink();
    }
    deepseek::Logger::detach_host_sink();
    done = true;
    writer.join();

    // Nothing arrives once the sink is gone.
    auto seen = first.count.load() + second.count.load();
    LOG_INFO("after the loop");
    CHECK(first.count.load() + second.count.load() == seen);
}

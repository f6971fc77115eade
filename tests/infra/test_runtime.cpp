#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "deepseek/infra/runtime.hpp"

using namespace std::chrono_literals;
using boost::asio::awaitable;

TEST_CASE("Runtime runs spawned tasks on its worker", "[infra][runtime]") {
    deepseek::infra::Runtime runtime;
    CHECK(runtime.running());

    std::promise<std::thread::id> ran_on;
    auto fut = ran_on.get_future();
    runtime.spawn([&ran_on](std::stop_token) -> awaitable<void> {
        ran_on.set_value(std::this_thread::get_id());
        co_return;
    });

    REQUIRE(fut.wait_for(2s) == std::future_status::ready);
    CHECK(fut.get() != std::this_thread::get_id());

    CHECK(runtime.shutdown(1s));
    CHECK_FALSE(runtime.running());
    CHECK(runtime.in_flight() == 0);
}

TEST_CASE("Runtime counts tasks in flight", "[infra][runtime]") {
    deepseek::infra::Runtime runtime;

    std::promise<void> started;
    runtime.spawn([&runtime, &started](std::stop_token) -> awaitable<void> {
        started.set_value();
        boost::asio::steady_timer timer(runtime.context(), 200ms);
        co_await timer.async_wait(boost::asio::use_awaitable);
    });

    REQUIRE(started.get_future().wait_for(2s) == std::future_status::ready);
    CHECK(runtime.in_flight() == 1);

    // The timer finishes well within the shutdown window.
    CHECK(runtime.shutdown(2s));
    CHECK(runtime.in_flight() == 0);
}

TEST_CASE("Runtime shutdown requests stop on running tasks", "[infra][runtime]") {
    deepseek::infra::Runtime runtime;
    std::atomic<bool> saw_stop{false};

    runtime.spawn([&runtime, &saw_stop](std::stop_token stop) -> awaitable<void> {
        boost::asio::steady_timer timer(runtime.context());
        while (!stop.stop_requested()) {
            timer.expires_after(5ms);
            co_await timer.async_wait(boost::asio::use_awaitable);
        }
        saw_stop = true;
    });

    std::this_thread::sleep_for(20ms);
    CHECK(runtime.shutdown(2s));
    CHECK(saw_stop);
}

TEST_CASE("Runtime shutdown gives up on stuck tasks", "[infra][runtime]") {
    deepseek::infra::Runtime runtime;

    std::promise<void> started;
    runtime.spawn([&runtime, &started](std::stop_token) -> awaitable<void> {
        started.set_value();
        // Ignores the stop token.
        boost::asio::steady_timer timer(runtime.context(), 10s);
        co_await timer.async_wait(boost::asio::use_awaitable);
    });

    REQUIRE(started.get_future().wait_for(2s) == std::future_status::ready);
    CHECK_FALSE(runtime.shutdown(50ms));
    CHECK(runtime.in_flight() == 1);
    CHECK_FALSE(runtime.running());

    // A second shutdown is a no-op.
    CHECK(runtime.shutdown(10ms));
}

TEST_CASE("Runtime survives a throwing task", "[infra][runtime]") {
    deepseek::infra::Runtime runtime;

    runtime.spawn([](std::stop_token) -> awaitable<void> {
        throw std::runtime_error("boom");
        co_return;
    });

    std::promise<void> second;
    auto fut = second.get_future();
    runtime.spawn([&second](std::stop_token) -> awaitable<void> {
        second.set_value();
        co_return;
    });

    REQUIRE(fut.wait_for(2s) == std::future_status::ready);
    CHECK(runtime.shutdown(1s));
    CHECK(runtime.in_flight() == 0);
}

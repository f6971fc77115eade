#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace deepseek::infra {

/// Owns the plugin's io_context and the worker thread that drives it.
///
/// Tasks are coroutines started with spawn(). Each receives a stop token
/// that is triggered by shutdown(); the runtime counts tasks in flight so
/// that shutdown can wait for them before tearing the context down.
class Runtime {
public:
    using Task = std::function<boost::asio::awaitable<void>(std::stop_token)>;

    Runtime();
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    [[nodiscard]] auto context() -> boost::asio::io_context&;

    /// Starts a task on the worker thread.
    void spawn(Task task);

    /// Requests stop on all tasks and waits up to `timeout` for them to
    /// finish, then stops the worker. Returns false if tasks were still in
    /// flight; the context is then leaked so late completions stay valid.
    auto shutdown(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto running() const -> bool;
    [[nodiscard]] auto in_flight() const -> std::size_t;

private:
    void task_finished();

    std::unique_ptr<boost::asio::io_context> ioc_;
    std::optional<boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>> work_;
    std::thread worker_;
    std::stop_source stop_;

    mutable std::mutex mtx_;
    std::condition_variable idle_cv_;
    std::size_t in_flight_ = 0;
    bool running_ = false;
};

} // namespace deepseek::infra

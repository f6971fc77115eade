#include "deepseek/infra/runtime.hpp"
#include "deepseek/core/logger.hpp"

#include <exception>

#include <boost/asio/co_spawn.hpp>

namespace deepseek::infra {

Runtime::Runtime()
    : ioc_(std::make_unique<boost::asio::io_context>()) {
    work_.emplace(boost::asio::make_work_guard(*ioc_));
    running_ = true;
    worker_ = std::thread([ioc = ioc_.get()] {
        ioc->run();
    });
    LOG_DEBUG("Runtime worker thread started");
}

Runtime::~Runtime() {
    if (running()) {
        shutdown(std::chrono::milliseconds(100));
    }
}

auto Runtime::context() -> boost::asio::io_context& {
    return *ioc_;
}

void Runtime::spawn(Task task) {
    {
        std::lock_guard lock(mtx_);
        ++in_flight_;
    }

    auto token = stop_.get_token();
    boost::asio::co_spawn(
        *ioc_,
        [task = std::move(task), token]() -> boost::asio::awaitable<void> {
            co_await task(token);
        },
        [this](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    LOG_ERROR("Runtime task failed: {}", e.what());
                }
            }
            task_finished();
        });
}

void Runtime::task_finished() {
    std::lock_guard lock(mtx_);
    --in_flight_;
    if (in_flight_ == 0) {
        idle_cv_.notify_all();
    }
}

auto Runtime::shutdown(std::chrono::milliseconds timeout) -> bool {
    {
        std::lock_guard lock(mtx_);
        if (!running_) return true;
        running_ = false;
    }

    stop_.request_stop();

    bool drained = false;
    {
        std::unique_lock lock(mtx_);
        drained = idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
    }

    work_.reset();
    ioc_->stop();
    if (worker_.joinable()) {
        worker_.join();
    }

    if (!drained) {
        LOG_WARN("Cannot shutdown runtime: {} request(s) still in flight", in_flight());
        // Background HTTP threads still hold handles into the context.
        static_cast<void>(ioc_.release());
        return false;
    }

    LOG_DEBUG("Runtime worker thread stopped");
    return true;
}

auto Runtime::running() const -> bool {
    std::lock_guard lock(mtx_);
    return running_;
}

auto Runtime::in_flight() const -> std::size_t {
    std::lock_guard lock(mtx_);
    return in_flight_;
}

} // namespace deepseek::infra

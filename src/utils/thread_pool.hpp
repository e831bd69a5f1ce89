#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include "../core/result.hpp"

namespace xarb {

// Fixed-size worker pool for bounded collaborator calls (feed polls, order
// submissions). A call is only accepted when a worker is free to start it, so
// nothing ever waits in the queue behind a hung call.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Runs f on a free worker and waits at most `timeout`. Fails immediately
    // when every worker is still busy with an earlier call. An exception thrown
    // by f or an expired deadline becomes an error result. After a timeout the
    // call is abandoned: if it has not started yet, f is never invoked.
    template<typename F>
    auto call_with_timeout(F&& f, std::chrono::milliseconds timeout)
        -> Result<typename std::invoke_result_t<F>>;

    size_t busy_workers() const;

    void shutdown();

private:
    bool try_enqueue(std::function<void()> task);
    void release_worker();
    void worker_thread();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
    size_t busy_workers_ = 0;
};

template<typename F>
auto ThreadPool::call_with_timeout(F&& f, std::chrono::milliseconds timeout)
    -> Result<typename std::invoke_result_t<F>> {
    using return_type = typename std::invoke_result_t<F>;

    auto promise = std::make_shared<std::promise<return_type>>();
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    std::future<return_type> future = promise->get_future();

    auto task = [this, func = std::forward<F>(f), promise, abandoned]() mutable {
        if (*abandoned) {
            release_worker();
            return;
        }

        std::optional<return_type> value;
        std::exception_ptr error;
        try {
            value.emplace(func());
        } catch (...) {
            error = std::current_exception();
        }

        // The worker counts as free before the caller can observe the result.
        release_worker();
        if (error) {
            promise->set_exception(error);
        } else {
            promise->set_value(std::move(*value));
        }
    };

    if (!try_enqueue(std::move(task))) {
        return Result<return_type>::error("no idle worker, " + std::to_string(busy_workers()) +
                                          " earlier calls still running");
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        *abandoned = true;
        return Result<return_type>::error("timed out after " + std::to_string(timeout.count()) + " ms");
    }

    try {
        return Result<return_type>::success(future.get());
    } catch (const std::exception& e) {
        return Result<return_type>::error(e.what());
    }
}

} // namespace xarb

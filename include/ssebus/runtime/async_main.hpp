#pragma once

#include "scheduler.hpp"
#include <ssebus/coro/task.hpp>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <variant>

namespace ssebus::runtime {

/// Configuration for running async tasks
struct run_config {
    /// Number of worker threads (0 = hardware concurrency)
    size_t num_threads = 0;
};

namespace detail {

/// Blocks the calling thread until the wrapped task reports back
template<typename T>
struct completion_signal {
    using stored_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::mutex mutex;
    std::condition_variable cv;
    std::optional<stored_type> result;
    std::exception_ptr exception;
    bool completed = false;

    template<typename... U>
    void set_result(U&&... value) {
        std::lock_guard<std::mutex> lock(mutex);
        result.emplace(std::forward<U>(value)...);
        completed = true;
        cv.notify_one();
    }

    void set_exception(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex);
        exception = std::move(e);
        completed = true;
        cv.notify_one();
    }

    T wait() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return completed; });
        if (exception) {
            std::rethrow_exception(exception);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*result);
        }
    }
};

template<typename T>
coro::task<void> completion_wrapper(coro::task<T> inner, completion_signal<T>* signal) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(inner);
            signal->set_result();
        } else {
            signal->set_result(co_await std::move(inner));
        }
    } catch (...) {
        signal->set_exception(std::current_exception());
    }
}

} // namespace detail

/// Run a coroutine to completion on a fresh scheduler and return its result
///
/// ```cpp
/// coro::task<int> async_main() {
///     local_bus bus;
///     // ...
///     co_return 0;
/// }
///
/// int main() { return ssebus::run(async_main()); }
/// ```
template<typename T>
T run(coro::task<T> task, const run_config& config = {}) {
    detail::completion_signal<T> signal;

    size_t threads = config.num_threads;
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 1;
    }

    scheduler sched(threads);
    sched.start();

    auto wrapper = detail::completion_wrapper(std::move(task), &signal);
    sched.spawn(wrapper.release());

    if constexpr (std::is_void_v<T>) {
        signal.wait();
        sched.shutdown();
    } else {
        T result = signal.wait();
        sched.shutdown();
        return result;
    }
}

template<typename T>
T run(coro::task<T> task, size_t num_threads) {
    return run(std::move(task), run_config{.num_threads = num_threads});
}

} // namespace ssebus::runtime

namespace ssebus {

using runtime::run;
using runtime::run_config;

} // namespace ssebus

/// Define main() around `coro::task<int> async_main(int argc, char* argv[])`
#define SSEBUS_ASYNC_MAIN(async_main_func) \
    int main(int argc, char* argv[]) { \
        return ssebus::run(async_main_func(argc, argv)); \
    }

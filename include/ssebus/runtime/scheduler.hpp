#pragma once

#include "worker_thread.hpp"
#include <ssebus/io/poller.hpp>
#include <ssebus/log/macros.hpp>
#include <chrono>
#include <mutex>
#include <vector>
#include <memory>
#include <atomic>
#include <coroutine>
#include <thread>

namespace ssebus::runtime {

/// Work-stealing scheduler for coroutines
///
/// Every open stream is one coroutine; the scheduler multiplexes all of them
/// onto a fixed set of worker threads. Streams waiting for a slow client to
/// drain its socket park on the scheduler's poller, which idle workers poll.
class scheduler {
    friend class worker_thread;

public:
    explicit scheduler(size_t num_threads = std::thread::hardware_concurrency())
        : num_threads_(num_threads == 0 ? 1 : num_threads)
        , running_(false)
        , spawn_index_(0)
        , poller_(std::make_unique<io::poller>()) {
        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.push_back(std::make_unique<worker_thread>(this, i));
        }
    }

    ~scheduler() {
        if (running_.load(std::memory_order_relaxed)) {
            shutdown();
        }
    }

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;
    scheduler(scheduler&&) = delete;
    scheduler& operator=(scheduler&&) = delete;

    void start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return;
        }
        for (auto& worker : workers_) {
            worker->start();
        }
        current_scheduler_ = this;
        SSEBUS_LOG_DEBUG("scheduler started with {} workers", num_threads_);
    }

    void shutdown() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }

        for (auto& worker : workers_) {
            worker->stop();
        }

        // No worker can steal any more, so queued frames can be destroyed
        for (auto& worker : workers_) {
            worker->drain_remaining_tasks();
        }

        // Parked writers resume on this thread and see their write fail
        poller_->cancel_all();

        if (current_scheduler_ == this) {
            current_scheduler_ = nullptr;
        }
        SSEBUS_LOG_DEBUG("scheduler stopped");
    }

    /// Queue a coroutine on some worker (round-robin)
    void spawn(std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return;
        if (!running_.load(std::memory_order_relaxed)) [[unlikely]] {
            handle.destroy();
            return;
        }
        size_t index = spawn_index_.fetch_add(1, std::memory_order_relaxed) % num_threads_;
        workers_[index]->schedule(handle);
    }

    /// Queue a coroutine, preferring the calling worker's own queue
    void schedule(std::coroutine_handle<> handle) {
        auto* self = worker_thread::current();
        if (self && self->owner() == this && running_.load(std::memory_order_relaxed)) {
            self->schedule(handle);
            return;
        }
        spawn(handle);
    }

    [[nodiscard]] size_t num_threads() const noexcept {
        return num_threads_;
    }

    [[nodiscard]] size_t pending_tasks() const {
        size_t total = 0;
        for (auto& worker : workers_) {
            total += worker->queue_size();
        }
        return total;
    }

    [[nodiscard]] size_t total_tasks_executed() const noexcept {
        size_t total = 0;
        for (auto& worker : workers_) {
            total += worker->tasks_executed();
        }
        return total;
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] worker_thread* get_worker(size_t index) noexcept {
        return index < workers_.size() ? workers_[index].get() : nullptr;
    }

    [[nodiscard]] static scheduler* current() noexcept {
        return current_scheduler_;
    }

    [[nodiscard]] io::poller& io_poller() noexcept {
        return *poller_;
    }

    /// Poll for writable descriptors unless another worker already is
    /// @return true if any parked writer was resumed
    bool try_poll_io(std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) {
        std::unique_lock<std::mutex> lock(io_poll_mutex_, std::try_to_lock);
        if (!lock.owns_lock() || !poller_->has_pending()) {
            return false;
        }
        return poller_->poll(timeout) > 0;
    }

private:
    std::vector<std::unique_ptr<worker_thread>> workers_;
    const size_t num_threads_;
    std::atomic<bool> running_;
    std::atomic<size_t> spawn_index_;
    std::mutex io_poll_mutex_;
    std::unique_ptr<io::poller> poller_;

    static inline thread_local scheduler* current_scheduler_ = nullptr;
};

inline scheduler* get_current_scheduler() noexcept {
    return scheduler::current();
}

/// Resume `handle` on `home`, or inline when it has no running scheduler
///
/// Wakers pass the scheduler the coroutine suspended on, so a coroutine
/// parked by a worker never runs on the waking thread.
inline void schedule_handle(std::coroutine_handle<> handle, scheduler* home) noexcept {
    if (!handle) return;

    if (home && home->is_running()) {
        home->schedule(handle);
    } else {
        // No scheduler - run synchronously. Task self-destructs via final_suspend.
        if (!handle.done()) handle.resume();
    }
}

inline void schedule_handle(std::coroutine_handle<> handle) noexcept {
    schedule_handle(handle, scheduler::current());
}

inline void worker_thread::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    thread_ = std::thread(&worker_thread::run, this);
}

inline void worker_thread::stop() {
    bool expected = true;
    if (running_.compare_exchange_strong(expected, false,
            std::memory_order_release, std::memory_order_relaxed)) {
        // Take the lock so a worker between its check and its wait sees the flag
        { std::lock_guard<std::mutex> lock(mutex_); }
        cv_.notify_all();
    }
    if (thread_.joinable()) thread_.join();
}

inline void worker_thread::drain_remaining_tasks() noexcept {
    std::deque<void*> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(queue_);
    }
    for (void* addr : remaining) {
        auto handle = std::coroutine_handle<>::from_address(addr);
        if (handle) {
            handle.destroy();
        }
    }
}

inline void worker_thread::run() {
    scheduler::current_scheduler_ = scheduler_;
    current_worker_ = this;

    while (running_.load(std::memory_order_relaxed)) {
        auto handle = pop_local();
        if (!handle) {
            handle = try_steal();
        }

        if (handle) {
            if (!handle.done()) [[likely]] {
                handle.resume();
                tasks_executed_.fetch_add(1, std::memory_order_relaxed);
            }
            // The frame may already be running elsewhere or destroyed; don't touch it
        } else {
            wait_for_work();
        }
    }

    scheduler::current_scheduler_ = nullptr;
    current_worker_ = nullptr;
}

inline std::coroutine_handle<> worker_thread::pop_local() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return nullptr;
    void* addr = queue_.front();
    queue_.pop_front();
    return std::coroutine_handle<>::from_address(addr);
}

inline std::coroutine_handle<> worker_thread::try_steal() noexcept {
    size_t num_workers = scheduler_->num_threads();
    if (num_workers <= 1) return nullptr;

    for (size_t i = 1; i < num_workers; ++i) {
        auto* victim = scheduler_->get_worker((worker_id_ + i) % num_workers);
        if (!victim) continue;
        auto handle = victim->steal_task();
        if (handle) {
            return handle;
        }
    }
    return nullptr;
}

inline void worker_thread::wait_for_work() {
    if (scheduler_->try_poll_io()) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, IDLE_WAIT, [this] {
        return !queue_.empty() || !running_.load(std::memory_order_relaxed);
    });
}

} // namespace ssebus::runtime

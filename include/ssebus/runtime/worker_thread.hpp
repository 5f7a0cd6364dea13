#pragma once

#include <coroutine>
#include <condition_variable>
#include <deque>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>

namespace ssebus::runtime {

class scheduler;

/// Worker thread that runs coroutines from its own queue and steals from
/// peers when idle
///
/// The owner pops from the front so a stream's resumptions run in the order
/// they were scheduled; thieves take from the back. An idle worker sleeps on
/// a condition variable until it is handed work or the idle interval passes.
class worker_thread {
public:
    static constexpr std::chrono::milliseconds IDLE_WAIT{5};

    worker_thread(scheduler* sched, size_t worker_id)
        : scheduler_(sched)
        , worker_id_(worker_id)
        , running_(false)
        , tasks_executed_(0) {}

    ~worker_thread() {
        stop();
    }

    worker_thread(const worker_thread&) = delete;
    worker_thread& operator=(const worker_thread&) = delete;
    worker_thread(worker_thread&&) = delete;
    worker_thread& operator=(worker_thread&&) = delete;

    void start();
    void stop();

    /// Destroy tasks still queued - only call after ALL workers have stopped
    void drain_remaining_tasks() noexcept;

    /// Queue a coroutine for this worker (any thread)
    void schedule(std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(handle.address());
        }
        cv_.notify_one();
    }

    /// Take one task from the back of the queue without blocking the owner
    [[nodiscard]] std::coroutine_handle<> steal_task() noexcept {
        if (!running_.load(std::memory_order_acquire)) return nullptr;
        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock() || queue_.empty()) return nullptr;
        void* addr = queue_.back();
        queue_.pop_back();
        return std::coroutine_handle<>::from_address(addr);
    }

    [[nodiscard]] size_t tasks_executed() const noexcept {
        return tasks_executed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t queue_size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t worker_id() const noexcept {
        return worker_id_;
    }

    /// Worker running on the calling thread, if any
    [[nodiscard]] static worker_thread* current() noexcept {
        return current_worker_;
    }

    [[nodiscard]] scheduler* owner() const noexcept {
        return scheduler_;
    }

private:
    void run();
    [[nodiscard]] std::coroutine_handle<> pop_local() noexcept;
    [[nodiscard]] std::coroutine_handle<> try_steal() noexcept;
    void wait_for_work();

    scheduler* scheduler_;
    size_t worker_id_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<void*> queue_;
    std::thread thread_;
    std::atomic<bool> running_;
    std::atomic<size_t> tasks_executed_;

    static inline thread_local worker_thread* current_worker_ = nullptr;
};

} // namespace ssebus::runtime

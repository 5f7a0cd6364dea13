#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace ssebus::coro {

namespace detail {

/// Shared cancellation state
struct cancel_state {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    uint64_t next_id = 1;

    /// Returns 0 if the state was already cancelled and cb ran inline
    uint64_t add_callback(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!cancelled.load(std::memory_order_relaxed)) {
                uint64_t id = next_id++;
                callbacks.emplace_back(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    void remove_callback(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        callbacks.erase(
            std::remove_if(callbacks.begin(), callbacks.end(),
                [id](const auto& p) { return p.first == id; }),
            callbacks.end()
        );
    }

    /// Returns false if it was already triggered
    bool trigger() {
        std::vector<std::pair<uint64_t, std::function<void()>>> to_invoke;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled.exchange(true, std::memory_order_release)) {
                return false;
            }
            to_invoke.swap(callbacks);
        }
        // Callbacks may resume coroutines, never hold the lock across them
        for (auto& entry : to_invoke) {
            entry.second();
        }
        return true;
    }
};

} // namespace detail

/// RAII registration of a cancel callback
class cancel_registration {
public:
    cancel_registration() = default;
    cancel_registration(cancel_registration&& other) noexcept
        : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

    cancel_registration& operator=(cancel_registration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    ~cancel_registration() { unregister(); }

    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;

    void unregister() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
        }
        id_ = 0;
        state_.reset();
    }

private:
    friend class cancel_token;

    cancel_registration(std::shared_ptr<detail::cancel_state> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::cancel_state> state_;
    uint64_t id_ = 0;
};

/// Observer side of a cancel_source
///
/// Tokens are cheap to copy. A default constructed token is never cancelled,
/// which is what a stream gets when the caller has no shutdown signal.
///
/// ```cpp
/// cancel_source shutdown;
/// auto result = co_await stream(conn, bus, topics, {}, shutdown.get_token());
/// ```
class cancel_token {
public:
    using registration = cancel_registration;

    cancel_token() = default;

    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    /// True if NOT cancelled
    explicit operator bool() const noexcept {
        return !is_cancelled();
    }

    /// Check whether this token can ever be cancelled
    bool can_be_cancelled() const noexcept {
        return state_ != nullptr;
    }

    /// Register a callback to run on cancellation (runs inline if already cancelled)
    template<typename F>
    [[nodiscard]] registration on_cancel(F&& callback) const {
        if (!state_) {
            return registration{};
        }
        uint64_t id = state_->add_callback(std::function<void()>(std::forward<F>(callback)));
        if (id == 0) {
            return registration{};
        }
        return registration{state_, id};
    }

private:
    friend class cancel_source;

    explicit cancel_token(std::shared_ptr<detail::cancel_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_;
};

/// Owner side: hands out tokens and fires them
class cancel_source {
public:
    cancel_source()
        : state_(std::make_shared<detail::cancel_state>()) {}

    cancel_token get_token() const noexcept {
        return cancel_token{state_};
    }

    /// Fire all tokens; returns false if this source was already cancelled
    bool cancel() {
        return state_ && state_->trigger();
    }

    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::cancel_state> state_;
};

} // namespace ssebus::coro

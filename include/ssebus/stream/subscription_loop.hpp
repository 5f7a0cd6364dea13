#pragma once

/// @file subscription_loop.hpp
/// @brief Per-connection relay from bus topics to an SSE response
///
/// One loop owns one connection from the moment its topics are known until
/// the stream ends:
///
///     idle -> subscribing -> streaming -> draining -> closed
///
/// While streaming, the loop suspends on its subscriber mailbox. Every
/// subscribed topic feeds that one mailbox, and the transport's closed
/// signal and the shutdown token close it, so a single co_await waits for
/// all three sources. Frames are written by this coroutine only, which
/// serializes writes per connection.

#include <ssebus/bus/bus.hpp>
#include <ssebus/coro/cancel_token.hpp>
#include <ssebus/coro/task.hpp>
#include <ssebus/log/macros.hpp>
#include <ssebus/sse/chunk.hpp>
#include <ssebus/sse/encoder.hpp>
#include <ssebus/transport/transport.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ssebus::stream {

/// Topic names of one connection, fixed once streaming starts
using subscription_set = std::vector<std::string>;

enum class stream_state : uint8_t {
    idle,
    subscribing,
    streaming,
    draining,
    closed
};

constexpr const char* state_to_string(stream_state state) noexcept {
    switch (state) {
        case stream_state::idle:        return "idle";
        case stream_state::subscribing: return "subscribing";
        case stream_state::streaming:   return "streaming";
        case stream_state::draining:    return "draining";
        case stream_state::closed:      return "closed";
        default:                        return "unknown";
    }
}

/// Why a stream stopped
enum class close_cause : uint8_t {
    client_disconnected,     ///< Transport reported closure
    shutdown_requested,      ///< Shutdown token fired, or the bus went away
    transport_write_failed,  ///< A frame could not be written
    invalid_chunk            ///< A delivery could not be encoded
};

constexpr const char* cause_to_string(close_cause cause) noexcept {
    switch (cause) {
        case close_cause::client_disconnected:    return "client disconnected";
        case close_cause::shutdown_requested:     return "shutdown requested";
        case close_cause::transport_write_failed: return "transport write failed";
        case close_cause::invalid_chunk:          return "invalid chunk";
        default:                                  return "unknown";
    }
}

/// Disconnects and shutdowns are normal ends of a stream
constexpr bool is_clean(close_cause cause) noexcept {
    return cause == close_cause::client_disconnected ||
           cause == close_cause::shutdown_requested;
}

struct stream_result {
    close_cause cause = close_cause::shutdown_requested;
    size_t frames_written = 0;
    size_t bytes_written = 0;
};

/// Per-stream settings
struct stream_config {
    /// Mailbox capacity (0 = unbounded). When bounded, the bus drops
    /// messages for this stream only while its mailbox is full.
    size_t mailbox_capacity = 0;

    /// Called on every state change, on the thread running the loop
    std::function<void(stream_state)> on_state_change;

    /// Name used in log lines (defaults to the subscriber id)
    std::string label;
};

class subscription_loop {
public:
    /// Both `conn` and `target` must outlive the loop
    subscription_loop(transport::transport& conn, bus::bus& target,
                      subscription_set topics, stream_config config = {})
        : conn_(conn)
        , bus_(target)
        , topics_(unique_topics(std::move(topics)))
        , config_(std::move(config))
        , subscriber_(std::make_shared<bus::subscriber>(config_.mailbox_capacity)) {
        if (config_.label.empty()) {
            config_.label = "#" + std::to_string(subscriber_->id());
        }
    }

    ~subscription_loop() {
        drain();
    }

    subscription_loop(const subscription_loop&) = delete;
    subscription_loop& operator=(const subscription_loop&) = delete;

    /// Stream until disconnect, shutdown, bus teardown or a write failure
    ///
    /// @param shutdown Fires to stop the stream; default never fires
    /// @param initial Written as the first frame when set and non-empty
    /// @throws bus::bus_error if subscribing fails; topics registered so far
    ///         are unsubscribed first
    coro::task<stream_result> run(coro::cancel_token shutdown = {},
                                  std::optional<sse::chunk> initial = std::nullopt) {
        if (state() != stream_state::idle) {
            throw std::logic_error("subscription_loop::run called more than once");
        }

        // Either signal closes the mailbox, which wakes a pending recv().
        // The callbacks hold the subscriber so they stay valid after the loop.
        auto wake = [sub = subscriber_]() { sub->inbox().close(); };
        auto on_disconnect = conn_.closed_token().on_cancel(wake);
        auto on_shutdown = shutdown.on_cancel(wake);

        drain_guard guard{*this};
        stream_result result;
        std::exception_ptr failure;

        transition(stream_state::subscribing);
        try {
            subscribe_all();
            SSEBUS_LOG_INFO("stream {} open on {} topic(s)", config_.label, topics_.size());

            transition(stream_state::streaming);
            result.cause = co_await pump(shutdown, std::move(initial));
        } catch (...) {
            failure = std::current_exception();
        }

        transition(stream_state::draining);
        drain();
        result.frames_written = frames_written();
        result.bytes_written = bytes_written();
        transition(stream_state::closed);

        if (failure) {
            SSEBUS_LOG_WARNING("stream {} aborted after {} frame(s)",
                               config_.label, result.frames_written);
            std::rethrow_exception(failure);
        }

        SSEBUS_LOG_INFO("stream {} closed: {} after {} frame(s)",
                        config_.label, cause_to_string(result.cause), result.frames_written);
        co_return result;
    }

    stream_state state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    /// Topics after duplicates were removed
    const subscription_set& topics() const noexcept { return topics_; }

    bus::subscriber_id id() const noexcept { return subscriber_->id(); }

    size_t frames_written() const noexcept {
        return frames_written_.load(std::memory_order_relaxed);
    }

    size_t bytes_written() const noexcept {
        return bytes_written_.load(std::memory_order_relaxed);
    }

    /// Messages the bus dropped because the mailbox was full
    size_t dropped() const noexcept {
        return subscriber_->inbox().dropped();
    }

private:
    /// Unsubscribes if the frame is destroyed before the loop finished
    struct drain_guard {
        subscription_loop& loop;
        ~drain_guard() { loop.drain(); }
    };

    static subscription_set unique_topics(subscription_set topics) {
        subscription_set result;
        result.reserve(topics.size());
        for (auto& topic : topics) {
            if (std::find(result.begin(), result.end(), topic) == result.end()) {
                result.push_back(std::move(topic));
            }
        }
        return result;
    }

    void transition(stream_state next) {
        auto prev = state_.exchange(next, std::memory_order_acq_rel);
        SSEBUS_LOG_DEBUG("stream {}: {} -> {}", config_.label,
                         state_to_string(prev), state_to_string(next));
        (void)prev;
        if (config_.on_state_change) {
            config_.on_state_change(next);
        }
    }

    void subscribe_all() {
        for (const auto& topic : topics_) {
            bus_.subscribe(topic, subscriber_);
            subscribed_.push_back(topic);
        }
    }

    /// Best effort; safe to call more than once
    void drain() noexcept {
        for (const auto& topic : subscribed_) {
            if (!bus_.unsubscribe(topic, subscriber_->id())) {
                SSEBUS_LOG_WARNING("stream {}: unsubscribe from '{}' failed",
                                   config_.label, topic);
            }
        }
        subscribed_.clear();
        subscriber_->inbox().close();
    }

    /// Disconnect and shutdown are checked together, before every frame
    std::optional<close_cause> interrupted(const coro::cancel_token& shutdown) const noexcept {
        if (conn_.is_closed()) {
            return close_cause::client_disconnected;
        }
        if (shutdown.is_cancelled()) {
            return close_cause::shutdown_requested;
        }
        return std::nullopt;
    }

    coro::task<bool> send(const std::string& frame) {
        bool ok = co_await conn_.write(frame);
        if (ok) {
            frames_written_.fetch_add(1, std::memory_order_relaxed);
            bytes_written_.fetch_add(frame.size(), std::memory_order_relaxed);
        }
        co_return ok;
    }

    coro::task<close_cause> pump(const coro::cancel_token& shutdown,
                                 std::optional<sse::chunk> initial) {
        auto& inbox = subscriber_->inbox();

        if (auto cause = interrupted(shutdown)) {
            co_return *cause;
        }
        if (initial && !initial->empty()) {
            std::optional<std::string> frame = encode_or_log(*initial);
            if (!frame) {
                co_return close_cause::invalid_chunk;
            }
            if (!co_await send(*frame)) {
                co_return close_cause::transport_write_failed;
            }
        }

        while (true) {
            if (auto cause = interrupted(shutdown)) {
                co_return *cause;
            }

            auto env = co_await inbox.recv();

            // Pending deliveries are dropped once the client or server is gone
            if (auto cause = interrupted(shutdown)) {
                co_return *cause;
            }
            if (!env) {
                SSEBUS_LOG_INFO("stream {}: bus closed the subscription", config_.label);
                co_return close_cause::shutdown_requested;
            }

            std::optional<std::string> frame;
            if (env->payload) {
                frame = encode_or_log(*env->payload);
            } else {
                SSEBUS_LOG_ERROR("stream {}: empty delivery on '{}'", config_.label, env->topic);
            }
            if (!frame) {
                co_return close_cause::invalid_chunk;
            }
            if (!co_await send(*frame)) {
                co_return close_cause::transport_write_failed;
            }
        }
    }

    std::optional<std::string> encode_or_log(const sse::chunk& c) const {
        try {
            return sse::encode(c);
        } catch (const sse::invalid_chunk& e) {
            SSEBUS_LOG_ERROR("stream {}: {}", config_.label, e.what());
            return std::nullopt;
        }
    }

    transport::transport& conn_;
    bus::bus& bus_;
    subscription_set topics_;
    stream_config config_;
    std::shared_ptr<bus::subscriber> subscriber_;
    subscription_set subscribed_;
    std::atomic<stream_state> state_{stream_state::idle};
    std::atomic<size_t> frames_written_{0};
    std::atomic<size_t> bytes_written_{0};
};

} // namespace ssebus::stream

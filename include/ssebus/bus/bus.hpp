#pragma once

/// @file bus.hpp
/// @brief Publish/subscribe bus interface consumed by streams
///
/// A bus maps topic names to subscribers. Publishing hands one shared,
/// immutable chunk to the mailbox of every subscriber of the topic; the
/// subscriber's stream picks it up from there. Implementations must allow
/// subscribe, unsubscribe and publish from any thread without outside
/// locking.

#include <ssebus/sse/chunk.hpp>
#include <ssebus/sync/mailbox.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ssebus::bus {

/// Raised by a bus that cannot take the request (e.g. it was shut down)
class bus_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using subscriber_id = uint64_t;

/// Item a bus drops into a subscriber mailbox
///
/// Streams treat it as opaque until they encode it; a null payload is a
/// malformed delivery.
struct envelope {
    std::string topic;
    std::shared_ptr<const sse::chunk> payload;
};

/// Identity and inbox of one connection on the bus
class subscriber {
public:
    using inbox_type = sync::mailbox<envelope>;

    /// @param capacity Mailbox capacity (0 = unbounded)
    explicit subscriber(size_t capacity = 0)
        : id_(next_id()), inbox_(capacity) {}

    subscriber(const subscriber&) = delete;
    subscriber& operator=(const subscriber&) = delete;

    subscriber_id id() const noexcept { return id_; }

    inbox_type& inbox() noexcept { return inbox_; }
    const inbox_type& inbox() const noexcept { return inbox_; }

    /// Called by the bus for each message on a subscribed topic
    inbox_type::post_result deliver(envelope env) {
        return inbox_.post(std::move(env));
    }

private:
    static subscriber_id next_id() noexcept {
        static std::atomic<subscriber_id> counter{1};
        return counter.fetch_add(1, std::memory_order_relaxed);
    }

    subscriber_id id_;
    inbox_type inbox_;
};

/// Abstract bus
class bus {
public:
    virtual ~bus() = default;

    /// Register `sub` for `topic`; subscribing twice is a no-op
    /// @throws bus_error if the bus cannot accept subscribers
    virtual void subscribe(std::string_view topic, std::shared_ptr<subscriber> sub) = 0;

    /// Best-effort removal; false if the subscriber was not registered
    virtual bool unsubscribe(std::string_view topic, subscriber_id id) noexcept = 0;

    /// Deliver `chunk` to every current subscriber of `topic`
    /// @throws bus_error if the bus cannot dispatch
    virtual void publish(std::string_view topic, std::shared_ptr<const sse::chunk> chunk) = 0;

    void publish(std::string_view topic, sse::chunk chunk) {
        publish(topic, std::make_shared<const sse::chunk>(std::move(chunk)));
    }
};

} // namespace ssebus::bus

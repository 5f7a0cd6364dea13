#pragma once

/// ssebus - Server-Sent Events over a publish/subscribe bus
///
/// Version: 0.1.0
///
/// Include this file to get the whole library.

#define SSEBUS_VERSION_MAJOR 0
#define SSEBUS_VERSION_MINOR 1
#define SSEBUS_VERSION_PATCH 0

#include <tuple>

// Coroutines and runtime
#include "coro/task.hpp"
#include "coro/cancel_token.hpp"
#include "runtime/scheduler.hpp"
#include "runtime/async_main.hpp"
#include "sync/mailbox.hpp"
#include "io/poller.hpp"
#include "io/io_awaitables.hpp"

// SSE payloads
#include "sse/chunk.hpp"
#include "sse/encoder.hpp"

// Bus
#include "bus/bus.hpp"
#include "bus/local_bus.hpp"
#include "bus/publisher.hpp"

// Transports
#include "transport/transport.hpp"
#include "transport/fd_transport.hpp"

// Streams
#include "stream/subscription_loop.hpp"
#include "stream/stream.hpp"
#include "http/sse_response.hpp"

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

/// Root namespace for the ssebus library
namespace ssebus {

inline const char* version() noexcept {
    return "0.1.0";
}

inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(SSEBUS_VERSION_MAJOR, SSEBUS_VERSION_MINOR, SSEBUS_VERSION_PATCH);
}

} // namespace ssebus

/// Quick Start Example:
///
/// ```cpp
/// #include <ssebus/ssebus.hpp>
///
/// using namespace ssebus;
///
/// bus::local_bus events;
///
/// // HTTP handler, after the response head was sent
/// coro::task<void> on_subscribe(transport::transport& conn, std::string_view query) {
///     co_await stream::stream(conn, events, http::topics_from_query(query));
/// }
///
/// // Anywhere else
/// bus::broadcast(events, "time", "01:34:55.123567");
/// bus::broadcast(events, "time", "01:34:55.123567", "event", "tick");
/// ```

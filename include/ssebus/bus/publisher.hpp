#pragma once

#include <ssebus/bus/bus.hpp>
#include <ssebus/sse/chunk.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace ssebus::bus {

/// Send `chunk` to every current subscriber of `topic`
///
/// One dispatch, no retry, nothing kept locally. Errors from the bus
/// propagate unchanged.
inline void publish(bus& target, std::string_view topic, sse::chunk chunk) {
    target.publish(topic, std::move(chunk));
}

/// Alias of publish() under the name HTTP-facing code uses
inline void broadcast(bus& target, std::string_view topic, sse::chunk chunk) {
    publish(target, topic, std::move(chunk));
}

/// Build a chunk from a string kind and publish it
///
/// ```cpp
/// broadcast(bus, "time", "01:34:55.123567");
/// broadcast(bus, "time", "01:34:55.123567", "event", "tick");
/// ```
///
/// @throws sse::invalid_chunk_kind before anything is published if `kind`
///         is not "message" or "event", or an event has no name
inline void broadcast(bus& target, std::string_view topic, sse::chunk::payload data,
                      std::string_view kind = "message",
                      std::optional<std::string> event_name = std::nullopt) {
    publish(target, topic, sse::build_chunk(std::move(data), kind, std::move(event_name)));
}

} // namespace ssebus::bus

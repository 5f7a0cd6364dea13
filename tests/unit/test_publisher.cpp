#include <catch2/catch.hpp>
#include <ssebus/bus/local_bus.hpp>
#include <ssebus/bus/publisher.hpp>
#include <ssebus/sse/encoder.hpp>
#include <memory>

using namespace ssebus;

namespace {

std::string next_frame(bus::subscriber& sub) {
    auto env = sub.inbox().try_recv();
    REQUIRE(env.has_value());
    return sse::encode(env->payload);
}

} // namespace

TEST_CASE("publish and broadcast reach subscribers", "[publisher]") {
    bus::local_bus hub;
    auto sub = std::make_shared<bus::subscriber>();
    hub.subscribe("time", sub);

    bus::publish(hub, "time", sse::chunk::message("one"));
    bus::broadcast(hub, "time", sse::chunk::event("tick", "two"));

    REQUIRE(next_frame(*sub) == "data: one\n\n");
    REQUIRE(next_frame(*sub) == "event: tick\ndata: two\n\n");
}

TEST_CASE("broadcast with a string kind", "[publisher]") {
    bus::local_bus hub;
    auto sub = std::make_shared<bus::subscriber>();
    hub.subscribe("time", sub);

    SECTION("defaults to message") {
        bus::broadcast(hub, "time", "01:34:55.123567");
        REQUIRE(next_frame(*sub) == "data: 01:34:55.123567\n\n");
    }

    SECTION("event uses the given name") {
        bus::broadcast(hub, "time", sse::chunk::lines{"a", "b"}, "event", "tick");
        REQUIRE(next_frame(*sub) == "event: tick\ndata: a\ndata: b\n\n");
    }

    SECTION("unknown kind publishes nothing") {
        REQUIRE_THROWS_AS(bus::broadcast(hub, "time", "x", "alert"), sse::invalid_chunk_kind);
        REQUIRE(sub->inbox().empty());
        REQUIRE(hub.published() == 0);
    }
}

TEST_CASE("publish without subscribers is a no-op", "[publisher]") {
    bus::local_bus hub;
    REQUIRE_NOTHROW(bus::publish(hub, "nobody", sse::chunk::message("x")));
    REQUIRE(hub.published() == 1);
}

TEST_CASE("publish errors propagate", "[publisher]") {
    bus::local_bus hub;
    hub.shutdown();
    REQUIRE_THROWS_AS(bus::publish(hub, "t", sse::chunk::message("x")), bus::bus_error);
}

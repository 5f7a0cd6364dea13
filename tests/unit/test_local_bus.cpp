#include <catch2/catch.hpp>
#include <ssebus/bus/local_bus.hpp>
#include <ssebus/sse/encoder.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace ssebus;
using namespace ssebus::bus;

namespace {

std::vector<std::string> drain_payloads(subscriber& sub) {
    std::vector<std::string> out;
    while (auto env = sub.inbox().try_recv()) {
        out.push_back(sse::encode(env->payload));
    }
    return out;
}

} // namespace

TEST_CASE("subscriber ids are unique", "[bus]") {
    subscriber a, b;
    REQUIRE(a.id() != b.id());
}

TEST_CASE("local_bus delivers to topic subscribers only", "[bus][local_bus]") {
    local_bus bus;
    auto a = std::make_shared<subscriber>();
    auto b = std::make_shared<subscriber>();

    bus.subscribe("news", a);
    bus.subscribe("news", b);
    bus.subscribe("sport", b);
    REQUIRE(bus.subscriber_count("news") == 2);
    REQUIRE(bus.topic_count() == 2);

    bus.publish("news", sse::chunk::message("n1"));
    bus.publish("sport", sse::chunk::message("s1"));
    bus.publish("weather", sse::chunk::message("w1"));

    REQUIRE(drain_payloads(*a) == std::vector<std::string>{"data: n1\n\n"});
    REQUIRE(drain_payloads(*b) == std::vector<std::string>{"data: n1\n\n", "data: s1\n\n"});
    REQUIRE(bus.published() == 3);
}

TEST_CASE("local_bus shares one chunk across subscribers", "[bus][local_bus]") {
    local_bus bus;
    auto a = std::make_shared<subscriber>();
    auto b = std::make_shared<subscriber>();
    bus.subscribe("t", a);
    bus.subscribe("t", b);

    auto c = std::make_shared<const sse::chunk>(sse::chunk::message("x"));
    bus.publish("t", c);

    auto ea = a->inbox().try_recv();
    auto eb = b->inbox().try_recv();
    REQUIRE(ea->payload.get() == c.get());
    REQUIRE(eb->payload.get() == c.get());
    REQUIRE(ea->topic == "t");
}

TEST_CASE("local_bus subscribe and unsubscribe", "[bus][local_bus]") {
    local_bus bus;
    auto sub = std::make_shared<subscriber>();

    SECTION("double subscribe is a no-op") {
        bus.subscribe("t", sub);
        bus.subscribe("t", sub);
        REQUIRE(bus.subscriber_count("t") == 1);

        bus.publish("t", sse::chunk::message("once"));
        REQUIRE(sub->inbox().size() == 1);
    }

    SECTION("unsubscribe removes the topic when empty") {
        bus.subscribe("t", sub);
        REQUIRE(bus.unsubscribe("t", sub->id()));
        REQUIRE(bus.topic_count() == 0);
        REQUIRE_FALSE(bus.unsubscribe("t", sub->id()));
        REQUIRE_FALSE(bus.unsubscribe("missing", sub->id()));

        bus.publish("t", sse::chunk::message("gone"));
        REQUIRE(sub->inbox().empty());
    }

    SECTION("null subscriber") {
        REQUIRE_THROWS_AS(bus.subscribe("t", nullptr), bus_error);
    }
}

TEST_CASE("local_bus drops for a full mailbox only", "[bus][local_bus]") {
    local_bus bus;
    auto slow = std::make_shared<subscriber>(1);
    auto fast = std::make_shared<subscriber>();
    bus.subscribe("t", slow);
    bus.subscribe("t", fast);

    bus.publish("t", sse::chunk::message("1"));
    bus.publish("t", sse::chunk::message("2"));

    REQUIRE(slow->inbox().size() == 1);
    REQUIRE(slow->inbox().dropped() == 1);
    REQUIRE(fast->inbox().size() == 2);
}

TEST_CASE("local_bus shutdown", "[bus][local_bus]") {
    local_bus bus;
    auto sub = std::make_shared<subscriber>();
    bus.subscribe("t", sub);

    bus.shutdown();
    bus.shutdown();
    REQUIRE(bus.is_shut_down());
    REQUIRE(sub->inbox().is_closed());
    REQUIRE(bus.topic_count() == 0);

    REQUIRE_THROWS_AS(bus.subscribe("t", sub), bus_error);
    REQUIRE_THROWS_AS(bus.publish("t", sse::chunk::message("late")), bus_error);
    REQUIRE_FALSE(bus.unsubscribe("t", sub->id()));
}

TEST_CASE("local_bus concurrent publish and subscribe", "[bus][local_bus]") {
    local_bus bus;
    auto observer = std::make_shared<subscriber>();
    bus.subscribe("hot", observer);

    std::atomic<bool> stop{false};
    std::thread churn([&] {
        while (!stop.load()) {
            auto s = std::make_shared<subscriber>();
            bus.subscribe("hot", s);
            bus.unsubscribe("hot", s->id());
        }
    });

    constexpr int messages = 2000;
    for (int i = 0; i < messages; ++i) {
        bus.publish("hot", sse::chunk::message(std::to_string(i)));
    }
    stop.store(true);
    churn.join();

    // The long-lived subscriber saw every message, in order
    int expected = 0;
    while (auto env = observer->inbox().try_recv()) {
        REQUIRE(std::get<std::string>(env->payload->data()) == std::to_string(expected));
        ++expected;
    }
    REQUIRE(expected == messages);
}

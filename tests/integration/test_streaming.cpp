#include <catch2/catch.hpp>
#include <ssebus/ssebus.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "../test_main.cpp"
#include "../test_doubles.hpp"

using namespace ssebus;
using namespace ssebus::test;

namespace {

/// One client: its transport, and what its stream reported
struct client {
    recording_transport conn;
    std::optional<stream::stream_result> result;
};

coro::task<void> serve(client& c, bus::bus& hub, stream::subscription_set topics,
                       coro::cancel_token shutdown, std::atomic<int>& streaming,
                       std::atomic<int>& finished) {
    stream::stream_config config;
    config.on_state_change = [&streaming](stream::stream_state s) {
        if (s == stream::stream_state::streaming) streaming.fetch_add(1);
    };
    c.result = co_await stream::stream(c.conn, hub, std::move(topics), std::nullopt,
                                       std::move(shutdown), std::move(config));
    finished.fetch_add(1);
}

coro::task<void> relay(transport::transport& conn, bus::bus& hub, coro::cancel_token shutdown,
                       std::atomic<int>& streaming, std::atomic<int>& finished) {
    stream::stream_config config;
    config.on_state_change = [&streaming](stream::stream_state s) {
        if (s == stream::stream_state::streaming) streaming.fetch_add(1);
    };
    stream::subscription_set topics{"t"};
    co_await stream::stream(conn, hub, std::move(topics), std::nullopt, std::move(shutdown), std::move(config));
    finished.fetch_add(1);
}

} // namespace

TEST_CASE("fan-out to many streams on a scheduler", "[integration][stream]") {
    runtime::scheduler sched(4);
    sched.start();

    bus::local_bus hub;
    coro::cancel_source shutdown;
    std::atomic<int> streaming{0};
    std::atomic<int> finished{0};

    constexpr int num_clients = 32;
    constexpr int num_messages = 100;

    std::vector<std::unique_ptr<client>> clients;
    for (int i = 0; i < num_clients; ++i) {
        clients.push_back(std::make_unique<client>());
        // Even clients also listen to a topic nobody publishes on
        stream::subscription_set topics{"ticks"};
        if (i % 2 == 0) topics.push_back("quiet");
        sched.spawn(serve(*clients.back(), hub, std::move(topics), shutdown.get_token(),
                          streaming, finished).release());
    }

    REQUIRE(wait_until([&] { return streaming.load() == num_clients; }, scaled_ms(2000)));
    REQUIRE(hub.subscriber_count("ticks") == num_clients);
    REQUIRE(hub.subscriber_count("quiet") == num_clients / 2);

    for (int i = 0; i < num_messages; ++i) {
        bus::broadcast(hub, "ticks", std::to_string(i), "event", "tick");
    }

    REQUIRE(wait_until([&] {
        for (auto& c : clients) {
            if (c->conn.frame_count() < num_messages) return false;
        }
        return true;
    }, scaled_sec(5)));

    shutdown.cancel();
    REQUIRE(wait_until([&] { return finished.load() == num_clients; }, scaled_ms(2000)));

    for (auto& c : clients) {
        auto frames = c->conn.frames();
        REQUIRE(frames.size() == static_cast<size_t>(num_messages));
        for (int i = 0; i < num_messages; ++i) {
            REQUIRE(frames[i] == "event: tick\ndata: " + std::to_string(i) + "\n\n");
        }
        REQUIRE(c->result->cause == stream::close_cause::shutdown_requested);
    }
    REQUIRE(hub.topic_count() == 0);

    sched.shutdown();
}

TEST_CASE("disconnects leave other streams running", "[integration][stream]") {
    runtime::scheduler sched(2);
    sched.start();

    bus::local_bus hub;
    coro::cancel_source shutdown;
    std::atomic<int> streaming{0};
    std::atomic<int> finished{0};

    client leaving, staying;
    sched.spawn(serve(leaving, hub, {"t"}, shutdown.get_token(), streaming, finished).release());
    sched.spawn(serve(staying, hub, {"t"}, shutdown.get_token(), streaming, finished).release());
    REQUIRE(wait_until([&] { return streaming.load() == 2; }, scaled_ms(2000)));

    leaving.conn.close();
    REQUIRE(wait_until([&] { return finished.load() == 1; }, scaled_ms(2000)));
    REQUIRE(leaving.result->cause == stream::close_cause::client_disconnected);
    REQUIRE(hub.subscriber_count("t") == 1);

    bus::publish(hub, "t", sse::chunk::message("still here"));
    REQUIRE(wait_until([&] { return staying.conn.frame_count() == 1; }, scaled_ms(2000)));
    REQUIRE(leaving.conn.frame_count() == 0);

    hub.shutdown();
    REQUIRE(wait_until([&] { return finished.load() == 2; }, scaled_ms(2000)));
    REQUIRE(staying.result->cause == stream::close_cause::shutdown_requested);

    sched.shutdown();
}

TEST_CASE("run() drives a stream to completion", "[integration][stream]") {
    bus::local_bus hub;
    recording_transport conn;

    auto session = [&]() -> coro::task<size_t> {
        coro::cancel_source stop;
        conn.on_write([&](size_t count) {
            // The initial frame proves the stream is subscribed
            if (count == 1) {
                for (int i = 0; i < 3; ++i) {
                    bus::broadcast(hub, "t", std::to_string(i));
                }
            }
            if (count == 4) {
                stop.cancel();
            }
        });

        stream::subscription_set topics{"t"};
        auto result = co_await stream::stream(conn, hub, std::move(topics), sse::chunk::message("start"),
                                              stop.get_token());
        conn.on_write(nullptr);
        co_return result.frames_written;
    };

    REQUIRE(ssebus::run(session(), 2) == 4);
    REQUIRE(conn.frames() == std::vector<std::string>{
        "data: start\n\n", "data: 0\n\n", "data: 1\n\n", "data: 2\n\n"});
    REQUIRE(hub.topic_count() == 0);
}

TEST_CASE("a stalled client holds up only its own stream", "[integration][stream]") {
    std::signal(SIGPIPE, SIG_IGN);

    runtime::scheduler sched(2);
    sched.start();

    bus::local_bus hub;
    coro::cancel_source shutdown;
    std::atomic<int> streaming{0};
    std::atomic<int> finished{0};

    // As many stalled readers as workers: pipes nobody reads
    constexpr int num_stalled = 2;
    int pipes[num_stalled][2];
    std::vector<std::unique_ptr<transport::fd_transport>> stalled;
    for (auto& fds : pipes) {
        REQUIRE(::pipe(fds) == 0);
        stalled.push_back(std::make_unique<transport::fd_transport>(fds[1]));
        sched.spawn(relay(*stalled.back(), hub, shutdown.get_token(), streaming, finished).release());
    }
    client fast;
    sched.spawn(serve(fast, hub, {"t"}, shutdown.get_token(), streaming, finished).release());
    REQUIRE(wait_until([&] { return streaming.load() == num_stalled + 1; }, scaled_ms(2000)));

    // Publish from a thread outside the pool; the first frame overflows every pipe
    constexpr int num_small = 50;
    std::chrono::steady_clock::duration publish_took{};
    std::thread publisher([&] {
        auto start = std::chrono::steady_clock::now();
        bus::broadcast(hub, "t", std::string(256 * 1024, 'x'));
        for (int i = 0; i < num_small; ++i) {
            bus::broadcast(hub, "t", std::to_string(i));
        }
        publish_took = std::chrono::steady_clock::now() - start;
    });
    publisher.join();

    REQUIRE(publish_took < scaled_ms(1000));
    REQUIRE(wait_until([&] { return fast.conn.frame_count() == num_small + 1; }, scaled_ms(2000)));
    REQUIRE(wait_until([&] { return sched.io_poller().pending_count() == num_stalled; },
                       scaled_ms(2000)));

    auto frames = fast.conn.frames();
    for (int i = 0; i < num_small; ++i) {
        REQUIRE(frames[i + 1] == "data: " + std::to_string(i) + "\n\n");
    }

    // Dropping the stalled clients ends their streams mid-write
    for (auto& conn : stalled) {
        conn->close();
    }
    REQUIRE(wait_until([&] { return finished.load() == num_stalled; }, scaled_ms(2000)));
    REQUIRE_FALSE(fast.result.has_value());

    shutdown.cancel();
    REQUIRE(wait_until([&] { return finished.load() == num_stalled + 1; }, scaled_ms(2000)));
    REQUIRE(fast.result->cause == stream::close_cause::shutdown_requested);
    REQUIRE(hub.topic_count() == 0);

    sched.shutdown();
    stalled.clear();
    for (auto& fds : pipes) {
        ::close(fds[0]);
        ::close(fds[1]);
    }
}

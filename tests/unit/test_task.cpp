#include <catch2/catch.hpp>
#include <ssebus/coro/task.hpp>
#include <ssebus/runtime/scheduler.hpp>
#include <ssebus/runtime/async_main.hpp>
#include <string>
#include <atomic>
#include <stdexcept>
#include "../test_main.cpp"  // For scaled timeouts

using namespace ssebus::coro;
using namespace ssebus::runtime;
using namespace ssebus::test;

task<int> answer() {
    co_return 42;
}

task<int> failing() {
    throw std::runtime_error("task failed");
    co_return 0;
}

task<int> doubled() {
    int v = co_await answer();
    co_return v * 2;
}

TEST_CASE("task is lazy", "[task]") {
    bool started = false;
    auto body = [&]() -> task<void> {
        started = true;
        co_return;
    };

    auto t = body();
    REQUIRE(t.handle() != nullptr);
    REQUIRE_FALSE(started);

    t.handle().resume();
    REQUIRE(started);
    REQUIRE(t.handle().done());
}

TEST_CASE("task move semantics", "[task]") {
    auto t1 = answer();
    auto h1 = t1.handle();

    auto t2 = std::move(t1);
    REQUIRE(t1.handle() == nullptr);
    REQUIRE(t2.handle() == h1);
}

TEST_CASE("task stores value and exception", "[task]") {
    SECTION("value") {
        auto t = answer();
        t.handle().resume();
        REQUIRE(t.handle().promise().value_ == 42);
    }

    SECTION("exception") {
        auto t = failing();
        t.handle().resume();
        REQUIRE(t.handle().promise().exception() != nullptr);
    }
}

TEST_CASE("task co_await chains", "[task]") {
    REQUIRE(run_inline(doubled()) == 84);

    auto level3 = []() -> task<int> { co_return 1; };
    auto level2 = [&]() -> task<int> { co_return co_await level3() + 1; };
    auto level1 = [&]() -> task<int> { co_return co_await level2() + 1; };
    REQUIRE(run_inline(level1()) == 3);
}

TEST_CASE("task exception propagates to awaiter", "[task]") {
    auto catcher = []() -> task<std::string> {
        try {
            co_await failing();
        } catch (const std::runtime_error& e) {
            co_return std::string(e.what());
        }
        co_return std::string("no exception");
    };

    REQUIRE(run_inline(catcher()) == "task failed");
    REQUIRE_THROWS_AS(run_inline(failing()), std::runtime_error);
}

TEST_CASE("task::go() runs detached on a scheduler", "[task][spawn]") {
    scheduler sched(2);
    sched.start();

    std::atomic<bool> executed{false};
    auto body = [&]() -> task<void> {
        executed.store(true);
        co_return;
    };
    body().go();

    REQUIRE(wait_until([&] { return executed.load(); }, scaled_ms(500)));

    sched.shutdown();
}

TEST_CASE("task::spawn() returns a joinable handle", "[task][spawn][join_handle]") {
    scheduler sched(2);
    sched.start();

    std::atomic<int> result{0};
    std::atomic<bool> caught{false};

    auto driver = [&]() -> task<void> {
        auto handle = answer().spawn();
        result.store(co_await handle);

        auto bad = failing().spawn();
        try {
            co_await bad;
        } catch (const std::runtime_error&) {
            caught.store(true);
        }
    };
    driver().go();

    REQUIRE(wait_until([&] { return caught.load(); }, scaled_ms(1000)));
    REQUIRE(result.load() == 42);

    sched.shutdown();
}

TEST_CASE("run() blocks for the result", "[task][run]") {
    REQUIRE(ssebus::run(doubled(), 2) == 84);
    REQUIRE_THROWS_AS(ssebus::run(failing(), 1), std::runtime_error);

    // The calling thread is released from the scheduler afterwards
    REQUIRE(get_current_scheduler() == nullptr);
}

#include <catch2/catch.hpp>
#include <ssebus/coro/cancel_token.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace ssebus::coro;

TEST_CASE("cancel_token default state", "[cancel]") {
    cancel_token token;
    REQUIRE_FALSE(token.is_cancelled());
    REQUIRE_FALSE(token.can_be_cancelled());
    REQUIRE(static_cast<bool>(token));

    // Registering on a token that can never fire is a no-op
    int calls = 0;
    auto reg = token.on_cancel([&] { ++calls; });
    REQUIRE(calls == 0);
}

TEST_CASE("cancel_source fires its tokens", "[cancel]") {
    cancel_source source;
    auto token = source.get_token();
    REQUIRE(token.can_be_cancelled());

    int calls = 0;
    auto reg = token.on_cancel([&] { ++calls; });

    REQUIRE(source.cancel());
    REQUIRE(source.is_cancelled());
    REQUIRE(token.is_cancelled());
    REQUIRE_FALSE(static_cast<bool>(token));
    REQUIRE(calls == 1);

    SECTION("second cancel is a no-op") {
        REQUIRE_FALSE(source.cancel());
        REQUIRE(calls == 1);
    }

    SECTION("late registration runs inline") {
        int late = 0;
        auto late_reg = token.on_cancel([&] { ++late; });
        REQUIRE(late == 1);
    }
}

TEST_CASE("cancel_registration unregisters on destruction", "[cancel]") {
    cancel_source source;
    int calls = 0;
    {
        auto reg = source.get_token().on_cancel([&] { ++calls; });
    }
    source.cancel();
    REQUIRE(calls == 0);
}

TEST_CASE("cancel_registration move", "[cancel]") {
    cancel_source source;
    int calls = 0;
    cancel_registration outer;
    {
        auto reg = source.get_token().on_cancel([&] { ++calls; });
        outer = std::move(reg);
    }
    source.cancel();
    REQUIRE(calls == 1);
}

TEST_CASE("callback may unregister others while firing", "[cancel]") {
    cancel_source source;
    auto token = source.get_token();
    int calls = 0;

    cancel_registration second;
    auto first = token.on_cancel([&] {
        ++calls;
        second.unregister();
    });
    second = token.on_cancel([&] { ++calls; });

    source.cancel();
    // Both were detached from the state before either ran
    REQUIRE(calls == 2);
}

TEST_CASE("cancel from another thread", "[cancel]") {
    cancel_source source;
    std::atomic<int> calls{0};

    std::vector<cancel_registration> regs;
    for (int i = 0; i < 8; ++i) {
        regs.push_back(source.get_token().on_cancel([&] { calls.fetch_add(1); }));
    }

    std::thread canceller([&] { source.cancel(); });
    canceller.join();

    REQUIRE(calls.load() == 8);
}

#include "../ReactiveTestHelper.hpp"

#include <reactivedom/reactive/Cell.hpp>
#include <reactivedom/reactive/Scheduler.hpp>

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace RD;

TEST_SUITE("reactive.scheduler") {

TEST_CASE_FIXTURE(ReactiveFixture, "flush drains queued cells in FIFO order") {
    auto                     a = makeCell(0);
    auto                     b = makeCell(0);
    std::vector<std::string> order;
    auto ua = a.subscribe([&](int) { order.push_back("a"); });
    auto ub = b.subscribe([&](int) { order.push_back("b"); });

    b.set(1);
    a.set(1);
    CHECK(drain() == 2);
    CHECK(order == std::vector<std::string>{"b", "a"});
    CHECK_FALSE(Scheduler::current().hasPending());
    ua();
    ub();
}

TEST_CASE_FIXTURE(ReactiveFixture, "writes made by subscribers are delivered in the same flush") {
    auto source  = makeCell(1);
    auto doubled = makeCell(0);
    int  seen    = 0;
    auto forward = source.subscribe([&](int value) { doubled.set(value * 2); });
    auto observe = doubled.subscribe([&](int value) { seen = value; });

    source.set(5);
    CHECK(drain() == 2);
    CHECK(seen == 10);
    forward();
    observe();
}

TEST_CASE_FIXTURE(ReactiveFixture, "a subscriber writing its own cell gets a fresh pass") {
    auto counter = makeCell(0);
    int  calls   = 0;
    auto unsub   = counter.subscribe([&](int value) {
        ++calls;
        if (value < 3)
            counter.set(value + 1);
    });

    counter.set(1);
    drain();
    CHECK(counter.peek() == 3);
    CHECK(calls == 3);
    unsub();
}

TEST_CASE_FIXTURE(ReactiveFixture, "re-entrant flush is a no-op") {
    auto                 cell = makeCell(0);
    Expected<std::size_t> inner{std::size_t{99}};
    auto unsub = cell.subscribe([&](int) {
        CHECK(Scheduler::current().isFlushing());
        inner = flush();
    });

    cell.set(1);
    drain();
    REQUIRE(inner.has_value());
    CHECK(*inner == 0);
    unsub();
}

TEST_CASE_FIXTURE(ReactiveFixture, "batch delivers synchronously when the outermost batch exits") {
    auto             a = makeCell(0);
    auto             b = makeCell(0);
    std::vector<int> seen;
    auto ua = a.subscribe([&](int value) { seen.push_back(value); });
    auto ub = b.subscribe([&](int value) { seen.push_back(value * 100); });

    auto result = batch([&] {
        a.set(1);
        batch([&] {
            b.set(2);
            a.set(3);
        });
        CHECK(seen.empty());
        CHECK(Scheduler::current().isBatching());
        return 7;
    });
    CHECK(result == 7);
    CHECK(seen == std::vector<int>{3, 200});
    CHECK_FALSE(Scheduler::current().isBatching());
    ua();
    ub();
}

TEST_CASE_FIXTURE(ReactiveFixture, "batch still flushes when its body throws") {
    auto cell  = makeCell(0);
    int  seen  = 0;
    auto unsub = cell.subscribe([&](int value) { seen = value; });

    CHECK_THROWS_AS(batch([&] {
                        cell.set(8);
                        throw std::runtime_error("abort");
                    }),
                    std::runtime_error);
    CHECK(seen == 8);
    CHECK_FALSE(Scheduler::current().isBatching());
    unsub();
}

TEST_CASE_FIXTURE(ReactiveFixture, "turn hook fires when the queue becomes non-empty") {
    int hooks = 0;
    Scheduler::current().setTurnHook([&] { ++hooks; });
    auto a = makeCell(0);
    auto b = makeCell(0);

    a.set(1);
    b.set(1);
    CHECK(hooks == 1);
    drain();

    batch([&] { a.set(2); });
    CHECK(hooks == 1);

    a.set(3);
    CHECK(hooks == 2);
    drain();
}

TEST_CASE_FIXTURE(ReactiveFixture, "runaway notification loops stop at the iteration limit") {
    Scheduler::current().setMaxFlushIterations(10);
    auto ping = makeCell(0);
    auto pong = makeCell(0);
    auto up   = ping.subscribe([&](int value) { pong.set(value + 1); });
    auto down = pong.subscribe([&](int value) { ping.set(value + 1); });

    ping.set(1);
    auto result = Scheduler::current().flush();
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::CapacityExceeded);
    CHECK_FALSE(Scheduler::current().hasPending());
    CHECK_FALSE(ping.core()->isNotifyScheduled());
    CHECK_FALSE(pong.core()->isNotifyScheduled());
    CHECK(Scheduler::current().stats().droppedPasses == 1);
    CHECK(Scheduler::current().stats().cellPasses == 10);
    up();
    down();
}

TEST_CASE_FIXTURE(ReactiveFixture, "stats count flushes and deliveries") {
    auto cell = makeCell(0);
    auto one  = cell.subscribe([](int) {});
    auto two  = cell.subscribe([](int) {});
    cell.set(1);
    drain();
    auto const& stats = Scheduler::current().stats();
    CHECK(stats.flushes == 1);
    CHECK(stats.cellPasses == 1);
    CHECK(stats.notificationsDelivered == 2);
    one();
    two();
}

TEST_CASE_FIXTURE(ReactiveFixture, "clear drops pending passes") {
    auto cell  = makeCell(0);
    int  calls = 0;
    auto unsub = cell.subscribe([&](int) { ++calls; });
    cell.set(1);
    Scheduler::current().clear();
    CHECK(drain() == 0);
    CHECK(calls == 0);
    cell.set(2);
    drain();
    CHECK(calls == 1);
    unsub();
}

}

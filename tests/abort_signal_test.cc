#include <gtest/gtest.h>

#include <optional>
#include <variant>
#include <vector>

#include <wstreams/abort_signal.hpp>
#include <wstreams/block_on.hpp>
#include <wstreams/host/event_loop.hpp>
#include <wstreams/host/promise.hpp>
#include <wstreams/race.hpp>
#include <wstreams/ref.hpp>
#include <wstreams/task.hpp>
#include <wstreams/yield.hpp>

namespace {

using namespace wstreams;

TEST(abort_signal, fires_listeners_once) {
    abort_controller controller;
    auto signal = controller.signal();
    std::vector<value> seen;
    signal.add_listener([&](const value& reason) {
        seen.push_back(reason);
    });

    EXPECT_FALSE(signal.aborted());
    controller.abort(value("stop"));
    controller.abort(value("again"));

    EXPECT_TRUE(signal.aborted());
    EXPECT_EQ(signal.reason(), value("stop"));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], value("stop"));
}

TEST(abort_signal, removed_listener_does_not_run) {
    abort_controller controller;
    auto signal = controller.signal();
    int calls = 0;
    auto id = signal.add_listener([&](const value&) {
        calls++;
    });
    signal.remove_listener(id);
    controller.abort();
    EXPECT_EQ(calls, 0);
}

TEST(abort_signal, default_reason_is_abort_error) {
    abort_controller controller;
    controller.abort();
    EXPECT_EQ(controller.signal().reason().error_name(), "AbortError");
}

TEST(abort_signal, already_aborted_signal) {
    auto signal = abort_signal::abort(value(7));
    EXPECT_TRUE(signal.aborted());
    host::event_loop loop;
    EXPECT_EQ(block_on(loop, signal.on_abort()), value(7));
}

TEST(abort_signal, copies_observe_the_same_controller) {
    abort_controller controller;
    auto a = controller.signal();
    auto b = controller.signal();
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == abort_controller().signal());
}

task<> store_reason(abort_signal signal, std::optional<value>& out) {
    out = co_await signal.on_abort();
}

TEST(abort_signal, on_abort_wakes_the_task) {
    host::event_loop loop;
    abort_controller controller;
    std::optional<value> got;
    loop.spawn_local(store_reason(controller.signal(), got));

    loop.run_until_idle();
    EXPECT_FALSE(got);
    controller.abort(value("late"));
    loop.run_until_idle();
    ASSERT_TRUE(got);
    EXPECT_EQ(*got, value("late"));
}

TEST(race, first_ready_wins) {
    host::event_loop loop;
    auto [slow, settle] = host::promise<int>::create(loop);
    auto winner = block_on(loop, race(host::to_future(slow), yield(2)));
    EXPECT_EQ(winner.index(), 1u);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(winner));
}

TEST(race, leftmost_wins_ties) {
    host::event_loop loop;
    auto a = host::promise<int>::resolved(loop, 1);
    auto b = host::promise<int>::resolved(loop, 2);
    auto winner = block_on(loop, race(host::to_future(a), host::to_future(b)));
    ASSERT_EQ(winner.index(), 0u);
    EXPECT_EQ(std::get<0>(winner).get(), 1);
}

TEST(race, abort_cuts_a_pending_future_short) {
    host::event_loop loop;
    abort_controller controller;
    auto aborted = controller.signal().on_abort();
    auto [never, settle] = host::promise<int>::create(loop);
    auto pending = host::to_future(never);

    loop.queue_microtask([&] {
        controller.abort(value("cancelled"));
    });
    auto winner = block_on(loop, race(ref(aborted), ref(pending)));
    ASSERT_EQ(winner.index(), 0u);
    EXPECT_EQ(std::get<0>(winner), value("cancelled"));

    // The loser survived the race through its ref and can still complete.
    settle.resolve(5);
    EXPECT_EQ(block_on(loop, ref(pending)).get(), 5);
}

}  // namespace

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "test_support.hpp"

namespace {

using namespace wstreams;
using namespace wstreams::testing;

stream<result<value>> countdown(int from) {
    for (int i = from; i > 0; i--) {
        co_await yield(2);
        co_yield result<value>::ok(value(i));
    }
}

task<result<>> drain_into(reader_stream_awaitable& items, writer_sink& out) {
    while (auto item = co_await next(items)) {
        if (item->is_err()) {
            co_return result<>::err(item->take_error());
        }
        auto sent = co_await send(out, item->take());
        if (sent.is_err()) {
            co_return sent;
        }
    }
    co_return co_await close(out);
}

TEST(round_trip, sequence_through_a_readable_stream) {
    host::event_loop loop;
    auto readable = from_stream(loop, countdown(3));
    auto items = into_stream(readable);
    EXPECT_EQ(numbers(collect(loop, items)), (std::vector<double>{3, 2, 1}));
}

TEST(round_trip, sink_through_a_writable_stream) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    auto writable = from_sink(loop, std::move(target));
    auto out = into_sink(writable);

    EXPECT_TRUE(block_on(loop, send(out, value("a"))).is_ok());
    EXPECT_TRUE(block_on(loop, send(out, value("b"))).is_ok());
    EXPECT_TRUE(block_on(loop, close(out)).is_ok());
    EXPECT_EQ(state->received, (std::vector<value>{value("a"), value("b")}));
    EXPECT_TRUE(state->closed);
}

TEST(round_trip, pipe_between_adapted_streams) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    auto readable = from_stream(loop, countdown(4));
    auto writable = from_sink(loop, std::move(target));

    EXPECT_TRUE(await(loop, readable.pipe_to(writable)).is_ok());
    EXPECT_EQ(state->received.size(), 4u);
    EXPECT_EQ(state->received.back(), value(1));
    EXPECT_TRUE(state->closed);
}

TEST(round_trip, errors_cross_both_adapters_unchanged) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    auto readable = from_stream(
        loop, stream_of({result<value>::ok(value(1)), result<value>::err(boom())})
    );
    auto writable = from_sink(loop, std::move(target));

    EXPECT_EQ(await(loop, readable.pipe_to(writable)).error(), boom());
    EXPECT_EQ(state->received, (std::vector<value>{value(1)}));
    EXPECT_EQ(state->aborted_with, boom());
}

TEST(round_trip, sequences_drive_sinks_in_a_task) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    auto readable = from_stream(loop, countdown(5));
    auto writable = from_sink(loop, std::move(target), host::count_queuing_strategy(2));
    auto items = into_stream(readable);
    auto out = into_sink(writable);

    EXPECT_TRUE(block_on(loop, drain_into(items, out)).is_ok());
    EXPECT_EQ(state->received.size(), 5u);
    EXPECT_TRUE(state->closed);
    EXPECT_FALSE(readable.locked());
    EXPECT_FALSE(writable.locked());
}

TEST(round_trip, abort_stops_a_running_drain) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    channel_stream source;
    auto feed = source.handle();
    auto readable = from_stream(loop, std::move(source));
    auto writable = from_sink(loop, std::move(target));

    abort_controller canceller;
    auto items = into_stream(readable, canceller.signal());
    auto out = into_sink(writable);

    feed->push(value(1));
    loop.queue_microtask([&canceller] {
        canceller.abort(value("stop"));
    });
    // The sequence ends once the abort canceled the readable side.
    EXPECT_TRUE(block_on(loop, drain_into(items, out)).is_ok());
    EXPECT_TRUE(feed->dropped);
    EXPECT_TRUE(state->closed);
}

}  // namespace

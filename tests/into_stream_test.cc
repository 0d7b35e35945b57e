#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

#include "test_support.hpp"

namespace {

using namespace wstreams;
using namespace wstreams::testing;

struct into_stream_fixture : public ::testing::Test {
    host::event_loop loop;
    std::shared_ptr<source_log> source = std::make_shared<source_log>();
    host::readable_stream readable{loop, std::make_unique<scripted_source>(source)};

    void SetUp() override {
        loop.run_until_idle();
    }

    const host::readable_stream_default_controller& controller() {
        return *source->controller;
    }
};

TEST_F(into_stream_fixture, yields_chunks_until_close) {
    controller().enqueue(value(1));
    controller().enqueue(value(2));
    controller().close();

    auto s = into_stream(readable);
    EXPECT_TRUE(readable.locked());
    auto items = collect(loop, s);
    EXPECT_EQ(numbers(items), (std::vector<double>{1, 2}));
    EXPECT_TRUE(s.is_terminated());
    EXPECT_FALSE(readable.locked());
    EXPECT_FALSE(block_on(loop, next(s)));
}

TEST_F(into_stream_fixture, waits_for_late_chunks) {
    auto s = into_stream(readable);
    loop.queue_microtask([this] {
        controller().enqueue(value("late"));
    });
    auto item = block_on(loop, next(s));
    ASSERT_TRUE(item);
    EXPECT_EQ(item->get(), value("late"));
}

TEST_F(into_stream_fixture, error_is_yielded_once) {
    controller().enqueue(value(1));
    controller().error(boom());

    auto s = into_stream(readable);
    auto items = collect(loop, s);
    ASSERT_EQ(items.size(), 1u);
    ASSERT_TRUE(items[0].is_err());
    EXPECT_EQ(items[0].error(), boom());
    EXPECT_FALSE(readable.locked());
}

TEST_F(into_stream_fixture, dropping_early_releases_the_lock) {
    controller().enqueue(value(1));
    controller().enqueue(value(2));
    {
        auto s = into_stream(readable);
        auto first = block_on(loop, next(s));
        ASSERT_TRUE(first);
        EXPECT_EQ(first->get(), value(1));
    }
    EXPECT_FALSE(readable.locked());

    // The remaining chunk is still there for the next reader.
    auto reader = readable.get_reader();
    EXPECT_EQ(await(loop, reader.read()).get().value, value(2));
    EXPECT_EQ(source->cancels, 0);
}

TEST_F(into_stream_fixture, abort_cancels_the_stream) {
    abort_controller canceller;
    auto s = into_stream(readable, canceller.signal());
    loop.queue_microtask([&canceller] {
        canceller.abort(value("stop"));
    });

    EXPECT_FALSE(block_on(loop, next(s)));
    EXPECT_EQ(source->cancels, 1);
    EXPECT_EQ(source->cancel_reason, value("stop"));
    EXPECT_FALSE(readable.locked());
    EXPECT_FALSE(block_on(loop, next(s)));
    EXPECT_EQ(source->cancels, 1);
}

TEST_F(into_stream_fixture, already_aborted_signal_ends_at_once) {
    controller().enqueue(value(1));
    auto s = into_stream(readable, abort_signal::abort(value("early")));
    // abort wins the race even though a chunk is available
    EXPECT_TRUE(collect(loop, s).empty());
    EXPECT_EQ(source->cancels, 1);
    EXPECT_EQ(source->cancel_reason, value("early"));
}

TEST_F(into_stream_fixture, already_aborted_signal_issues_no_read) {
    int pulls = source->pulls;
    auto s = into_stream(readable, abort_signal::abort(value("early")));
    EXPECT_FALSE(block_on(loop, next(s)));
    EXPECT_EQ(source->pulls, pulls);
    EXPECT_EQ(source->cancels, 1);
}

TEST_F(into_stream_fixture, abort_after_first_item) {
    controller().enqueue(value(1));
    abort_controller canceller;
    auto s = into_stream(readable, canceller.signal());

    auto first = block_on(loop, next(s));
    ASSERT_TRUE(first);
    EXPECT_EQ(first->get(), value(1));

    canceller.abort(value("stop"));
    EXPECT_FALSE(block_on(loop, next(s)));
    EXPECT_FALSE(block_on(loop, next(s)));
    EXPECT_TRUE(s.is_terminated());
    EXPECT_EQ(source->cancels, 1);
    EXPECT_EQ(source->cancel_reason, value("stop"));
    EXPECT_FALSE(readable.locked());
}

TEST_F(into_stream_fixture, locked_stream_is_refused) {
    auto previous = get_log_sink();
    auto logs = std::make_shared<vector_sink>();
    set_log_sink(logs);
    auto reader = readable.get_reader();
    EXPECT_THROW(into_stream(readable), lock_error);
    set_log_sink(previous);

    auto entries = logs->entries();
    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries.back().level, log_level::warning);
}

TEST(into_stream, reads_a_stream_made_from_a_sequence) {
    host::event_loop loop;
    auto readable = from_stream(
        loop, stream_of({result<value>::ok(value("x")), result<value>::ok(value("y"))})
    );
    auto s = into_stream(readable);
    auto items = collect(loop, s);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[1].get(), value("y"));
}

}  // namespace

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "test_support.hpp"

namespace {

using namespace wstreams;
using namespace wstreams::testing;

static_assert(abortable_sink<writer_sink, value>);

struct into_sink_fixture : public ::testing::Test {
    host::event_loop loop;
    std::shared_ptr<sink_log> target = std::make_shared<sink_log>();
    host::writable_stream writable{loop, std::make_unique<scripted_sink>(target)};
};

TEST_F(into_sink_fixture, sends_then_closes) {
    auto s = into_sink(writable);
    EXPECT_TRUE(writable.locked());

    EXPECT_TRUE(block_on(loop, send(s, value(1))).is_ok());
    EXPECT_TRUE(block_on(loop, send(s, value(2))).is_ok());
    EXPECT_TRUE(block_on(loop, close(s)).is_ok());

    EXPECT_EQ(target->writes, (std::vector<value>{value(1), value(2)}));
    EXPECT_EQ(target->closes, 1);
    EXPECT_FALSE(writable.locked());
    // closing again is a no-op once the writer was released
    EXPECT_TRUE(block_on(loop, close(s)).is_ok());
}

TEST_F(into_sink_fixture, flush_waits_for_the_write) {
    target->manual = true;
    auto s = into_sink(writable);
    loop.run_until_idle();

    auto sent = send(s, value("a"));
    EXPECT_FALSE(sent.poll(waker()).is_ready());
    ASSERT_EQ(target->pending_writes.size(), 1u);

    target->pending_writes.front().resolve();
    EXPECT_TRUE(block_on(loop, sent).is_ok());
}

TEST_F(into_sink_fixture, host_error_is_sticky) {
    target->fail_write = boom();
    auto s = into_sink(writable);

    EXPECT_EQ(block_on(loop, send(s, value(1))).error(), boom());
    EXPECT_EQ(block_on(loop, send(s, value(2))).error(), boom());
    EXPECT_EQ(block_on(loop, close(s)).error(), boom());
    EXPECT_EQ(target->writes.size(), 1u);
    EXPECT_FALSE(writable.locked());
}

TEST_F(into_sink_fixture, abort_signal_aborts_the_stream) {
    target->manual = true;
    abort_controller canceller;
    auto s = into_sink(writable, canceller.signal());

    // The first chunk fills the queue, so the second send waits for readiness.
    EXPECT_TRUE(s.start_send(value(1)).is_ok());
    loop.queue_microtask([&canceller] {
        canceller.abort(value("stop"));
    });
    EXPECT_EQ(block_on(loop, send(s, value(2))).error(), value("stop"));

    target->pending_writes.front().resolve();
    loop.run_until_idle();
    EXPECT_EQ(target->aborts, 1);
    EXPECT_EQ(target->abort_reason, value("stop"));
    EXPECT_FALSE(writable.locked());
    EXPECT_EQ(target->writes.size(), 1u);
}

TEST_F(into_sink_fixture, abort_tears_down_the_stream) {
    auto s = into_sink(writable);
    EXPECT_TRUE(block_on(loop, send(s, value(1))).is_ok());

    EXPECT_TRUE(s.abort(boom()).is_ok());
    loop.run_until_idle();
    EXPECT_EQ(target->aborts, 1);
    EXPECT_EQ(target->abort_reason, boom());
    EXPECT_EQ(s.start_send(value(2)).error(), boom());
}

TEST_F(into_sink_fixture, locked_stream_is_refused) {
    auto writer = writable.get_writer();
    EXPECT_THROW(into_sink(writable), lock_error);
}

TEST_F(into_sink_fixture, released_writer_reports_type_error) {
    auto writer = writable.get_writer();
    writer.release_lock();
    auto s = into_sink(std::move(writer));
    auto r = block_on(loop, send(s, value(1)));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().error_name(), "TypeError");
}

}  // namespace

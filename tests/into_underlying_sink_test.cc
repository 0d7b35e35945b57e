#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support.hpp"

namespace {

using namespace wstreams;
using namespace wstreams::testing;

// Exposes only the required sink operations, so the host's abort cannot reach it.
class plain_sink {
  public:
    explicit plain_sink(std::shared_ptr<std::vector<value>> out) : out_(std::move(out)) {}

    awaitable_state<result<>> poll_ready(const waker&) {
        return awaitable_state<result<>>::ready(result<>::ok());
    }

    result<> start_send(value chunk) {
        out_->push_back(std::move(chunk));
        return result<>::ok();
    }

    awaitable_state<result<>> poll_flush(const waker&) {
        return awaitable_state<result<>>::ready(result<>::ok());
    }

    awaitable_state<result<>> poll_close(const waker&) {
        return awaitable_state<result<>>::ready(result<>::ok());
    }

  private:
    std::shared_ptr<std::vector<value>> out_;
};

// Throws from whichever step it is told to.
class throwing_sink {
  public:
    bool throw_on_send = true;

    awaitable_state<result<>> poll_ready(const waker&) {
        return awaitable_state<result<>>::ready(result<>::ok());
    }

    result<> start_send(value) {
        if (throw_on_send) {
            throw std::runtime_error("sink blew up");
        }
        return result<>::ok();
    }

    awaitable_state<result<>> poll_flush(const waker&) {
        return awaitable_state<result<>>::ready(result<>::ok());
    }

    awaitable_state<result<>> poll_close(const waker&) {
        throw std::runtime_error("close blew up");
    }
};

std::string error_message(const value& e) {
    auto err = e.as_object<error_object>();
    return err ? err->message : std::string();
}

static_assert(sink<plain_sink, value>);
static_assert(!abortable_sink<plain_sink, value>);
static_assert(abortable_sink<recording_sink, value>);

TEST(into_underlying_sink, sends_and_flushes_every_write) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    auto writable = from_sink(loop, std::move(target));
    auto writer = writable.get_writer();

    EXPECT_TRUE(await(loop, writer.write(value(1))).is_ok());
    EXPECT_TRUE(await(loop, writer.write(value(2))).is_ok());
    EXPECT_EQ(state->received, (std::vector<value>{value(1), value(2)}));
    EXPECT_EQ(state->flushes, 2);

    EXPECT_TRUE(await(loop, writer.close()).is_ok());
    EXPECT_TRUE(state->closed);
    EXPECT_TRUE(state->dropped);
}

TEST(into_underlying_sink, write_waits_for_readiness) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    state->hold_ready = true;
    auto writable = from_sink(loop, std::move(target));
    auto writer = writable.get_writer();

    auto written = writer.write(value("x"));
    loop.run_until_idle();
    EXPECT_TRUE(written.is_pending());
    EXPECT_TRUE(state->received.empty());

    state->release_ready();
    EXPECT_TRUE(await(loop, written).is_ok());
    EXPECT_EQ(state->received, (std::vector<value>{value("x")}));
}

TEST(into_underlying_sink, failure_is_sticky) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    state->fail_send = boom();
    auto writable = from_sink(loop, std::move(target));
    auto writer = writable.get_writer();

    EXPECT_EQ(await(loop, writer.write(value(1))).error(), boom());
    EXPECT_TRUE(state->dropped);
    EXPECT_EQ(await(loop, writer.closed()).error(), boom());
    EXPECT_EQ(await(loop, writer.write(value(2))).error(), boom());
}

TEST(into_underlying_sink, failed_close_rejects) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    state->fail_close = boom();
    auto writable = from_sink(loop, std::move(target));
    auto writer = writable.get_writer();

    EXPECT_EQ(await(loop, writer.close()).error(), boom());
    EXPECT_EQ(await(loop, writer.closed()).error(), boom());
    EXPECT_TRUE(state->dropped);
}

TEST(into_underlying_sink, abort_reaches_an_abortable_sink) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    auto writable = from_sink(loop, std::move(target));

    EXPECT_TRUE(await(loop, writable.abort(value("stop"))).is_ok());
    EXPECT_EQ(state->aborted_with, value("stop"));
    EXPECT_TRUE(state->dropped);
    EXPECT_FALSE(state->closed);
}

TEST(into_underlying_sink, failed_abort_rejects) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    state->fail_abort = boom();
    auto writable = from_sink(loop, std::move(target));

    EXPECT_EQ(await(loop, writable.abort(value("stop"))).error(), boom());
}

TEST(into_underlying_sink, abort_drops_a_plain_sink) {
    host::event_loop loop;
    auto out = std::make_shared<std::vector<value>>();
    auto writable = from_sink(loop, plain_sink(out));
    auto writer = writable.get_writer();

    EXPECT_TRUE(await(loop, writer.write(value(1))).is_ok());
    EXPECT_TRUE(await(loop, writer.abort(boom())).is_ok());
    EXPECT_EQ(await(loop, writer.write(value(2))).error(), boom());
    EXPECT_EQ(out->size(), 1u);
}

TEST(into_underlying_sink, host_queue_buffers_behind_a_slow_sink) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    state->hold_ready = true;
    auto writable = from_sink(loop, std::move(target), host::count_queuing_strategy(3));
    auto writer = writable.get_writer();

    auto a = writer.write(value(1));
    auto b = writer.write(value(2));
    loop.run_until_idle();
    EXPECT_EQ(writer.desired_size(), 1.0);
    EXPECT_TRUE(writer.ready().is_fulfilled());

    state->release_ready();
    EXPECT_TRUE(await(loop, b).is_ok());
    EXPECT_TRUE(a.is_fulfilled());
    EXPECT_EQ(state->received.size(), 2u);
}

TEST(into_underlying_sink, close_twice_succeeds_both_times) {
    host::event_loop loop;
    recording_sink target;
    auto state = target.handle();
    into_underlying_sink<recording_sink> adapter(loop, std::move(target));

    EXPECT_TRUE(await(loop, adapter.close()).is_ok());
    EXPECT_TRUE(state->closed);
    EXPECT_TRUE(await(loop, adapter.close()).is_ok());
    // nothing left to abort
    EXPECT_TRUE(await(loop, adapter.abort(value("late"))).is_ok());
    EXPECT_FALSE(state->aborted_with);
}

TEST(into_underlying_sink, exception_from_send_errors_the_stream) {
    host::event_loop loop;
    auto writable = from_sink(loop, throwing_sink());
    auto writer = writable.get_writer();

    auto written = await(loop, writer.write(value(1)));
    ASSERT_TRUE(written.is_err());
    EXPECT_EQ(written.error().error_name(), "Error");
    EXPECT_EQ(error_message(written.error()), "sink blew up");
    EXPECT_EQ(await(loop, writer.closed()).error(), written.error());
    EXPECT_EQ(await(loop, writer.write(value(2))).error(), written.error());
}

TEST(into_underlying_sink, exception_from_close_rejects_the_close) {
    host::event_loop loop;
    throwing_sink target;
    target.throw_on_send = false;
    auto writable = from_sink(loop, std::move(target));
    auto writer = writable.get_writer();

    EXPECT_TRUE(await(loop, writer.write(value(1))).is_ok());
    auto closed = await(loop, writer.close());
    ASSERT_TRUE(closed.is_err());
    EXPECT_EQ(error_message(closed.error()), "close blew up");
    EXPECT_EQ(await(loop, writer.closed()).error(), closed.error());
}

}  // namespace

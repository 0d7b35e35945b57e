#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <wstreams/host/transform_stream.hpp>

#include "test_support.hpp"

namespace {

using namespace wstreams;
using namespace wstreams::testing;

// Enqueues every chunk twice and a final "end" on flush.
class doubling_transformer : public host::transformer {
  public:
    host::promise<> transform(
        const value& chunk, host::transform_stream_default_controller& controller
    ) override {
        controller.enqueue(chunk);
        controller.enqueue(chunk);
        return {};
    }

    host::promise<> flush(host::transform_stream_default_controller& controller) override {
        controller.enqueue(value("end"));
        return {};
    }
};

// Terminates on "stop", fails on "bad", passes everything else through.
class picky_transformer : public host::transformer {
  public:
    host::promise<> transform(
        const value& chunk, host::transform_stream_default_controller& controller
    ) override {
        if (chunk == value("stop")) {
            controller.terminate();
            return {};
        }
        if (chunk == value("bad")) {
            return host::promise<>::rejected(controller.loop(), boom());
        }
        controller.enqueue(chunk);
        return {};
    }
};

std::vector<std::string> strings(const std::vector<result<value>>& items) {
    std::vector<std::string> out;
    for (const auto& item : items) {
        if (item.is_ok() && item.get().is_string()) {
            out.push_back(item.get().as_string());
        }
    }
    return out;
}

TEST(transform_stream, passes_chunks_through_by_default) {
    host::event_loop loop;
    host::transform_stream transform(loop);
    auto writer = transform.writable().get_writer();
    auto reader = transform.readable().get_reader();

    auto written = writer.write(value(1));
    loop.run_until_idle();
    // nothing is transformed before someone reads
    EXPECT_TRUE(written.is_pending());

    EXPECT_EQ(await(loop, reader.read()).get().value, value(1));
    EXPECT_TRUE(await(loop, written).is_ok());

    auto closed = writer.close();
    EXPECT_TRUE(await(loop, reader.read()).get().done);
    EXPECT_TRUE(await(loop, closed).is_ok());
    EXPECT_TRUE(await(loop, reader.closed()).is_ok());
}

TEST(transform_stream, pipes_through_a_transformer) {
    host::event_loop loop;
    host::transform_stream transform(loop, std::make_unique<doubling_transformer>());
    auto source = from_stream(loop, stream_of({result<value>::ok(value("a")), result<value>::ok(value("b"))}));
    auto piped = source.pipe_to(transform.writable());

    auto out = into_stream(transform.readable());
    auto items = collect(loop, out);
    EXPECT_EQ(strings(items), (std::vector<std::string>{"a", "a", "b", "b", "end"}));
    EXPECT_TRUE(await(loop, piped).is_ok());
}

TEST(transform_stream, terminate_closes_readable_and_errors_writable) {
    host::event_loop loop;
    host::transform_stream transform(loop, std::make_unique<picky_transformer>());
    auto writer = transform.writable().get_writer();
    auto reader = transform.readable().get_reader();

    writer.write(value("x"));
    EXPECT_EQ(await(loop, reader.read()).get().value, value("x"));

    writer.write(value("stop"));
    EXPECT_TRUE(await(loop, reader.read()).get().done);
    EXPECT_EQ(await(loop, writer.closed()).error().error_name(), "TypeError");
    EXPECT_EQ(await(loop, writer.write(value("y"))).error().error_name(), "TypeError");
}

TEST(transform_stream, failed_transform_errors_both_sides) {
    host::event_loop loop;
    host::transform_stream transform(loop, std::make_unique<picky_transformer>());
    auto writer = transform.writable().get_writer();
    auto reader = transform.readable().get_reader();

    auto written = writer.write(value("bad"));
    EXPECT_EQ(await(loop, reader.read()).error(), boom());
    EXPECT_EQ(await(loop, written).error(), boom());
    EXPECT_EQ(await(loop, writer.closed()).error(), boom());
}

TEST(transform_stream, cancel_errors_the_writable_side) {
    host::event_loop loop;
    host::transform_stream transform(loop);
    auto writer = transform.writable().get_writer();
    auto blocked = writer.write(value(1));
    loop.run_until_idle();

    EXPECT_TRUE(await(loop, transform.readable().cancel(value("bye"))).is_ok());
    EXPECT_EQ(await(loop, blocked).error(), value("bye"));
    EXPECT_EQ(await(loop, writer.closed()).error(), value("bye"));
}

TEST(transform_stream, abort_errors_the_readable_side) {
    host::event_loop loop;
    host::transform_stream transform(loop);
    auto writer = transform.writable().get_writer();
    auto reader = transform.readable().get_reader();

    EXPECT_TRUE(await(loop, writer.abort(value("stop"))).is_ok());
    EXPECT_EQ(await(loop, reader.read()).error(), value("stop"));
}

}  // namespace

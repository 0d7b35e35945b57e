#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "test_support.hpp"

namespace {

using namespace wstreams;
using namespace wstreams::testing;

struct pipe_fixture : public ::testing::Test {
    host::event_loop loop;
    std::shared_ptr<source_log> source = std::make_shared<source_log>();
    std::shared_ptr<sink_log> sink = std::make_shared<sink_log>();

    host::readable_stream readable{loop, std::make_unique<scripted_source>(source)};
    host::writable_stream writable{loop, std::make_unique<scripted_sink>(sink)};
};

TEST_F(pipe_fixture, copies_every_chunk_then_closes) {
    loop.run_until_idle();
    source->controller->enqueue(value(1));
    source->controller->enqueue(value(2));
    source->controller->close();

    auto piped = readable.pipe_to(writable);
    EXPECT_TRUE(readable.locked());
    EXPECT_TRUE(writable.locked());
    EXPECT_TRUE(await(loop, piped).is_ok());

    EXPECT_EQ(sink->writes, (std::vector<value>{value(1), value(2)}));
    EXPECT_EQ(sink->closes, 1);
    EXPECT_FALSE(readable.locked());
    EXPECT_FALSE(writable.locked());
}

TEST_F(pipe_fixture, prevent_close_leaves_destination_open) {
    loop.run_until_idle();
    source->controller->enqueue(value(1));
    source->controller->close();

    host::pipe_options options;
    options.prevent_close = true;
    EXPECT_TRUE(await(loop, readable.pipe_to(writable, options)).is_ok());
    EXPECT_EQ(sink->closes, 0);

    auto writer = writable.get_writer();
    EXPECT_TRUE(await(loop, writer.write(value(2))).is_ok());
}

TEST_F(pipe_fixture, source_error_aborts_destination) {
    auto piped = readable.pipe_to(writable);
    loop.run_until_idle();
    source->controller->enqueue(value(1));
    source->controller->error(boom());

    EXPECT_EQ(await(loop, piped).error(), boom());
    EXPECT_EQ(sink->writes, (std::vector<value>{value(1)}));
    EXPECT_EQ(sink->aborts, 1);
    EXPECT_EQ(sink->abort_reason, boom());
}

TEST_F(pipe_fixture, destination_error_cancels_source) {
    sink->fail_write = boom();
    auto piped = readable.pipe_to(writable);
    loop.run_until_idle();
    source->controller->enqueue(value(1));

    EXPECT_EQ(await(loop, piped).error(), boom());
    EXPECT_EQ(source->cancels, 1);
    EXPECT_EQ(source->cancel_reason, boom());
}

TEST_F(pipe_fixture, abort_signal_stops_both_sides) {
    abort_controller controller;
    host::pipe_options options;
    options.signal = controller.signal();
    auto piped = readable.pipe_to(writable, options);
    loop.run_until_idle();

    controller.abort(value("enough"));
    EXPECT_EQ(await(loop, piped).error(), value("enough"));
    EXPECT_EQ(sink->aborts, 1);
    EXPECT_EQ(source->cancels, 1);
    EXPECT_EQ(source->cancel_reason, value("enough"));
}

TEST_F(pipe_fixture, locked_streams_are_rejected) {
    auto reader = readable.get_reader();
    EXPECT_EQ(await(loop, readable.pipe_to(writable)).error().error_name(), "TypeError");
    EXPECT_FALSE(writable.locked());
}

}  // namespace

#include <gtest/gtest.h>

#include <asio/io_context.hpp>
#include <exception>
#include <optional>
#include <stdexcept>

#include <wstreams/asio.hpp>

#include "test_support.hpp"

namespace {

using namespace wstreams;
using namespace wstreams::testing;

task<int> sum_of(host::readable_stream& readable) {
    auto items = into_stream(readable);
    int total = 0;
    while (auto item = co_await next(items)) {
        total += static_cast<int>(item->get().as_number());
    }
    co_return total;
}

TEST(asio, io_context_drains_the_loop) {
    asio::io_context ctx;
    host::event_loop loop;
    bind_to_asio(loop, ctx.get_executor());

    int ran = 0;
    loop.queue_microtask([&] {
        ran++;
        loop.queue_microtask([&] {
            ran++;
        });
    });
    ctx.run();
    EXPECT_EQ(ran, 2);
    EXPECT_TRUE(loop.idle());
}

TEST(asio, completes_through_a_callback) {
    asio::io_context ctx;
    host::event_loop loop;
    bind_to_asio(loop, ctx.get_executor());

    auto readable = from_stream(
        loop,
        stream_of({result<value>::ok(value(1)), result<value>::ok(value(2)), result<value>::ok(value(3))})
    );
    std::optional<int> total;
    to_asio(ctx.get_executor(), sum_of(readable), [&](std::exception_ptr e, int n) {
        EXPECT_FALSE(e);
        total = n;
    });
    ctx.run();
    ASSERT_TRUE(total);
    EXPECT_EQ(*total, 6);
}

task<int> fails() {
    co_await yield(2);
    throw std::runtime_error("failed");
}

TEST(asio, reports_exceptions) {
    asio::io_context ctx;
    std::exception_ptr error;
    to_asio(ctx.get_executor(), fails(), [&](std::exception_ptr e, int) {
        error = e;
    });
    ctx.run();
    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), std::runtime_error);
}

}  // namespace

/*
 * ASIO Example
 *
 * Runs the host event loop on an asio::io_context and hands the result of a
 * coroutine back to ASIO through a completion handler.
 */

#include <asio/io_context.hpp>
#include <exception>
#include <iostream>
#include <wstreams/asio.hpp>
#include <wstreams/next.hpp>
#include <wstreams/readable.hpp>
#include <wstreams/stream.hpp>
#include <wstreams/task.hpp>
#include <wstreams/yield.hpp>

namespace {

wstreams::stream<wstreams::result<wstreams::value>> words() {
    for (const char* w : {"poll", "meets", "promise"}) {
        co_await wstreams::yield(2);
        co_yield wstreams::result<wstreams::value>::ok(wstreams::value(w));
    }
}

wstreams::task<int> count_words(wstreams::host::readable_stream& readable) {
    auto items = wstreams::into_stream(readable);
    int count = 0;
    while (auto item = co_await wstreams::next(items)) {
        std::cout << "  word: " << item->get() << "\n";
        ++count;
    }
    co_return count;
}

}  // namespace

int main() {
    asio::io_context ctx;
    wstreams::host::event_loop loop;
    wstreams::bind_to_asio(loop, ctx.get_executor());

    auto readable = wstreams::from_stream(loop, words());
    wstreams::to_asio(ctx.get_executor(), count_words(readable), [](std::exception_ptr e, int n) {
        if (e) {
            std::cout << "counting failed\n";
            return;
        }
        std::cout << "counted " << n << " words\n";
    });

    ctx.run();
    return 0;
}

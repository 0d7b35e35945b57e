/*
 * Round Trip Example
 *
 * Shows the four adapters working together:
 * - from_stream: a coroutine sequence becomes a host readable stream
 * - into_stream: the host readable stream is read back as a sequence
 * - from_sink:   a sink becomes a host writable stream
 * - into_sink:   the host writable stream is written to as a sink
 */

#include <iostream>
#include <string>
#include <vector>
#include <wstreams/block_on.hpp>
#include <wstreams/next.hpp>
#include <wstreams/readable.hpp>
#include <wstreams/sink.hpp>
#include <wstreams/stream.hpp>
#include <wstreams/task.hpp>
#include <wstreams/writable.hpp>
#include <wstreams/yield.hpp>

namespace {

// Produces "line 1" ... "line n", pretending each line takes a moment to arrive
wstreams::stream<wstreams::result<wstreams::value>> lines(int n) {
    for (int i = 1; i <= n; ++i) {
        co_await wstreams::yield(2);
        co_yield wstreams::result<wstreams::value>::ok(wstreams::value("line " + std::to_string(i)));
    }
}

// A sink that prints what it receives
class console_sink {
  public:
    wstreams::awaitable_state<wstreams::result<>> poll_ready(const wstreams::waker&) {
        return wstreams::awaitable_state<wstreams::result<>>::ready(wstreams::result<>::ok());
    }

    wstreams::result<> start_send(wstreams::value chunk) {
        std::cout << "  sink got: " << chunk << "\n";
        return wstreams::result<>::ok();
    }

    wstreams::awaitable_state<wstreams::result<>> poll_flush(const wstreams::waker&) {
        return wstreams::awaitable_state<wstreams::result<>>::ready(wstreams::result<>::ok());
    }

    wstreams::awaitable_state<wstreams::result<>> poll_close(const wstreams::waker&) {
        std::cout << "  sink closed\n";
        return wstreams::awaitable_state<wstreams::result<>>::ready(wstreams::result<>::ok());
    }
};

wstreams::task<wstreams::result<>> copy(
    wstreams::reader_stream_awaitable& from, wstreams::writer_sink& to
) {
    while (auto item = co_await wstreams::next(from)) {
        if (item->is_err()) {
            co_return wstreams::result<>::err(item->take_error());
        }
        auto sent = co_await wstreams::send(to, item->take());
        if (sent.is_err()) {
            co_return sent;
        }
    }
    co_return co_await wstreams::close(to);
}

}  // namespace

int main() {
    wstreams::host::event_loop loop;

    std::cout << "=== sequence -> readable stream -> sequence ===\n";
    {
        auto readable = wstreams::from_stream(loop, lines(3));
        auto items = wstreams::into_stream(readable);
        while (auto item = wstreams::block_on(loop, wstreams::next(items))) {
            std::cout << "  read: " << item->get() << "\n";
        }
    }

    std::cout << "\n=== sequence -> host streams -> sink ===\n";
    {
        auto readable = wstreams::from_stream(loop, lines(4));
        auto writable = wstreams::from_sink(loop, console_sink());
        auto from = wstreams::into_stream(readable);
        auto to = wstreams::into_sink(writable);
        auto copied = wstreams::block_on(loop, copy(from, to));
        std::cout << "  copy " << (copied.is_ok() ? "finished" : "failed") << "\n";
    }

    return 0;
}

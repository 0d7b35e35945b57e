/*
 * Pipe Example
 *
 * Pipes a host readable stream into a host writable stream. Both ends are adapters
 * here, so the chunks travel sequence -> host -> host -> sink.
 */

#include <iostream>
#include <wstreams/block_on.hpp>
#include <wstreams/host/promise.hpp>
#include <wstreams/readable.hpp>
#include <wstreams/stream.hpp>
#include <wstreams/writable.hpp>

namespace {

wstreams::stream<wstreams::result<wstreams::value>> squares(int n) {
    for (int i = 1; i <= n; ++i) {
        co_yield wstreams::result<wstreams::value>::ok(wstreams::value(i * i));
    }
    co_yield wstreams::result<wstreams::value>::err(wstreams::value::error("RangeError", "out of squares"));
}

class summing_sink {
  public:
    explicit summing_sink(double& total) : total_(&total) {}

    wstreams::awaitable_state<wstreams::result<>> poll_ready(const wstreams::waker&) {
        return wstreams::awaitable_state<wstreams::result<>>::ready(wstreams::result<>::ok());
    }

    wstreams::result<> start_send(wstreams::value chunk) {
        if (!chunk.is_number()) {
            return wstreams::result<>::err(wstreams::value::type_error("expected a number"));
        }
        *total_ += chunk.as_number();
        return wstreams::result<>::ok();
    }

    wstreams::awaitable_state<wstreams::result<>> poll_flush(const wstreams::waker&) {
        return wstreams::awaitable_state<wstreams::result<>>::ready(wstreams::result<>::ok());
    }

    wstreams::awaitable_state<wstreams::result<>> poll_close(const wstreams::waker&) {
        return wstreams::awaitable_state<wstreams::result<>>::ready(wstreams::result<>::ok());
    }

  private:
    double* total_;
};

}  // namespace

int main() {
    wstreams::host::event_loop loop;
    double total = 0;

    auto readable = wstreams::from_stream(loop, squares(4));
    auto writable = wstreams::from_sink(loop, summing_sink(total));

    auto piped = wstreams::block_on(loop, wstreams::host::to_future(readable.pipe_to(writable)));
    std::cout << "sum of squares: " << total << "\n";
    if (piped.is_err()) {
        std::cout << "pipe stopped: " << piped.error() << "\n";
    }
    return 0;
}

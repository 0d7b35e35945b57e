/*
 * Abort Example
 *
 * An abort signal cuts a read short: the host stream is canceled with the signal's
 * reason and the sequence simply ends.
 */

#include <iostream>
#include <memory>
#include <wstreams/abort_signal.hpp>
#include <wstreams/block_on.hpp>
#include <wstreams/log.hpp>
#include <wstreams/next.hpp>
#include <wstreams/readable.hpp>
#include <wstreams/stream.hpp>
#include <wstreams/yield.hpp>

namespace {

// Never ends on its own
wstreams::stream<wstreams::result<wstreams::value>> ticks() {
    for (int i = 0;; ++i) {
        co_await wstreams::yield(3);
        co_yield wstreams::result<wstreams::value>::ok(wstreams::value(i));
    }
}

}  // namespace

int main() {
    auto sink = std::make_shared<wstreams::stderr_sink>();
    sink->set_level(wstreams::log_level::debug);
    wstreams::set_log_sink(sink);

    wstreams::host::event_loop loop;
    wstreams::abort_controller controller;

    auto readable = wstreams::from_stream(loop, ticks());
    auto items = wstreams::into_stream(readable, controller.signal());

    int seen = 0;
    while (auto item = wstreams::block_on(loop, wstreams::next(items))) {
        std::cout << "tick " << item->get() << "\n";
        if (++seen == 5) {
            controller.abort(wstreams::value("had enough"));
        }
    }

    std::cout << "stream ended after " << seen << " ticks, locked: " << std::boolalpha
              << readable.locked() << "\n";
    return 0;
}

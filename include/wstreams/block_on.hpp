#pragma once

#include <memory>
#include <type_traits>

#include "awaitable.hpp"
#include "errors.hpp"
#include "host/event_loop.hpp"
#include "waker.hpp"

namespace wstreams {

/// Drives an awaitable to completion on the calling thread, running the loop's
/// microtasks whenever the awaitable is pending.
///
/// Throws stalled_error if the awaitable is pending, was not woken, and the loop has
/// nothing left to run: in a single-threaded host nothing could ever wake it.
template<awaitable Awaitable>
auto block_on(host::event_loop& loop, Awaitable&& awaitable)
    -> awaitable_result_t<std::remove_cvref_t<Awaitable>> {
    struct wake_flag {
        bool notified = true;

        void wake() noexcept {
            notified = true;
        }
    };

    // Owned by the waker, so a waker left registered somewhere after we return stays
    // harmless.
    auto flag = std::make_shared<wake_flag>();
    waker w(flag);
    while (true) {
        if (flag->notified) {
            flag->notified = false;
            auto state = awaitable.poll(w);
            if (state.is_ready()) {
                return state.take_result();
            }
            continue;
        }
        if (!loop.run_one()) {
            throw stalled_error("block_on: awaitable is pending but the event loop is idle");
        }
    }
}

}  // namespace wstreams

#pragma once

#include <cstdint>

#include "awaitable.hpp"
#include "waker.hpp"

namespace wstreams {
// Pending for the given number of polls, waking itself each time. On the event loop
// every pending poll costs one trip through the microtask queue.
class yield_awaitable {
    uint32_t ready_{0};

  public:
    yield_awaitable() : yield_awaitable(1) {}

    explicit yield_awaitable(uint32_t ready) : ready_(ready) {}

    awaitable_state<> poll(const waker& w) {
        if (ready_ > 0) {
            ready_--;
        }
        if (ready_ == 0) {
            return awaitable_state<>::ready();
        }
        w.wake();
        return awaitable_state<>::pending();
    }
};

inline auto yield(uint32_t ready = 1) {
    return yield_awaitable(ready);
}

}  // namespace wstreams

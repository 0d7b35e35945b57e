#pragma once

#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

#include "awaitable.hpp"
#include "result.hpp"
#include "value.hpp"
#include "waker.hpp"

namespace wstreams {
/// A poll-based consumer of Items.
///
/// poll_ready() must be ready before each start_send(). start_send() hands the item over
/// without waiting for it to be consumed; poll_flush() waits until everything sent so far
/// was consumed, poll_close() flushes and then shuts the sink down. Failures are opaque
/// values; once a sink failed it keeps failing.
template<typename S, typename Item>
concept sink = std::move_constructible<S> && requires(S s, const waker& w, Item item) {
    { s.poll_ready(w) } -> std::same_as<awaitable_state<result<>>>;
    { s.start_send(std::move(item)) } -> std::same_as<result<>>;
    { s.poll_flush(w) } -> std::same_as<awaitable_state<result<>>>;
    { s.poll_close(w) } -> std::same_as<awaitable_state<result<>>>;
};

// A sink that can be torn down abruptly, discarding whatever it still buffers.
template<typename S, typename Item>
concept abortable_sink = sink<S, Item> && requires(S s, const value& reason) {
    { s.abort(reason) } -> std::same_as<result<>>;
};

template<typename Sink, typename Item>
    requires sink<Sink, Item>
class send_awaitable {
    Sink& sink_;
    std::optional<Item> item_;

  public:
    send_awaitable(Sink& sink, Item item) : sink_(sink), item_(std::move(item)) {}

    awaitable_state<result<>> poll(const waker& w) {
        if (item_) {
            auto ready = sink_.poll_ready(w);
            if (!ready.is_ready()) {
                return awaitable_state<result<>>::pending();
            }
            auto r = ready.take_result();
            if (r.is_err()) {
                item_.reset();
                return awaitable_state<result<>>::ready(std::move(r));
            }
            auto sent = sink_.start_send(*std::exchange(item_, std::nullopt));
            if (sent.is_err()) {
                return awaitable_state<result<>>::ready(std::move(sent));
            }
        }
        return sink_.poll_flush(w);
    }
};

template<typename Sink>
class flush_awaitable {
    Sink& sink_;

  public:
    explicit flush_awaitable(Sink& sink) : sink_(sink) {}

    awaitable_state<result<>> poll(const waker& w) {
        return sink_.poll_flush(w);
    }
};

template<typename Sink>
class close_awaitable {
    Sink& sink_;

  public:
    explicit close_awaitable(Sink& sink) : sink_(sink) {}

    awaitable_state<result<>> poll(const waker& w) {
        return sink_.poll_close(w);
    }
};

/// Waits for readiness, sends the item and flushes.
template<typename Sink, typename Item>
    requires sink<Sink, std::remove_cvref_t<Item>>
auto send(Sink& sink, Item&& item) {
    return send_awaitable<Sink, std::remove_cvref_t<Item>>(sink, std::forward<Item>(item));
}

template<typename Sink>
auto flush(Sink& sink) {
    return flush_awaitable<Sink>(sink);
}

template<typename Sink>
auto close(Sink& sink) {
    return close_awaitable<Sink>(sink);
}

}  // namespace wstreams

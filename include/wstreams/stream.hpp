#pragma once

#include <coroutine>
#include <exception>
#include <utility>

#include "detail/promise.hpp"
#include "stream_awaitable.hpp"
#include "waker.hpp"

namespace wstreams {
/// A coroutine sequence: co_yield produces an item, co_return ends the sequence.
/// Handy for writing the sequences handed to from_stream().
template<typename T>
class stream {
    void destroy() {
        if (handle_) {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

  public:
    using promise_type = detail::promise_type<stream, T, detail::stream_storage<T>>;

    explicit stream(std::coroutine_handle<promise_type> h) : handle_(h) {}

    stream(stream&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    stream& operator=(stream&& other) noexcept {
        if (this != &other) {
            destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    stream(const stream&) = delete;
    stream& operator=(const stream&) = delete;

    ~stream() {
        destroy();
    }

    stream_awaitable_state<T> poll_next(const waker& w) {
        auto& promise = handle_.promise();
        bool resumed = false;
        if (!is_ready()) {
            try {
                resumed = promise.poll_ready(w);
            } catch (...) {
                promise.exception = std::current_exception();
                resumed = true;
            }
            if (resumed) {
                handle_.resume();
            }
        }

        if (promise.has_value()) {
            return stream_awaitable_state<T>::ready(promise.take_result());
        }

        if (is_ready()) {
            auto exception = std::exchange(promise.exception, nullptr);
            if (exception) {
                std::rethrow_exception(exception);
            }
            return stream_awaitable_state<T>::done();
        }

        if (resumed) {
            w.wake();
        }

        return stream_awaitable_state<T>::pending();
    }

  private:
    std::coroutine_handle<promise_type> handle_;

    bool is_ready() const {
        return handle_.done();
    }
};

}  // namespace wstreams

#pragma once

#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>

#include "awaitable.hpp"
#include "detail/promise.hpp"
#include "waker.hpp"

namespace wstreams {
/// A coroutine that is itself an awaitable. It runs only while polled; each poll resumes
/// it as far as the awaitable it is suspended on allows.
///
/// An exception escaping the coroutine is rethrown from the poll that completes it.
template<typename T = void>
class task {
    void destroy() {
        if (handle_) {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

  public:
    using promise_type = detail::promise_type<task, T, detail::task_storage<T>>;

    explicit task(std::coroutine_handle<promise_type> h) : handle_(h) {}

    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    ~task() {
        destroy();
    }

    awaitable_state<T> poll(const waker& w) {
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

        if (is_ready()) {
            auto exception = promise.exception;
            promise.exception = nullptr;
            if (exception) {
                std::rethrow_exception(exception);
            }
            if constexpr (std::is_void_v<T>) {
                return awaitable_state<T>::ready();
            } else {
                return awaitable_state<T>::ready(promise.take_result());
            }
        }

        // The coroutine moved on to a new awaitable that has not been polled yet.
        if (resumed) {
            w.wake();
        }

        return awaitable_state<T>::pending();
    }

  private:
    std::coroutine_handle<promise_type> handle_;

    bool is_ready() const {
        return handle_.done();
    }
};

}  // namespace wstreams

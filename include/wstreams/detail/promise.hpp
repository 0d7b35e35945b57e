#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include "../awaitable.hpp"
#include "../waker.hpp"

namespace wstreams::detail {
struct promise_base {
    std::exception_ptr exception{nullptr};

    // The awaitable the coroutine is suspended on, type-erased.
    void* current_awaitable = nullptr;
    bool (*current_awaitable_poll)(void*, const waker&) = nullptr;
};

template<typename T>
class task_storage : public promise_base {
    std::optional<T> result;

  public:
    void return_value(T value) {
        result = std::move(value);
    }

    T take_result() {
        auto value = std::move(*result);
        result = std::nullopt;
        return value;
    }
};

template<>
class task_storage<void> : public promise_base {
  public:
    void return_void() {}
};

template<typename T>
class stream_storage : public promise_base {
    std::optional<T> result;

  public:
    void return_void() {}

    std::suspend_always yield_value(T value) {
        result = std::move(value);
        return {};
    }

    T take_result() {
        auto value = std::move(*result);
        result = std::nullopt;
        return value;
    }

    bool has_value() const {
        return result.has_value();
    }
};

template<typename promise_type, awaitable Awaitable>
auto transform_awaitable(promise_type& promise, Awaitable&& awaitable) {
    using result_type = awaitable_result_t<std::remove_cvref_t<Awaitable>>;

    struct transformed_awaitable : task_storage<result_type> {
        promise_type& promise;
        std::remove_cvref_t<Awaitable> awaitable;

        transformed_awaitable(promise_type& promise, Awaitable&& awaitable)
            : promise(promise), awaitable(std::forward<Awaitable>(awaitable)) {}

        constexpr bool await_ready() {
            return false;
        }

        void await_suspend(std::coroutine_handle<>) {
            promise.exception = nullptr;
            promise.current_awaitable = this;
            promise.current_awaitable_poll = [](void* awaitable, const waker& w) {
                auto self = static_cast<transformed_awaitable*>(awaitable);
                auto state = self->awaitable.poll(w);
                if (!state.is_ready()) {
                    return false;
                }
                if constexpr (!std::is_void_v<result_type>) {
                    self->return_value(state.take_result());
                }
                return true;
            };
        }

        result_type await_resume() {
            auto exception = promise.exception;
            promise.current_awaitable = nullptr;
            promise.current_awaitable_poll = nullptr;
            promise.exception = nullptr;
            if (exception) {
                std::rethrow_exception(exception);
            }
            if constexpr (!std::is_void_v<result_type>) {
                return this->take_result();
            }
        }
    };

    return transformed_awaitable(promise, std::forward<Awaitable>(awaitable));
}

template<typename task, typename result, typename storage>
struct promise_type : public storage {
    bool poll_ready(const waker& w) {
        if (this->current_awaitable_poll) {
            return this->current_awaitable_poll(this->current_awaitable, w);
        }
        return true;
    }

    task get_return_object() {
        return task(std::coroutine_handle<promise_type>::from_promise(*this));
    }

    std::suspend_always initial_suspend() {
        return {};
    }

    std::suspend_always final_suspend() noexcept {
        return {};
    }

    void unhandled_exception() {
        this->exception = std::current_exception();
    }

    template<awaitable Awaitable>
    auto await_transform(Awaitable&& awaitable) {
        return transform_awaitable<promise_type, Awaitable>(
            *this, std::forward<Awaitable>(awaitable)
        );
    }
};

}  // namespace wstreams::detail

#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "../awaitable.hpp"
#include "../result.hpp"
#include "../value.hpp"
#include "../waker.hpp"
#include "event_loop.hpp"

namespace wstreams::host {
template<typename T>
class promise;

template<typename T>
class resolver;

namespace detail {

template<typename T>
struct promise_storage {
    using type = T;
};

template<>
struct promise_storage<void> {
    using type = std::monostate;
};

template<typename T>
class promise_state : public std::enable_shared_from_this<promise_state<T>> {
  public:
    using storage = typename promise_storage<T>::type;
    using reaction = std::function<void(promise_state&)>;

    explicit promise_state(event_loop* loop) : loop_(loop) {}

    bool is_pending() const {
        return outcome_.index() == 0;
    }

    bool is_fulfilled() const {
        return outcome_.index() == 1;
    }

    bool is_rejected() const {
        return outcome_.index() == 2;
    }

    // Settling an already settled promise is ignored, as in the host's own promises.
    void fulfill(storage v) {
        if (!is_pending()) {
            return;
        }
        outcome_.template emplace<1>(std::move(v));
        flush();
    }

    void reject(value reason) {
        if (!is_pending()) {
            return;
        }
        outcome_.template emplace<2>(std::move(reason));
        flush();
    }

    const storage& fulfilled_value() const {
        return std::get<1>(outcome_);
    }

    const value& rejection_reason() const {
        return std::get<2>(outcome_);
    }

    // Reactions always run as microtasks, never synchronously from fulfill/reject.
    void on_settled(reaction r) {
        if (is_pending()) {
            reactions_.push_back(std::move(r));
            return;
        }
        schedule(std::move(r));
    }

    event_loop& loop() const {
        return *loop_;
    }

  private:
    void flush() {
        auto reactions = std::move(reactions_);
        reactions_.clear();
        for (auto& r : reactions) {
            schedule(std::move(r));
        }
    }

    void schedule(reaction r) {
        loop_->queue_microtask([self = this->shared_from_this(), r = std::move(r)] {
            r(*self);
        });
    }

    event_loop* loop_;
    std::variant<std::monostate, storage, value> outcome_;
    std::vector<reaction> reactions_;
};

}  // namespace detail

/// A host promise: a shared handle on a value that settles once, either fulfilled or
/// rejected with an opaque value.
///
/// A default-constructed promise<void> stands for a callback that returned nothing and
/// counts as already fulfilled.
template<typename T = void>
class promise {
    using state_type = detail::promise_state<T>;

    explicit promise(std::shared_ptr<state_type> state) : state_(std::move(state)) {}

    friend class resolver<T>;

  public:
    promise() = default;

    static std::tuple<promise, resolver<T>> create(event_loop& loop) {
        auto state = std::make_shared<state_type>(&loop);
        return std::make_tuple(promise(state), resolver<T>(state));
    }

    template<typename U = T>
        requires(!std::is_void_v<U>)
    static promise resolved(event_loop& loop, U v) {
        auto state = std::make_shared<state_type>(&loop);
        state->fulfill(std::move(v));
        return promise(std::move(state));
    }

    template<typename U = T>
        requires std::is_void_v<U>
    static promise resolved(event_loop& loop) {
        auto state = std::make_shared<state_type>(&loop);
        state->fulfill(std::monostate{});
        return promise(std::move(state));
    }

    static promise rejected(event_loop& loop, value reason) {
        auto state = std::make_shared<state_type>(&loop);
        state->reject(std::move(reason));
        return promise(std::move(state));
    }

    bool valid() const {
        return state_ != nullptr;
    }

    bool is_pending() const {
        return state_ && state_->is_pending();
    }

    bool is_fulfilled() const {
        return !state_ || state_->is_fulfilled();
    }

    bool is_rejected() const {
        return state_ && state_->is_rejected();
    }

    const value& rejection_reason() const {
        return state_->rejection_reason();
    }

    /// Reacts to settlement. Exactly one of the callbacks runs, as a microtask.
    template<typename OnFulfilled, typename OnRejected>
    void then(OnFulfilled on_fulfilled, OnRejected on_rejected) const {
        if (!state_) {
            throw std::logic_error("then() on an empty promise needs an event loop");
        }
        state_->on_settled([on_fulfilled = std::move(on_fulfilled),
                            on_rejected = std::move(on_rejected)](state_type& state) mutable {
            if (state.is_fulfilled()) {
                if constexpr (std::is_void_v<T>) {
                    on_fulfilled();
                } else {
                    on_fulfilled(state.fulfilled_value());
                }
            } else {
                on_rejected(state.rejection_reason());
            }
        });
    }

    // Same as then(), but an empty promise<void> reacts on the given loop.
    template<typename OnFulfilled, typename OnRejected>
    void then(event_loop& loop, OnFulfilled on_fulfilled, OnRejected on_rejected) const {
        if (!state_) {
            if constexpr (std::is_void_v<T>) {
                promise::resolved(loop).then(std::move(on_fulfilled), std::move(on_rejected));
                return;
            }
        }
        then(std::move(on_fulfilled), std::move(on_rejected));
    }

    const std::shared_ptr<state_type>& state() const {
        return state_;
    }

  private:
    std::shared_ptr<state_type> state_;
};

/// The settling half of a promise. Copies share the promise; only the first settle
/// has an effect.
template<typename T = void>
class resolver {
    using state_type = detail::promise_state<T>;

    explicit resolver(std::shared_ptr<state_type> state) : state_(std::move(state)) {}

    friend class promise<T>;

  public:
    template<typename U = T>
        requires(!std::is_void_v<U>)
    void resolve(U v) const {
        state_->fulfill(std::move(v));
    }

    template<typename U = T>
        requires std::is_void_v<U>
    void resolve() const {
        state_->fulfill(std::monostate{});
    }

    void reject(value reason) const {
        state_->reject(std::move(reason));
    }

    bool settled() const {
        return !state_->is_pending();
    }

    promise<T> get_promise() const {
        return promise<T>(state_);
    }

  private:
    std::shared_ptr<state_type> state_;
};

/// Polls a host promise: the bridge from the host's callback world into the poll world.
/// A rejection is reported as an err result, never thrown.
template<typename T = void>
class promise_future {
    using state_type = detail::promise_state<T>;

    std::shared_ptr<state_type> state_;
    std::shared_ptr<waker> slot_;

    void unregister() {
        if (slot_) {
            *slot_ = waker();
            slot_ = nullptr;
        }
    }

  public:
    explicit promise_future(const promise<T>& p) : state_(p.state()) {
        if constexpr (!std::is_void_v<T>) {
            if (!state_) {
                throw std::logic_error("promise_future: empty promise");
            }
        }
    }

    promise_future(promise_future&& other) noexcept
        : state_(std::move(other.state_)), slot_(std::move(other.slot_)) {}

    promise_future& operator=(promise_future&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            slot_ = std::move(other.slot_);
        }
        return *this;
    }

    promise_future(const promise_future&) = delete;
    promise_future& operator=(const promise_future&) = delete;

    ~promise_future() {
        unregister();
    }

    awaitable_state<result<T>> poll(const waker& w) {
        if (!state_) {
            if constexpr (std::is_void_v<T>) {
                return awaitable_state<result<T>>::ready(result<T>::ok());
            }
        }
        if (state_->is_pending()) {
            if (!slot_) {
                slot_ = std::make_shared<waker>(w);
                state_->on_settled([slot = slot_](state_type&) {
                    slot->wake();
                });
            } else if (!slot_->will_wake(w)) {
                *slot_ = w;
            }
            return awaitable_state<result<T>>::pending();
        }
        if (state_->is_rejected()) {
            return awaitable_state<result<T>>::ready(result<T>::err(state_->rejection_reason()));
        }
        if constexpr (std::is_void_v<T>) {
            return awaitable_state<result<T>>::ready(result<T>::ok());
        } else {
            return awaitable_state<result<T>>::ready(result<T>::ok(state_->fulfilled_value()));
        }
    }
};

template<typename T>
auto to_future(const promise<T>& p) {
    return promise_future<T>(p);
}

}  // namespace wstreams::host

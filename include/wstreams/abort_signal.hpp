#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <utility>

#include "awaitable.hpp"
#include "value.hpp"
#include "waker.hpp"

namespace wstreams {
namespace detail {

class abort_state {
  public:
    using listener = std::function<void(const value&)>;

    bool aborted() const {
        return aborted_;
    }

    const value& reason() const {
        return reason_;
    }

    std::uint64_t add_listener(listener l);

    void remove_listener(std::uint64_t id) {
        listeners_.erase(id);
    }

    // The first call wins. Listeners run synchronously, in registration order.
    void abort(value reason);

  private:
    bool aborted_{false};
    value reason_;
    std::uint64_t next_id_{1};
    std::map<std::uint64_t, listener> listeners_;
};

}  // namespace detail

class abort_awaitable;

/// Observes an abort_controller. Copies observe the same controller.
///
/// Signals are single-threaded like everything else on the host side: abort, listeners
/// and polls all happen on the event loop's thread.
class abort_signal {
    explicit abort_signal(std::shared_ptr<detail::abort_state> state) : state_(std::move(state)) {}

    friend class abort_controller;

  public:
    using listener_id = std::uint64_t;

    // A signal that is already aborted with the given reason.
    static abort_signal abort(value reason);

    bool aborted() const {
        return state_->aborted();
    }

    const value& reason() const {
        return state_->reason();
    }

    // Runs once, on abort. If the signal is already aborted it never runs.
    listener_id add_listener(std::function<void(const value&)> listener) const {
        return state_->add_listener(std::move(listener));
    }

    void remove_listener(listener_id id) const {
        state_->remove_listener(id);
    }

    // Resolves to the abort reason.
    abort_awaitable on_abort() const;

    friend bool operator==(const abort_signal& a, const abort_signal& b) {
        return a.state_ == b.state_;
    }

  private:
    std::shared_ptr<detail::abort_state> state_;
};

class abort_controller {
  public:
    abort_controller() : state_(std::make_shared<detail::abort_state>()) {}

    abort_signal signal() const {
        return abort_signal(state_);
    }

    // Without a reason the signal aborts with an AbortError.
    void abort();

    void abort(value reason) {
        state_->abort(std::move(reason));
    }

  private:
    std::shared_ptr<detail::abort_state> state_;
};

class abort_awaitable {
    std::shared_ptr<detail::abort_state> state_;
    std::shared_ptr<waker> slot_;
    std::uint64_t listener_{0};

    void unregister() {
        if (listener_ != 0) {
            state_->remove_listener(listener_);
            listener_ = 0;
        }
        slot_ = nullptr;
    }

  public:
    explicit abort_awaitable(std::shared_ptr<detail::abort_state> state) : state_(std::move(state)) {}

    abort_awaitable(abort_awaitable&& other) noexcept
        : state_(std::move(other.state_)),
          slot_(std::move(other.slot_)),
          listener_(std::exchange(other.listener_, 0)) {}

    abort_awaitable& operator=(abort_awaitable&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            slot_ = std::move(other.slot_);
            listener_ = std::exchange(other.listener_, 0);
        }
        return *this;
    }

    abort_awaitable(const abort_awaitable&) = delete;
    abort_awaitable& operator=(const abort_awaitable&) = delete;

    ~abort_awaitable() {
        if (state_) {
            unregister();
        }
    }

    awaitable_state<value> poll(const waker& w) {
        if (state_->aborted()) {
            listener_ = 0;
            return awaitable_state<value>::ready(state_->reason());
        }
        if (!slot_) {
            slot_ = std::make_shared<waker>(w);
            listener_ = state_->add_listener([slot = slot_](const value&) {
                slot->wake();
            });
        } else if (!slot_->will_wake(w)) {
            *slot_ = w;
        }
        return awaitable_state<value>::pending();
    }
};

inline abort_awaitable abort_signal::on_abort() const {
    return abort_awaitable(state_);
}

}  // namespace wstreams

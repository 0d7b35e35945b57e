#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "../awaitable.hpp"
#include "../waker.hpp"

namespace wstreams::host {
class event_loop;

namespace detail {

// A future spawned onto the loop. It is owned by whoever can still wake it: queued
// microtasks and the wakers it handed out while pending.
class local_task : public std::enable_shared_from_this<local_task> {
  public:
    explicit local_task(event_loop* loop) : loop_(loop) {}

    virtual ~local_task() = default;

    local_task(const local_task&) = delete;
    local_task& operator=(const local_task&) = delete;

    // Queues a poll unless one is already queued or the task finished.
    void wake();

    void run();

    bool done() const {
        return done_;
    }

    void detach() {
        loop_ = nullptr;
    }

  protected:
    // Returns true once the wrapped awaitable completed.
    virtual bool poll_once(const waker& w) = 0;

  private:
    event_loop* loop_;
    bool queued_{false};
    bool done_{false};
};

template<awaitable Awaitable>
class local_task_impl final : public local_task {
    std::optional<Awaitable> awaitable_;

  public:
    local_task_impl(event_loop* loop, Awaitable awaitable)
        : local_task(loop), awaitable_(std::move(awaitable)) {}

  protected:
    bool poll_once(const waker& w) override {
        auto state = awaitable_->poll(w);
        if (!state.is_ready()) {
            return false;
        }
        // Destroying the awaitable right away drops every waker it registered.
        awaitable_.reset();
        return true;
    }
};

}  // namespace detail

/// The host's cooperative scheduler: a FIFO queue of microtasks run on one thread.
///
/// Promise reactions, spawned tasks and task re-polls are all microtasks. Nothing
/// runs until someone drives the loop, either explicitly with run_one() and
/// run_until_idle() or through block_on().
class event_loop {
  public:
    event_loop() = default;
    ~event_loop();

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    void queue_microtask(std::function<void()> task);

    // Runs the oldest microtask. Returns false if there was nothing to run.
    bool run_one();

    std::size_t run_until_idle();

    bool idle() const {
        return queue_.empty();
    }

    std::size_t pending_microtasks() const {
        return queue_.size();
    }

    // Polls the awaitable on this loop until it completes. Its result is discarded.
    template<awaitable Awaitable>
    void spawn_local(Awaitable&& awaitable) {
        using task_type = detail::local_task_impl<std::remove_cvref_t<Awaitable>>;
        auto task = std::make_shared<task_type>(this, std::forward<Awaitable>(awaitable));
        track(task);
        task->wake();
    }

    // Called whenever the queue goes from empty to non-empty. Lets another event loop
    // (asio, a GUI toolkit) schedule a drain of this one.
    void set_work_notifier(std::function<void()> notifier) {
        notifier_ = std::move(notifier);
    }

  private:
    void track(const std::shared_ptr<detail::local_task>& task);

    std::deque<std::function<void()>> queue_;
    std::vector<std::weak_ptr<detail::local_task>> tasks_;
    std::function<void()> notifier_;
};

}  // namespace wstreams::host

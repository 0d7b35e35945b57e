#include <wstreams/host/event_loop.hpp>

#include <algorithm>

namespace wstreams::host {
namespace detail {

void local_task::wake() {
    if (!loop_ || done_ || queued_) {
        return;
    }
    queued_ = true;
    loop_->queue_microtask([self = shared_from_this()] {
        self->run();
    });
}

void local_task::run() {
    queued_ = false;
    if (done_ || !loop_) {
        return;
    }
    try {
        done_ = poll_once(waker(shared_from_this()));
    } catch (...) {
        done_ = true;
        throw;
    }
}

}  // namespace detail

event_loop::~event_loop() {
    // Tasks can outlive the loop through wakers stored elsewhere; waking them after
    // this point must do nothing.
    for (auto& weak : tasks_) {
        if (auto task = weak.lock()) {
            task->detach();
        }
    }
    // Dropping a queued microtask can release objects that queue new ones.
    notifier_ = nullptr;
    while (!queue_.empty()) {
        auto dropped = std::move(queue_);
        queue_.clear();
    }
}

void event_loop::queue_microtask(std::function<void()> task) {
    bool was_idle = queue_.empty();
    queue_.push_back(std::move(task));
    if (was_idle && notifier_) {
        notifier_();
    }
}

bool event_loop::run_one() {
    if (queue_.empty()) {
        return false;
    }
    auto task = std::move(queue_.front());
    queue_.pop_front();
    task();
    return true;
}

std::size_t event_loop::run_until_idle() {
    std::size_t count = 0;
    while (run_one()) {
        count++;
    }
    return count;
}

void event_loop::track(const std::shared_ptr<detail::local_task>& task) {
    std::erase_if(tasks_, [](const std::weak_ptr<detail::local_task>& weak) {
        return weak.expired();
    });
    tasks_.push_back(task);
}

}  // namespace wstreams::host

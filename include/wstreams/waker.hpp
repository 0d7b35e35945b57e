#pragma once

#include <memory>
#include <utility>

namespace wstreams {
namespace detail {

template<typename WakerType>
inline void waker_wake_function(void* data) noexcept {
    static_cast<WakerType*>(data)->wake();
}

}  // namespace detail

// A waker either borrows its target (the caller guarantees the target outlives every
// wake) or shares ownership of it. Host promises can hold on to a waker long after the
// poll that registered it, so spawned tasks hand out owning wakers.
class waker {
    void (*wake_function_)(void*) = nullptr;
    std::shared_ptr<void> data_;

  public:
    waker() = default;

    waker(void* data, void (*wake_function)(void*)) noexcept
        : wake_function_(wake_function), data_(std::shared_ptr<void>(), data) {}

    waker(std::shared_ptr<void> data, void (*wake_function)(void*)) noexcept
        : wake_function_(wake_function), data_(std::move(data)) {}

    template<typename WakerType>
    explicit waker(WakerType* waker_ptr) noexcept
        : waker(static_cast<void*>(waker_ptr), &detail::waker_wake_function<WakerType>) {}

    template<typename WakerType>
    explicit waker(std::shared_ptr<WakerType> owner) noexcept
        : waker(std::static_pointer_cast<void>(std::move(owner)),
                &detail::waker_wake_function<WakerType>) {}

    void wake() const noexcept {
        if (wake_function_) {
            wake_function_(data_.get());
        }
    }

    bool will_wake(const waker& other) const noexcept {
        return data_.get() == other.data_.get() && wake_function_ == other.wake_function_;
    }

    explicit operator bool() const noexcept {
        return wake_function_ != nullptr;
    }
};

}  // namespace wstreams

#pragma once

#include <type_traits>
#include <utility>

#include "awaitable.hpp"
#include "waker.hpp"

namespace wstreams {
namespace detail {
template<typename T, typename = void>
struct awaitable_access;

// Direct awaitable
template<typename T>
    requires awaitable<T>
struct awaitable_access<T> {
    using type = T&;

    static constexpr type get(T& t) {
        return t;
    }
};

// Dereferenceable to awaitable (std::optional, std::shared_ptr, ...)
template<typename T>
    requires(!awaitable<T>) && requires(T t) { *t; } &&
            awaitable<std::remove_cvref_t<decltype(*std::declval<T&>())>>
struct awaitable_access<T> {
    using type = decltype(*std::declval<T&>());

    static constexpr type get(T& t) {
        return *t;
    }
};

template<typename T>
using awaitable_access_t = std::remove_cvref_t<typename awaitable_access<T>::type>;
}  // namespace detail

/// Polls an awaitable that lives elsewhere. Racing a long-lived future through a ref
/// leaves it intact for the next race.
template<typename AwaitableRef>
class ref_awaitable {
    AwaitableRef awaitable_;

  public:
    ref_awaitable(AwaitableRef awaitable) : awaitable_(std::forward<AwaitableRef>(awaitable)) {}

    auto poll(const waker& w) {
        return detail::awaitable_access<std::remove_reference_t<AwaitableRef>>::get(awaitable_)
            .poll(w);
    }
};

template<typename AwaitableRef>
    requires awaitable<detail::awaitable_access_t<std::remove_reference_t<AwaitableRef>>>
auto ref(AwaitableRef&& awaitable) {
    return ref_awaitable<AwaitableRef>(std::forward<AwaitableRef>(awaitable));
}

}  // namespace wstreams

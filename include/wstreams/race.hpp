#pragma once

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "awaitable.hpp"
#include "waker.hpp"

namespace wstreams {
namespace detail {
template<typename T>
struct race_slot {
    using type = T;
};

template<>
struct race_slot<void> {
    using type = std::monostate;
};

template<typename T>
using race_slot_t = typename race_slot<T>::type;
}  // namespace detail

/// Completes with whichever awaitable is ready first. The variant's index tells which
/// one; void results are reported as std::monostate.
///
/// Awaitables are polled in argument order, so when several are ready in the same poll
/// the leftmost wins. The losers are dropped with the race, never awaited.
template<awaitable... Awaitables>
class race_awaitable {
    static_assert(sizeof...(Awaitables) > 0, "race requires at least one awaitable");

  public:
    using result_type = std::variant<detail::race_slot_t<awaitable_result_t<Awaitables>>...>;

    explicit race_awaitable(Awaitables&&... awaitables) : awaitables_(std::move(awaitables)...) {}

    awaitable_state<result_type> poll(const waker& w) {
        return get_first_ready_result(std::index_sequence_for<Awaitables...>{}, w);
    }

  private:
    template<std::size_t I>
    awaitable_state<result_type> try_get_result(const waker& w) {
        auto state = std::get<I>(awaitables_).poll(w);
        if (!state.is_ready()) {
            return awaitable_state<result_type>::pending();
        }
        if constexpr (std::is_void_v<typename decltype(state)::result_type>) {
            return awaitable_state<result_type>::ready(result_type(std::in_place_index<I>));
        } else {
            return awaitable_state<result_type>::ready(
                result_type(std::in_place_index<I>, state.take_result())
            );
        }
    }

    template<std::size_t... Is>
    awaitable_state<result_type> get_first_ready_result(std::index_sequence<Is...>, const waker& w) {
        auto result = awaitable_state<result_type>::pending();
        ((result = try_get_result<Is>(w), result.is_ready()) || ...);
        return result;
    }

    std::tuple<Awaitables...> awaitables_;
};

template<awaitable... Awaitables>
auto race(Awaitables&&... awaitables) {
    return race_awaitable<std::remove_cvref_t<Awaitables>...>(std::move(awaitables)...);
}

}  // namespace wstreams

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "value.hpp"

namespace wstreams {

/// Outcome of an operation that crosses the host boundary: either a payload or an
/// opaque error. Errors are never thrown across the boundary; they travel in here.
template<typename T = void, typename E = value>
class result {
    using repr = std::variant<T, E>;

    explicit result(repr r) : repr_(std::move(r)) {}

  public:
    using value_type = T;
    using error_type = E;

    static result ok(T v) {
        return result(repr(std::in_place_index<0>, std::move(v)));
    }

    static result err(E e) {
        return result(repr(std::in_place_index<1>, std::move(e)));
    }

    bool is_ok() const {
        return repr_.index() == 0;
    }

    bool is_err() const {
        return repr_.index() == 1;
    }

    T& get() {
        return std::get<0>(repr_);
    }

    const T& get() const {
        return std::get<0>(repr_);
    }

    T take() {
        return std::move(std::get<0>(repr_));
    }

    const E& error() const {
        return std::get<1>(repr_);
    }

    E take_error() {
        return std::move(std::get<1>(repr_));
    }

    template<typename Func>
    auto map(Func&& func) && {
        using U = std::invoke_result_t<Func, T>;
        if (is_err()) {
            return result<U, E>::err(take_error());
        }
        if constexpr (std::is_void_v<U>) {
            func(take());
            return result<U, E>::ok();
        } else {
            return result<U, E>::ok(func(take()));
        }
    }

    friend bool operator==(const result& a, const result& b) {
        return a.repr_ == b.repr_;
    }

  private:
    repr repr_;
};

template<typename E>
class result<void, E> {
    explicit result(std::optional<E> error) : error_(std::move(error)) {}

  public:
    using value_type = void;
    using error_type = E;

    static result ok() {
        return result(std::nullopt);
    }

    static result err(E e) {
        return result(std::move(e));
    }

    bool is_ok() const {
        return !error_.has_value();
    }

    bool is_err() const {
        return error_.has_value();
    }

    const E& error() const {
        return *error_;
    }

    E take_error() {
        return std::move(*error_);
    }

    friend bool operator==(const result& a, const result& b) {
        return a.error_ == b.error_;
    }

  private:
    std::optional<E> error_;
};

}  // namespace wstreams

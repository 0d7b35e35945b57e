#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <typeinfo>
#include <utility>
#include <variant>

namespace wstreams {

struct undefined_t {
    friend bool operator==(undefined_t, undefined_t) {
        return true;
    }
};

inline constexpr undefined_t undefined{};

// Payload of the error objects the host creates itself (TypeError, AbortError, ...).
struct error_object {
    std::string name;
    std::string message;
};

/// An opaque host value. Chunks, cancellation reasons and errors all travel as values;
/// the adapters relay them verbatim and never look inside.
///
/// Objects are held by shared reference and compare by identity, everything else
/// compares by content.
class value {
    struct object_ref {
        std::shared_ptr<void> ptr;
        const std::type_info* type = nullptr;

        friend bool operator==(const object_ref& a, const object_ref& b) {
            return a.ptr == b.ptr;
        }
    };

    using repr = std::variant<undefined_t, bool, double, std::string, object_ref>;

  public:
    value() = default;

    value(undefined_t) {}

    value(bool b) : repr_(b) {}

    value(int n) : repr_(static_cast<double>(n)) {}

    value(double n) : repr_(n) {}

    value(std::string s) : repr_(std::move(s)) {}

    value(const char* s) : repr_(std::string(s)) {}

    template<typename T>
    static value object(std::shared_ptr<T> ptr) {
        value v;
        v.repr_ = object_ref{std::const_pointer_cast<void>(
                                 std::static_pointer_cast<const void>(std::move(ptr))),
                             &typeid(T)};
        return v;
    }

    template<typename T, typename... Args>
    static value make_object(Args&&... args) {
        return object(std::make_shared<T>(std::forward<Args>(args)...));
    }

    static value error(std::string name, std::string message) {
        return make_object<error_object>(error_object{std::move(name), std::move(message)});
    }

    static value type_error(std::string message) {
        return error("TypeError", std::move(message));
    }

    bool is_undefined() const {
        return std::holds_alternative<undefined_t>(repr_);
    }

    bool is_bool() const {
        return std::holds_alternative<bool>(repr_);
    }

    bool is_number() const {
        return std::holds_alternative<double>(repr_);
    }

    bool is_string() const {
        return std::holds_alternative<std::string>(repr_);
    }

    bool is_object() const {
        return std::holds_alternative<object_ref>(repr_);
    }

    bool as_bool() const {
        return std::get<bool>(repr_);
    }

    double as_number() const {
        return std::get<double>(repr_);
    }

    const std::string& as_string() const {
        return std::get<std::string>(repr_);
    }

    // Returns nullptr when the value is not an object of type T.
    template<typename T>
    std::shared_ptr<T> as_object() const {
        auto ref = std::get_if<object_ref>(&repr_);
        if (!ref || *ref->type != typeid(T)) {
            return nullptr;
        }
        return std::static_pointer_cast<T>(ref->ptr);
    }

    // Error objects created by the host report their name, e.g. "TypeError".
    std::string error_name() const;

    std::string to_string() const;

    friend bool operator==(const value& a, const value& b) {
        return a.repr_ == b.repr_;
    }

  private:
    repr repr_;
};

std::ostream& operator<<(std::ostream& os, const value& v);

}  // namespace wstreams

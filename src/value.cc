#include <wstreams/value.hpp>

#include <sstream>

#include <wstreams/errors.hpp>

namespace wstreams {

std::string value::error_name() const {
    if (auto err = as_object<error_object>()) {
        return err->name;
    }
    return {};
}

std::string value::to_string() const {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, undefined_t>) {
                return "undefined";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                std::ostringstream out;
                out << v;
                return out.str();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                if (v.type && *v.type == typeid(error_object)) {
                    auto err = std::static_pointer_cast<error_object>(v.ptr);
                    return err->message.empty() ? err->name : err->name + ": " + err->message;
                }
                return "[object]";
            }
        },
        repr_
    );
}

value exception_to_value(std::exception_ptr e) {
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        return value::error("Error", ex.what());
    } catch (...) {
        return value::error("Error", "unknown exception");
    }
}

std::ostream& operator<<(std::ostream& os, const value& v) {
    return os << v.to_string();
}

}  // namespace wstreams

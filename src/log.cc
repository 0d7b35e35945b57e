#include <wstreams/log.hpp>

#include <iostream>

namespace wstreams {
namespace {

std::mutex sink_mutex;

std::shared_ptr<log_sink>& current_sink() {
    static std::shared_ptr<log_sink> sink = std::make_shared<stderr_sink>();
    return sink;
}

}  // namespace

const char* to_string(log_level level) {
    switch (level) {
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warning:
            return "WARNING";
        case log_level::error:
            return "ERROR";
    }
    return "UNKNOWN";
}

void stderr_sink::write(log_level level, const std::string& message) {
    std::cerr << "[wstreams][" << to_string(level) << "] " << message << std::endl;
}

void set_log_sink(std::shared_ptr<log_sink> sink) {
    std::lock_guard lock(sink_mutex);
    current_sink() = std::move(sink);
}

std::shared_ptr<log_sink> get_log_sink() {
    std::lock_guard lock(sink_mutex);
    return current_sink();
}

}  // namespace wstreams

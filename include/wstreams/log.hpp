#pragma once

#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace wstreams {

enum class log_level {
    debug,
    info,
    warning,
    error,
};

const char* to_string(log_level level);

class log_sink {
  public:
    virtual ~log_sink() = default;

    virtual void write(log_level level, const std::string& message) = 0;

    void set_level(log_level level) {
        min_level_ = level;
    }

    log_level level() const {
        return min_level_;
    }

    bool enabled(log_level level) const {
        return level >= min_level_;
    }

  protected:
    log_level min_level_ = log_level::warning;
};

class stderr_sink : public log_sink {
  public:
    void write(log_level level, const std::string& message) override;
};

// Keeps every message in memory. Mostly useful in tests.
class vector_sink : public log_sink {
  public:
    struct entry {
        log_level level;
        std::string message;
    };

    vector_sink() {
        min_level_ = log_level::debug;
    }

    void write(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        entries_.push_back({level, message});
    }

    std::vector<entry> entries() const {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<entry> entries_;
};

// Replaces the process-wide sink. Passing nullptr silences logging.
void set_log_sink(std::shared_ptr<log_sink> sink);

std::shared_ptr<log_sink> get_log_sink();

template<typename... Args>
void log(log_level level, Args&&... args) {
    auto sink = get_log_sink();
    if (!sink || !sink->enabled(level)) {
        return;
    }
    std::ostringstream out;
    (out << ... << std::forward<Args>(args));
    sink->write(level, out.str());
}

}  // namespace wstreams

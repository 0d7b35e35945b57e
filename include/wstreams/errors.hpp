#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "value.hpp"

namespace wstreams {

// Acquiring a reader or writer on a stream that is already locked. This is a caller
// error and is reported synchronously, never as a stream error.
class lock_error : public std::logic_error {
  public:
    explicit lock_error(const std::string& what) : std::logic_error(what) {}
};

// A controller was asked to enqueue into, or close, a stream that can no longer
// accept chunks.
class stream_state_error : public std::logic_error {
  public:
    explicit stream_state_error(const std::string& what) : std::logic_error(what) {}
};

// block_on() found the awaitable pending with no work left on the event loop.
class stalled_error : public std::runtime_error {
  public:
    explicit stalled_error(const std::string& what) : std::runtime_error(what) {}
};

// Turns an exception thrown by a wrapped sequence or sink into the error value the host
// stream is errored with: an "Error" object carrying what().
value exception_to_value(std::exception_ptr e);

}  // namespace wstreams

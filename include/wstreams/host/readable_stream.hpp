#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "../abort_signal.hpp"
#include "../value.hpp"
#include "event_loop.hpp"
#include "promise.hpp"
#include "queuing_strategy.hpp"

namespace wstreams::host {
class readable_stream;
class readable_stream_default_reader;
class writable_stream;

namespace detail {
class readable_stream_state;
struct readable_reader_state;
}  // namespace detail

struct read_result {
    wstreams::value value;
    bool done = false;
};

/// Handle through which an underlying source feeds its stream. Copies refer to the same
/// stream; once the stream is gone every call is a no-op.
class readable_stream_default_controller {
  public:
    // Throws stream_state_error if the stream is closing, closed or errored.
    void enqueue(value chunk) const;

    // Throws stream_state_error if the stream is closing, closed or errored.
    void close() const;

    // Errors the stream. Ignored unless the stream is still readable.
    void error(value e) const;

    // Empty once the stream errored.
    std::optional<double> desired_size() const;

    event_loop& loop() const {
        return *loop_;
    }

  private:
    friend class detail::readable_stream_state;

    readable_stream_default_controller(
        std::weak_ptr<detail::readable_stream_state> state, event_loop* loop
    )
        : state_(std::move(state)), loop_(loop) {}

    std::weak_ptr<detail::readable_stream_state> state_;
    event_loop* loop_;
};

/// The callbacks behind a readable stream. Every callback returns a promise; returning
/// an empty promise means success.
///
/// The stream never calls pull() again before the previous pull promise settled.
class underlying_source {
  public:
    virtual ~underlying_source() = default;

    virtual promise<> start(readable_stream_default_controller& controller) {
        return {};
    }

    virtual promise<> pull(readable_stream_default_controller& controller) {
        return {};
    }

    virtual promise<> cancel(const value& reason) {
        return {};
    }
};

struct pipe_options {
    bool prevent_close = false;
    bool prevent_abort = false;
    bool prevent_cancel = false;
    std::optional<abort_signal> signal;
};

/// Exclusive reading access to a readable stream. Destroying a reader releases its lock.
class readable_stream_default_reader {
  public:
    readable_stream_default_reader(readable_stream_default_reader&& other) noexcept = default;
    readable_stream_default_reader& operator=(readable_stream_default_reader&& other) noexcept;

    readable_stream_default_reader(const readable_stream_default_reader&) = delete;
    readable_stream_default_reader& operator=(const readable_stream_default_reader&) = delete;

    ~readable_stream_default_reader();

    promise<read_result> read();

    promise<> cancel(value reason = undefined);

    // Fulfilled when the stream closes, rejected when it errors or the lock is released.
    promise<> closed() const;

    // Rejects pending reads with a TypeError. Calling it again does nothing.
    void release_lock();

  private:
    friend class readable_stream;

    explicit readable_stream_default_reader(std::shared_ptr<detail::readable_reader_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::readable_reader_state> state_;
};

class readable_stream {
  public:
    readable_stream(
        event_loop& loop,
        std::unique_ptr<underlying_source> source,
        queuing_strategy strategy = {}
    );

    readable_stream(readable_stream&&) noexcept = default;
    readable_stream& operator=(readable_stream&&) noexcept = default;

    readable_stream(const readable_stream&) = delete;
    readable_stream& operator=(const readable_stream&) = delete;

    bool locked() const;

    // Rejects with a TypeError if the stream is locked.
    promise<> cancel(value reason = undefined);

    // Throws lock_error if the stream is already locked.
    readable_stream_default_reader get_reader();

    /// Reads every chunk and writes it to dest. Both streams stay locked until the pipe
    /// finished. The returned promise is fulfilled once dest closed (or, with
    /// prevent_close, once the source was exhausted) and rejected with the error that
    /// stopped the pipe.
    promise<> pipe_to(writable_stream& dest, pipe_options options = {});

    /// Splits the stream into two branches that each see every chunk. The chunks are
    /// shared, not copied. Locks this stream for good; throws lock_error if it is
    /// already locked.
    ///
    /// The source is canceled only once both branches are, with an object holding both
    /// reasons as a std::vector<value>.
    std::pair<readable_stream, readable_stream> tee();

    event_loop& loop() const;

  private:
    std::shared_ptr<detail::readable_stream_state> state_;
};

}  // namespace wstreams::host

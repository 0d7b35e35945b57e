#pragma once

#include <memory>
#include <optional>

#include "../abort_signal.hpp"
#include "../value.hpp"
#include "event_loop.hpp"
#include "promise.hpp"
#include "queuing_strategy.hpp"

namespace wstreams::host {
class writable_stream;
class writable_stream_default_writer;

namespace detail {
class writable_stream_state;
struct writable_writer_state;
}  // namespace detail

class writable_stream_default_controller {
  public:
    // Errors the stream. Ignored unless the stream is still writable.
    void error(value e) const;

    // Fires when the stream is aborted, before the sink's abort() runs.
    abort_signal signal() const {
        return signal_;
    }

    event_loop& loop() const {
        return *loop_;
    }

  private:
    friend class detail::writable_stream_state;

    writable_stream_default_controller(
        std::weak_ptr<detail::writable_stream_state> state, event_loop* loop, abort_signal signal
    )
        : state_(std::move(state)), loop_(loop), signal_(std::move(signal)) {}

    std::weak_ptr<detail::writable_stream_state> state_;
    event_loop* loop_;
    abort_signal signal_;
};

/// The callbacks behind a writable stream. Returning an empty promise means success.
///
/// Writes are strictly sequential: write() is not called again, and close() is not
/// called, before the previous write promise settled.
class underlying_sink {
  public:
    virtual ~underlying_sink() = default;

    virtual promise<> start(writable_stream_default_controller& controller) {
        return {};
    }

    virtual promise<> write(const value& chunk, writable_stream_default_controller& controller) {
        return {};
    }

    virtual promise<> close() {
        return {};
    }

    virtual promise<> abort(const value& reason) {
        return {};
    }
};

/// Exclusive writing access to a writable stream. Destroying a writer releases its lock.
class writable_stream_default_writer {
  public:
    writable_stream_default_writer(writable_stream_default_writer&& other) noexcept = default;
    writable_stream_default_writer& operator=(writable_stream_default_writer&& other) noexcept;

    writable_stream_default_writer(const writable_stream_default_writer&) = delete;
    writable_stream_default_writer& operator=(const writable_stream_default_writer&) = delete;

    ~writable_stream_default_writer();

    // Pending while the stream applies backpressure.
    promise<> ready() const;

    promise<> closed() const;

    // Empty while the stream is erroring or errored. Throws stream_state_error after the
    // lock was released.
    std::optional<double> desired_size() const;

    // Settles once the sink processed this chunk.
    promise<> write(value chunk);

    promise<> close();

    promise<> abort(value reason = undefined);

    void release_lock();

  private:
    friend class writable_stream;

    explicit writable_stream_default_writer(std::shared_ptr<detail::writable_writer_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::writable_writer_state> state_;
};

class writable_stream {
  public:
    writable_stream(
        event_loop& loop, std::unique_ptr<underlying_sink> sink, queuing_strategy strategy = {}
    );

    writable_stream(writable_stream&&) noexcept = default;
    writable_stream& operator=(writable_stream&&) noexcept = default;

    writable_stream(const writable_stream&) = delete;
    writable_stream& operator=(const writable_stream&) = delete;

    bool locked() const;

    // Rejects with a TypeError if the stream is locked.
    promise<> abort(value reason = undefined);

    // Rejects with a TypeError if the stream is locked or already closing.
    promise<> close();

    // Throws lock_error if the stream is already locked.
    writable_stream_default_writer get_writer();

    event_loop& loop() const;

  private:
    std::shared_ptr<detail::writable_stream_state> state_;
};

}  // namespace wstreams::host

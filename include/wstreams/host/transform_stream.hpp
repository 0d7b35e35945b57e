#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "../value.hpp"
#include "event_loop.hpp"
#include "promise.hpp"
#include "queuing_strategy.hpp"
#include "readable_stream.hpp"
#include "writable_stream.hpp"

namespace wstreams::host {
namespace detail {
class transform_stream_state;
}  // namespace detail

/// Handle through which a transformer feeds the readable side. Copies refer to the same
/// stream.
class transform_stream_default_controller {
  public:
    // Throws stream_state_error once the readable side closed or errored.
    void enqueue(value chunk) const;

    // Errors both sides.
    void error(value e) const;

    // Closes the readable side and errors the writable side with a TypeError.
    void terminate() const;

    std::optional<double> desired_size() const;

    event_loop& loop() const {
        return *loop_;
    }

  private:
    friend class detail::transform_stream_state;

    transform_stream_default_controller(
        std::weak_ptr<detail::transform_stream_state> state, event_loop* loop
    )
        : state_(std::move(state)), loop_(loop) {}

    std::weak_ptr<detail::transform_stream_state> state_;
    event_loop* loop_;
};

/// The callbacks behind a transform stream. Returning an empty promise means success.
class transformer {
  public:
    virtual ~transformer() = default;

    virtual promise<> start(transform_stream_default_controller& controller) {
        return {};
    }

    // Passes the chunk through unchanged unless overridden.
    virtual promise<> transform(const value& chunk, transform_stream_default_controller& controller) {
        controller.enqueue(chunk);
        return {};
    }

    // Runs once the writable side is closed, before the readable side closes.
    virtual promise<> flush(transform_stream_default_controller& controller) {
        return {};
    }
};

/// A writable and a readable stream joined by a transformer: chunks written to
/// writable() come out of readable() as the transformer enqueues them.
///
/// Writes wait while the readable side has backpressure, so by default (a readable
/// high-water mark of 0) a chunk is only transformed once someone reads.
class transform_stream {
  public:
    explicit transform_stream(
        event_loop& loop,
        std::unique_ptr<transformer> t = nullptr,
        queuing_strategy writable_strategy = {},
        queuing_strategy readable_strategy = count_queuing_strategy(0)
    );

    transform_stream(transform_stream&&) noexcept = default;
    transform_stream& operator=(transform_stream&&) noexcept = default;

    readable_stream& readable() {
        return readable_;
    }

    writable_stream& writable() {
        return writable_;
    }

  private:
    std::shared_ptr<detail::transform_stream_state> state_;
    writable_stream writable_;
    readable_stream readable_;
};

}  // namespace wstreams::host

#pragma once

#include <optional>
#include <utility>

#include "../abort_signal.hpp"
#include "../awaitable.hpp"
#include "../host/promise.hpp"
#include "../host/writable_stream.hpp"
#include "../log.hpp"
#include "../race.hpp"
#include "../ref.hpp"
#include "../result.hpp"
#include "../value.hpp"
#include "../waker.hpp"

namespace wstreams {

/// A sink that writes to a host writable stream through its writer.
///
/// Readiness follows the writer's backpressure. start_send() queues the write without
/// waiting for it; poll_flush() waits for the latest write. Closing the sink closes the
/// stream and then releases the writer.
///
/// Failures are sticky: once any host operation rejected, every call reports that error.
class writer_sink {
    using state_type = awaitable_state<result<>>;

  public:
    explicit writer_sink(
        host::writable_stream_default_writer writer, std::optional<abort_signal> signal = std::nullopt
    )
        : writer_(std::move(writer)), signal_(std::move(signal)) {}

    state_type poll_ready(const waker& w) {
        if (error_) {
            return state_type::ready(result<>::err(*error_));
        }
        if (!writer_) {
            return state_type::ready(result<>::err(value::type_error("sink is closed")));
        }

        if (!ready_) {
            ready_.emplace(host::to_future(writer_->ready()));
        }
        if (!signal_) {
            auto ready = ready_->poll(w);
            if (!ready.is_ready()) {
                return state_type::pending();
            }
            return state_type::ready(on_ready(ready.take_result()));
        }

        if (!aborted_) {
            aborted_.emplace(signal_->on_abort());
        }
        auto raced = race(ref(*aborted_), ref(*ready_)).poll(w);
        if (!raced.is_ready()) {
            return state_type::pending();
        }
        auto outcome = raced.take_result();
        if (outcome.index() == 1) {
            return state_type::ready(on_ready(std::get<1>(std::move(outcome))));
        }
        auto reason = std::get<0>(std::move(outcome));
        log(log_level::debug, "write aborted, aborting writable stream: ", reason);
        // The abort completes on its own; we only report the reason.
        writer_->abort(reason);
        return state_type::ready(fail(std::move(reason)));
    }

    result<> start_send(value chunk) {
        if (error_) {
            return result<>::err(*error_);
        }
        if (!writer_) {
            return result<>::err(value::type_error("sink is closed"));
        }
        write_.emplace(host::to_future(writer_->write(std::move(chunk))));
        return result<>::ok();
    }

    state_type poll_flush(const waker& w) {
        if (error_) {
            return state_type::ready(result<>::err(*error_));
        }
        if (!write_) {
            return state_type::ready(result<>::ok());
        }
        auto written = write_->poll(w);
        if (!written.is_ready()) {
            return state_type::pending();
        }
        write_.reset();
        auto r = written.take_result();
        if (r.is_err()) {
            return state_type::ready(fail(r.take_error()));
        }
        return state_type::ready(result<>::ok());
    }

    state_type poll_close(const waker& w) {
        if (error_) {
            return state_type::ready(result<>::err(*error_));
        }
        if (!writer_) {
            return state_type::ready(result<>::ok());
        }
        if (!close_) {
            close_.emplace(host::to_future(writer_->close()));
        }
        auto closed = close_->poll(w);
        if (!closed.is_ready()) {
            return state_type::pending();
        }
        close_.reset();
        auto r = closed.take_result();
        if (r.is_err()) {
            return state_type::ready(fail(r.take_error()));
        }
        release();
        return state_type::ready(result<>::ok());
    }

    // Aborts the stream and releases the writer. Later operations fail with the reason.
    result<> abort(const value& reason) {
        if (writer_) {
            writer_->abort(reason);
        }
        if (!error_) {
            fail(reason);
        }
        return result<>::ok();
    }

  private:
    result<> on_ready(result<> r) {
        ready_.reset();
        if (r.is_err()) {
            return fail(r.take_error());
        }
        return r;
    }

    result<> fail(value e) {
        log(log_level::debug, "writable stream failed: ", e);
        error_ = e;
        release();
        return result<>::err(std::move(e));
    }

    void release() {
        aborted_.reset();
        ready_.reset();
        write_.reset();
        close_.reset();
        writer_.reset();
    }

    std::optional<host::writable_stream_default_writer> writer_;
    std::optional<abort_signal> signal_;
    std::optional<abort_awaitable> aborted_;
    std::optional<host::promise_future<>> ready_;
    std::optional<host::promise_future<>> write_;
    std::optional<host::promise_future<>> close_;
    std::optional<value> error_;
};

}  // namespace wstreams

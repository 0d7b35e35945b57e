#pragma once

#include <optional>
#include <utility>

#include "../abort_signal.hpp"
#include "../host/promise.hpp"
#include "../host/readable_stream.hpp"
#include "../log.hpp"
#include "../race.hpp"
#include "../ref.hpp"
#include "../result.hpp"
#include "../stream_awaitable.hpp"
#include "../value.hpp"
#include "../waker.hpp"

namespace wstreams {

/// Reads a host readable stream as a sequence of result<value>.
///
/// Holds the stream's reader until the stream closes or errors; an error is yielded
/// once as an err item. Destroying the sequence early releases the reader, which
/// discards any read still in flight.
///
/// With an abort signal, firing the signal cancels the stream with the signal's reason
/// and the sequence ends once the cancellation went through.
class reader_stream_awaitable {
  public:
    explicit reader_stream_awaitable(
        host::readable_stream_default_reader reader, std::optional<abort_signal> signal = std::nullopt
    )
        : reader_(std::move(reader)), signal_(std::move(signal)) {}

    stream_awaitable_state<result<value>> poll_next(const waker& w) {
        using state_type = stream_awaitable_state<result<value>>;
        if (terminated_) {
            return state_type::done();
        }

        if (cancel_) {
            auto canceled = cancel_->poll(w);
            if (!canceled.is_ready()) {
                return state_type::pending();
            }
            auto r = canceled.take_result();
            if (r.is_err()) {
                log(log_level::debug, "cancel of aborted read failed: ", r.error());
            }
            finish();
            return state_type::done();
        }

        if (!read_) {
            // No read goes out once the signal fired.
            if (signal_ && signal_->aborted()) {
                return start_cancel(signal_->reason(), w);
            }
            read_.emplace(host::to_future(reader_->read()));
        }
        if (!signal_) {
            auto read = read_->poll(w);
            if (!read.is_ready()) {
                return state_type::pending();
            }
            return on_read(read.take_result());
        }

        if (!aborted_) {
            aborted_.emplace(signal_->on_abort());
        }
        auto raced = race(ref(*aborted_), ref(*read_)).poll(w);
        if (!raced.is_ready()) {
            return state_type::pending();
        }
        auto outcome = raced.take_result();
        if (outcome.index() == 1) {
            return on_read(std::get<1>(std::move(outcome)));
        }
        return start_cancel(std::get<0>(std::move(outcome)), w);
    }

    // True once the sequence returned done, or is about to because the stream errored.
    bool is_terminated() const {
        return terminated_;
    }

  private:
    stream_awaitable_state<result<value>> start_cancel(value reason, const waker& w) {
        log(log_level::debug, "read aborted, canceling readable stream: ", reason);
        read_.reset();
        cancel_.emplace(host::to_future(reader_->cancel(std::move(reason))));
        return poll_next(w);
    }

    stream_awaitable_state<result<value>> on_read(result<host::read_result> r) {
        using state_type = stream_awaitable_state<result<value>>;
        read_.reset();
        if (r.is_err()) {
            finish();
            return state_type::ready(result<value>::err(r.take_error()));
        }
        auto chunk = r.take();
        if (chunk.done) {
            finish();
            return state_type::done();
        }
        return state_type::ready(result<value>::ok(std::move(chunk.value)));
    }

    void finish() {
        terminated_ = true;
        aborted_.reset();
        read_.reset();
        reader_.reset();
    }

    std::optional<host::readable_stream_default_reader> reader_;
    std::optional<abort_signal> signal_;
    std::optional<abort_awaitable> aborted_;
    std::optional<host::promise_future<host::read_result>> read_;
    std::optional<host::promise_future<>> cancel_;
    bool terminated_{false};
};

}  // namespace wstreams

#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <utility>

#include "../awaitable.hpp"
#include "../errors.hpp"
#include "../host/event_loop.hpp"
#include "../host/promise.hpp"
#include "../host/writable_stream.hpp"
#include "../log.hpp"
#include "../result.hpp"
#include "../sink.hpp"
#include "../value.hpp"
#include "../waker.hpp"

namespace wstreams {

/// Drains a host writable stream into a sink. Every chunk the host writes is sent and
/// flushed before the write settles, so the host's queue is the only buffer.
///
/// The first failure, whether reported as an err result or thrown, drops the sink; every
/// later write, close or abort is rejected with that same error.
///
/// The sink is only polled while the host has an operation outstanding. If the sink
/// fails in between, the failure surfaces on the host's next write or close.
template<typename Sink>
    requires sink<Sink, value>
class into_underlying_sink final : public host::underlying_sink {
    struct shared_state {
        std::optional<Sink> sink;
        std::optional<value> error;
        bool closed = false;

        void fail(value e) {
            log(log_level::debug, "sink failed: ", e);
            sink.reset();
            error = std::move(e);
        }

        value closed_error() const {
            return error ? *error : value::type_error("sink is closed");
        }
    };

    class write_op {
        std::shared_ptr<shared_state> inner_;
        std::optional<value> chunk_;
        host::resolver<> done_;

        awaitable_state<> fail(value e) {
            inner_->fail(e);
            done_.reject(std::move(e));
            return awaitable_state<>::ready();
        }

        awaitable_state<> step(const waker& w) {
            auto& inner = *inner_;
            if (chunk_) {
                auto ready = inner.sink->poll_ready(w);
                if (!ready.is_ready()) {
                    return awaitable_state<>::pending();
                }
                auto r = ready.take_result();
                if (r.is_err()) {
                    return fail(r.take_error());
                }
                auto sent = inner.sink->start_send(*std::exchange(chunk_, std::nullopt));
                if (sent.is_err()) {
                    return fail(sent.take_error());
                }
            }
            auto flushed = inner.sink->poll_flush(w);
            if (!flushed.is_ready()) {
                return awaitable_state<>::pending();
            }
            auto r = flushed.take_result();
            if (r.is_err()) {
                return fail(r.take_error());
            }
            done_.resolve();
            return awaitable_state<>::ready();
        }

      public:
        write_op(std::shared_ptr<shared_state> inner, value chunk, host::resolver<> done)
            : inner_(std::move(inner)), chunk_(std::move(chunk)), done_(std::move(done)) {}

        awaitable_state<> poll(const waker& w) {
            if (!inner_->sink) {
                done_.reject(inner_->closed_error());
                return awaitable_state<>::ready();
            }
            try {
                return step(w);
            } catch (...) {
                auto e = exception_to_value(std::current_exception());
                log(log_level::warning, "sink threw during write: ", e);
                return fail(std::move(e));
            }
        }
    };

    class close_op {
        std::shared_ptr<shared_state> inner_;
        host::resolver<> done_;

        awaitable_state<> fail(value e) {
            inner_->fail(e);
            done_.reject(std::move(e));
            return awaitable_state<>::ready();
        }

      public:
        close_op(std::shared_ptr<shared_state> inner, host::resolver<> done)
            : inner_(std::move(inner)), done_(std::move(done)) {}

        awaitable_state<> poll(const waker& w) {
            auto& inner = *inner_;
            if (inner.closed) {
                done_.resolve();
                return awaitable_state<>::ready();
            }
            if (!inner.sink) {
                done_.reject(inner.closed_error());
                return awaitable_state<>::ready();
            }
            std::optional<result<>> r;
            try {
                auto closed = inner.sink->poll_close(w);
                if (!closed.is_ready()) {
                    return awaitable_state<>::pending();
                }
                r.emplace(closed.take_result());
            } catch (...) {
                auto e = exception_to_value(std::current_exception());
                log(log_level::warning, "sink threw during close: ", e);
                return fail(std::move(e));
            }
            if (r->is_err()) {
                return fail(r->take_error());
            }
            inner.sink.reset();
            inner.closed = true;
            done_.resolve();
            return awaitable_state<>::ready();
        }
    };

  public:
    into_underlying_sink(host::event_loop& loop, Sink sink)
        : loop_(&loop), inner_(std::make_shared<shared_state>()) {
        inner_->sink.emplace(std::move(sink));
    }

    host::promise<> write(
        const value& chunk, host::writable_stream_default_controller& controller
    ) override {
        if (inner_->error) {
            return host::promise<>::rejected(*loop_, *inner_->error);
        }
        auto [written, done] = host::promise<>::create(*loop_);
        loop_->spawn_local(write_op(inner_, chunk, done));
        return written;
    }

    // Closing a closed sink succeeds again.
    host::promise<> close() override {
        if (inner_->error) {
            return host::promise<>::rejected(*loop_, *inner_->error);
        }
        if (inner_->closed) {
            return host::promise<>::resolved(*loop_);
        }
        auto [closed, done] = host::promise<>::create(*loop_);
        loop_->spawn_local(close_op(inner_, done));
        return closed;
    }

    // Best effort: the sink only hears about the abort if it can be aborted.
    host::promise<> abort(const value& reason) override {
        log(log_level::debug, "writable stream aborted, dropping sink: ", reason);
        if (inner_->error) {
            return host::promise<>::rejected(*loop_, *inner_->error);
        }
        if (!inner_->sink) {
            return {};
        }
        if constexpr (abortable_sink<Sink, value>) {
            std::optional<result<>> r;
            try {
                r.emplace(inner_->sink->abort(reason));
            } catch (...) {
                r.emplace(result<>::err(exception_to_value(std::current_exception())));
            }
            inner_->sink.reset();
            if (r->is_err()) {
                inner_->error = r->error();
                return host::promise<>::rejected(*loop_, r->take_error());
            }
        } else {
            inner_->sink.reset();
        }
        return {};
    }

  private:
    host::event_loop* loop_;
    std::shared_ptr<shared_state> inner_;
};

}  // namespace wstreams

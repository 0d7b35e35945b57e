#include <wstreams/host/writable_stream.hpp>

#include <cmath>
#include <deque>
#include <stdexcept>
#include <utility>

#include <wstreams/errors.hpp>
#include <wstreams/log.hpp>

namespace wstreams::host {
namespace detail {

struct writable_writer_state {
    event_loop* loop = nullptr;
    // Empty once the lock was released.
    std::shared_ptr<writable_stream_state> stream;
    promise<> ready;
    std::optional<resolver<>> ready_resolver;
    promise<> closed;
    std::optional<resolver<>> closed_resolver;

    void reset_ready() {
        auto [p, settle] = promise<>::create(*loop);
        ready = p;
        ready_resolver = settle;
    }

    void resolve_ready() {
        if (ready_resolver) {
            ready_resolver->resolve();
        }
    }

    void ensure_ready_rejected(const value& e) {
        if (ready_resolver && !ready_resolver->settled()) {
            ready_resolver->reject(e);
        } else {
            ready = promise<>::rejected(*loop, e);
            ready_resolver.reset();
        }
    }

    void reset_closed() {
        auto [p, settle] = promise<>::create(*loop);
        closed = p;
        closed_resolver = settle;
    }

    void resolve_closed() {
        if (closed_resolver) {
            closed_resolver->resolve();
        }
    }

    void ensure_closed_rejected(const value& e) {
        if (closed_resolver && !closed_resolver->settled()) {
            closed_resolver->reject(e);
        } else {
            closed = promise<>::rejected(*loop, e);
            closed_resolver.reset();
        }
    }
};

class writable_stream_state : public std::enable_shared_from_this<writable_stream_state> {
    enum class status {
        writable,
        erroring,
        errored,
        closed,
    };

    // An entry without a chunk marks the close request.
    struct queue_entry {
        std::optional<value> chunk;
        double size;
    };

    struct pending_abort {
        promise<> result;
        resolver<> settle;
        value reason;
        bool was_already_erroring;
    };

  public:
    writable_stream_state(
        event_loop& loop, std::unique_ptr<underlying_sink> sink, queuing_strategy strategy
    )
        : loop_(&loop), sink_(std::move(sink)), strategy_(std::move(strategy)) {}

    void start() {
        backpressure_ = get_backpressure();
        auto ctrl = controller();
        auto started = sink_->start(ctrl);
        auto self = shared_from_this();
        started.then(
            *loop_,
            [self] {
                self->started_ = true;
                self->advance_queue_if_needed();
            },
            [self](const value& e) {
                self->started_ = true;
                self->deal_with_rejection(e);
            }
        );
    }

    event_loop& loop() const {
        return *loop_;
    }

    bool locked() const {
        return writer_ != nullptr;
    }

    bool close_queued_or_in_flight() const {
        return close_request_.has_value() || in_flight_close_.has_value();
    }

    promise<> abort(value reason) {
        if (status_ == status::closed || status_ == status::errored) {
            return promise<>::resolved(*loop_);
        }
        abort_controller_.abort(reason);
        // Abort listeners may have moved the stream on.
        if (status_ == status::closed || status_ == status::errored) {
            return promise<>::resolved(*loop_);
        }
        if (pending_abort_) {
            return pending_abort_->result;
        }
        bool was_already_erroring = false;
        if (status_ == status::erroring) {
            was_already_erroring = true;
            reason = undefined;
        }
        auto [result, settle] = promise<>::create(*loop_);
        pending_abort_ = pending_abort{result, settle, reason, was_already_erroring};
        if (!was_already_erroring) {
            start_erroring(std::move(reason));
        }
        return result;
    }

    promise<> close() {
        if (status_ == status::closed || status_ == status::errored) {
            return promise<>::rejected(
                *loop_, value::type_error("cannot close a closed or errored stream")
            );
        }
        auto [result, settle] = promise<>::create(*loop_);
        close_request_ = settle;
        if (writer_ && backpressure_ && status_ == status::writable) {
            writer_->resolve_ready();
        }
        queue_.push_back({std::nullopt, 0});
        advance_queue_if_needed();
        return result;
    }

    promise<> write(value chunk) {
        auto size = strategy_.chunk_size(chunk);
        if (status_ == status::errored) {
            return promise<>::rejected(*loop_, stored_error_);
        }
        if (close_queued_or_in_flight() || status_ == status::closed) {
            return promise<>::rejected(
                *loop_, value::type_error("cannot write to a closing or closed stream")
            );
        }
        if (status_ == status::erroring) {
            return promise<>::rejected(*loop_, stored_error_);
        }
        auto [result, settle] = promise<>::create(*loop_);
        write_requests_.push_back(settle);
        queue_total_size_ += size;
        queue_.push_back({std::move(chunk), size});
        if (!close_queued_or_in_flight() && status_ == status::writable) {
            update_backpressure(get_backpressure());
        }
        advance_queue_if_needed();
        return result;
    }

    void controller_error(value e) {
        if (status_ != status::writable) {
            return;
        }
        clear_algorithms();
        start_erroring(std::move(e));
    }

    std::optional<double> desired_size() const {
        switch (status_) {
            case status::errored:
            case status::erroring:
                return std::nullopt;
            case status::closed:
                return 0.0;
            case status::writable:
                break;
        }
        return strategy_.high_water_mark - queue_total_size_;
    }

    std::shared_ptr<writable_writer_state> acquire_writer() {
        auto writer = std::make_shared<writable_writer_state>();
        writer->loop = loop_;
        writer->stream = shared_from_this();
        switch (status_) {
            case status::writable:
                if (!close_queued_or_in_flight() && backpressure_) {
                    writer->reset_ready();
                } else {
                    writer->ready = promise<>::resolved(*loop_);
                }
                writer->reset_closed();
                break;
            case status::erroring:
                writer->ready = promise<>::rejected(*loop_, stored_error_);
                writer->reset_closed();
                break;
            case status::closed:
                writer->ready = promise<>::resolved(*loop_);
                writer->closed = promise<>::resolved(*loop_);
                break;
            case status::errored:
                writer->ready = promise<>::rejected(*loop_, stored_error_);
                writer->closed = promise<>::rejected(*loop_, stored_error_);
                break;
        }
        writer_ = writer;
        return writer;
    }

    void release_writer(writable_writer_state& writer) {
        // Dropping the writer's reference below may drop the last one to us.
        auto self = shared_from_this();
        auto released = value::type_error("writer has been released");
        writer.ensure_ready_rejected(released);
        writer.ensure_closed_rejected(released);
        writer.stream = nullptr;
        writer_ = nullptr;
    }

  private:
    writable_stream_default_controller controller() {
        return writable_stream_default_controller(
            weak_from_this(), loop_, abort_controller_.signal()
        );
    }

    bool get_backpressure() const {
        return strategy_.high_water_mark - queue_total_size_ <= 0;
    }

    bool has_operation_marked_in_flight() const {
        return in_flight_write_.has_value() || in_flight_close_.has_value();
    }

    void update_backpressure(bool backpressure) {
        if (writer_ && backpressure != backpressure_) {
            if (backpressure) {
                writer_->reset_ready();
            } else {
                writer_->resolve_ready();
            }
        }
        backpressure_ = backpressure;
    }

    void advance_queue_if_needed() {
        if (!started_ || in_flight_write_) {
            return;
        }
        if (status_ == status::erroring) {
            finish_erroring();
            return;
        }
        if (queue_.empty()) {
            return;
        }
        if (!queue_.front().chunk) {
            process_close();
        } else {
            process_write(*queue_.front().chunk);
        }
    }

    void process_close() {
        in_flight_close_ = std::move(close_request_);
        close_request_.reset();
        queue_.pop_front();
        queue_total_size_ = 0;

        promise<> closed;
        if (sink_) {
            closed = sink_->close();
        }
        clear_algorithms();

        auto self = shared_from_this();
        closed.then(
            *loop_,
            [self] {
                self->finish_in_flight_close();
            },
            [self](const value& e) {
                self->finish_in_flight_close_with_error(e);
            }
        );
    }

    // Takes the chunk by value: the sink may error the stream, and clear the queue,
    // from inside write().
    void process_write(value chunk) {
        in_flight_write_ = std::move(write_requests_.front());
        write_requests_.pop_front();

        promise<> written;
        if (sink_) {
            auto ctrl = controller();
            written = sink_->write(chunk, ctrl);
        }

        auto self = shared_from_this();
        written.then(
            *loop_,
            [self] {
                self->finish_in_flight_write();
                if (!self->queue_.empty()) {
                    auto size = self->queue_.front().size;
                    self->queue_.pop_front();
                    self->queue_total_size_ =
                        self->queue_.empty() ? 0 : self->queue_total_size_ - size;
                }
                if (!self->close_queued_or_in_flight() && self->status_ == status::writable) {
                    self->update_backpressure(self->get_backpressure());
                }
                self->advance_queue_if_needed();
            },
            [self](const value& e) {
                if (self->status_ == status::writable) {
                    self->clear_algorithms();
                }
                self->finish_in_flight_write_with_error(e);
            }
        );
    }

    void finish_in_flight_write() {
        auto request = std::move(*in_flight_write_);
        in_flight_write_.reset();
        request.resolve();
    }

    void finish_in_flight_write_with_error(const value& e) {
        auto request = std::move(*in_flight_write_);
        in_flight_write_.reset();
        request.reject(e);
        deal_with_rejection(e);
    }

    void finish_in_flight_close() {
        auto request = std::move(*in_flight_close_);
        in_flight_close_.reset();
        request.resolve();
        if (status_ == status::erroring) {
            stored_error_ = undefined;
            if (pending_abort_) {
                pending_abort_->settle.resolve();
                pending_abort_.reset();
            }
        }
        status_ = status::closed;
        if (writer_) {
            writer_->resolve_closed();
        }
    }

    void finish_in_flight_close_with_error(const value& e) {
        auto request = std::move(*in_flight_close_);
        in_flight_close_.reset();
        request.reject(e);
        if (pending_abort_) {
            pending_abort_->settle.reject(e);
            pending_abort_.reset();
        }
        deal_with_rejection(e);
    }

    void deal_with_rejection(const value& e) {
        if (status_ == status::writable) {
            start_erroring(e);
            return;
        }
        finish_erroring();
    }

    void start_erroring(value reason) {
        log(log_level::debug, "writable stream erroring: ", reason);
        stored_error_ = std::move(reason);
        status_ = status::erroring;
        if (writer_) {
            writer_->ensure_ready_rejected(stored_error_);
        }
        if (!has_operation_marked_in_flight() && started_) {
            finish_erroring();
        }
    }

    void finish_erroring() {
        status_ = status::errored;
        queue_.clear();
        queue_total_size_ = 0;

        auto requests = std::move(write_requests_);
        write_requests_.clear();
        for (auto& request : requests) {
            request.reject(stored_error_);
        }

        if (!pending_abort_) {
            reject_close_and_closed_promise_if_needed();
            return;
        }
        auto abort_request = std::move(*pending_abort_);
        pending_abort_.reset();
        if (abort_request.was_already_erroring) {
            abort_request.settle.reject(stored_error_);
            reject_close_and_closed_promise_if_needed();
            return;
        }

        promise<> aborted;
        if (sink_) {
            aborted = sink_->abort(abort_request.reason);
        }
        clear_algorithms();

        auto self = shared_from_this();
        aborted.then(
            *loop_,
            [self, settle = abort_request.settle] {
                settle.resolve();
                self->reject_close_and_closed_promise_if_needed();
            },
            [self, settle = abort_request.settle](const value& e) {
                settle.reject(e);
                self->reject_close_and_closed_promise_if_needed();
            }
        );
    }

    void reject_close_and_closed_promise_if_needed() {
        if (close_request_) {
            auto request = std::move(*close_request_);
            close_request_.reset();
            request.reject(stored_error_);
        }
        if (writer_ && writer_->closed_resolver) {
            writer_->closed_resolver->reject(stored_error_);
        }
    }

    // The sink may be running one of its own callbacks right now, so it is destroyed
    // from a later microtask.
    void clear_algorithms() {
        if (!sink_) {
            return;
        }
        std::shared_ptr<underlying_sink> sink = std::move(sink_);
        loop_->queue_microtask([sink] {});
    }

    event_loop* loop_;
    std::unique_ptr<underlying_sink> sink_;
    queuing_strategy strategy_;
    abort_controller abort_controller_;

    status status_{status::writable};
    value stored_error_;
    std::shared_ptr<writable_writer_state> writer_;
    bool backpressure_{false};

    std::deque<resolver<>> write_requests_;
    std::optional<resolver<>> in_flight_write_;
    std::optional<resolver<>> close_request_;
    std::optional<resolver<>> in_flight_close_;
    std::optional<pending_abort> pending_abort_;

    std::deque<queue_entry> queue_;
    double queue_total_size_{0};
    bool started_{false};
};

}  // namespace detail

void writable_stream_default_controller::error(value e) const {
    if (auto state = state_.lock()) {
        state->controller_error(std::move(e));
    }
}

writable_stream_default_writer& writable_stream_default_writer::operator=(
    writable_stream_default_writer&& other
) noexcept {
    if (this != &other) {
        release_lock();
        state_ = std::move(other.state_);
    }
    return *this;
}

writable_stream_default_writer::~writable_stream_default_writer() {
    release_lock();
}

promise<> writable_stream_default_writer::ready() const {
    if (!state_) {
        throw stream_state_error("ready() on a moved-from writer");
    }
    return state_->ready;
}

promise<> writable_stream_default_writer::closed() const {
    if (!state_) {
        throw stream_state_error("closed() on a moved-from writer");
    }
    return state_->closed;
}

std::optional<double> writable_stream_default_writer::desired_size() const {
    if (!state_ || !state_->stream) {
        throw stream_state_error("desired_size() on a released writer");
    }
    return state_->stream->desired_size();
}

promise<> writable_stream_default_writer::write(value chunk) {
    if (!state_) {
        throw stream_state_error("write() on a moved-from writer");
    }
    if (!state_->stream) {
        return promise<>::rejected(
            *state_->loop, value::type_error("cannot write through a released writer")
        );
    }
    return state_->stream->write(std::move(chunk));
}

promise<> writable_stream_default_writer::close() {
    if (!state_) {
        throw stream_state_error("close() on a moved-from writer");
    }
    if (!state_->stream) {
        return promise<>::rejected(
            *state_->loop, value::type_error("cannot close through a released writer")
        );
    }
    if (state_->stream->close_queued_or_in_flight()) {
        return promise<>::rejected(*state_->loop, value::type_error("stream is already closing"));
    }
    return state_->stream->close();
}

promise<> writable_stream_default_writer::abort(value reason) {
    if (!state_) {
        throw stream_state_error("abort() on a moved-from writer");
    }
    if (!state_->stream) {
        return promise<>::rejected(
            *state_->loop, value::type_error("cannot abort through a released writer")
        );
    }
    return state_->stream->abort(std::move(reason));
}

void writable_stream_default_writer::release_lock() {
    if (state_ && state_->stream) {
        auto stream = state_->stream;
        stream->release_writer(*state_);
    }
}

writable_stream::writable_stream(
    event_loop& loop, std::unique_ptr<underlying_sink> sink, queuing_strategy strategy
) {
    if (std::isnan(strategy.high_water_mark) || strategy.high_water_mark < 0) {
        throw std::invalid_argument("high water mark must be a non-negative number");
    }
    if (!sink) {
        sink = std::make_unique<underlying_sink>();
    }
    state_ = std::make_shared<detail::writable_stream_state>(
        loop, std::move(sink), std::move(strategy)
    );
    state_->start();
}

bool writable_stream::locked() const {
    return state_->locked();
}

promise<> writable_stream::abort(value reason) {
    if (state_->locked()) {
        return promise<>::rejected(
            state_->loop(), value::type_error("cannot abort a stream that is locked to a writer")
        );
    }
    return state_->abort(std::move(reason));
}

promise<> writable_stream::close() {
    if (state_->locked()) {
        return promise<>::rejected(
            state_->loop(), value::type_error("cannot close a stream that is locked to a writer")
        );
    }
    if (state_->close_queued_or_in_flight()) {
        return promise<>::rejected(state_->loop(), value::type_error("stream is already closing"));
    }
    return state_->close();
}

writable_stream_default_writer writable_stream::get_writer() {
    if (state_->locked()) {
        throw lock_error("writable stream is already locked to a writer");
    }
    return writable_stream_default_writer(state_->acquire_writer());
}

event_loop& writable_stream::loop() const {
    return state_->loop();
}

}  // namespace wstreams::host

#include <wstreams/host/readable_stream.hpp>

#include <cmath>
#include <deque>
#include <stdexcept>
#include <utility>

#include <wstreams/errors.hpp>
#include <wstreams/log.hpp>

namespace wstreams::host {
namespace detail {

struct readable_reader_state {
    event_loop* loop = nullptr;
    // Empty once the lock was released.
    std::shared_ptr<readable_stream_state> stream;
    std::deque<resolver<read_result>> read_requests;
    promise<> closed;
    std::optional<resolver<>> closed_resolver;
};

class readable_stream_state : public std::enable_shared_from_this<readable_stream_state> {
    enum class status {
        readable,
        closed,
        errored,
    };

    struct queue_entry {
        value chunk;
        double size;
    };

  public:
    readable_stream_state(
        event_loop& loop, std::unique_ptr<underlying_source> source, queuing_strategy strategy
    )
        : loop_(&loop), source_(std::move(source)), strategy_(std::move(strategy)) {}

    void start() {
        auto ctrl = controller();
        auto started = source_->start(ctrl);
        auto self = shared_from_this();
        started.then(
            *loop_,
            [self] {
                self->started_ = true;
                self->call_pull_if_needed();
            },
            [self](const value& e) {
                self->error(e);
            }
        );
    }

    event_loop& loop() const {
        return *loop_;
    }

    bool locked() const {
        return reader_ != nullptr;
    }

    bool can_close_or_enqueue() const {
        return !close_requested_ && status_ == status::readable;
    }

    void enqueue(value chunk) {
        if (!can_close_or_enqueue()) {
            throw stream_state_error("cannot enqueue into a closing, closed or errored stream");
        }
        if (reader_ && !reader_->read_requests.empty()) {
            auto request = std::move(reader_->read_requests.front());
            reader_->read_requests.pop_front();
            request.resolve(read_result{std::move(chunk), false});
        } else {
            auto size = strategy_.chunk_size(chunk);
            queue_total_size_ += size;
            queue_.push_back({std::move(chunk), size});
        }
        call_pull_if_needed();
    }

    void close() {
        if (!can_close_or_enqueue()) {
            throw stream_state_error("cannot close a closing, closed or errored stream");
        }
        close_requested_ = true;
        if (queue_.empty()) {
            clear_algorithms();
            close_stream();
        }
    }

    void error(value e) {
        if (status_ != status::readable) {
            return;
        }
        reset_queue();
        clear_algorithms();
        error_stream(std::move(e));
    }

    std::optional<double> desired_size() const {
        switch (status_) {
            case status::errored:
                return std::nullopt;
            case status::closed:
                return 0.0;
            case status::readable:
                break;
        }
        return strategy_.high_water_mark - queue_total_size_;
    }

    promise<> cancel(value reason) {
        if (status_ == status::closed) {
            return promise<>::resolved(*loop_);
        }
        if (status_ == status::errored) {
            return promise<>::rejected(*loop_, stored_error_);
        }
        log(log_level::debug, "readable stream canceled: ", reason);
        close_stream();
        reset_queue();

        promise<> canceled;
        if (source_) {
            canceled = source_->cancel(reason);
        }
        clear_algorithms();

        auto [result, settle] = promise<>::create(*loop_);
        canceled.then(
            *loop_,
            [settle = settle] {
                settle.resolve();
            },
            [settle = settle](const value& e) {
                settle.reject(e);
            }
        );
        return result;
    }

    promise<read_result> read() {
        if (status_ == status::closed) {
            return promise<read_result>::resolved(*loop_, read_result{undefined, true});
        }
        if (status_ == status::errored) {
            return promise<read_result>::rejected(*loop_, stored_error_);
        }
        if (!queue_.empty()) {
            auto entry = std::move(queue_.front());
            queue_.pop_front();
            queue_total_size_ = queue_.empty() ? 0 : queue_total_size_ - entry.size;
            auto chunk = promise<read_result>::resolved(*loop_, read_result{std::move(entry.chunk), false});
            if (close_requested_ && queue_.empty()) {
                clear_algorithms();
                close_stream();
            } else {
                call_pull_if_needed();
            }
            return chunk;
        }
        auto [result, settle] = promise<read_result>::create(*loop_);
        reader_->read_requests.push_back(settle);
        call_pull_if_needed();
        return result;
    }

    std::shared_ptr<readable_reader_state> acquire_reader() {
        auto reader = std::make_shared<readable_reader_state>();
        reader->loop = loop_;
        reader->stream = shared_from_this();
        switch (status_) {
            case status::readable: {
                auto [closed, settle] = promise<>::create(*loop_);
                reader->closed = closed;
                reader->closed_resolver = settle;
                break;
            }
            case status::closed:
                reader->closed = promise<>::resolved(*loop_);
                break;
            case status::errored:
                reader->closed = promise<>::rejected(*loop_, stored_error_);
                break;
        }
        reader_ = reader;
        return reader;
    }

    void release_reader(readable_reader_state& reader) {
        // Dropping the reader's reference below may drop the last one to us.
        auto self = shared_from_this();
        auto released = value::type_error("reader has been released");
        if (reader.closed_resolver && !reader.closed_resolver->settled()) {
            reader.closed_resolver->reject(released);
        } else {
            reader.closed = promise<>::rejected(*loop_, released);
        }
        reader.closed_resolver.reset();

        auto requests = std::move(reader.read_requests);
        reader.read_requests.clear();
        for (auto& request : requests) {
            request.reject(released);
        }

        reader.stream = nullptr;
        reader_ = nullptr;
    }

  private:
    readable_stream_default_controller controller() {
        return readable_stream_default_controller(weak_from_this(), loop_);
    }

    bool should_call_pull() const {
        if (!can_close_or_enqueue() || !started_ || !source_) {
            return false;
        }
        if (reader_ && !reader_->read_requests.empty()) {
            return true;
        }
        auto size = desired_size();
        return size && *size > 0;
    }

    void call_pull_if_needed() {
        if (!should_call_pull()) {
            return;
        }
        if (pulling_) {
            pull_again_ = true;
            return;
        }
        pulling_ = true;
        auto ctrl = controller();
        auto pulled = source_->pull(ctrl);
        auto self = shared_from_this();
        pulled.then(
            *loop_,
            [self] {
                self->pulling_ = false;
                if (self->pull_again_) {
                    self->pull_again_ = false;
                    self->call_pull_if_needed();
                }
            },
            [self](const value& e) {
                self->error(e);
            }
        );
    }

    // The source may be running one of its own callbacks right now, so it is destroyed
    // from a later microtask.
    void clear_algorithms() {
        if (!source_) {
            return;
        }
        std::shared_ptr<underlying_source> source = std::move(source_);
        loop_->queue_microtask([source] {});
    }

    void reset_queue() {
        queue_.clear();
        queue_total_size_ = 0;
    }

    void close_stream() {
        status_ = status::closed;
        if (!reader_) {
            return;
        }
        auto reader = reader_;
        auto requests = std::move(reader->read_requests);
        reader->read_requests.clear();
        for (auto& request : requests) {
            request.resolve(read_result{undefined, true});
        }
        if (reader->closed_resolver) {
            reader->closed_resolver->resolve();
        }
    }

    void error_stream(value e) {
        log(log_level::debug, "readable stream errored: ", e);
        status_ = status::errored;
        stored_error_ = std::move(e);
        if (!reader_) {
            return;
        }
        auto reader = reader_;
        auto requests = std::move(reader->read_requests);
        reader->read_requests.clear();
        for (auto& request : requests) {
            request.reject(stored_error_);
        }
        if (reader->closed_resolver) {
            reader->closed_resolver->reject(stored_error_);
        }
    }

    event_loop* loop_;
    std::unique_ptr<underlying_source> source_;
    queuing_strategy strategy_;

    status status_{status::readable};
    value stored_error_;
    std::shared_ptr<readable_reader_state> reader_;

    std::deque<queue_entry> queue_;
    double queue_total_size_{0};
    bool started_{false};
    bool close_requested_{false};
    bool pulling_{false};
    bool pull_again_{false};
};

}  // namespace detail

void readable_stream_default_controller::enqueue(value chunk) const {
    if (auto state = state_.lock()) {
        state->enqueue(std::move(chunk));
    }
}

void readable_stream_default_controller::close() const {
    if (auto state = state_.lock()) {
        state->close();
    }
}

void readable_stream_default_controller::error(value e) const {
    if (auto state = state_.lock()) {
        state->error(std::move(e));
    }
}

std::optional<double> readable_stream_default_controller::desired_size() const {
    if (auto state = state_.lock()) {
        return state->desired_size();
    }
    return std::nullopt;
}

readable_stream_default_reader& readable_stream_default_reader::operator=(
    readable_stream_default_reader&& other
) noexcept {
    if (this != &other) {
        release_lock();
        state_ = std::move(other.state_);
    }
    return *this;
}

readable_stream_default_reader::~readable_stream_default_reader() {
    release_lock();
}

promise<read_result> readable_stream_default_reader::read() {
    if (!state_) {
        throw stream_state_error("read() on a moved-from reader");
    }
    if (!state_->stream) {
        return promise<read_result>::rejected(
            *state_->loop, value::type_error("cannot read from a released reader")
        );
    }
    return state_->stream->read();
}

promise<> readable_stream_default_reader::cancel(value reason) {
    if (!state_) {
        throw stream_state_error("cancel() on a moved-from reader");
    }
    if (!state_->stream) {
        return promise<>::rejected(
            *state_->loop, value::type_error("cannot cancel through a released reader")
        );
    }
    return state_->stream->cancel(std::move(reason));
}

promise<> readable_stream_default_reader::closed() const {
    if (!state_) {
        throw stream_state_error("closed() on a moved-from reader");
    }
    return state_->closed;
}

void readable_stream_default_reader::release_lock() {
    if (state_ && state_->stream) {
        auto stream = state_->stream;
        stream->release_reader(*state_);
    }
}

readable_stream::readable_stream(
    event_loop& loop, std::unique_ptr<underlying_source> source, queuing_strategy strategy
) {
    if (std::isnan(strategy.high_water_mark) || strategy.high_water_mark < 0) {
        throw std::invalid_argument("high water mark must be a non-negative number");
    }
    if (!source) {
        source = std::make_unique<underlying_source>();
    }
    state_ = std::make_shared<detail::readable_stream_state>(
        loop, std::move(source), std::move(strategy)
    );
    state_->start();
}

bool readable_stream::locked() const {
    return state_->locked();
}

promise<> readable_stream::cancel(value reason) {
    if (state_->locked()) {
        return promise<>::rejected(
            state_->loop(), value::type_error("cannot cancel a stream that is locked to a reader")
        );
    }
    return state_->cancel(std::move(reason));
}

readable_stream_default_reader readable_stream::get_reader() {
    if (state_->locked()) {
        throw lock_error("readable stream is already locked to a reader");
    }
    return readable_stream_default_reader(state_->acquire_reader());
}

event_loop& readable_stream::loop() const {
    return state_->loop();
}

}  // namespace wstreams::host

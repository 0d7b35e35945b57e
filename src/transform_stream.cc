#include <wstreams/host/transform_stream.hpp>

#include <utility>

#include <wstreams/errors.hpp>
#include <wstreams/log.hpp>

namespace wstreams::host {
namespace detail {

class transform_stream_state : public std::enable_shared_from_this<transform_stream_state> {
  public:
    transform_stream_state(event_loop& loop, std::unique_ptr<transformer> t)
        : loop_(&loop), transformer_(std::move(t)) {
        if (!transformer_) {
            transformer_ = std::make_unique<transformer>();
        }
        auto [started, settle] = promise<>::create(loop);
        started_ = started;
        start_resolver_ = settle;
        set_backpressure(true);
    }

    // Both sides hold off until the transformer started.
    void start() {
        auto ctrl = controller();
        auto started = transformer_->start(ctrl);
        auto settle = *start_resolver_;
        started.then(
            *loop_,
            [settle] {
                settle.resolve();
            },
            [settle](const value& e) {
                settle.reject(e);
            }
        );
    }

    promise<> attach(readable_stream_default_controller& controller) {
        readable_ = controller;
        return started_;
    }

    promise<> attach(writable_stream_default_controller& controller) {
        writable_ = controller;
        return started_;
    }

    void enqueue(value chunk) {
        if (readable_done_) {
            throw stream_state_error("cannot enqueue into a closed or errored transform stream");
        }
        readable_->enqueue(std::move(chunk));
        auto size = readable_->desired_size();
        bool has_backpressure = !size || *size <= 0;
        if (has_backpressure && !backpressure_) {
            set_backpressure(true);
        }
    }

    void error(value e) {
        log(log_level::debug, "transform stream errored: ", e);
        if (!readable_done_) {
            readable_done_ = true;
            readable_error_ = e;
            readable_->error(e);
        }
        error_writable_and_unblock(std::move(e));
    }

    void terminate() {
        if (!readable_done_) {
            readable_done_ = true;
            readable_->close();
        }
        error_writable_and_unblock(value::type_error("transform stream terminated"));
    }

    std::optional<double> desired_size() const {
        return readable_->desired_size();
    }

    // Writable side.

    promise<> write(const value& chunk) {
        if (!backpressure_) {
            return transform(chunk);
        }
        auto [written, settle] = promise<>::create(*loop_);
        auto self = shared_from_this();
        backpressure_change_.then(
            [self, chunk, settle] {
                if (self->writable_error_) {
                    settle.reject(*self->writable_error_);
                    return;
                }
                settle_with(self->transform(chunk), settle);
            },
            [settle](const value& e) {
                settle.reject(e);
            }
        );
        return written;
    }

    promise<> close() {
        auto ctrl = controller();
        auto flushed = transformer_->flush(ctrl);
        auto [closed, settle] = promise<>::create(*loop_);
        auto self = shared_from_this();
        flushed.then(
            *loop_,
            [self, settle] {
                if (self->readable_error_) {
                    settle.reject(*self->readable_error_);
                    return;
                }
                if (!self->readable_done_) {
                    self->readable_done_ = true;
                    self->readable_->close();
                }
                settle.resolve();
            },
            [self, settle](const value& e) {
                self->error(e);
                settle.reject(e);
            }
        );
        return closed;
    }

    promise<> abort(const value& reason) {
        error(reason);
        return {};
    }

    // Readable side.

    promise<> pull() {
        set_backpressure(false);
        return backpressure_change_;
    }

    promise<> cancel(const value& reason) {
        log(log_level::debug, "transform stream readable side canceled: ", reason);
        readable_done_ = true;
        error_writable_and_unblock(reason);
        return {};
    }

  private:
    transform_stream_default_controller controller() {
        return transform_stream_default_controller(weak_from_this(), loop_);
    }

    static void settle_with(const promise<>& from, resolver<> to) {
        from.then(
            [to] {
                to.resolve();
            },
            [to](const value& e) {
                to.reject(e);
            }
        );
    }

    promise<> transform(const value& chunk) {
        auto ctrl = controller();
        auto transformed = transformer_->transform(chunk, ctrl);
        auto [written, settle] = promise<>::create(*loop_);
        auto self = shared_from_this();
        transformed.then(
            *loop_,
            [settle] {
                settle.resolve();
            },
            [self, settle](const value& e) {
                self->error(e);
                settle.reject(e);
            }
        );
        return written;
    }

    void error_writable_and_unblock(value e) {
        if (!writable_error_) {
            writable_error_ = e;
        }
        writable_->error(std::move(e));
        if (backpressure_) {
            set_backpressure(false);
        }
    }

    // Settles the previous backpressure change promise and starts a new one.
    void set_backpressure(bool backpressure) {
        if (change_resolver_) {
            change_resolver_->resolve();
        }
        auto [changed, settle] = promise<>::create(*loop_);
        backpressure_change_ = changed;
        change_resolver_ = settle;
        backpressure_ = backpressure;
    }

    event_loop* loop_;
    std::unique_ptr<transformer> transformer_;
    promise<> started_;
    std::optional<resolver<>> start_resolver_;

    std::optional<readable_stream_default_controller> readable_;
    std::optional<writable_stream_default_controller> writable_;

    bool backpressure_{false};
    promise<> backpressure_change_;
    std::optional<resolver<>> change_resolver_;

    bool readable_done_{false};
    std::optional<value> readable_error_;
    std::optional<value> writable_error_;
};

}  // namespace detail

namespace {

class transform_source final : public underlying_source {
  public:
    explicit transform_source(std::shared_ptr<detail::transform_stream_state> state)
        : state_(std::move(state)) {}

    promise<> start(readable_stream_default_controller& controller) override {
        return state_->attach(controller);
    }

    promise<> pull(readable_stream_default_controller&) override {
        return state_->pull();
    }

    promise<> cancel(const value& reason) override {
        return state_->cancel(reason);
    }

  private:
    std::shared_ptr<detail::transform_stream_state> state_;
};

class transform_sink final : public underlying_sink {
  public:
    explicit transform_sink(std::shared_ptr<detail::transform_stream_state> state)
        : state_(std::move(state)) {}

    promise<> start(writable_stream_default_controller& controller) override {
        return state_->attach(controller);
    }

    promise<> write(const value& chunk, writable_stream_default_controller&) override {
        return state_->write(chunk);
    }

    promise<> close() override {
        return state_->close();
    }

    promise<> abort(const value& reason) override {
        return state_->abort(reason);
    }

  private:
    std::shared_ptr<detail::transform_stream_state> state_;
};

}  // namespace

void transform_stream_default_controller::enqueue(value chunk) const {
    if (auto state = state_.lock()) {
        state->enqueue(std::move(chunk));
    }
}

void transform_stream_default_controller::error(value e) const {
    if (auto state = state_.lock()) {
        state->error(std::move(e));
    }
}

void transform_stream_default_controller::terminate() const {
    if (auto state = state_.lock()) {
        state->terminate();
    }
}

std::optional<double> transform_stream_default_controller::desired_size() const {
    if (auto state = state_.lock()) {
        return state->desired_size();
    }
    return std::nullopt;
}

transform_stream::transform_stream(
    event_loop& loop,
    std::unique_ptr<transformer> t,
    queuing_strategy writable_strategy,
    queuing_strategy readable_strategy
)
    : state_(std::make_shared<detail::transform_stream_state>(loop, std::move(t))),
      writable_(loop, std::make_unique<transform_sink>(state_), std::move(writable_strategy)),
      readable_(loop, std::make_unique<transform_source>(state_), std::move(readable_strategy)) {
    state_->start();
}

}  // namespace wstreams::host

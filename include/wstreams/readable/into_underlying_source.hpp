#pragma once

#include <concepts>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "../awaitable.hpp"
#include "../errors.hpp"
#include "../host/event_loop.hpp"
#include "../host/promise.hpp"
#include "../host/readable_stream.hpp"
#include "../log.hpp"
#include "../result.hpp"
#include "../stream_awaitable.hpp"
#include "../value.hpp"
#include "../waker.hpp"

namespace wstreams {

// A sequence whose items can be relayed to a host stream: each item is either a chunk
// or the error that ends the sequence.
template<typename S>
concept result_stream =
    stream_awaitable<S> && std::same_as<stream_awaitable_result_t<S>, result<value>>;

/// Feeds a host readable stream from a sequence. The host calls pull() whenever it wants
/// a chunk, and each pull takes exactly one item from the sequence.
///
/// Ending the sequence closes the stream; an err item errors it, and so does an exception
/// thrown from poll_next(). Either way, and on cancel(), the sequence is dropped right
/// away.
template<result_stream Stream>
class into_underlying_source final : public host::underlying_source {
    // Shared with the pull tasks running on the loop.
    struct shared_state {
        std::optional<Stream> stream;
        std::optional<host::readable_stream_default_controller> controller;
    };

    class pull_awaitable {
        std::shared_ptr<shared_state> inner_;
        host::resolver<> done_;

      public:
        pull_awaitable(std::shared_ptr<shared_state> inner, host::resolver<> done)
            : inner_(std::move(inner)), done_(std::move(done)) {}

        awaitable_state<> poll(const waker& w) {
            auto& inner = *inner_;
            // Canceled while this pull was in progress.
            if (!inner.stream) {
                done_.resolve();
                return awaitable_state<>::ready();
            }

            try {
                if (!relay_next(w)) {
                    return awaitable_state<>::pending();
                }
            } catch (...) {
                auto e = exception_to_value(std::current_exception());
                log(log_level::warning, "sequence threw, erroring readable stream: ", e);
                inner.stream.reset();
                inner.controller->error(std::move(e));
            }
            done_.resolve();
            return awaitable_state<>::ready();
        }

      private:
        // False while the sequence is pending.
        bool relay_next(const waker& w) {
            auto& inner = *inner_;
            auto state = inner.stream->poll_next(w);
            if (state.is_done()) {
                log(log_level::debug, "sequence ended, closing readable stream");
                inner.stream.reset();
                inner.controller->close();
                return true;
            }
            if (!state.is_ready()) {
                return false;
            }
            auto item = state.take_result();
            if (item.is_ok()) {
                inner.controller->enqueue(item.take());
            } else {
                log(log_level::debug, "sequence failed: ", item.error());
                inner.stream.reset();
                inner.controller->error(item.take_error());
            }
            return true;
        }
    };

  public:
    into_underlying_source(host::event_loop& loop, Stream stream)
        : loop_(&loop), inner_(std::make_shared<shared_state>()) {
        inner_->stream.emplace(std::move(stream));
    }

    host::promise<> start(host::readable_stream_default_controller& controller) override {
        inner_->controller = controller;
        return {};
    }

    host::promise<> pull(host::readable_stream_default_controller& controller) override {
        auto [pulled, done] = host::promise<>::create(*loop_);
        loop_->spawn_local(pull_awaitable(inner_, done));
        return pulled;
    }

    host::promise<> cancel(const value& reason) override {
        log(log_level::debug, "readable stream canceled, dropping sequence: ", reason);
        inner_->stream.reset();
        return {};
    }

  private:
    host::event_loop* loop_;
    std::shared_ptr<shared_state> inner_;
};

}  // namespace wstreams

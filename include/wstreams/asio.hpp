#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "awaitable.hpp"
#include "host/event_loop.hpp"
#include "waker.hpp"

namespace wstreams {
namespace detail {

template<typename ResultType>
struct poll_signature {
    using type = void(std::exception_ptr, ResultType);
};

template<>
struct poll_signature<void> {
    using type = void(std::exception_ptr);
};

template<typename ResultType>
using poll_signature_t = typename poll_signature<ResultType>::type;

}  // namespace detail

/// Runs the host event loop on an io_context: whenever the loop receives work, a drain of
/// the loop is posted to the executor. Both must live on the same thread.
///
/// Example:
///   asio::io_context ctx;
///   wstreams::host::event_loop loop;
///   wstreams::bind_to_asio(loop, ctx.get_executor());
///   auto stream = wstreams::from_stream(loop, numbers());
///   ctx.run();
inline void bind_to_asio(host::event_loop& loop, asio::any_io_executor executor) {
    auto drain = [&loop] {
        loop.run_until_idle();
    };
    loop.set_work_notifier([executor, drain] {
        asio::post(executor, drain);
    });
    if (!loop.idle()) {
        asio::post(executor, drain);
    }
}

/// Drives an awaitable from the io_context's thread and reports its result through an
/// ASIO completion token (use_awaitable, use_future, a callback, ...). Pair it with
/// bind_to_asio() when the awaitable depends on host streams.
template<awaitable Awaitable, typename CompletionToken>
auto to_asio(asio::any_io_executor executor, Awaitable&& aw, CompletionToken&& token) {
    using result_type = awaitable_result_t<std::decay_t<Awaitable>>;
    using signature = detail::poll_signature_t<result_type>;
    static_assert(
        std::is_void_v<result_type> || std::is_default_constructible_v<result_type>,
        "to_asio: an exception is reported with a default-constructed result"
    );

    return asio::async_initiate<CompletionToken, signature>(
        [executor](auto handler, std::decay_t<Awaitable> awaitable) mutable {
            using handler_type = std::decay_t<decltype(handler)>;

            struct op_state : std::enable_shared_from_this<op_state> {
                std::decay_t<Awaitable> awaitable;
                asio::any_io_executor executor;
                std::optional<handler_type> handler;
                bool wake_pending{true};
                bool polling{false};

                op_state(std::decay_t<Awaitable> aw, asio::any_io_executor exec, handler_type h)
                    : awaitable(std::move(aw)), executor(std::move(exec)), handler(std::move(h)) {}

                void poll() {
                    auto self = this->shared_from_this();
                    while (handler && std::exchange(wake_pending, false)) {
                        polling = true;
                        try {
                            auto state = awaitable.poll(waker(self));
                            polling = false;
                            if (state.is_ready()) {
                                complete(std::move(state));
                                return;
                            }
                        } catch (...) {
                            polling = false;
                            complete_with_exception(std::current_exception());
                            return;
                        }
                    }
                }

                void wake() {
                    wake_pending = true;
                    if (polling || !handler) {
                        return;
                    }
                    asio::post(executor, [self = this->shared_from_this()] {
                        self->poll();
                    });
                }

                void complete(awaitable_state<result_type> state) {
                    auto h = std::move(*handler);
                    handler.reset();
                    if constexpr (std::is_void_v<result_type>) {
                        std::invoke(std::move(h), std::exception_ptr{});
                    } else {
                        std::invoke(std::move(h), std::exception_ptr{}, state.take_result());
                    }
                }

                void complete_with_exception(std::exception_ptr ex) {
                    auto h = std::move(*handler);
                    handler.reset();
                    if constexpr (std::is_void_v<result_type>) {
                        std::invoke(std::move(h), ex);
                    } else {
                        std::invoke(std::move(h), ex, result_type{});
                    }
                }
            };

            auto op = std::make_shared<op_state>(std::move(awaitable), executor, std::move(handler));
            op->poll();
        },
        std::forward<CompletionToken>(token),
        std::forward<Awaitable>(aw)
    );
}

}  // namespace wstreams

#include <optional>
#include <utility>

#include <wstreams/host/readable_stream.hpp>
#include <wstreams/host/writable_stream.hpp>
#include <wstreams/log.hpp>
#include <wstreams/race.hpp>
#include <wstreams/ref.hpp>
#include <wstreams/task.hpp>

namespace wstreams::host {
namespace {

enum class pipe_stop {
    source_closed,
    source_errored,
    dest_closed,
    dest_errored,
    aborted,
};

// Owns both locks until the pipe finished, then settles `done`.
task<> pipe_loop(
    readable_stream_default_reader reader,
    writable_stream_default_writer writer,
    pipe_options options,
    resolver<> done
) {
    auto signal = options.signal ? *options.signal : abort_controller().signal();
    auto aborted = signal.on_abort();
    auto dest_closed = to_future(writer.closed());
    std::optional<promise_future<>> last_write;

    pipe_stop stop = pipe_stop::source_closed;
    value error;
    while (true) {
        auto ready = co_await race(ref(aborted), to_future(writer.ready()), ref(dest_closed));
        if (ready.index() == 0) {
            stop = pipe_stop::aborted;
            error = std::get<0>(ready);
            break;
        }
        if (ready.index() == 1) {
            auto r = std::get<1>(std::move(ready));
            if (r.is_err()) {
                stop = pipe_stop::dest_errored;
                error = r.take_error();
                break;
            }
        } else {
            auto r = std::get<2>(std::move(ready));
            stop = r.is_err() ? pipe_stop::dest_errored : pipe_stop::dest_closed;
            if (r.is_err()) {
                error = r.take_error();
            }
            break;
        }

        auto read = co_await race(ref(aborted), to_future(reader.read()), ref(dest_closed));
        if (read.index() == 0) {
            stop = pipe_stop::aborted;
            error = std::get<0>(read);
            break;
        }
        if (read.index() == 2) {
            auto r = std::get<2>(std::move(read));
            stop = r.is_err() ? pipe_stop::dest_errored : pipe_stop::dest_closed;
            if (r.is_err()) {
                error = r.take_error();
            }
            break;
        }
        auto r = std::get<1>(std::move(read));
        if (r.is_err()) {
            stop = pipe_stop::source_errored;
            error = r.take_error();
            break;
        }
        auto chunk = r.take();
        if (chunk.done) {
            stop = pipe_stop::source_closed;
            break;
        }
        last_write.emplace(to_future(writer.write(std::move(chunk.value))));
    }

    std::optional<value> failure;
    switch (stop) {
        case pipe_stop::source_closed:
            if (!options.prevent_close) {
                // Queued behind every pending write.
                auto closed = co_await to_future(writer.close());
                if (closed.is_err()) {
                    failure = closed.take_error();
                }
            } else if (last_write) {
                co_await ref(*last_write);
            }
            break;
        case pipe_stop::source_errored:
            if (!options.prevent_abort) {
                if (last_write) {
                    co_await ref(*last_write);
                }
                auto abort_result = co_await to_future(writer.abort(error));
                if (abort_result.is_err()) {
                    error = abort_result.take_error();
                }
            }
            failure = error;
            break;
        case pipe_stop::dest_closed:
            error = value::type_error("destination stream closed while piping");
            [[fallthrough]];
        case pipe_stop::dest_errored:
            if (!options.prevent_cancel) {
                auto cancel_result = co_await to_future(reader.cancel(error));
                if (cancel_result.is_err()) {
                    error = cancel_result.take_error();
                }
            }
            failure = error;
            break;
        case pipe_stop::aborted:
            if (!options.prevent_abort) {
                auto abort_result = co_await to_future(writer.abort(error));
                if (abort_result.is_err()) {
                    error = abort_result.take_error();
                }
            }
            if (!options.prevent_cancel) {
                auto cancel_result = co_await to_future(reader.cancel(error));
                if (cancel_result.is_err()) {
                    error = cancel_result.take_error();
                }
            }
            failure = error;
            break;
    }

    reader.release_lock();
    writer.release_lock();
    if (failure) {
        log(log_level::debug, "pipe failed: ", *failure);
        done.reject(*failure);
    } else {
        done.resolve();
    }
}

}  // namespace

promise<> readable_stream::pipe_to(writable_stream& dest, pipe_options options) {
    if (locked()) {
        return promise<>::rejected(loop(), value::type_error("cannot pipe a locked stream"));
    }
    if (dest.locked()) {
        return promise<>::rejected(loop(), value::type_error("cannot pipe to a locked stream"));
    }
    auto reader = get_reader();
    auto writer = dest.get_writer();
    auto [result, done] = promise<>::create(loop());
    loop().spawn_local(pipe_loop(std::move(reader), std::move(writer), std::move(options), done));
    return result;
}

}  // namespace wstreams::host

#include <wstreams/abort_signal.hpp>

#include <vector>

namespace wstreams {
namespace detail {

std::uint64_t abort_state::add_listener(listener l) {
    auto id = next_id_++;
    if (!aborted_) {
        listeners_.emplace(id, std::move(l));
    }
    return id;
}

void abort_state::abort(value reason) {
    if (aborted_) {
        return;
    }
    aborted_ = true;
    reason_ = std::move(reason);

    // A listener may add or remove listeners while we iterate.
    std::vector<listener> fired;
    fired.reserve(listeners_.size());
    for (auto& [id, l] : listeners_) {
        fired.push_back(std::move(l));
    }
    listeners_.clear();
    for (auto& l : fired) {
        l(reason_);
    }
}

}  // namespace detail

abort_signal abort_signal::abort(value reason) {
    auto state = std::make_shared<detail::abort_state>();
    state->abort(std::move(reason));
    return abort_signal(std::move(state));
}

void abort_controller::abort() {
    state_->abort(value::error("AbortError", "signal is aborted without reason"));
}

}  // namespace wstreams

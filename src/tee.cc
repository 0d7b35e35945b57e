#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <wstreams/host/readable_stream.hpp>
#include <wstreams/log.hpp>

namespace wstreams::host {
namespace {

struct tee_state {
    explicit tee_state(readable_stream_default_reader r) : reader(std::move(r)) {}

    readable_stream_default_reader reader;
    bool reading = false;
    bool read_again = false;
    std::array<bool, 2> canceled{};
    std::array<value, 2> reasons;
    std::array<std::optional<readable_stream_default_controller>, 2> branches;
    promise<> canceled_both;
    std::optional<resolver<>> cancel_resolver;

    void settle_cancel() {
        if (!canceled[0] || !canceled[1]) {
            cancel_resolver->resolve();
        }
    }
};

// One read from the source serves both branches. A pull that arrives while a read is
// out is remembered and served once that read settled.
void tee_pull(const std::shared_ptr<tee_state>& tee) {
    if (tee->reading) {
        tee->read_again = true;
        return;
    }
    tee->reading = true;
    std::weak_ptr<tee_state> weak = tee;
    tee->reader.read().then(
        [weak](const read_result& r) {
            auto tee = weak.lock();
            if (!tee) {
                return;
            }
            tee->read_again = false;
            if (r.done) {
                tee->reading = false;
                for (std::size_t i = 0; i < 2; i++) {
                    if (!tee->canceled[i]) {
                        tee->branches[i]->close();
                    }
                }
                tee->settle_cancel();
                return;
            }
            for (std::size_t i = 0; i < 2; i++) {
                if (!tee->canceled[i]) {
                    tee->branches[i]->enqueue(r.value);
                }
            }
            tee->reading = false;
            if (tee->read_again) {
                tee_pull(tee);
            }
        },
        [weak](const value&) {
            if (auto tee = weak.lock()) {
                tee->reading = false;
            }
        }
    );
}

class tee_branch final : public underlying_source {
  public:
    tee_branch(std::shared_ptr<tee_state> tee, std::size_t index)
        : tee_(std::move(tee)), index_(index) {}

    promise<> start(readable_stream_default_controller& controller) override {
        tee_->branches[index_] = controller;
        return {};
    }

    promise<> pull(readable_stream_default_controller& controller) override {
        tee_pull(tee_);
        return {};
    }

    promise<> cancel(const value& reason) override {
        tee_->canceled[index_] = true;
        tee_->reasons[index_] = reason;
        if (tee_->canceled[1 - index_]) {
            auto composite =
                value::make_object<std::vector<value>>(std::vector<value>{tee_->reasons[0], tee_->reasons[1]});
            log(log_level::debug, "both tee branches canceled, canceling the source");
            auto settle = *tee_->cancel_resolver;
            tee_->reader.cancel(std::move(composite))
                .then(
                    [settle] {
                        settle.resolve();
                    },
                    [settle](const value& e) {
                        settle.reject(e);
                    }
                );
        }
        return tee_->canceled_both;
    }

  private:
    std::shared_ptr<tee_state> tee_;
    std::size_t index_;
};

}  // namespace

std::pair<readable_stream, readable_stream> readable_stream::tee() {
    auto& loop = this->loop();
    auto tee = std::make_shared<tee_state>(get_reader());
    auto [canceled_both, settle] = promise<>::create(loop);
    tee->canceled_both = canceled_both;
    tee->cancel_resolver = settle;

    readable_stream left(loop, std::make_unique<tee_branch>(tee, 0));
    readable_stream right(loop, std::make_unique<tee_branch>(tee, 1));

    std::weak_ptr<tee_state> weak = tee;
    tee->reader.closed().then(
        [] {},
        [weak](const value& e) {
            auto tee = weak.lock();
            if (!tee) {
                return;
            }
            for (auto& branch : tee->branches) {
                branch->error(e);
            }
            tee->settle_cancel();
        }
    );
    return {std::move(left), std::move(right)};
}

}  // namespace wstreams::host

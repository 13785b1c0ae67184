#pragma once

#include <atomic>
#include <memory>

namespace scoopdeck {

// Read side of a cancellation flag. Copies share the same flag.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    bool is_cancellation_requested() const {
        return state_ && state_->requested.load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> requested{false};
    };
    std::shared_ptr<State> state_;
};

// Write side, held by whoever may cancel.
class CancellationSource {
public:
    void cancel() {
        if (token_.state_) {
            token_.state_->requested.store(true, std::memory_order_release);
        }
    }

    bool is_cancellation_requested() const { return token_.is_cancellation_requested(); }

    CancellationToken token() const { return token_; }

private:
    CancellationToken token_;
};

} // namespace scoopdeck

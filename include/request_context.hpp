#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "errors.hpp"

namespace redirector {

// Deadline and cancellation signal carried into every blocking core operation.
// Copies share the cancellation flag.
class RequestContext {
public:
    using Clock = std::chrono::steady_clock;

    RequestContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    static RequestContext with_timeout(Clock::duration timeout) {
        RequestContext ctx;
        ctx.deadline_ = Clock::now() + timeout;
        return ctx;
    }

    void cancel() { cancelled_->store(true); }

    bool cancelled() const { return cancelled_->load(); }

    bool expired() const {
        return deadline_ && Clock::now() >= *deadline_;
    }

    bool done() const { return cancelled() || expired(); }

    const std::optional<Clock::time_point>& deadline() const { return deadline_; }

    // Time left before the deadline, or `fallback` when no deadline is set.
    Clock::duration remaining(Clock::duration fallback) const {
        if (!deadline_) return fallback;
        auto left = *deadline_ - Clock::now();
        if (left < Clock::duration::zero()) return Clock::duration::zero();
        return left < fallback ? left : fallback;
    }

    // Throws when the operation must not proceed.
    void check() const {
        if (cancelled()) throw OperationCancelledError("operation cancelled");
        if (expired()) throw OperationCancelledError("deadline exceeded");
    }

private:
    std::optional<Clock::time_point> deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace redirector

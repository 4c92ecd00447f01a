#include "upo/upload/rate_limit.hpp"

#include <algorithm>

namespace upo::upload {

RateLimitController::RateLimitController()
    : RateLimitController([] { return Clock::now(); }) {}

RateLimitController::RateLimitController(NowFn now)
    : now_(std::move(now)) {}

RateLimitController::Clock::time_point RateLimitController::arm(std::chrono::milliseconds delay) {
    const auto now = now_();
    auto candidate = now + std::max(delay, std::chrono::milliseconds{0});

    expire_if_due();
    if (pause_until_ && *pause_until_ > candidate) {
        candidate = *pause_until_;
    }

    pause_until_ = candidate;
    reason_ = describe(std::chrono::duration_cast<std::chrono::milliseconds>(candidate - now));
    return candidate;
}

bool RateLimitController::is_paused() const {
    expire_if_due();
    return pause_until_.has_value();
}

std::string RateLimitController::reason() const {
    expire_if_due();
    return reason_;
}

std::chrono::milliseconds RateLimitController::remaining() const {
    expire_if_due();
    if (!pause_until_) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*pause_until_ - now_());
}

std::optional<RateLimitController::Clock::time_point> RateLimitController::deadline() const {
    expire_if_due();
    return pause_until_;
}

PauseState RateLimitController::state() const {
    PauseState state;
    state.paused = is_paused();
    if (state.paused) {
        state.reason = reason_;
        state.remaining = remaining();
    }
    return state;
}

void RateLimitController::clear() noexcept {
    pause_until_.reset();
    reason_.clear();
}

std::string RateLimitController::describe(std::chrono::milliseconds delay) {
    // Whole seconds, rounded up, so a 200ms pause still reads "1 seconds"
    const auto seconds = (std::max<std::int64_t>(delay.count(), 0) + 999) / 1000;
    return "Rate limited. Resuming in " + std::to_string(seconds) + " seconds...";
}

void RateLimitController::expire_if_due() const {
    if (pause_until_ && now_() >= *pause_until_) {
        pause_until_.reset();
        reason_.clear();
    }
}

BackoffPolicy::BackoffPolicy(std::uint32_t max_attempts,
                             std::chrono::milliseconds initial_delay,
                             std::chrono::milliseconds max_delay)
    : max_attempts_(max_attempts)
    , initial_delay_(initial_delay)
    , max_delay_(std::max(max_delay, initial_delay)) {}

bool BackoffPolicy::should_retry(std::uint32_t attempted_retries) const noexcept {
    return attempted_retries < max_attempts_;
}

std::chrono::milliseconds BackoffPolicy::delay_before_retry(std::uint32_t attempted_retries) const noexcept {
    auto delay = initial_delay_;
    for (std::uint32_t i = 0; i < attempted_retries && delay < max_delay_; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay_);
}

} // namespace upo::upload

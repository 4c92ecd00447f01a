#pragma once

#include "upo/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace upo::upload {

/**
 * @brief System-wide pause triggered by server rate limiting
 *
 * Holds a single deadline. Arming while already paused never shortens the
 * pause: the later of the two deadlines wins. The controller clears itself
 * lazily the first time it is queried at or after the deadline.
 *
 * THREAD SAFETY: None. The owning scheduler serialises every call.
 */
class RateLimitController {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    RateLimitController();
    explicit RateLimitController(NowFn now);

    /**
     * @brief Pause for at least `delay` from now
     *
     * RETURNS: the effective deadline after merging with any existing pause
     */
    Clock::time_point arm(std::chrono::milliseconds delay);

    [[nodiscard]] bool is_paused() const;

    /// Empty when not paused
    [[nodiscard]] std::string reason() const;

    [[nodiscard]] std::chrono::milliseconds remaining() const;

    [[nodiscard]] std::optional<Clock::time_point> deadline() const;

    [[nodiscard]] PauseState state() const;

    void clear() noexcept;

    static std::string describe(std::chrono::milliseconds delay);

private:
    void expire_if_due() const;

    NowFn now_;
    mutable std::optional<Clock::time_point> pause_until_;
    mutable std::string reason_;
};

/**
 * @brief Exponential backoff for transient per-entry failures
 *
 * delay(n) = initial * 2^n, capped at `max_delay`. Retries stop once
 * `max_attempts` requeues have been spent.
 */
class BackoffPolicy {
public:
    BackoffPolicy(std::uint32_t max_attempts,
                  std::chrono::milliseconds initial_delay,
                  std::chrono::milliseconds max_delay);

    [[nodiscard]] bool should_retry(std::uint32_t attempted_retries) const noexcept;

    [[nodiscard]] std::chrono::milliseconds delay_before_retry(std::uint32_t attempted_retries) const noexcept;

    [[nodiscard]] std::uint32_t max_attempts() const noexcept { return max_attempts_; }

private:
    std::uint32_t max_attempts_;
    std::chrono::milliseconds initial_delay_;
    std::chrono::milliseconds max_delay_;
};

} // namespace upo::upload

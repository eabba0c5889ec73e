#pragma once

// Exponential backoff with jitter for reconnect attempts.
//
// Each attempt waits the current base delay plus or minus up to half of
// it, measured from the previous attempt. The base starts at zero, then
// grows from `initial_delay` by `backoff_factor` up to `max_delay`.
//
// Internal header — not installed.

#include "../util/async_queue.hpp"

#include <chrono>
#include <random>

namespace docsync_cpp::remote {

class ExponentialBackoff {
public:
    static constexpr auto default_initial_delay = std::chrono::milliseconds{1000};
    static constexpr double default_backoff_factor = 1.5;
    static constexpr auto default_max_delay = std::chrono::milliseconds{60 * 1000};

    ExponentialBackoff(util::AsyncQueue& queue, util::TimerId timer_id,
                       double backoff_factor = default_backoff_factor,
                       std::chrono::milliseconds initial_delay = default_initial_delay,
                       std::chrono::milliseconds max_delay = default_max_delay);

    // The next attempt runs immediately.
    void reset() { current_base_ = std::chrono::milliseconds{0}; }

    // The next attempt waits the maximum delay (the backend asked us to
    // slow down).
    void reset_to_max() { current_base_ = max_delay_; }

    // Cancel any pending attempt and schedule `operation` after the
    // current delay, then grow the delay.
    void backoff_and_run(util::AsyncQueue::Operation operation);

    void cancel();

    auto current_base() const -> std::chrono::milliseconds { return current_base_; }

private:
    auto delay_with_jitter() -> std::chrono::milliseconds;
    auto clamp_delay(std::chrono::milliseconds delay) const -> std::chrono::milliseconds;

    util::AsyncQueue& queue_;
    util::TimerId timer_id_;
    util::DelayedOperation delayed_operation_;
    double backoff_factor_;
    std::chrono::milliseconds initial_delay_;
    std::chrono::milliseconds max_delay_;
    std::chrono::milliseconds current_base_{0};
    util::AsyncQueue::Clock::time_point last_attempt_time_;
    std::mt19937 random_;
};

}  // namespace docsync_cpp::remote

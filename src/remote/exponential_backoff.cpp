#include "exponential_backoff.hpp"

#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

#include <algorithm>

namespace docsync_cpp::remote {

ExponentialBackoff::ExponentialBackoff(util::AsyncQueue& queue, util::TimerId timer_id,
                                       double backoff_factor, std::chrono::milliseconds initial_delay,
                                       std::chrono::milliseconds max_delay)
    : queue_{queue},
      timer_id_{timer_id},
      backoff_factor_{backoff_factor},
      initial_delay_{initial_delay},
      max_delay_{max_delay},
      last_attempt_time_{util::AsyncQueue::Clock::now()},
      random_{std::random_device{}()} {
    util::hard_assert(backoff_factor >= 1.0, "backoff factor {} below 1", backoff_factor);
    util::hard_assert(initial_delay <= max_delay, "initial delay above max delay");
}

void ExponentialBackoff::backoff_and_run(util::AsyncQueue::Operation operation) {
    cancel();

    // The current base may be zero and is honoured as such
    auto desired_delay = current_base_ + delay_with_jitter();
    auto now = util::AsyncQueue::Clock::now();
    auto since_last_attempt =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::max(now - last_attempt_time_,
                                                                       util::AsyncQueue::Clock::duration{0}));
    auto remaining_delay = std::max(std::chrono::milliseconds{0}, desired_delay - since_last_attempt);

    if (current_base_.count() > 0) {
        util::logger()->debug("backoff: {} waiting {} ms (base {} ms, desired {} ms)",
                              util::to_string_view(timer_id_), remaining_delay.count(), current_base_.count(),
                              desired_delay.count());
    }

    delayed_operation_ = queue_.enqueue_after_delay(remaining_delay, timer_id_, std::move(operation));
    last_attempt_time_ = now;

    auto next = std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(static_cast<double>(current_base_.count()) * backoff_factor_)};
    current_base_ = clamp_delay(next);
}

void ExponentialBackoff::cancel() {
    delayed_operation_.cancel();
    delayed_operation_ = util::DelayedOperation{};
}

auto ExponentialBackoff::delay_with_jitter() -> std::chrono::milliseconds {
    auto jitter = std::uniform_real_distribution<double>{-0.5, 0.5}(random_);
    return std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(jitter * static_cast<double>(current_base_.count()))};
}

auto ExponentialBackoff::clamp_delay(std::chrono::milliseconds delay) const -> std::chrono::milliseconds {
    return std::clamp(delay, initial_delay_, max_delay_);
}

}  // namespace docsync_cpp::remote

#include "online_state_tracker.hpp"

#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

namespace docsync_cpp::remote {

void OnlineStateTracker::handle_watch_stream_start() {
    if (watch_stream_failures_ != 0) return;

    set_and_broadcast(OnlineState::unknown);
    util::hard_assert(!online_state_timer_.is_scheduled(), "online state timer already running");

    online_state_timer_ = queue_.enqueue_after_delay(
        std::chrono::duration_cast<std::chrono::milliseconds>(online_state_timeout),
        util::TimerId::online_state_timeout, [this] {
            online_state_timer_ = util::DelayedOperation{};
            util::hard_assert(state_ == OnlineState::unknown,
                              "online state timer fired in state {}", to_string_view(state_));
            log_offline_warning_if_necessary(fmt::format("backend did not respond within {} seconds",
                                                         online_state_timeout.count()));
            set_and_broadcast(OnlineState::offline);
        });
}

void OnlineStateTracker::handle_watch_stream_failure(const Error& error) {
    if (state_ == OnlineState::online) {
        set_and_broadcast(OnlineState::unknown);
        util::hard_assert(watch_stream_failures_ == 0, "watch stream failures recorded while online");
        util::hard_assert(!online_state_timer_.is_scheduled(), "online state timer running while online");
        return;
    }

    ++watch_stream_failures_;
    if (watch_stream_failures_ >= max_watch_stream_failures) {
        clear_online_state_timer();
        log_offline_warning_if_necessary(fmt::format("connection failed {} times, most recent error: {}",
                                                     max_watch_stream_failures, error.message));
        set_and_broadcast(OnlineState::offline);
    }
}

void OnlineStateTracker::update_state(OnlineState new_state) {
    clear_online_state_timer();
    watch_stream_failures_ = 0;

    if (new_state == OnlineState::online) {
        // Connected at least once; offline periods are no longer news
        should_warn_offline_ = false;
    }
    set_and_broadcast(new_state);
}

void OnlineStateTracker::set_and_broadcast(OnlineState new_state) {
    if (new_state == state_) return;
    util::logger()->debug("online state: {} -> {}", to_string_view(state_), to_string_view(new_state));
    state_ = new_state;
    handler_(new_state);
}

void OnlineStateTracker::log_offline_warning_if_necessary(const std::string& reason) {
    auto message = fmt::format("could not reach the backend: {}. The client will operate in offline mode "
                               "until it can connect.", reason);
    if (should_warn_offline_) {
        util::logger()->warn("{}", message);
        should_warn_offline_ = false;
    } else {
        util::logger()->debug("{}", message);
    }
}

void OnlineStateTracker::clear_online_state_timer() {
    online_state_timer_.cancel();
    online_state_timer_ = util::DelayedOperation{};
}

}  // namespace docsync_cpp::remote

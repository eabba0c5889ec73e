#pragma once

// Derives the client's OnlineState from watch stream health.
//
// Unknown becomes Offline after one failed watch connection, or when a
// connection attempt has not produced a message within the timeout. Any
// message from the backend makes the state Online. A failure while Online
// returns to Unknown first so cached results are not raised prematurely.
//
// Internal header — not installed.

#include "../util/async_queue.hpp"

#include <docsync-cpp/error.hpp>
#include <docsync-cpp/snapshot.hpp>

#include <chrono>
#include <functional>

namespace docsync_cpp::remote {

class OnlineStateTracker {
public:
    using OnlineStateHandler = std::function<void(OnlineState)>;

    static constexpr int max_watch_stream_failures = 1;
    static constexpr auto online_state_timeout = std::chrono::seconds{10};

    OnlineStateTracker(util::AsyncQueue& queue, OnlineStateHandler handler)
        : queue_{queue}, handler_{std::move(handler)} {}

    // A watch connection attempt started.
    void handle_watch_stream_start();

    // A watch connection failed.
    void handle_watch_stream_failure(const Error& error);

    // Set the state explicitly, resetting the failure heuristics.
    void update_state(OnlineState new_state);

    auto state() const -> OnlineState { return state_; }

private:
    void set_and_broadcast(OnlineState new_state);
    void log_offline_warning_if_necessary(const std::string& reason);
    void clear_online_state_timer();

    util::AsyncQueue& queue_;
    OnlineStateHandler handler_;
    OnlineState state_{OnlineState::unknown};
    int watch_stream_failures_{0};
    util::DelayedOperation online_state_timer_;
    bool should_warn_offline_{true};
};

}  // namespace docsync_cpp::remote

#include "../src/remote/online_state_tracker.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace docsync_cpp;
using namespace docsync_cpp::remote;

namespace {

class OnlineStateTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tracker = std::make_unique<OnlineStateTracker>(queue, [this](OnlineState state) { states.push_back(state); });
    }

    void TearDown() override {
        queue.shutdown();
    }

    template <typename Fn>
    void on_queue(Fn&& fn) {
        queue.enqueue_blocking(std::forward<Fn>(fn));
    }

    auto current() -> OnlineState {
        return queue.enqueue_blocking([&] { return tracker->state(); });
    }

    auto broadcast() -> std::vector<OnlineState> {
        return queue.enqueue_blocking([&] { return states; });
    }

    util::AsyncQueue queue;
    std::vector<OnlineState> states;
    std::unique_ptr<OnlineStateTracker> tracker;
};

auto unavailable() -> Error {
    return Error{ErrorCode::unavailable, "connection refused"};
}

}  // namespace

TEST_F(OnlineStateTrackerTest, starts_unknown_and_schedules_timeout) {
    on_queue([&] { tracker->handle_watch_stream_start(); });
    EXPECT_EQ(current(), OnlineState::unknown);
    EXPECT_TRUE(broadcast().empty());
    EXPECT_TRUE(queue.is_scheduled(util::TimerId::online_state_timeout));
}

TEST_F(OnlineStateTrackerTest, one_failure_means_offline) {
    on_queue([&] {
        tracker->handle_watch_stream_start();
        tracker->handle_watch_stream_failure(unavailable());
    });
    EXPECT_EQ(current(), OnlineState::offline);
    EXPECT_FALSE(queue.is_scheduled(util::TimerId::online_state_timeout));
    EXPECT_EQ(broadcast(), (std::vector<OnlineState>{OnlineState::offline}));
}

TEST_F(OnlineStateTrackerTest, silent_backend_times_out_to_offline) {
    on_queue([&] { tracker->handle_watch_stream_start(); });
    queue.run_delays_until(util::TimerId::online_state_timeout);
    EXPECT_EQ(current(), OnlineState::offline);
}

TEST_F(OnlineStateTrackerTest, message_from_backend_means_online) {
    on_queue([&] {
        tracker->handle_watch_stream_start();
        tracker->update_state(OnlineState::online);
    });
    EXPECT_EQ(current(), OnlineState::online);
    EXPECT_FALSE(queue.is_scheduled(util::TimerId::online_state_timeout));
}

TEST_F(OnlineStateTrackerTest, failure_while_online_returns_to_unknown) {
    on_queue([&] {
        tracker->update_state(OnlineState::online);
        tracker->handle_watch_stream_failure(unavailable());
    });
    EXPECT_EQ(current(), OnlineState::unknown);

    // A second failure in a row is enough to go offline
    on_queue([&] { tracker->handle_watch_stream_failure(unavailable()); });
    EXPECT_EQ(current(), OnlineState::offline);
    EXPECT_EQ(broadcast(),
              (std::vector<OnlineState>{OnlineState::online, OnlineState::unknown, OnlineState::offline}));
}

TEST_F(OnlineStateTrackerTest, restart_after_failure_keeps_offline) {
    on_queue([&] {
        tracker->handle_watch_stream_start();
        tracker->handle_watch_stream_failure(unavailable());
        tracker->handle_watch_stream_start();
    });
    EXPECT_EQ(current(), OnlineState::offline);
    EXPECT_FALSE(queue.is_scheduled(util::TimerId::online_state_timeout));
}

TEST_F(OnlineStateTrackerTest, repeated_state_is_not_rebroadcast) {
    on_queue([&] {
        tracker->update_state(OnlineState::offline);
        tracker->update_state(OnlineState::offline);
    });
    EXPECT_EQ(broadcast(), (std::vector<OnlineState>{OnlineState::offline}));
}

#pragma once

// The connection state machine shared by the watch and write streams.
//
//   initial --start--> starting --tokens, connection open--> open
//   open --error--> error --start--> backoff --delay--> initial --> starting
//   any --stop--> initial
//
// Starting fetches the auth and App Check tokens in parallel. Every
// connection gets its own observer, stamped with the generation the stream
// had when the connection opened. Transport callbacks arrive on any thread
// and are re-dispatched onto the async queue, where callbacks from a
// connection the stream has since closed are dropped.
//
// Internal header — not installed.

#include "exponential_backoff.hpp"
#include "../util/async_queue.hpp"

#include <docsync-cpp/credentials.hpp>
#include <docsync-cpp/datastore.hpp>
#include <docsync-cpp/error.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

namespace docsync_cpp::remote {

class Stream : public std::enable_shared_from_this<Stream> {
public:
    enum class State : std::uint8_t {
        initial,   // Not started, or stopped cleanly.
        starting,  // Waiting for tokens or the connection to open.
        open,      // Connected.
        error,     // Closed by an error; the next start backs off.
        backoff,   // Waiting to reconnect.
    };

    static constexpr auto idle_timeout = std::chrono::seconds{60};

    Stream(util::AsyncQueue& queue, std::shared_ptr<Datastore> datastore,
           std::shared_ptr<CredentialsProvider> credentials, std::shared_ptr<AppCheckProvider> app_check,
           util::TimerId backoff_timer_id, util::TimerId idle_timer_id);
    virtual ~Stream() = default;

    Stream(const Stream&) = delete;
    auto operator=(const Stream&) -> Stream& = delete;

    // Connect, or schedule a reconnect after an error.
    void start();

    // Close cleanly. The next start connects immediately.
    void stop();

    // Starting, backing off, or open.
    auto is_started() const -> bool;
    auto is_open() const -> bool { return state_ == State::open; }
    auto state() const -> State { return state_; }

    // Close the stream after the idle timeout unless it is used again.
    void mark_idle();

    // After a permanent error, reconnect without waiting.
    void inhibit_backoff();

    // Whether the connection opened under `generation` is still the current
    // one. Every close starts a new generation.
    auto is_current_connection(std::uint64_t generation) const -> bool { return generation == generation_; }

protected:
    // Open the transport connection with `tokens`. Its observer forwards
    // messages through a ConnectionDispatcher for the current generation.
    virtual void open_connection(const StreamTokens& tokens) = 0;

    // Close and drop the transport connection.
    virtual void close_connection() = 0;

    virtual void notify_stream_open() = 0;
    virtual void notify_stream_close(const Error& status) = 0;

    virtual auto name() const -> std::string_view = 0;

    // A message arrived; the connection is healthy.
    void on_message_received();

    void cancel_idle_check();

    auto generation() const -> std::uint64_t { return generation_; }

    void handle_stream_open();
    void handle_stream_close(Error status);

    auto datastore() -> Datastore& { return *datastore_; }
    auto queue() -> util::AsyncQueue& { return queue_; }

private:
    void request_tokens();
    void resume_start_after_tokens(Result<AuthToken> auth, Result<std::string> app_check);
    void close(Error status);
    void backoff_and_try_restarting();
    void handle_idle_close_timer();

    util::AsyncQueue& queue_;
    std::shared_ptr<Datastore> datastore_;
    std::shared_ptr<CredentialsProvider> credentials_;
    std::shared_ptr<AppCheckProvider> app_check_;
    ExponentialBackoff backoff_;
    util::TimerId idle_timer_id_;
    util::DelayedOperation idle_timer_;
    State state_{State::initial};
    std::uint64_t generation_{0};
};

auto to_string_view(Stream::State state) noexcept -> std::string_view;

// Re-dispatches the callbacks of one connection onto the queue. Holds the
// stream weakly; a callback runs only while the stream is alive and the
// connection is still its current one.
template <typename S>
class ConnectionDispatcher {
public:
    ConnectionDispatcher(util::AsyncQueue& queue, std::weak_ptr<S> stream, std::uint64_t generation)
        : queue_{queue}, stream_{std::move(stream)}, generation_{generation} {}

    void operator()(std::function<void(S&)> fn) const {
        queue_.enqueue([stream = stream_, generation = generation_, fn = std::move(fn)] {
            auto self = stream.lock();
            if (!self || !self->is_current_connection(generation)) return;
            fn(*self);
        });
    }

    auto generation() const -> std::uint64_t { return generation_; }

private:
    util::AsyncQueue& queue_;
    std::weak_ptr<S> stream_;
    std::uint64_t generation_;
};

}  // namespace docsync_cpp::remote

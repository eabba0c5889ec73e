#include "stream.hpp"

#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

#include <mutex>
#include <optional>

namespace docsync_cpp::remote {

auto to_string_view(Stream::State state) noexcept -> std::string_view {
    switch (state) {
        case Stream::State::initial:  return "initial";
        case Stream::State::starting: return "starting";
        case Stream::State::open:     return "open";
        case Stream::State::error:    return "error";
        case Stream::State::backoff:  return "backoff";
    }
    return "unknown";
}

Stream::Stream(util::AsyncQueue& queue, std::shared_ptr<Datastore> datastore,
               std::shared_ptr<CredentialsProvider> credentials, std::shared_ptr<AppCheckProvider> app_check,
               util::TimerId backoff_timer_id, util::TimerId idle_timer_id)
    : queue_{queue},
      datastore_{std::move(datastore)},
      credentials_{std::move(credentials)},
      app_check_{std::move(app_check)},
      backoff_{queue, backoff_timer_id},
      idle_timer_id_{idle_timer_id} {}

auto Stream::is_started() const -> bool {
    return state_ == State::starting || state_ == State::backoff || state_ == State::open;
}

void Stream::start() {
    queue_.verify_is_current_queue();

    if (state_ == State::error) {
        backoff_and_try_restarting();
        return;
    }

    util::hard_assert(state_ == State::initial, "{} stream already started ({})", name(),
                      to_string_view(state_));
    util::logger()->debug("{} stream: starting", name());
    state_ = State::starting;
    request_tokens();
}

void Stream::request_tokens() {
    // Both tokens are fetched in parallel; whichever callback finishes
    // last resumes the start on the queue
    struct Pending {
        std::mutex mutex;
        std::optional<Result<AuthToken>> auth;
        std::optional<Result<std::string>> app_check;
    };
    auto pending = std::make_shared<Pending>();
    auto weak = weak_from_this();
    auto generation = generation_;
    // The queue outlives every stream it runs; the stream itself may be
    // gone by the time the providers answer
    auto* queue = &queue_;

    auto maybe_resume = [queue, weak, generation, pending] {
        // Called with pending->mutex held
        if (!pending->auth || !pending->app_check) return;
        auto auth = std::move(*pending->auth);
        auto app_check = std::move(*pending->app_check);
        queue->enqueue([weak, generation, auth = std::move(auth), app_check = std::move(app_check)] {
            auto self = weak.lock();
            if (!self || !self->is_current_connection(generation)) return;
            self->resume_start_after_tokens(auth, app_check);
        });
    };

    credentials_->get_token([pending, maybe_resume](Result<AuthToken> token) {
        auto lock = std::lock_guard{pending->mutex};
        pending->auth.emplace(std::move(token));
        maybe_resume();
    });
    app_check_->get_token([pending, maybe_resume](Result<std::string> token) {
        auto lock = std::lock_guard{pending->mutex};
        pending->app_check.emplace(std::move(token));
        maybe_resume();
    });
}

void Stream::resume_start_after_tokens(Result<AuthToken> auth, Result<std::string> app_check) {
    util::hard_assert(state_ == State::starting, "{} stream got tokens in state {}", name(),
                      to_string_view(state_));

    if (!auth.ok()) {
        util::logger()->warn("{} stream: fetching auth token failed: {}", name(), auth.error().message);
        close(auth.error());
        return;
    }

    auto tokens = StreamTokens{};
    tokens.auth = auth.value();
    if (app_check.ok()) {
        tokens.app_check = app_check.value();
    } else {
        // The backend decides whether a missing attestation is fatal
        util::logger()->warn("{} stream: fetching App Check token failed: {}", name(), app_check.error().message);
    }

    open_connection(tokens);
}

void Stream::handle_stream_open() {
    util::hard_assert(state_ == State::starting, "{} stream opened in state {}", name(),
                      to_string_view(state_));
    util::logger()->debug("{} stream: open", name());
    state_ = State::open;
    notify_stream_open();
}

void Stream::handle_stream_close(Error status) {
    if (status.code != ErrorCode::ok) {
        util::logger()->warn("{} stream: closed with error {}: {}", name(), to_string_view(status.code),
                             status.message);
    }
    close(std::move(status));
}

void Stream::on_message_received() {
    // Any message proves the connection healthy
    backoff_.reset();
}

void Stream::stop() {
    if (!is_started()) return;
    util::logger()->debug("{} stream: stopping", name());
    close(Error{ErrorCode::ok, {}});
}

void Stream::close(Error status) {
    // Invalidate callbacks from this connection before anything else runs
    ++generation_;
    cancel_idle_check();
    backoff_.cancel();
    close_connection();

    if (status.code == ErrorCode::resource_exhausted) {
        util::logger()->debug("{} stream: backend is overloaded, using maximum backoff", name());
        backoff_.reset_to_max();
    } else if (status.code == ErrorCode::unauthenticated) {
        credentials_->invalidate_token();
        app_check_->invalidate_token();
    }

    auto clean = status.code == ErrorCode::ok;
    // A clean close reconnects without delay
    if (clean) backoff_.reset();
    state_ = clean ? State::initial : State::error;
    notify_stream_close(status);
}

void Stream::backoff_and_try_restarting() {
    util::hard_assert(state_ == State::error, "{} stream backing off in state {}", name(),
                      to_string_view(state_));
    state_ = State::backoff;

    auto weak = weak_from_this();
    backoff_.backoff_and_run([this, weak] {
        auto self = weak.lock();
        if (!self) return;
        util::hard_assert(state_ == State::backoff, "{} stream left backoff early ({})", name(),
                          to_string_view(state_));
        state_ = State::initial;
        start();
    });
}

void Stream::inhibit_backoff() {
    util::hard_assert(!is_started(), "{} stream inhibiting backoff while started ({})", name(),
                      to_string_view(state_));
    state_ = State::initial;
    backoff_.reset();
}

void Stream::mark_idle() {
    if (!is_open() || idle_timer_.is_scheduled()) return;
    auto weak = weak_from_this();
    idle_timer_ = queue_.enqueue_after_delay(std::chrono::duration_cast<std::chrono::milliseconds>(idle_timeout),
                                             idle_timer_id_, [this, weak] {
                                                 auto self = weak.lock();
                                                 if (!self) return;
                                                 idle_timer_ = util::DelayedOperation{};
                                                 handle_idle_close_timer();
                                             });
}

void Stream::handle_idle_close_timer() {
    // An idle close is not an error; the next start connects immediately
    if (is_open()) {
        util::logger()->debug("{} stream: closing idle connection", name());
        close(Error{ErrorCode::ok, {}});
    }
}

void Stream::cancel_idle_check() {
    idle_timer_.cancel();
    idle_timer_ = util::DelayedOperation{};
}

}  // namespace docsync_cpp::remote

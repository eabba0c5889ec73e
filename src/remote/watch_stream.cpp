#include "watch_stream.hpp"

#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

namespace docsync_cpp::remote {

// -- Observer -------------------------------------------------------------------

class WatchStream::Observer final : public WatchStreamObserver {
public:
    explicit Observer(ConnectionDispatcher<WatchStream> dispatch) : dispatch_{std::move(dispatch)} {}

    void on_stream_open() override {
        dispatch_([](WatchStream& stream) { stream.handle_stream_open(); });
    }

    void on_watch_change(WatchChange change, SnapshotVersion snapshot_version) override {
        dispatch_([change = std::move(change), snapshot_version](WatchStream& stream) {
            stream.on_message_received();
            stream.callback_.on_watch_stream_change(change, snapshot_version);
        });
    }

    void on_stream_close(Error status) override {
        dispatch_([status = std::move(status)](WatchStream& stream) { stream.handle_stream_close(status); });
    }

private:
    ConnectionDispatcher<WatchStream> dispatch_;
};

// -- WatchStream ----------------------------------------------------------------

WatchStream::WatchStream(util::AsyncQueue& queue, std::shared_ptr<Datastore> datastore,
                         std::shared_ptr<CredentialsProvider> credentials,
                         std::shared_ptr<AppCheckProvider> app_check, WatchStreamCallback& callback)
    : Stream{queue, std::move(datastore), std::move(credentials), std::move(app_check),
             util::TimerId::listen_stream_connection_backoff, util::TimerId::listen_stream_idle},
      callback_{callback} {}

WatchStream::~WatchStream() {
    if (connection_) connection_->close();
}

void WatchStream::open_connection(const StreamTokens& tokens) {
    auto self = std::static_pointer_cast<WatchStream>(shared_from_this());
    auto observer = std::make_shared<Observer>(ConnectionDispatcher<WatchStream>{queue(), self, generation()});
    connection_ = datastore().open_watch_stream(tokens, std::move(observer));
    util::hard_assert(connection_ != nullptr, "datastore returned no watch connection");
}

void WatchStream::close_connection() {
    if (!connection_) return;
    connection_->close();
    connection_.reset();
}

void WatchStream::watch_query(const TargetData& target_data) {
    util::hard_assert(is_open(), "watching target {} on a closed stream", target_data.target_id);
    cancel_idle_check();
    util::logger()->debug("watch stream: watch target {} ({}), resume token {} bytes, version {}",
                          target_data.target_id, to_string_view(target_data.purpose),
                          target_data.resume_token.size(), target_data.snapshot_version.to_string());
    connection_->watch(target_data);
}

void WatchStream::unwatch_target_id(TargetId target_id) {
    util::hard_assert(is_open(), "unwatching target {} on a closed stream", target_id);
    cancel_idle_check();
    util::logger()->debug("watch stream: unwatch target {}", target_id);
    connection_->unwatch(target_id);
}

}  // namespace docsync_cpp::remote

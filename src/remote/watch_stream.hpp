#pragma once

// The listen stream: sends watch and unwatch requests and delivers watch
// changes.
//
// Internal header — not installed.

#include "stream.hpp"

#include <docsync-cpp/datastore.hpp>
#include <docsync-cpp/query.hpp>

#include <memory>

namespace docsync_cpp::remote {

class WatchStreamCallback {
public:
    virtual ~WatchStreamCallback() = default;

    virtual void on_watch_stream_open() = 0;
    virtual void on_watch_stream_change(const WatchChange& change, SnapshotVersion snapshot_version) = 0;
    virtual void on_watch_stream_close(const Error& status) = 0;
};

class WatchStream final : public Stream {
public:
    WatchStream(util::AsyncQueue& queue, std::shared_ptr<Datastore> datastore,
                std::shared_ptr<CredentialsProvider> credentials, std::shared_ptr<AppCheckProvider> app_check,
                WatchStreamCallback& callback);

    ~WatchStream() override;

    void watch_query(const TargetData& target_data);
    void unwatch_target_id(TargetId target_id);

protected:
    void open_connection(const StreamTokens& tokens) override;
    void close_connection() override;
    void notify_stream_open() override { callback_.on_watch_stream_open(); }
    void notify_stream_close(const Error& status) override { callback_.on_watch_stream_close(status); }
    auto name() const -> std::string_view override { return "watch"; }

private:
    class Observer;

    WatchStreamCallback& callback_;
    std::unique_ptr<WatchStreamConnection> connection_;
};

}  // namespace docsync_cpp::remote

#pragma once

// Multiplexes application listeners onto one sync-engine listen per query
// and decides which snapshots each listener sees.
//
// Internal header — not installed.

#include "sync_engine.hpp"

#include <docsync-cpp/client.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/snapshot.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docsync_cpp::core {

// One application listener on a query.
class QueryListener {
public:
    QueryListener(Query query, ListenOptions options, SnapshotListener listener);

    // Returns true if a snapshot was raised to the listener.
    auto on_view_snapshot(ViewSnapshot snapshot) -> bool;
    void on_error(const Error& error);
    auto apply_online_state_change(OnlineState online_state) -> bool;

    auto query() const -> const Query& { return query_; }

private:
    auto should_raise_initial_event(const ViewSnapshot& snapshot, OnlineState online_state) const -> bool;
    auto should_raise_event(const ViewSnapshot& snapshot) const -> bool;
    void raise_initial_event(const ViewSnapshot& snapshot);

    Query query_;
    ListenOptions options_;
    SnapshotListener listener_;
    bool raised_initial_event_{false};
    OnlineState online_state_{OnlineState::unknown};
    // The last snapshot seen, raised or not.
    std::optional<ViewSnapshot> snapshot_;
};

class EventManager final : public SyncEngineCallback {
public:
    explicit EventManager(QueryEventSource& query_event_source);

    // Start delivering snapshots to `listener`. The first listener of a
    // query starts the listen.
    void add_query_listener(std::shared_ptr<QueryListener> listener);

    // The last listener of a query stops the listen.
    void remove_query_listener(const std::shared_ptr<QueryListener>& listener);

    void on_view_snapshots(std::vector<ViewSnapshot>&& snapshots) override;
    void on_error(const Query& query, const Error& error) override;
    void handle_online_state_change(OnlineState online_state) override;

    auto online_state() const -> OnlineState { return online_state_; }

private:
    struct QueryListenersInfo {
        std::optional<ViewSnapshot> view_snapshot;
        std::vector<std::shared_ptr<QueryListener>> listeners;
    };

    QueryEventSource& query_event_source_;
    // By query canonical id.
    std::map<std::string, QueryListenersInfo> queries_;
    OnlineState online_state_{OnlineState::unknown};
};

}  // namespace docsync_cpp::core

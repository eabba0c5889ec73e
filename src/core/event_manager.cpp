#include "event_manager.hpp"

#include "../util/hard_assert.hpp"

#include <algorithm>

namespace docsync_cpp::core {

// -- QueryListener ------------------------------------------------------------

QueryListener::QueryListener(Query query, ListenOptions options, SnapshotListener listener)
    : query_{std::move(query)}, options_{options}, listener_{std::move(listener)} {}

auto QueryListener::on_view_snapshot(ViewSnapshot snapshot) -> bool {
    util::hard_assert(!snapshot.document_changes.empty() || snapshot.sync_state_changed,
                      "received a snapshot without changes for {}", query_.canonical_id());

    if (!options_.include_document_metadata_changes) {
        std::erase_if(snapshot.document_changes, [](const DocumentViewChange& change) {
            return change.type == DocumentViewChange::Type::metadata;
        });
        snapshot.excludes_metadata_changes = true;
    }

    auto raised_event = false;
    if (!raised_initial_event_) {
        if (should_raise_initial_event(snapshot, online_state_)) {
            raise_initial_event(snapshot);
            raised_event = true;
        }
    } else if (should_raise_event(snapshot)) {
        listener_(snapshot);
        raised_event = true;
    }

    snapshot_ = std::move(snapshot);
    return raised_event;
}

void QueryListener::on_error(const Error& error) {
    listener_(error);
}

auto QueryListener::apply_online_state_change(OnlineState online_state) -> bool {
    online_state_ = online_state;
    if (snapshot_ && !raised_initial_event_ && should_raise_initial_event(*snapshot_, online_state)) {
        raise_initial_event(*snapshot_);
        return true;
    }
    return false;
}

auto QueryListener::should_raise_initial_event(const ViewSnapshot& snapshot, OnlineState online_state) const
    -> bool {
    util::hard_assert(!raised_initial_event_, "initial event already raised for {}", query_.canonical_id());

    // Synced results are always worth raising
    if (!snapshot.from_cache) return true;

    // Unknown counts as online; it settles one way or the other
    auto maybe_online = online_state != OnlineState::offline;
    if (options_.wait_for_sync_when_online && maybe_online) return false;

    return !snapshot.documents.empty() || snapshot.has_cached_results || online_state == OnlineState::offline;
}

auto QueryListener::should_raise_event(const ViewSnapshot& snapshot) const -> bool {
    // Metadata-only document changes were stripped above if unwanted
    if (!snapshot.document_changes.empty()) return true;

    auto has_pending_writes_changed = snapshot_ && snapshot_->has_pending_writes() != snapshot.has_pending_writes();
    if (snapshot.sync_state_changed || has_pending_writes_changed) {
        return options_.include_query_metadata_changes;
    }

    // Only filtered metadata changes
    return false;
}

void QueryListener::raise_initial_event(const ViewSnapshot& snapshot) {
    raised_initial_event_ = true;
    listener_(ViewSnapshot::from_initial_documents(query_, snapshot.documents, snapshot.mutated_keys,
                                                   snapshot.from_cache, snapshot.excludes_metadata_changes,
                                                   snapshot.has_cached_results));
}

// -- EventManager -------------------------------------------------------------

EventManager::EventManager(QueryEventSource& query_event_source) : query_event_source_{query_event_source} {
    query_event_source_.set_callback(this);
}

void EventManager::add_query_listener(std::shared_ptr<QueryListener> listener) {
    auto query = listener->query();
    auto [entry, first_listen] = queries_.try_emplace(query.canonical_id());
    auto& info = entry->second;
    info.listeners.push_back(listener);

    auto raised = listener->apply_online_state_change(online_state_);
    util::hard_assert(!raised, "online state change raised an event for a new listener");

    if (info.view_snapshot) listener->on_view_snapshot(*info.view_snapshot);

    // Raises the initial snapshot through on_view_snapshots
    if (first_listen) query_event_source_.listen(query);
}

void EventManager::remove_query_listener(const std::shared_ptr<QueryListener>& listener) {
    auto entry = queries_.find(listener->query().canonical_id());
    // Already removed by an error
    if (entry == queries_.end()) return;

    auto& listeners = entry->second.listeners;
    std::erase(listeners, listener);
    if (!listeners.empty()) return;

    auto query = listener->query();
    queries_.erase(entry);
    query_event_source_.stop_listening(query);
}

void EventManager::on_view_snapshots(std::vector<ViewSnapshot>&& snapshots) {
    for (auto& snapshot : snapshots) {
        auto entry = queries_.find(snapshot.query.canonical_id());
        if (entry == queries_.end()) continue;

        auto& info = entry->second;
        for (const auto& listener : info.listeners) listener->on_view_snapshot(snapshot);
        info.view_snapshot = std::move(snapshot);
    }
}

void EventManager::on_error(const Query& query, const Error& error) {
    auto entry = queries_.find(query.canonical_id());
    if (entry == queries_.end()) return;

    auto listeners = std::move(entry->second.listeners);
    queries_.erase(entry);
    for (const auto& listener : listeners) listener->on_error(error);
}

void EventManager::handle_online_state_change(OnlineState online_state) {
    online_state_ = online_state;
    for (auto& [canonical_id, info] : queries_) {
        for (const auto& listener : info.listeners) listener->apply_online_state_change(online_state);
    }
}

}  // namespace docsync_cpp::core

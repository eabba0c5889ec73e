#include "sync_engine.hpp"

#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

#include <algorithm>

namespace docsync_cpp::core {

namespace {

auto to_local_view_changes(TargetId target_id, const ViewSnapshot& snapshot) -> local::LocalViewChanges {
    auto changes = local::LocalViewChanges{};
    changes.target_id = target_id;
    changes.from_cache = snapshot.from_cache;
    for (const auto& change : snapshot.document_changes) {
        if (change.type == DocumentViewChange::Type::added) {
            changes.added_keys.insert(change.document.key());
        } else if (change.type == DocumentViewChange::Type::removed) {
            changes.removed_keys.insert(change.document.key());
        }
    }
    return changes;
}

}  // namespace

SyncEngine::SyncEngine(local::LocalStore& local_store, remote::RemoteStore& remote_store, User initial_user,
                       std::size_t max_concurrent_limbo_resolutions)
    : local_store_{local_store},
      remote_store_{remote_store},
      current_user_{std::move(initial_user)},
      max_concurrent_limbo_resolutions_{max_concurrent_limbo_resolutions} {}

auto SyncEngine::callback() const -> SyncEngineCallback& {
    util::hard_assert(callback_ != nullptr, "sync engine used without a callback");
    return *callback_;
}

// -- Listens ------------------------------------------------------------------

auto SyncEngine::listen(const Query& query) -> TargetId {
    util::hard_assert(!query_views_by_query_.contains(query.canonical_id()), "already listening to query {}",
                      query.canonical_id());

    auto target_data = local_store_.allocate_target(query.to_target());
    auto target_id = target_data.target_id;
    // Another query with the same target already listens remotely
    auto target_is_new = !queries_by_target_.contains(target_id);

    auto snapshot = initialize_view_and_compute_snapshot(query, target_id, target_data.resume_token);
    auto snapshots = std::vector<ViewSnapshot>{};
    snapshots.push_back(std::move(snapshot));
    callback().on_view_snapshots(std::move(snapshots));

    if (target_is_new) remote_store_.listen(target_data);
    return target_id;
}

auto SyncEngine::initialize_view_and_compute_snapshot(const Query& query, TargetId target_id,
                                                      const ByteString& resume_token) -> ViewSnapshot {
    auto query_result = local_store_.execute_query(query, /*use_previous_results=*/true);

    // A query sharing a target starts out as synced as its sibling
    auto current_sync_state = SyncState::none;
    if (auto siblings = queries_by_target_.find(target_id); siblings != queries_by_target_.end()) {
        const auto& mirror = siblings->second.front();
        current_sync_state = query_views_by_query_.at(mirror.canonical_id())->view.sync_state();
    }
    auto synthesized_change =
        remote::TargetChange::create_synthesized(current_sync_state == SyncState::synced, resume_token);

    auto view = View{query, std::move(query_result.remote_keys)};
    auto view_doc_changes = view.compute_doc_changes(query_result.documents);
    auto view_change = view.apply_changes(view_doc_changes, synthesized_change);
    util::hard_assert(view_change.limbo_changes.empty(), "view returned limbo documents during initialization");
    util::hard_assert(view_change.snapshot.has_value(), "initial view produced no snapshot");

    query_views_by_query_.emplace(query.canonical_id(),
                                  std::make_unique<QueryView>(QueryView{query, target_id, std::move(view)}));
    queries_by_target_[target_id].push_back(query);
    return std::move(*view_change.snapshot);
}

void SyncEngine::stop_listening(const Query& query) {
    auto entry = query_views_by_query_.find(query.canonical_id());
    util::hard_assert(entry != query_views_by_query_.end(), "trying to stop listening to unknown query {}",
                      query.canonical_id());
    auto target_id = entry->second->target_id;
    query_views_by_query_.erase(entry);

    auto& queries = queries_by_target_[target_id];
    std::erase_if(queries, [&](const Query& q) { return q == query; });
    if (!queries.empty()) return;

    // The last query on the target is gone
    local_store_.release_target(target_id);
    remote_store_.stop_listening(target_id);
    remove_and_clean_up_target(target_id, std::nullopt);
}

void SyncEngine::remove_and_clean_up_target(TargetId target_id, const std::optional<Error>& error) {
    if (auto queries = queries_by_target_.find(target_id); queries != queries_by_target_.end()) {
        for (const auto& query : queries->second) {
            query_views_by_query_.erase(query.canonical_id());
            if (error) callback().on_error(query, *error);
        }
        queries_by_target_.erase(queries);
    }

    auto limbo_keys = limbo_document_refs_.remove_references_for_id(target_id);
    for (const auto& key : limbo_keys) {
        // Still referenced by another view
        if (limbo_document_refs_.contains_key(key)) continue;
        remove_limbo_target(key);
    }
}

// -- Writes -------------------------------------------------------------------

auto SyncEngine::write_mutations(std::vector<Mutation> mutations, WriteCallback on_complete) -> BatchId {
    auto result = local_store_.write_locally(std::move(mutations));
    if (on_complete) mutation_user_callbacks_[current_user_].emplace(result.batch_id, std::move(on_complete));

    emit_new_snapshots_and_notify_local_store(result.changes, nullptr);
    remote_store_.fill_write_pipeline();
    return result.batch_id;
}

void SyncEngine::register_pending_writes_callback(PendingWritesCallback callback) {
    if (!remote_store_.is_network_enabled()) {
        util::logger()->debug("sync engine: network disabled, pending writes resolve once it is enabled");
    }

    auto largest_pending_batch_id = local_store_.get_highest_unacknowledged_batch_id();
    if (largest_pending_batch_id == unknown_batch_id) {
        callback(std::nullopt);
        return;
    }
    pending_writes_callbacks_[largest_pending_batch_id].push_back(std::move(callback));
}

void SyncEngine::handle_successful_write(const MutationBatchResult& batch_result) {
    auto batch_id = batch_result.batch.batch_id();
    auto changes = local_store_.acknowledge_batch(batch_result);

    notify_user(batch_id, std::nullopt);
    trigger_pending_writes_callbacks(batch_id);
    emit_new_snapshots_and_notify_local_store(changes, nullptr);
}

void SyncEngine::handle_rejected_write(BatchId batch_id, const Error& error) {
    auto changes = local_store_.reject_batch(batch_id);
    if (!changes.empty()) {
        util::logger()->warn("write batch {} rejected: {} ({})", batch_id, error.message,
                             to_string_view(error.code));
    }

    notify_user(batch_id, error);
    trigger_pending_writes_callbacks(batch_id);
    emit_new_snapshots_and_notify_local_store(changes, nullptr);
}

void SyncEngine::notify_user(BatchId batch_id, std::optional<Error> error) {
    auto user_callbacks = mutation_user_callbacks_.find(current_user_);
    if (user_callbacks == mutation_user_callbacks_.end()) return;

    auto& callbacks = user_callbacks->second;
    auto entry = callbacks.find(batch_id);
    if (entry == callbacks.end()) return;

    auto on_complete = std::move(entry->second);
    callbacks.erase(entry);
    on_complete(std::move(error));
}

void SyncEngine::trigger_pending_writes_callbacks(BatchId batch_id) {
    auto entry = pending_writes_callbacks_.find(batch_id);
    if (entry == pending_writes_callbacks_.end()) return;

    auto callbacks = std::move(entry->second);
    pending_writes_callbacks_.erase(entry);
    for (auto& callback : callbacks) callback(std::nullopt);
}

void SyncEngine::fail_outstanding_pending_writes_callbacks(const std::string& message) {
    auto pending = std::move(pending_writes_callbacks_);
    pending_writes_callbacks_.clear();
    for (auto& [batch_id, callbacks] : pending) {
        for (auto& callback : callbacks) callback(Error{ErrorCode::cancelled, message});
    }
}

void SyncEngine::handle_credential_change(const User& user) {
    auto user_changed = current_user_ != user;
    current_user_ = user;

    if (user_changed) {
        util::logger()->debug("sync engine: user changed to '{}'", user.uid());
        // The new user's batches are unrelated to the waits
        fail_outstanding_pending_writes_callbacks("wait_for_pending_writes cancelled by a user change");

        auto changes = local_store_.handle_user_change(user);
        emit_new_snapshots_and_notify_local_store(changes, nullptr);
    }

    remote_store_.handle_credential_change();
}

// -- Remote events ------------------------------------------------------------

void SyncEngine::apply_remote_event(const remote::RemoteEvent& remote_event) {
    // Track whether limbo targets have seen their document
    for (const auto& [target_id, change] : remote_event.target_changes) {
        auto resolution = active_limbo_resolutions_by_target_.find(target_id);
        if (resolution == active_limbo_resolutions_by_target_.end()) continue;

        auto& limbo = resolution->second;
        util::hard_assert(change.change_count() <= 1,
                          "limbo resolution for a single document contains multiple changes");
        if (!change.added_documents.empty()) {
            limbo.received_document = true;
        } else if (!change.modified_documents.empty()) {
            util::hard_assert(limbo.received_document, "received change for limbo target document without add");
        } else if (!change.removed_documents.empty()) {
            util::hard_assert(limbo.received_document, "received remove for limbo target document without add");
            limbo.received_document = false;
        }
    }

    auto changes = local_store_.apply_remote_event(remote_event);
    emit_new_snapshots_and_notify_local_store(changes, &remote_event);
}

void SyncEngine::handle_rejected_listen(TargetId target_id, const Error& error) {
    auto resolution = active_limbo_resolutions_by_target_.find(target_id);
    if (resolution == active_limbo_resolutions_by_target_.end()) {
        util::logger()->warn("listen for target {} rejected: {} ({})", target_id, error.message,
                             to_string_view(error.code));
        local_store_.release_target(target_id);
        remove_and_clean_up_target(target_id, error);
        return;
    }

    auto limbo_key = resolution->second.key;
    util::logger()->debug("sync engine: limbo resolution for {} rejected, treating it as deleted",
                          limbo_key.to_string());

    // The failed target is not listened to anymore
    active_limbo_resolutions_by_target_.erase(resolution);
    active_limbo_targets_by_key_.erase(limbo_key);
    pump_enqueued_limbo_resolutions();

    // A synthesized delete at version none removes the document from the cache
    auto event = remote::RemoteEvent{};
    event.snapshot_version = SnapshotVersion::none();
    event.document_updates.emplace(limbo_key, MutableDocument::no_document(limbo_key, SnapshotVersion::none()));
    event.resolved_limbo_documents.insert(limbo_key);
    apply_remote_event(event);
}

void SyncEngine::handle_online_state_change(OnlineState online_state) {
    auto snapshots = std::vector<ViewSnapshot>{};
    for (auto& [canonical_id, query_view] : query_views_by_query_) {
        auto view_change = query_view->view.apply_online_state_change(online_state);
        util::hard_assert(view_change.limbo_changes.empty(), "online state changes do not affect limbo documents");
        if (view_change.snapshot) snapshots.push_back(std::move(*view_change.snapshot));
    }
    callback().on_view_snapshots(std::move(snapshots));
    callback().handle_online_state_change(online_state);
}

auto SyncEngine::get_remote_keys_for_target(TargetId target_id) const -> DocumentKeySet {
    if (auto resolution = active_limbo_resolutions_by_target_.find(target_id);
        resolution != active_limbo_resolutions_by_target_.end()) {
        if (!resolution->second.received_document) return {};
        return DocumentKeySet{resolution->second.key};
    }

    auto keys = DocumentKeySet{};
    auto queries = queries_by_target_.find(target_id);
    if (queries == queries_by_target_.end()) return keys;
    for (const auto& query : queries->second) {
        const auto& synced = query_views_by_query_.at(query.canonical_id())->view.synced_documents();
        keys.insert(synced.begin(), synced.end());
    }
    return keys;
}

void SyncEngine::emit_new_snapshots_and_notify_local_store(const DocumentMap& changes,
                                                           const remote::RemoteEvent* remote_event) {
    auto new_snapshots = std::vector<ViewSnapshot>{};
    auto view_changes = std::vector<local::LocalViewChanges>{};

    for (auto& [canonical_id, query_view] : query_views_by_query_) {
        auto& view = query_view->view;
        auto view_doc_changes = view.compute_doc_changes(changes);
        if (view_doc_changes.needs_refill) {
            // A limit query lost documents; reload ones past the old limit
            auto query_result = local_store_.execute_query(query_view->query, /*use_previous_results=*/false);
            view_doc_changes = view.compute_doc_changes(query_result.documents, view_doc_changes);
        }

        auto target_change = std::optional<remote::TargetChange>{};
        auto target_is_pending_reset = false;
        if (remote_event) {
            if (auto change = remote_event->target_changes.find(query_view->target_id);
                change != remote_event->target_changes.end()) {
                target_change = change->second;
            }
            target_is_pending_reset = remote_event->target_mismatches.contains(query_view->target_id);
        }

        auto view_change = view.apply_changes(view_doc_changes, target_change, target_is_pending_reset);
        update_tracked_limbo_documents(view_change.limbo_changes, query_view->target_id);

        if (view_change.snapshot) {
            view_changes.push_back(to_local_view_changes(query_view->target_id, *view_change.snapshot));
            new_snapshots.push_back(std::move(*view_change.snapshot));
        }
    }

    callback().on_view_snapshots(std::move(new_snapshots));
    local_store_.notify_local_view_changes(view_changes);
}

// -- Limbo resolution ---------------------------------------------------------

void SyncEngine::update_tracked_limbo_documents(const std::vector<LimboDocumentChange>& limbo_changes,
                                                TargetId target_id) {
    for (const auto& change : limbo_changes) {
        if (change.type == LimboDocumentChangeType::added) {
            limbo_document_refs_.add_reference(change.key, target_id);
            track_limbo_change(change);
        } else {
            util::logger()->debug("sync engine: document no longer in limbo: {}", change.key.to_string());
            limbo_document_refs_.remove_reference(change.key, target_id);
            if (!limbo_document_refs_.contains_key(change.key)) remove_limbo_target(change.key);
        }
    }
}

void SyncEngine::track_limbo_change(const LimboDocumentChange& limbo_change) {
    const auto& key = limbo_change.key;
    if (active_limbo_targets_by_key_.contains(key)) return;
    if (std::ranges::find(enqueued_limbo_resolutions_, key) != enqueued_limbo_resolutions_.end()) return;

    util::logger()->debug("sync engine: new document in limbo: {}", key.to_string());
    enqueued_limbo_resolutions_.push_back(key);
    pump_enqueued_limbo_resolutions();
}

void SyncEngine::pump_enqueued_limbo_resolutions() {
    while (!enqueued_limbo_resolutions_.empty() &&
           active_limbo_targets_by_key_.size() < max_concurrent_limbo_resolutions_) {
        auto key = std::move(enqueued_limbo_resolutions_.front());
        enqueued_limbo_resolutions_.pop_front();

        auto limbo_target_id = next_limbo_target_id_;
        next_limbo_target_id_ += 2;

        active_limbo_resolutions_by_target_.emplace(limbo_target_id, LimboResolution{key});
        active_limbo_targets_by_key_.emplace(key, limbo_target_id);

        auto target_data = TargetData{};
        target_data.target = Query::document(key).to_target();
        target_data.target_id = limbo_target_id;
        target_data.purpose = QueryPurpose::limbo_resolution;
        remote_store_.listen(target_data);
    }
}

void SyncEngine::remove_limbo_target(const DocumentKey& key) {
    std::erase(enqueued_limbo_resolutions_, key);

    auto active = active_limbo_targets_by_key_.find(key);
    // Not yet listened to, or the resolution already failed
    if (active == active_limbo_targets_by_key_.end()) return;

    auto limbo_target_id = active->second;
    remote_store_.stop_listening(limbo_target_id);
    active_limbo_targets_by_key_.erase(active);
    active_limbo_resolutions_by_target_.erase(limbo_target_id);
    pump_enqueued_limbo_resolutions();
}

}  // namespace docsync_cpp::core

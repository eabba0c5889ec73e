#pragma once

// The sync engine: the glue between the event manager, the local store and
// the remote store.
//
// It owns one View per listened query, allocates targets for them, and
// resolves documents in limbo (present locally but not confirmed by the
// backend) by listening to them on single-document targets.
//
// Internal header — not installed.

#include "view.hpp"
#include "../local/local_store.hpp"
#include "../local/reference_set.hpp"
#include "../remote/remote_store.hpp"

#include <docsync-cpp/client.hpp>
#include <docsync-cpp/credentials.hpp>
#include <docsync-cpp/error.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/snapshot.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docsync_cpp::core {

// Receives the snapshots and errors the sync engine raises.
class SyncEngineCallback {
public:
    virtual ~SyncEngineCallback() = default;

    virtual void on_view_snapshots(std::vector<ViewSnapshot>&& snapshots) = 0;
    virtual void on_error(const Query& query, const Error& error) = 0;
    virtual void handle_online_state_change(OnlineState online_state) = 0;
};

// The listen side of the sync engine, as used by the event manager.
class QueryEventSource {
public:
    virtual ~QueryEventSource() = default;

    virtual void set_callback(SyncEngineCallback* callback) = 0;

    // Start listening; raises the initial snapshot. Returns the target id.
    virtual auto listen(const Query& query) -> TargetId = 0;
    virtual void stop_listening(const Query& query) = 0;
};

using PendingWritesCallback = std::function<void(std::optional<Error>)>;

class SyncEngine final : public remote::RemoteStoreCallback, public QueryEventSource {
public:
    SyncEngine(local::LocalStore& local_store, remote::RemoteStore& remote_store, User initial_user,
               std::size_t max_concurrent_limbo_resolutions);

    void set_callback(SyncEngineCallback* callback) override { callback_ = callback; }

    auto listen(const Query& query) -> TargetId override;
    void stop_listening(const Query& query) override;

    // Apply the batch locally and queue it for the backend. `on_complete`
    // runs when the backend acknowledges or rejects it.
    auto write_mutations(std::vector<Mutation> mutations, WriteCallback on_complete) -> BatchId;

    // Run `callback` once every batch written so far is acknowledged or
    // rejected.
    void register_pending_writes_callback(PendingWritesCallback callback);

    void handle_credential_change(const User& user);

    // -- RemoteStoreCallback ----------------------------------------------------

    void apply_remote_event(const remote::RemoteEvent& remote_event) override;
    void handle_rejected_listen(TargetId target_id, const Error& error) override;
    void handle_successful_write(const MutationBatchResult& batch_result) override;
    void handle_rejected_write(BatchId batch_id, const Error& error) override;
    void handle_online_state_change(OnlineState online_state) override;
    auto get_remote_keys_for_target(TargetId target_id) const -> DocumentKeySet override;

    // -- Testing ----------------------------------------------------------------

    // Documents with an active limbo resolution target, by key.
    auto active_limbo_document_resolutions() const -> const std::map<DocumentKey, TargetId>& {
        return active_limbo_targets_by_key_;
    }
    auto enqueued_limbo_document_resolutions() const -> const std::deque<DocumentKey>& {
        return enqueued_limbo_resolutions_;
    }

private:
    struct QueryView {
        Query query;
        TargetId target_id{0};
        View view;
    };

    struct LimboResolution {
        DocumentKey key;
        // The backend sent the document on the limbo target.
        bool received_document{false};
    };

    auto callback() const -> SyncEngineCallback&;

    auto initialize_view_and_compute_snapshot(const Query& query, TargetId target_id,
                                              const ByteString& resume_token) -> ViewSnapshot;
    void remove_and_clean_up_target(TargetId target_id, const std::optional<Error>& error);

    void emit_new_snapshots_and_notify_local_store(const DocumentMap& changes,
                                                   const remote::RemoteEvent* remote_event);

    void update_tracked_limbo_documents(const std::vector<LimboDocumentChange>& limbo_changes,
                                        TargetId target_id);
    void track_limbo_change(const LimboDocumentChange& limbo_change);
    void pump_enqueued_limbo_resolutions();
    void remove_limbo_target(const DocumentKey& key);

    void notify_user(BatchId batch_id, std::optional<Error> error);
    void trigger_pending_writes_callbacks(BatchId batch_id);
    void fail_outstanding_pending_writes_callbacks(const std::string& message);

    local::LocalStore& local_store_;
    remote::RemoteStore& remote_store_;
    SyncEngineCallback* callback_{nullptr};
    User current_user_;
    std::size_t max_concurrent_limbo_resolutions_;

    // By query canonical id. Several queries may share a target.
    std::map<std::string, std::unique_ptr<QueryView>> query_views_by_query_;
    std::map<TargetId, std::vector<Query>> queries_by_target_;

    // Limbo keys waiting for a free resolution slot, oldest first.
    std::deque<DocumentKey> enqueued_limbo_resolutions_;
    std::map<DocumentKey, TargetId> active_limbo_targets_by_key_;
    std::map<TargetId, LimboResolution> active_limbo_resolutions_by_target_;
    // Which views reference each limbo document.
    local::ReferenceSet limbo_document_refs_;
    // Limbo targets use odd ids; the local store hands out even ones.
    TargetId next_limbo_target_id_{1};

    std::map<User, std::map<BatchId, WriteCallback>> mutation_user_callbacks_;
    // By the highest batch id outstanding at registration.
    std::map<BatchId, std::vector<PendingWritesCallback>> pending_writes_callbacks_;
};

}  // namespace docsync_cpp::core

#pragma once

// The local store: the engine's single entry point into persistence.
//
// Every operation runs in one named persistence transaction, so a failure
// leaves the cache as it was. The store also tracks the targets that are
// currently listened to and the documents pinned by local views.
//
// Internal header — not installed.

#include "document_overlay_cache.hpp"
#include "index_backfiller.hpp"
#include "local_documents_view.hpp"
#include "lru_garbage_collector.hpp"
#include "mutation_queue.hpp"
#include "persistence.hpp"
#include "query_engine.hpp"
#include "reference_set.hpp"
#include "../remote/remote_event.hpp"

#include <docsync-cpp/credentials.hpp>
#include <docsync-cpp/document.hpp>
#include <docsync-cpp/index.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/query.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace docsync_cpp::local {

// A locally applied batch and the local view of the documents it changed.
struct LocalWriteResult {
    BatchId batch_id{unknown_batch_id};
    DocumentMap changes;
};

// The documents matching a query and the keys the backend last confirmed
// for its target.
struct QueryResult {
    DocumentMap documents;
    DocumentKeySet remote_keys;
};

// The keys a view added and removed, reported after every view change.
struct LocalViewChanges {
    TargetId target_id{0};
    bool from_cache{true};
    DocumentKeySet added_keys;
    DocumentKeySet removed_keys;
};

class LocalStore {
public:
    // Resume tokens older than this are persisted even without changes.
    static constexpr auto resume_token_max_age = std::chrono::minutes{5};

    LocalStore(Persistence& persistence, QueryEngine& query_engine, User initial_user);

    LocalStore(const LocalStore&) = delete;
    auto operator=(const LocalStore&) -> LocalStore& = delete;

    void start();

    // Switch to `user`'s mutation queue and overlays. Returns the local view
    // of every document either user had pending writes for.
    auto handle_user_change(const User& user) -> DocumentMap;

    auto write_locally(std::vector<Mutation> mutations) -> LocalWriteResult;

    // The backend committed the batch. Returns the affected documents.
    auto acknowledge_batch(const MutationBatchResult& batch_result) -> DocumentMap;

    // The backend refused the batch. Returns the affected documents.
    auto reject_batch(BatchId batch_id) -> DocumentMap;

    auto get_highest_unacknowledged_batch_id() -> BatchId;
    auto last_stream_token() -> ByteString;
    void set_last_stream_token(const ByteString& stream_token);
    auto get_last_remote_snapshot_version() -> SnapshotVersion;

    // Persist a consistent snapshot from the watch stream. Returns the
    // local view of every changed document.
    auto apply_remote_event(const remote::RemoteEvent& event) -> DocumentMap;

    void notify_local_view_changes(const std::vector<LocalViewChanges>& view_changes);

    auto next_mutation_batch(BatchId after_batch_id) -> std::optional<MutationBatch>;

    auto read_document(const DocumentKey& key) -> Document;
    auto get_documents(const DocumentKeySet& keys) -> DocumentMap;

    // Reuse the target's persisted data or allocate a new target id.
    auto allocate_target(const Target& target) -> TargetData;
    auto get_target_data(const Target& target) -> std::optional<TargetData>;
    void release_target(TargetId target_id);

    auto execute_query(const Query& query, bool use_previous_results) -> QueryResult;
    auto get_remote_document_keys(TargetId target_id) -> DocumentKeySet;

    auto collect_garbage(LruGarbageCollector& garbage_collector) -> LruResults;

    // Returns the number of documents indexed.
    auto backfill_indexes() -> std::size_t;

    // Replace the field indexes with `indexes`. Unchanged definitions keep
    // their entries.
    void configure_field_indexes(const std::vector<FieldIndex>& indexes);

    auto has_field_indexes() -> bool;

    auto user() const -> const User& { return mutation_queue_->user(); }

private:
    void start_mutation_queue();
    void rebuild_local_documents();
    void apply_batch_result(const MutationBatchResult& batch_result);

    struct DocumentChanges {
        MutableDocumentMap changed_docs;
        DocumentKeySet existence_changed_keys;
    };
    auto populate_document_changes(RemoteDocumentChangeBuffer& buffer, const MutableDocumentMap& documents)
        -> DocumentChanges;

    auto next_target_id() -> TargetId;

    Persistence& persistence_;
    QueryEngine& query_engine_;
    std::unique_ptr<MutationQueue> mutation_queue_;
    std::unique_ptr<DocumentOverlayCache> overlays_;
    std::unique_ptr<LocalDocumentsView> local_documents_;
    IndexBackfiller index_backfiller_;

    // Documents referenced by views, by target id. Pinned against GC.
    ReferenceSet local_view_references_;

    std::unordered_map<TargetId, TargetData> target_data_by_target_;
    std::unordered_map<std::string, TargetId> target_id_by_canonical_id_;
    TargetId last_target_id_{0};
};

}  // namespace docsync_cpp::local

#pragma once

// Accumulates watch changes until the backend reports a consistent
// snapshot, then turns them into a RemoteEvent.
//
// Internal header — not installed.

#include "bloom_filter.hpp"
#include "remote_event.hpp"

#include <docsync-cpp/datastore.hpp>
#include <docsync-cpp/document.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/snapshot.hpp>

#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace docsync_cpp::remote {

// What the aggregator needs to know about the targets the client listens
// to.
class TargetMetadataProvider {
public:
    virtual ~TargetMetadataProvider() = default;

    // The keys the local store holds for the target as of the last
    // RemoteEvent.
    virtual auto get_remote_keys_for_target(TargetId target_id) const -> DocumentKeySet = 0;

    // The target data of an active target, or nullopt if it is not
    // listened to.
    virtual auto get_target_data_for_target(TargetId target_id) const -> std::optional<TargetData> = 0;

    virtual auto database_id() const -> const DatabaseId& = 0;
};

// Accumulated changes for one target.
class TargetState {
public:
    // True while the backend has not answered every watch or unwatch
    // request for the target. Changes for pending targets are ignored.
    auto is_pending() const -> bool { return outstanding_responses_ != 0; }
    auto current() const -> bool { return current_; }
    auto resume_token() const -> const ByteString& { return resume_token_; }
    auto has_pending_changes() const -> bool { return has_pending_changes_; }

    void update_resume_token(const ByteString& token);
    auto to_target_change() const -> TargetChange;
    void clear_pending_changes();

    void record_pending_target_request() { ++outstanding_responses_; }
    void record_target_response() { --outstanding_responses_; }
    void mark_current();

    void add_document_change(const DocumentKey& key, DocumentViewChange::Type type);
    void remove_document_change(const DocumentKey& key);

private:
    int outstanding_responses_{0};
    std::map<DocumentKey, DocumentViewChange::Type> document_changes_;
    ByteString resume_token_;
    bool current_{false};
    // A new target reports its first snapshot even without changes
    bool has_pending_changes_{true};
};

// The outcome of reconciling a mismatched count with a Bloom filter.
enum class BloomFilterApplication : std::uint8_t {
    success,         // The filter explained the mismatch.
    skipped,         // No usable filter.
    false_positive,  // The filter kept a key the backend no longer has.
};

class WatchChangeAggregator {
public:
    explicit WatchChangeAggregator(const TargetMetadataProvider& metadata_provider)
        : metadata_provider_{metadata_provider} {}

    void handle_document_change(const DocumentWatchChange& change);
    void handle_target_change(const WatchTargetChange& change);
    void handle_existence_filter(const ExistenceFilterWatchChange& existence_filter);

    // Build the event for everything accumulated so far and start over.
    auto create_remote_event(SnapshotVersion snapshot_version) -> RemoteEvent;

    // A watch or unwatch request was sent for the target.
    void record_pending_target_request(TargetId target_id);

    void remove_target(TargetId target_id);

private:
    auto target_ids(const WatchTargetChange& change) const -> std::vector<TargetId>;
    auto ensure_target_state(TargetId target_id) -> TargetState&;
    auto is_active_target(TargetId target_id) const -> bool;
    auto target_data_for_active_target(TargetId target_id) const -> std::optional<TargetData>;
    void reset_target(TargetId target_id);
    auto target_contains_document(TargetId target_id, const DocumentKey& key) const -> bool;
    auto current_document_count_for_target(TargetId target_id) -> std::int64_t;
    void add_document_to_target(TargetId target_id, const MutableDocument& document);
    void remove_document_from_target(TargetId target_id, const DocumentKey& key,
                                     const std::optional<MutableDocument>& updated_document);
    auto apply_bloom_filter(const ExistenceFilterWatchChange& existence_filter, std::int64_t current_count)
        -> BloomFilterApplication;
    auto filter_removed_documents(const BloomFilter& bloom_filter, TargetId target_id) -> std::int64_t;

    const TargetMetadataProvider& metadata_provider_;
    std::map<TargetId, TargetState> target_states_;
    MutableDocumentMap pending_document_updates_;
    std::map<DocumentKey, std::set<TargetId>> pending_document_target_mapping_;
    std::map<TargetId, QueryPurpose> pending_target_resets_;
};

}  // namespace docsync_cpp::remote

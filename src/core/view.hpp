#pragma once

// A query's view of the local cache. Computes the ViewSnapshot raised to
// listeners from local document changes and target changes, and tracks
// which documents are in limbo.
//
// Internal header — not installed.

#include "../remote/remote_event.hpp"

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/snapshot.hpp>

#include <map>
#include <optional>
#include <vector>

namespace docsync_cpp::core {

// Accumulates per-document changes, merging repeated changes to one key.
class DocumentViewChangeSet {
public:
    void add_change(DocumentViewChange change);

    // The changes in key order.
    auto get_changes() const -> std::vector<DocumentViewChange>;

private:
    std::map<DocumentKey, DocumentViewChange> changes_;
};

enum class LimboDocumentChangeType : std::uint8_t { added, removed };

struct LimboDocumentChange {
    LimboDocumentChangeType type{LimboDocumentChangeType::added};
    DocumentKey key;

    auto operator==(const LimboDocumentChange&) const -> bool = default;
};

enum class SyncState : std::uint8_t { none, local, synced };

// The result of folding document changes into a view, before it is applied.
struct ViewDocumentChanges {
    DocumentSet document_set;
    DocumentViewChangeSet change_set;
    DocumentKeySet mutated_keys;
    // A limit query lost a document and must be recomputed from the cache.
    bool needs_refill{false};
};

struct ViewChange {
    std::optional<ViewSnapshot> snapshot;
    std::vector<LimboDocumentChange> limbo_changes;
};

class View {
public:
    View(Query query, DocumentKeySet remote_documents);

    // Fold `doc_changes` into the view without applying them. Pass the
    // previous result when recomputing after a refill.
    auto compute_doc_changes(const DocumentMap& doc_changes,
                             const std::optional<ViewDocumentChanges>& previous_changes = std::nullopt) const
        -> ViewDocumentChanges;

    // Apply computed changes and an optional target change. While a target
    // reset is pending limbo documents are left untouched.
    auto apply_changes(const ViewDocumentChanges& doc_changes,
                       const std::optional<remote::TargetChange>& target_change = std::nullopt,
                       bool target_is_pending_reset = false) -> ViewChange;

    // Going offline makes the view non-current so it raises from_cache.
    auto apply_online_state_change(OnlineState online_state) -> ViewChange;

    auto query() const -> const Query& { return query_; }
    auto documents() const -> const DocumentSet& { return document_set_; }
    auto synced_documents() const -> const DocumentKeySet& { return synced_documents_; }
    auto limbo_documents() const -> const DocumentKeySet& { return limbo_documents_; }
    auto sync_state() const -> SyncState { return sync_state_; }

private:
    void apply_target_change(const std::optional<remote::TargetChange>& target_change);
    auto update_limbo_documents() -> std::vector<LimboDocumentChange>;
    auto should_be_limbo_document(const DocumentKey& key) const -> bool;

    Query query_;
    DocumentSet document_set_;
    DocumentKeySet mutated_keys_;
    // Keys the backend says are in the target.
    DocumentKeySet synced_documents_;
    DocumentKeySet limbo_documents_;
    SyncState sync_state_{SyncState::none};
    bool current_{false};
};

}  // namespace docsync_cpp::core

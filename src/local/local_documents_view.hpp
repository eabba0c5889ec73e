#pragma once

// The local view of documents: the remote document with the overlay of
// pending writes applied.
//
// Internal header — not installed.

#include "document_overlay_cache.hpp"
#include "index_manager.hpp"
#include "mutation_queue.hpp"
#include "remote_document_cache.hpp"

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/index.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/query.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace docsync_cpp::local {

// Documents for the index backfiller and the newest batch reflected in them.
struct LocalDocumentsResult {
    BatchId batch_id{unknown_batch_id};
    DocumentMap documents;
};

class LocalDocumentsView {
public:
    LocalDocumentsView(RemoteDocumentCache& remote_documents, MutationQueue& mutation_queue,
                       DocumentOverlayCache& overlays, IndexManager& index_manager)
        : remote_documents_{remote_documents},
          mutation_queue_{mutation_queue},
          overlays_{overlays},
          index_manager_{index_manager} {}

    auto get_document(const DocumentKey& key) -> Document;
    auto get_documents(const DocumentKeySet& keys) -> DocumentMap;

    // Apply overlays to `docs`. Keys in `existence_state_changed` whose
    // overlay may depend on the document existing get their overlays
    // recalculated first.
    auto get_local_view_of_documents(const MutableDocumentMap& docs,
                                     const DocumentKeySet& existence_state_changed = {}) -> DocumentMap;

    // As get_local_view_of_documents, keeping the fields each overlay changed.
    auto get_overlayed_documents(const MutableDocumentMap& docs) -> OverlayedDocumentMap;

    // Replay the pending batches for `keys` over their remote documents
    // and save the resulting overlays.
    void recalculate_and_save_overlays(const DocumentKeySet& keys);

    // Documents matching `query` whose remote version was read after
    // `offset` or that have overlays.
    auto get_documents_matching_query(const Query& query, const IndexOffset& offset,
                                      QueryContext* context = nullptr) -> DocumentMap;

    // Up to about `count` documents of `collection_group` changed after
    // `offset`, remote changes first, then pending writes.
    auto get_next_documents(const std::string& collection_group, const IndexOffset& offset,
                            std::size_t count) -> LocalDocumentsResult;

private:
    auto compute_views(MutableDocumentMap docs, const OverlayMap& overlays,
                       const DocumentKeySet& existence_state_changed) -> OverlayedDocumentMap;
    auto recalculate_and_save_overlays(MutableDocumentMap docs)
        -> std::map<DocumentKey, std::optional<FieldMask>>;
    auto get_documents_matching_collection_query(const Query& query, const IndexOffset& offset,
                                                 QueryContext* context) -> DocumentMap;

    RemoteDocumentCache& remote_documents_;
    MutationQueue& mutation_queue_;
    DocumentOverlayCache& overlays_;
    IndexManager& index_manager_;
};

}  // namespace docsync_cpp::local

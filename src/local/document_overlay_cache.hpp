#pragma once

// Per-user cache of overlays: the net effect of all pending batches on a
// document, saved so local reads need not replay the mutation queue.
//
// Internal header — not installed.

#include "persistence.hpp"

#include <docsync-cpp/credentials.hpp>
#include <docsync-cpp/mutation.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace docsync_cpp::local {

class DocumentOverlayCache {
public:
    DocumentOverlayCache(Persistence& persistence, User user);

    auto get_overlay(const DocumentKey& key) -> std::optional<Overlay>;
    auto get_overlays(const DocumentKeySet& keys) -> OverlayMap;

    // Save `overlays`, all produced by batches up to `largest_batch_id`,
    // replacing any earlier overlays for the same keys.
    void save_overlays(BatchId largest_batch_id, const std::map<DocumentKey, Mutation>& overlays);

    // Remove the overlays that `batch_id` produced.
    void remove_overlays_for_batch_id(BatchId batch_id);

    // Overlays for documents directly in `collection` produced by batches
    // after `since_batch_id`.
    auto get_overlays_for_collection(const ResourcePath& collection, BatchId since_batch_id)
        -> OverlayMap;

    // Overlays in `collection_group` after `since_batch_id`, in batch
    // order. Whole batches are returned until at least `count` overlays
    // are collected.
    auto get_overlays_for_collection_group(const std::string& collection_group,
                                           BatchId since_batch_id, std::size_t count) -> OverlayMap;

private:
    auto txn() -> Transaction& { return persistence_.current_transaction(); }
    void remove_overlay(const DocumentKey& key);

    Persistence& persistence_;
    User user_;
};

}  // namespace docsync_cpp::local

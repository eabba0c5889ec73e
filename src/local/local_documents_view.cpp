#include "local_documents_view.hpp"

#include "../util/clock.hpp"

#include <set>

namespace docsync_cpp::local {

namespace {

// The fields an overlay changes; nullopt for whole-document overlays.
auto overlay_field_mask(const Overlay& overlay) -> std::optional<FieldMask> {
    const auto* patch = std::get_if<PatchMutation>(&overlay.mutation.kind());
    if (!patch) return std::nullopt;
    auto mask = patch->mask;
    for (const auto& transform : overlay.mutation.field_transforms()) mask.insert(transform.path);
    return mask;
}

}  // namespace

auto LocalDocumentsView::get_document(const DocumentKey& key) -> Document {
    auto doc = remote_documents_.get(key);
    if (auto overlay = overlays_.get_overlay(key)) {
        overlay->mutation.apply_to_local_view(doc, FieldMask{}, util::now());
    }
    return doc;
}

auto LocalDocumentsView::get_documents(const DocumentKeySet& keys) -> DocumentMap {
    return get_local_view_of_documents(remote_documents_.get_all(keys));
}

auto LocalDocumentsView::get_local_view_of_documents(const MutableDocumentMap& docs,
                                                     const DocumentKeySet& existence_state_changed)
    -> DocumentMap {
    auto keys = DocumentKeySet{};
    for (const auto& [key, doc] : docs) keys.insert(key);
    auto overlayed = compute_views(docs, overlays_.get_overlays(keys), existence_state_changed);

    auto result = DocumentMap{};
    for (auto& [key, entry] : overlayed) result.emplace(key, std::move(entry.document));
    return result;
}

auto LocalDocumentsView::get_overlayed_documents(const MutableDocumentMap& docs) -> OverlayedDocumentMap {
    auto keys = DocumentKeySet{};
    for (const auto& [key, doc] : docs) keys.insert(key);
    return compute_views(docs, overlays_.get_overlays(keys), {});
}

auto LocalDocumentsView::compute_views(MutableDocumentMap docs, const OverlayMap& overlays,
                                       const DocumentKeySet& existence_state_changed)
    -> OverlayedDocumentMap {
    auto recalculate = MutableDocumentMap{};
    auto mutated_fields = std::map<DocumentKey, std::optional<FieldMask>>{};
    auto write_time = util::now();

    for (auto& [key, doc] : docs) {
        auto overlay = overlays.find(key);
        // A patch's precondition may start or stop matching when the
        // document appears or disappears, and a missing overlay may be a
        // patch that did not match before
        if (existence_state_changed.contains(key) &&
            (overlay == overlays.end() || overlay->second.mutation.is_patch())) {
            recalculate.emplace(key, doc);
        } else if (overlay != overlays.end()) {
            mutated_fields[key] = overlay_field_mask(overlay->second);
            overlay->second.mutation.apply_to_local_view(doc, FieldMask{}, write_time);
        }
    }

    auto recalculated = recalculate_and_save_overlays(std::move(recalculate));
    mutated_fields.insert(recalculated.begin(), recalculated.end());

    auto result = OverlayedDocumentMap{};
    for (auto& [key, doc] : docs) {
        auto mask = std::optional<FieldMask>{FieldMask{}};
        if (auto it = mutated_fields.find(key); it != mutated_fields.end()) mask = it->second;
        result.emplace(key, OverlayedDocument{std::move(doc), std::move(mask)});
    }
    return result;
}

auto LocalDocumentsView::recalculate_and_save_overlays(MutableDocumentMap docs)
    -> std::map<DocumentKey, std::optional<FieldMask>> {
    auto keys = DocumentKeySet{};
    for (const auto& [key, doc] : docs) keys.insert(key);
    auto batches = mutation_queue_.get_all_mutation_batches_affecting_document_keys(keys);

    auto masks = std::map<DocumentKey, std::optional<FieldMask>>{};
    auto documents_by_batch_id = std::map<BatchId, DocumentKeySet>{};
    for (const auto& batch : batches) {
        for (const auto& key : batch.keys()) {
            auto doc = docs.find(key);
            if (doc == docs.end()) continue;
            auto mask = masks.contains(key) ? masks[key] : std::optional<FieldMask>{FieldMask{}};
            masks[key] = batch.apply_to_local_view(doc->second, std::move(mask));
            documents_by_batch_id[batch.batch_id()].insert(key);
        }
    }

    // The newest batch touching a key produces its overlay
    auto processed = DocumentKeySet{};
    for (auto it = documents_by_batch_id.rbegin(); it != documents_by_batch_id.rend(); ++it) {
        auto overlays = std::map<DocumentKey, Mutation>{};
        for (const auto& key : it->second) {
            if (!processed.insert(key).second) continue;
            if (auto mutation = Mutation::calculate_overlay_mutation(docs.at(key), masks[key])) {
                overlays.emplace(key, std::move(*mutation));
            }
        }
        overlays_.save_overlays(it->first, overlays);
    }
    return masks;
}

void LocalDocumentsView::recalculate_and_save_overlays(const DocumentKeySet& keys) {
    recalculate_and_save_overlays(remote_documents_.get_all(keys));
}

auto LocalDocumentsView::get_documents_matching_query(const Query& query, const IndexOffset& offset,
                                                      QueryContext* context) -> DocumentMap {
    if (query.is_document_query()) {
        auto result = DocumentMap{};
        auto doc = get_document(DocumentKey{query.path()});
        if (doc.is_found_document()) result.emplace(doc.key(), std::move(doc));
        return result;
    }

    if (query.is_collection_group_query()) {
        const auto& collection_id = *query.collection_group_id();
        auto result = DocumentMap{};
        for (const auto& parent : index_manager_.get_collection_parents(collection_id)) {
            auto collection_query = query.as_collection_query_at_path(parent.child(collection_id));
            result.merge(get_documents_matching_collection_query(collection_query, offset, context));
        }
        return result;
    }

    return get_documents_matching_collection_query(query, offset, context);
}

auto LocalDocumentsView::get_documents_matching_collection_query(const Query& query,
                                                                 const IndexOffset& offset,
                                                                 QueryContext* context) -> DocumentMap {
    // Every overlay of the collection applies, however old: a document
    // read after the offset may carry an overlay from before it
    auto overlays = overlays_.get_overlays_for_collection(query.path(), unknown_batch_id);
    auto overlay_keys = DocumentKeySet{};
    for (const auto& [key, overlay] : overlays) overlay_keys.insert(key);

    auto remote_docs = remote_documents_.get_documents_matching_query(query, offset, overlay_keys, context);

    // Documents may match only because of their overlay
    for (const auto& [key, overlay] : overlays) {
        if (overlay.largest_batch_id > offset.largest_batch_id && !remote_docs.contains(key)) {
            remote_docs.emplace(key, remote_documents_.get(key));
        }
    }

    auto write_time = util::now();
    auto result = DocumentMap{};
    for (auto& [key, doc] : remote_docs) {
        if (auto overlay = overlays.find(key); overlay != overlays.end()) {
            overlay->second.mutation.apply_to_local_view(doc, FieldMask{}, write_time);
        }
        if (query.matches(doc)) result.emplace(key, std::move(doc));
    }
    return result;
}

auto LocalDocumentsView::get_next_documents(const std::string& collection_group,
                                            const IndexOffset& offset, std::size_t count)
    -> LocalDocumentsResult {
    auto docs = remote_documents_.get_all_from_collection_group(collection_group, offset, count);
    auto overlays = OverlayMap{};
    if (docs.size() < count) {
        overlays = overlays_.get_overlays_for_collection_group(collection_group, offset.largest_batch_id,
                                                               count - docs.size());
    }

    auto largest_batch_id = unknown_batch_id;
    for (const auto& [key, overlay] : overlays) {
        largest_batch_id = std::max(largest_batch_id, overlay.largest_batch_id);
        if (!docs.contains(key)) docs.emplace(key, remote_documents_.get(key));
    }

    // Remote documents may carry overlays from before the offset
    auto doc_keys = DocumentKeySet{};
    for (const auto& [key, doc] : docs) {
        if (!overlays.contains(key)) doc_keys.insert(key);
    }
    overlays.merge(overlays_.get_overlays(doc_keys));

    auto result = LocalDocumentsResult{largest_batch_id, {}};
    for (auto& [key, entry] : compute_views(std::move(docs), overlays, {})) {
        result.documents.emplace(key, std::move(entry.document));
    }
    return result;
}

}  // namespace docsync_cpp::local

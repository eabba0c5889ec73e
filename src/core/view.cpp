#include "view.hpp"

#include "../util/hard_assert.hpp"

#include <algorithm>

namespace docsync_cpp::core {

namespace {

using ChangeType = DocumentViewChange::Type;

// Metadata changes surface as modifications, so they sort together.
auto change_type_order(ChangeType type) -> int {
    switch (type) {
        case ChangeType::added:
        case ChangeType::removed:
            return 0;
        case ChangeType::modified:
        case ChangeType::metadata:
            return 1;
    }
    util::hard_fail("unknown view change type");
}

// A local write was acknowledged but the backend has not sent the new
// version yet; raising now would flicker back to the old value.
auto should_wait_for_synced_document(const Document& old_doc, const Document& new_doc) -> bool {
    return old_doc.has_local_mutations() && new_doc.has_committed_mutations() && !new_doc.has_local_mutations();
}

}  // namespace

// -- DocumentViewChangeSet ----------------------------------------------------

void DocumentViewChangeSet::add_change(DocumentViewChange change) {
    const auto& key = change.document.key();
    auto existing = changes_.find(key);
    if (existing == changes_.end()) {
        changes_.emplace(key, std::move(change));
        return;
    }

    auto old_type = existing->second.type;
    auto new_type = change.type;

    if (new_type != ChangeType::added && old_type == ChangeType::metadata) {
        existing->second = std::move(change);
    } else if (new_type == ChangeType::metadata && old_type != ChangeType::removed) {
        existing->second = DocumentViewChange{old_type, std::move(change.document)};
    } else if (new_type == ChangeType::modified && old_type == ChangeType::modified) {
        existing->second = DocumentViewChange{ChangeType::modified, std::move(change.document)};
    } else if (new_type == ChangeType::modified && old_type == ChangeType::added) {
        existing->second = DocumentViewChange{ChangeType::added, std::move(change.document)};
    } else if (new_type == ChangeType::removed && old_type == ChangeType::added) {
        changes_.erase(existing);
    } else if (new_type == ChangeType::removed && old_type == ChangeType::modified) {
        existing->second = DocumentViewChange{ChangeType::removed, existing->second.document};
    } else if (new_type == ChangeType::added && old_type == ChangeType::removed) {
        existing->second = DocumentViewChange{ChangeType::modified, std::move(change.document)};
    } else {
        util::hard_fail("unsupported view change combination: {} after {} for {}", to_string_view(new_type),
                        to_string_view(old_type), key.to_string());
    }
}

auto DocumentViewChangeSet::get_changes() const -> std::vector<DocumentViewChange> {
    auto result = std::vector<DocumentViewChange>{};
    result.reserve(changes_.size());
    for (const auto& [key, change] : changes_) result.push_back(change);
    return result;
}

// -- View ---------------------------------------------------------------------

View::View(Query query, DocumentKeySet remote_documents)
    : query_{std::move(query)}, document_set_{query_}, synced_documents_{std::move(remote_documents)} {}

auto View::compute_doc_changes(const DocumentMap& doc_changes,
                               const std::optional<ViewDocumentChanges>& previous_changes) const
    -> ViewDocumentChanges {
    auto change_set = previous_changes ? previous_changes->change_set : DocumentViewChangeSet{};
    const auto& old_document_set = previous_changes ? previous_changes->document_set : document_set_;
    auto new_mutated_keys = previous_changes ? previous_changes->mutated_keys : mutated_keys_;
    auto new_document_set = old_document_set;
    auto needs_refill = false;

    // The edge of a full limit window. A document moving past it may be
    // replaced by one the view never loaded.
    auto limit = query_.limit();
    auto window_full = limit && old_document_set.size() == static_cast<std::size_t>(*limit);
    auto last_doc_in_limit = std::optional<Document>{};
    auto first_doc_in_limit = std::optional<Document>{};
    if (window_full && query_.limit_type() == LimitType::first) last_doc_in_limit = old_document_set.last();
    if (window_full && query_.limit_type() == LimitType::last) first_doc_in_limit = old_document_set.first();

    for (const auto& [key, doc] : doc_changes) {
        const auto* old_doc = old_document_set.get(key);
        auto new_doc = query_.matches(doc) ? std::optional<Document>{doc} : std::nullopt;

        auto old_doc_had_pending_mutations = old_doc && mutated_keys_.contains(key);
        auto new_doc_has_pending_mutations =
            new_doc && (new_doc->has_local_mutations() ||
                        (mutated_keys_.contains(key) && new_doc->has_committed_mutations()));

        auto change_applied = false;
        if (old_doc && new_doc) {
            if (old_doc->data() != new_doc->data()) {
                if (!should_wait_for_synced_document(*old_doc, *new_doc)) {
                    change_set.add_change(DocumentViewChange{ChangeType::modified, *new_doc});
                    change_applied = true;
                    if ((last_doc_in_limit && query_.compare(*new_doc, *last_doc_in_limit) > 0) ||
                        (first_doc_in_limit && query_.compare(*new_doc, *first_doc_in_limit) < 0)) {
                        needs_refill = true;
                    }
                }
            } else if (old_doc_had_pending_mutations != new_doc_has_pending_mutations) {
                change_set.add_change(DocumentViewChange{ChangeType::metadata, *new_doc});
                change_applied = true;
            }
        } else if (!old_doc && new_doc) {
            change_set.add_change(DocumentViewChange{ChangeType::added, *new_doc});
            change_applied = true;
        } else if (old_doc && !new_doc) {
            change_set.add_change(DocumentViewChange{ChangeType::removed, *old_doc});
            change_applied = true;
            if (last_doc_in_limit || first_doc_in_limit) needs_refill = true;
        }

        if (!change_applied) continue;
        if (new_doc) {
            new_document_set.insert(*new_doc);
            if (new_doc->has_local_mutations()) {
                new_mutated_keys.insert(key);
            } else {
                new_mutated_keys.erase(key);
            }
        } else {
            new_document_set.erase(key);
            new_mutated_keys.erase(key);
        }
    }

    // Trim to the limit
    if (limit) {
        auto excess = static_cast<std::ptrdiff_t>(new_document_set.size()) - *limit;
        for (; excess > 0; --excess) {
            auto old_doc = query_.limit_type() == LimitType::first ? new_document_set.last() : new_document_set.first();
            new_document_set.erase(old_doc.key());
            new_mutated_keys.erase(old_doc.key());
            change_set.add_change(DocumentViewChange{ChangeType::removed, std::move(old_doc)});
        }
    }

    util::hard_assert(!needs_refill || !previous_changes,
                      "view was refilled using documents that themselves needed refilling");

    return ViewDocumentChanges{std::move(new_document_set), std::move(change_set), std::move(new_mutated_keys),
                               needs_refill};
}

auto View::apply_changes(const ViewDocumentChanges& doc_changes,
                         const std::optional<remote::TargetChange>& target_change, bool target_is_pending_reset)
    -> ViewChange {
    util::hard_assert(!doc_changes.needs_refill, "cannot apply changes that need a refill");

    auto old_documents = document_set_;
    document_set_ = doc_changes.document_set;
    mutated_keys_ = doc_changes.mutated_keys;

    auto changes = doc_changes.change_set.get_changes();
    std::ranges::stable_sort(changes, [this](const DocumentViewChange& lhs, const DocumentViewChange& rhs) {
        auto lhs_order = change_type_order(lhs.type);
        auto rhs_order = change_type_order(rhs.type);
        if (lhs_order != rhs_order) return lhs_order < rhs_order;
        return query_.compare(lhs.document, rhs.document) < 0;
    });

    apply_target_change(target_change);

    auto limbo_changes =
        target_is_pending_reset ? std::vector<LimboDocumentChange>{} : update_limbo_documents();

    auto synced = limbo_documents_.empty() && current_;
    auto new_sync_state = synced ? SyncState::synced : SyncState::local;
    auto sync_state_changed = new_sync_state != sync_state_;
    sync_state_ = new_sync_state;

    if (changes.empty() && !sync_state_changed) {
        // No snapshot, but limbo changes may still need handling
        return ViewChange{std::nullopt, std::move(limbo_changes)};
    }

    auto snapshot = ViewSnapshot{
        .query = query_,
        .documents = document_set_,
        .old_documents = std::move(old_documents),
        .document_changes = std::move(changes),
        .mutated_keys = mutated_keys_,
        .from_cache = new_sync_state == SyncState::local,
        .sync_state_changed = sync_state_changed,
        .excludes_metadata_changes = false,
        .has_cached_results = target_change && !target_change->resume_token.empty(),
    };
    return ViewChange{std::move(snapshot), std::move(limbo_changes)};
}

auto View::apply_online_state_change(OnlineState online_state) -> ViewChange {
    if (current_ && online_state == OnlineState::offline) {
        current_ = false;
        return apply_changes(ViewDocumentChanges{document_set_, DocumentViewChangeSet{}, mutated_keys_, false});
    }
    return ViewChange{};
}

void View::apply_target_change(const std::optional<remote::TargetChange>& target_change) {
    if (!target_change) return;

    for (const auto& key : target_change->added_documents) synced_documents_.insert(key);
    for (const auto& key : target_change->modified_documents) {
        util::hard_assert(synced_documents_.contains(key), "modified document {} not found in view",
                          key.to_string());
    }
    for (const auto& key : target_change->removed_documents) synced_documents_.erase(key);
    current_ = target_change->current;
}

auto View::update_limbo_documents() -> std::vector<LimboDocumentChange> {
    // Only a current view can tell which documents the backend lacks
    if (!current_) return {};

    auto old_limbo_documents = std::move(limbo_documents_);
    limbo_documents_ = {};
    for (const auto& doc : document_set_) {
        if (should_be_limbo_document(doc.key())) limbo_documents_.insert(doc.key());
    }

    auto changes = std::vector<LimboDocumentChange>{};
    for (const auto& key : old_limbo_documents) {
        if (!limbo_documents_.contains(key)) changes.push_back({LimboDocumentChangeType::removed, key});
    }
    for (const auto& key : limbo_documents_) {
        if (!old_limbo_documents.contains(key)) changes.push_back({LimboDocumentChangeType::added, key});
    }
    return changes;
}

auto View::should_be_limbo_document(const DocumentKey& key) const -> bool {
    if (synced_documents_.contains(key)) return false;

    const auto* doc = document_set_.get(key);
    // Not in the view at all
    if (doc == nullptr) return false;

    // Local writes explain why the backend does not have it
    return !doc->has_local_mutations();
}

}  // namespace docsync_cpp::core

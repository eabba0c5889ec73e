#include "watch_change_aggregator.hpp"

#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

namespace docsync_cpp {

auto to_string_view(WatchTargetChangeState state) noexcept -> std::string_view {
    switch (state) {
        case WatchTargetChangeState::no_change: return "no_change";
        case WatchTargetChangeState::added:     return "added";
        case WatchTargetChangeState::removed:   return "removed";
        case WatchTargetChangeState::current:   return "current";
        case WatchTargetChangeState::reset:     return "reset";
    }
    return "unknown";
}

}  // namespace docsync_cpp

namespace docsync_cpp::remote {

// -- TargetState --------------------------------------------------------------

void TargetState::update_resume_token(const ByteString& token) {
    if (token.empty()) return;
    has_pending_changes_ = true;
    resume_token_ = token;
}

auto TargetState::to_target_change() const -> TargetChange {
    auto change = TargetChange{};
    change.resume_token = resume_token_;
    change.current = current_;
    for (const auto& [key, type] : document_changes_) {
        switch (type) {
            case DocumentViewChange::Type::added:    change.added_documents.insert(key); break;
            case DocumentViewChange::Type::modified: change.modified_documents.insert(key); break;
            case DocumentViewChange::Type::removed:  change.removed_documents.insert(key); break;
            case DocumentViewChange::Type::metadata:
                util::hard_fail("metadata change recorded for {}", key.to_string());
        }
    }
    return change;
}

void TargetState::clear_pending_changes() {
    has_pending_changes_ = false;
    document_changes_.clear();
}

void TargetState::mark_current() {
    has_pending_changes_ = true;
    current_ = true;
}

void TargetState::add_document_change(const DocumentKey& key, DocumentViewChange::Type type) {
    has_pending_changes_ = true;
    document_changes_.insert_or_assign(key, type);
}

void TargetState::remove_document_change(const DocumentKey& key) {
    has_pending_changes_ = true;
    document_changes_.erase(key);
}

// -- WatchChangeAggregator ----------------------------------------------------

void WatchChangeAggregator::handle_document_change(const DocumentWatchChange& change) {
    for (auto target_id : change.updated_target_ids) {
        if (change.new_document && change.new_document->is_found_document()) {
            add_document_to_target(target_id, *change.new_document);
        } else {
            remove_document_from_target(target_id, change.key, change.new_document);
        }
    }
    for (auto target_id : change.removed_target_ids) {
        remove_document_from_target(target_id, change.key, change.new_document);
    }
}

void WatchChangeAggregator::handle_target_change(const WatchTargetChange& change) {
    for (auto target_id : target_ids(change)) {
        auto& target_state = ensure_target_state(target_id);
        switch (change.state) {
            case WatchTargetChangeState::no_change:
                if (is_active_target(target_id)) target_state.update_resume_token(change.resume_token);
                break;
            case WatchTargetChangeState::added:
                target_state.record_target_response();
                // A re-added target starts over
                if (!target_state.is_pending()) target_state.clear_pending_changes();
                target_state.update_resume_token(change.resume_token);
                break;
            case WatchTargetChangeState::removed:
                target_state.record_target_response();
                if (!target_state.is_pending()) remove_target(target_id);
                util::hard_assert(!change.cause, "errored target {} reached the aggregator", target_id);
                break;
            case WatchTargetChangeState::current:
                if (is_active_target(target_id)) {
                    target_state.mark_current();
                    target_state.update_resume_token(change.resume_token);
                }
                break;
            case WatchTargetChangeState::reset:
                if (is_active_target(target_id)) {
                    // The backend re-adds what still matches before the next snapshot
                    reset_target(target_id);
                    ensure_target_state(target_id).update_resume_token(change.resume_token);
                }
                break;
        }
    }
}

auto WatchChangeAggregator::target_ids(const WatchTargetChange& change) const -> std::vector<TargetId> {
    if (!change.target_ids.empty()) return change.target_ids;
    auto result = std::vector<TargetId>{};
    for (const auto& [target_id, state] : target_states_) result.push_back(target_id);
    return result;
}

void WatchChangeAggregator::handle_existence_filter(const ExistenceFilterWatchChange& existence_filter) {
    auto target_id = existence_filter.target_id;
    auto expected_count = std::int64_t{existence_filter.filter.count};

    auto target_data = target_data_for_active_target(target_id);
    if (!target_data) return;

    const auto& target = target_data->target;
    if (target.is_document_query()) {
        if (expected_count == 0) {
            // Apply the delete now so no other query raises the document
            // until the target resolves
            auto key = DocumentKey{target.path()};
            remove_document_from_target(target_id, key, MutableDocument::no_document(key, SnapshotVersion::none()));
        } else {
            util::hard_assert(expected_count == 1, "single document existence filter with count {}",
                              expected_count);
        }
        return;
    }

    auto current_count = current_document_count_for_target(target_id);
    if (current_count == expected_count) return;

    auto status = apply_bloom_filter(existence_filter, current_count);
    util::logger()->debug("watch: existence filter mismatch for target {} (local {}, backend {}): bloom filter {}",
                          target_id, current_count, expected_count,
                          status == BloomFilterApplication::success ? "resolved it" : "did not resolve it");

    if (status != BloomFilterApplication::success) {
        reset_target(target_id);
        auto purpose = status == BloomFilterApplication::false_positive
                           ? QueryPurpose::existence_filter_mismatch_bloom
                           : QueryPurpose::existence_filter_mismatch;
        pending_target_resets_.insert_or_assign(target_id, purpose);
    }
}

auto WatchChangeAggregator::apply_bloom_filter(const ExistenceFilterWatchChange& existence_filter,
                                               std::int64_t current_count) -> BloomFilterApplication {
    const auto& unchanged_names = existence_filter.filter.unchanged_names;
    if (!unchanged_names) return BloomFilterApplication::skipped;

    auto removed = std::int64_t{0};
    try {
        auto bloom_filter = BloomFilter{unchanged_names->bitmap, unchanged_names->padding,
                                        unchanged_names->hash_count};
        if (bloom_filter.bit_count() == 0) return BloomFilterApplication::skipped;
        removed = filter_removed_documents(bloom_filter, existence_filter.target_id);
    } catch (const Exception& e) {
        util::logger()->warn("watch: applying bloom filter failed: {}", e.what());
        return BloomFilterApplication::skipped;
    }

    if (existence_filter.filter.count != current_count - removed) return BloomFilterApplication::false_positive;
    return BloomFilterApplication::success;
}

auto WatchChangeAggregator::filter_removed_documents(const BloomFilter& bloom_filter, TargetId target_id)
    -> std::int64_t {
    auto removed = std::int64_t{0};
    for (const auto& key : metadata_provider_.get_remote_keys_for_target(target_id)) {
        auto name = metadata_provider_.database_id().document_resource_name(key);
        if (!bloom_filter.might_contain(name)) {
            remove_document_from_target(target_id, key, std::nullopt);
            ++removed;
        }
    }
    return removed;
}

auto WatchChangeAggregator::create_remote_event(SnapshotVersion snapshot_version) -> RemoteEvent {
    auto event = RemoteEvent{};
    event.snapshot_version = snapshot_version;

    for (auto& [target_id, target_state] : target_states_) {
        auto target_data = target_data_for_active_target(target_id);
        if (!target_data) continue;

        if (target_state.current() && target_data->target.is_document_query()) {
            // A current document target that never received its document
            // resolves to a delete
            auto key = DocumentKey{target_data->target.path()};
            if (!pending_document_updates_.contains(key) && !target_contains_document(target_id, key)) {
                remove_document_from_target(target_id, key, MutableDocument::no_document(key, snapshot_version));
            }
        }

        if (target_state.has_pending_changes()) {
            event.target_changes.emplace(target_id, target_state.to_target_change());
            target_state.clear_pending_changes();
        }
    }

    // Documents only referenced by limbo targets are not kept by any
    // target, so garbage collection needs to hear about them
    for (const auto& [key, targets] : pending_document_target_mapping_) {
        auto only_limbo = true;
        for (auto target_id : targets) {
            auto target_data = target_data_for_active_target(target_id);
            if (target_data && target_data->purpose != QueryPurpose::limbo_resolution) {
                only_limbo = false;
                break;
            }
        }
        if (only_limbo) event.resolved_limbo_documents.insert(key);
    }

    for (auto& [key, doc] : pending_document_updates_) doc.set_read_time(snapshot_version);

    event.document_updates = std::move(pending_document_updates_);
    event.target_mismatches = std::move(pending_target_resets_);
    pending_document_updates_.clear();
    pending_document_target_mapping_.clear();
    pending_target_resets_.clear();
    return event;
}

void WatchChangeAggregator::add_document_to_target(TargetId target_id, const MutableDocument& document) {
    if (!is_active_target(target_id)) return;

    auto type = target_contains_document(target_id, document.key()) ? DocumentViewChange::Type::modified
                                                                     : DocumentViewChange::Type::added;
    ensure_target_state(target_id).add_document_change(document.key(), type);
    pending_document_updates_.insert_or_assign(document.key(), document);
    pending_document_target_mapping_[document.key()].insert(target_id);
}

void WatchChangeAggregator::remove_document_from_target(TargetId target_id, const DocumentKey& key,
                                                        const std::optional<MutableDocument>& updated_document) {
    if (!is_active_target(target_id)) return;

    auto& target_state = ensure_target_state(target_id);
    if (target_contains_document(target_id, key)) {
        target_state.add_document_change(key, DocumentViewChange::Type::removed);
    } else {
        // Entered and left the target between snapshots
        target_state.remove_document_change(key);
    }

    pending_document_target_mapping_[key].insert(target_id);
    if (updated_document) pending_document_updates_.insert_or_assign(key, *updated_document);
}

void WatchChangeAggregator::remove_target(TargetId target_id) {
    target_states_.erase(target_id);
}

auto WatchChangeAggregator::current_document_count_for_target(TargetId target_id) -> std::int64_t {
    auto change = ensure_target_state(target_id).to_target_change();
    return static_cast<std::int64_t>(metadata_provider_.get_remote_keys_for_target(target_id).size() +
                                     change.added_documents.size()) -
           static_cast<std::int64_t>(change.removed_documents.size());
}

void WatchChangeAggregator::record_pending_target_request(TargetId target_id) {
    ensure_target_state(target_id).record_pending_target_request();
}

auto WatchChangeAggregator::ensure_target_state(TargetId target_id) -> TargetState& {
    return target_states_[target_id];
}

auto WatchChangeAggregator::is_active_target(TargetId target_id) const -> bool {
    return target_data_for_active_target(target_id).has_value();
}

auto WatchChangeAggregator::target_data_for_active_target(TargetId target_id) const
    -> std::optional<TargetData> {
    auto state = target_states_.find(target_id);
    if (state != target_states_.end() && state->second.is_pending()) return std::nullopt;
    return metadata_provider_.get_target_data_for_target(target_id);
}

void WatchChangeAggregator::reset_target(TargetId target_id) {
    util::hard_assert(!target_states_[target_id].is_pending(), "reset of pending target {}", target_id);
    target_states_[target_id] = TargetState{};

    // Removals become part of the next snapshot unless the backend
    // re-sends the documents
    for (const auto& key : metadata_provider_.get_remote_keys_for_target(target_id)) {
        remove_document_from_target(target_id, key, std::nullopt);
    }
}

auto WatchChangeAggregator::target_contains_document(TargetId target_id, const DocumentKey& key) const
    -> bool {
    return metadata_provider_.get_remote_keys_for_target(target_id).contains(key);
}

}  // namespace docsync_cpp::remote

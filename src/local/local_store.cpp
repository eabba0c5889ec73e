#include "local_store.hpp"

#include "index_manager.hpp"
#include "remote_document_cache.hpp"
#include "target_cache.hpp"
#include "../util/clock.hpp"
#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

#include <algorithm>

namespace docsync_cpp::local {

namespace {

// Keys of the batch whose results carry server-computed transform values.
auto keys_with_transform_results(const MutationBatchResult& batch_result) -> DocumentKeySet {
    auto result = DocumentKeySet{};
    const auto& mutations = batch_result.batch.mutations();
    for (std::size_t i = 0; i < batch_result.mutation_results.size() && i < mutations.size(); ++i) {
        const auto& transform_results = batch_result.mutation_results[i].transform_results;
        if (transform_results && !transform_results->empty()) result.insert(mutations[i].key());
    }
    return result;
}

// Whether the updated target data is worth a write. Resume tokens alone
// are cached in memory and flushed only once they grow old.
auto should_persist_target_data(const TargetData& new_target_data, const TargetData& old_target_data,
                                const remote::TargetChange& change) -> bool {
    if (old_target_data.resume_token.empty()) return true;

    auto age = std::chrono::microseconds{new_target_data.snapshot_version.micros -
                                         old_target_data.snapshot_version.micros};
    if (age >= LocalStore::resume_token_max_age) return true;

    return change.change_count() > 0;
}

}  // namespace

LocalStore::LocalStore(Persistence& persistence, QueryEngine& query_engine, User initial_user)
    : persistence_{persistence},
      query_engine_{query_engine},
      mutation_queue_{std::make_unique<MutationQueue>(persistence, initial_user)},
      overlays_{std::make_unique<DocumentOverlayCache>(persistence, initial_user)},
      index_backfiller_{persistence.index_manager()} {
    persistence_.reference_delegate().add_in_memory_pins(&local_view_references_);
    rebuild_local_documents();
}

void LocalStore::start() {
    persistence_.run("Start LocalStore", [&] {
        persistence_.reference_delegate().start();
        start_mutation_queue();
        last_target_id_ = persistence_.target_cache().highest_target_id();
    });
}

void LocalStore::start_mutation_queue() {
    mutation_queue_->start();
}

void LocalStore::rebuild_local_documents() {
    local_documents_ = std::make_unique<LocalDocumentsView>(persistence_.remote_document_cache(),
                                                            *mutation_queue_, *overlays_,
                                                            persistence_.index_manager());
    query_engine_.initialize(local_documents_.get(), &persistence_.index_manager());
}

auto LocalStore::handle_user_change(const User& user) -> DocumentMap {
    return persistence_.run("Handle user change", [&] {
        auto old_batches = mutation_queue_->get_all_mutation_batches();

        mutation_queue_ = std::make_unique<MutationQueue>(persistence_, user);
        overlays_ = std::make_unique<DocumentOverlayCache>(persistence_, user);
        start_mutation_queue();
        rebuild_local_documents();

        auto new_batches = mutation_queue_->get_all_mutation_batches();

        auto changed_keys = DocumentKeySet{};
        for (const auto* batches : {&old_batches, &new_batches}) {
            for (const auto& batch : *batches) {
                for (const auto& mutation : batch.mutations()) changed_keys.insert(mutation.key());
            }
        }
        util::logger()->debug("local store: user changed to '{}', {} documents affected", user.uid(),
                              changed_keys.size());
        return local_documents_->get_documents(changed_keys);
    });
}

auto LocalStore::write_locally(std::vector<Mutation> mutations) -> LocalWriteResult {
    auto local_write_time = util::now();
    auto keys = DocumentKeySet{};
    for (const auto& mutation : mutations) keys.insert(mutation.key());

    return persistence_.run("Locally write mutations", [&] {
        // Documents without a remote version get whole-document overlays
        auto remote_docs = persistence_.remote_document_cache().get_all(keys);
        auto docs_without_remote_version = DocumentKeySet{};
        for (const auto& [key, doc] : remote_docs) {
            if (!doc.is_valid_document()) docs_without_remote_version.insert(key);
        }

        // Pending writes define the base state non-idempotent transforms
        // read, so replays start from the same value
        auto overlayed = local_documents_->get_overlayed_documents(remote_docs);
        auto base_mutations = std::vector<Mutation>{};
        for (const auto& mutation : mutations) {
            auto base_value = mutation.extract_transform_base_value(overlayed.at(mutation.key()).document);
            if (base_value) {
                auto mask = leaf_paths(*base_value);
                base_mutations.push_back(Mutation::patch(mutation.key(), std::move(*base_value),
                                                         std::move(mask), Precondition::exists(true)));
            }
        }

        auto batch = mutation_queue_->add_mutation_batch(local_write_time, std::move(base_mutations),
                                                         std::move(mutations));
        auto overlays = batch.apply_to_local_document_set(overlayed, docs_without_remote_version);
        overlays_->save_overlays(batch.batch_id(), overlays);

        auto result = LocalWriteResult{batch.batch_id(), {}};
        for (auto& [key, entry] : overlayed) result.changes.emplace(key, std::move(entry.document));
        return result;
    });
}

auto LocalStore::acknowledge_batch(const MutationBatchResult& batch_result) -> DocumentMap {
    return persistence_.run("Acknowledge batch", [&] {
        const auto& batch = batch_result.batch;
        auto affected = batch.keys();

        mutation_queue_->acknowledge_batch(batch, batch_result.stream_token);
        apply_batch_result(batch_result);

        overlays_->remove_overlays_for_batch_id(batch.batch_id());
        local_documents_->recalculate_and_save_overlays(keys_with_transform_results(batch_result));
        return local_documents_->get_documents(affected);
    });
}

void LocalStore::apply_batch_result(const MutationBatchResult& batch_result) {
    const auto& batch = batch_result.batch;
    auto buffer = persistence_.remote_document_cache().new_change_buffer();
    auto versions = batch_result.document_versions();

    for (const auto& key : batch.keys()) {
        auto doc = buffer.get_entry(key);
        auto ack_version = versions.find(key);
        util::hard_assert(ack_version != versions.end(), "acknowledged batch {} has no version for {}",
                          batch.batch_id(), key.to_string());

        if (doc.version() < ack_version->second) {
            batch.apply_to_remote_document(doc, batch_result.mutation_results);
            if (doc.is_valid_document()) {
                doc.set_read_time(batch_result.commit_version);
                buffer.add_entry(doc);
            }
        }
    }

    mutation_queue_->remove_mutation_batch(batch);
    buffer.apply();
}

auto LocalStore::reject_batch(BatchId batch_id) -> DocumentMap {
    return persistence_.run("Reject batch", [&] {
        auto batch = mutation_queue_->lookup_mutation_batch(batch_id);
        util::hard_assert(batch.has_value(), "attempt to reject unknown batch {}", batch_id);

        auto affected = batch->keys();
        mutation_queue_->remove_mutation_batch(*batch);
        overlays_->remove_overlays_for_batch_id(batch_id);
        local_documents_->recalculate_and_save_overlays(affected);
        return local_documents_->get_documents(affected);
    });
}

auto LocalStore::get_highest_unacknowledged_batch_id() -> BatchId {
    return persistence_.run("Get highest unacknowledged batch id",
                            [&] { return mutation_queue_->get_highest_unacknowledged_batch_id(); });
}

auto LocalStore::last_stream_token() -> ByteString {
    return persistence_.run("Get last stream token", [&] { return mutation_queue_->last_stream_token(); });
}

void LocalStore::set_last_stream_token(const ByteString& stream_token) {
    persistence_.run("Set last stream token", [&] { mutation_queue_->set_last_stream_token(stream_token); });
}

auto LocalStore::get_last_remote_snapshot_version() -> SnapshotVersion {
    return persistence_.run("Get last remote snapshot version",
                            [&] { return persistence_.target_cache().last_remote_snapshot_version(); });
}

auto LocalStore::apply_remote_event(const remote::RemoteEvent& event) -> DocumentMap {
    return persistence_.run("Apply remote event", [&] {
        auto& target_cache = persistence_.target_cache();
        auto last_remote_version = target_cache.last_remote_snapshot_version();
        auto sequence_number = persistence_.reference_delegate().current_sequence_number();

        for (const auto& [target_id, change] : event.target_changes) {
            auto old_target_data = target_data_by_target_.find(target_id);
            // Keys of inactive targets are not tracked; their target data
            // would not be written along with them
            if (old_target_data == target_data_by_target_.end()) continue;

            target_cache.remove_matching_keys(change.removed_documents, target_id);
            target_cache.add_matching_keys(change.added_documents, target_id);

            auto new_target_data = old_target_data->second.with_sequence_number(sequence_number);
            auto mismatched = event.target_mismatches.contains(target_id);
            if (mismatched) {
                new_target_data = new_target_data.with_resume_token(ByteString{}, SnapshotVersion::none())
                                      .with_last_limbo_free_snapshot_version(SnapshotVersion::none());
            } else if (!change.resume_token.empty()) {
                new_target_data = new_target_data.with_resume_token(change.resume_token, event.snapshot_version);
            }

            if (mismatched || should_persist_target_data(new_target_data, old_target_data->second, change)) {
                target_cache.update_target(new_target_data);
            }
            old_target_data->second = std::move(new_target_data);
        }

        auto buffer = persistence_.remote_document_cache().new_change_buffer();
        auto changes = populate_document_changes(buffer, event.document_updates);

        for (const auto& key : event.resolved_limbo_documents) {
            persistence_.reference_delegate().update_limbo_document(key);
        }

        if (!event.snapshot_version.is_none()) {
            util::hard_assert(event.snapshot_version >= last_remote_version,
                              "watch stream reverted to a previous snapshot ({} < {})",
                              event.snapshot_version.to_string(), last_remote_version.to_string());
            target_cache.set_last_remote_snapshot_version(event.snapshot_version);
        }

        buffer.apply();
        return local_documents_->get_local_view_of_documents(changes.changed_docs,
                                                             changes.existence_changed_keys);
    });
}

auto LocalStore::populate_document_changes(RemoteDocumentChangeBuffer& buffer,
                                           const MutableDocumentMap& documents) -> DocumentChanges {
    auto keys = DocumentKeySet{};
    for (const auto& [key, doc] : documents) keys.insert(key);
    auto existing_docs = buffer.get_entries(keys);

    auto result = DocumentChanges{};
    for (const auto& [key, doc] : documents) {
        const auto& existing = existing_docs.at(key);
        if (doc.is_found_document() != existing.is_found_document()) {
            result.existence_changed_keys.insert(key);
        }

        // Synthesized deletes at version none (rejected limbo resolutions)
        // evict the document and must never add one
        if (doc.is_no_document() && doc.version().is_none()) {
            buffer.remove_entry(key);
            result.changed_docs.insert_or_assign(key, doc);
        } else if (!existing.is_valid_document() || doc.version() > existing.version() ||
                   (doc.version() == existing.version() && existing.has_pending_writes())) {
            util::hard_assert(!doc.read_time().is_none(), "remote document {} without read time",
                              key.to_string());
            buffer.add_entry(doc);
            result.changed_docs.insert_or_assign(key, doc);
        } else {
            util::logger()->debug("local store: ignoring outdated watch update for {} (cached {}, watch {})",
                                  key.to_string(), existing.version().to_string(), doc.version().to_string());
        }
    }
    return result;
}

void LocalStore::notify_local_view_changes(const std::vector<LocalViewChanges>& view_changes) {
    persistence_.run("Notify local view changes", [&] {
        for (const auto& changes : view_changes) {
            local_view_references_.add_references(changes.added_keys, changes.target_id);
            local_view_references_.remove_references(changes.removed_keys, changes.target_id);
            for (const auto& key : changes.removed_keys) {
                persistence_.reference_delegate().remove_reference(key);
            }

            if (changes.from_cache) continue;

            auto target_data = target_data_by_target_.find(changes.target_id);
            util::hard_assert(target_data != target_data_by_target_.end(),
                              "view changes for inactive target {}", changes.target_id);
            auto last_limbo_free = target_data->second.snapshot_version;
            if (target_data->second.last_limbo_free_snapshot_version == last_limbo_free) continue;

            target_data->second = target_data->second.with_last_limbo_free_snapshot_version(last_limbo_free);
            persistence_.target_cache().update_target(target_data->second);
        }
    });
}

auto LocalStore::next_mutation_batch(BatchId after_batch_id) -> std::optional<MutationBatch> {
    return persistence_.run("Next mutation batch", [&] {
        return mutation_queue_->get_next_mutation_batch_after_batch_id(after_batch_id);
    });
}

auto LocalStore::read_document(const DocumentKey& key) -> Document {
    return persistence_.run("Read document", [&] { return local_documents_->get_document(key); });
}

auto LocalStore::get_documents(const DocumentKeySet& keys) -> DocumentMap {
    return persistence_.run("Get documents", [&] { return local_documents_->get_documents(keys); });
}

auto LocalStore::next_target_id() -> TargetId {
    // The target cache allocates even ids; odd ids belong to limbo targets
    last_target_id_ = (last_target_id_ / 2 + 1) * 2;
    return last_target_id_;
}

auto LocalStore::allocate_target(const Target& target) -> TargetData {
    auto target_data = persistence_.run("Allocate target", [&] {
        auto& target_cache = persistence_.target_cache();
        if (auto cached = target_cache.get_target(target)) return *cached;

        auto allocated = TargetData{};
        allocated.target = target;
        allocated.target_id = next_target_id();
        allocated.sequence_number = persistence_.reference_delegate().current_sequence_number();
        allocated.purpose = QueryPurpose::listen;
        target_cache.add_target(allocated);
        return allocated;
    });

    if (!target_data_by_target_.contains(target_data.target_id)) {
        target_data_by_target_.emplace(target_data.target_id, target_data);
        target_id_by_canonical_id_.emplace(target.canonical_id(), target_data.target_id);
    }
    return target_data;
}

auto LocalStore::get_target_data(const Target& target) -> std::optional<TargetData> {
    if (auto id = target_id_by_canonical_id_.find(target.canonical_id());
        id != target_id_by_canonical_id_.end()) {
        return target_data_by_target_.at(id->second);
    }
    return persistence_.run("Get target data", [&] { return persistence_.target_cache().get_target(target); });
}

void LocalStore::release_target(TargetId target_id) {
    persistence_.run("Release target", [&] {
        auto target_data = target_data_by_target_.find(target_id);
        util::hard_assert(target_data != target_data_by_target_.end(), "releasing inactive target {}",
                          target_id);

        // Watch references go with the target; view references do not
        for (const auto& key : local_view_references_.remove_references_for_id(target_id)) {
            persistence_.reference_delegate().remove_reference(key);
        }
        persistence_.reference_delegate().remove_target(target_data->second);

        target_id_by_canonical_id_.erase(target_data->second.target.canonical_id());
        target_data_by_target_.erase(target_data);
    });
}

auto LocalStore::execute_query(const Query& query, bool use_previous_results) -> QueryResult {
    auto target_data = get_target_data(query.to_target());
    return persistence_.run("Execute query", [&] {
        auto last_limbo_free = SnapshotVersion::none();
        auto remote_keys = DocumentKeySet{};
        if (target_data) {
            last_limbo_free = target_data->last_limbo_free_snapshot_version;
            remote_keys = persistence_.target_cache().get_matching_keys(target_data->target_id);
        }

        auto documents = query_engine_.get_documents_matching_query(
            query, use_previous_results ? last_limbo_free : SnapshotVersion::none(),
            use_previous_results ? remote_keys : DocumentKeySet{});
        return QueryResult{std::move(documents), std::move(remote_keys)};
    });
}

auto LocalStore::get_remote_document_keys(TargetId target_id) -> DocumentKeySet {
    return persistence_.run("Get remote document keys",
                            [&] { return persistence_.target_cache().get_matching_keys(target_id); });
}

auto LocalStore::collect_garbage(LruGarbageCollector& garbage_collector) -> LruResults {
    return persistence_.run("Collect garbage", [&] { return garbage_collector.collect(target_data_by_target_); });
}

auto LocalStore::backfill_indexes() -> std::size_t {
    return persistence_.run("Backfill indexes",
                            [&] { return index_backfiller_.write_index_entries(*local_documents_); });
}

void LocalStore::configure_field_indexes(const std::vector<FieldIndex>& indexes) {
    persistence_.run("Configure field indexes", [&] {
        auto& index_manager = persistence_.index_manager();
        auto existing = index_manager.get_field_indexes();

        for (const auto& index : existing) {
            auto kept = std::any_of(indexes.begin(), indexes.end(),
                                    [&](const FieldIndex& wanted) { return wanted.same_definition(index); });
            if (!kept) index_manager.delete_field_index(index);
        }
        for (const auto& index : indexes) {
            auto present = std::any_of(existing.begin(), existing.end(),
                                       [&](const FieldIndex& have) { return have.same_definition(index); });
            if (!present) index_manager.add_field_index(index);
        }
        util::logger()->info("local store: {} field indexes configured", indexes.size());
    });
}

auto LocalStore::has_field_indexes() -> bool {
    return persistence_.run("Has field indexes",
                            [&] { return !persistence_.index_manager().get_field_indexes().empty(); });
}

}  // namespace docsync_cpp::local

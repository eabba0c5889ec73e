#include "mutation_queue.hpp"

#include "index_manager.hpp"
#include "keys.hpp"

#include <algorithm>
#include <set>

namespace docsync_cpp::local {

namespace {

// Split the remainder of a document-mutation key into path and batch id.
auto parse_document_mutation(std::string_view remainder) -> std::pair<ResourcePath, BatchId> {
    auto pos = remainder.rfind(keys::separator);
    return {keys::decode_path(remainder.substr(0, pos)),
            static_cast<BatchId>(keys::decode_id(remainder.substr(pos + 1)))};
}

}  // namespace

MutationQueue::MutationQueue(Persistence& persistence, User user)
    : persistence_{persistence}, user_{std::move(user)} {}

void MutationQueue::start() {
    auto& t = txn();
    auto metadata = load_metadata();
    if (!t.contains(keys::mutation_queue_meta(user_.uid()))) save_metadata(metadata);

    if (!t.contains(keys::next_batch_id)) {
        // Stores written before the counter existed: continue after the
        // highest id in any queue
        auto highest = BatchId{0};
        t.scan("mq/", [&](std::string_view key, std::string_view) {
            highest = std::max(highest, static_cast<BatchId>(keys::decode_id(keys::last_component(key))));
            return true;
        });
        t.put(std::string{keys::next_batch_id}, encode_sequence_number(highest + 1));
    }

    if (is_empty()) {
        // An empty queue cannot have index rows
        auto dangling = std::vector<std::string>{};
        t.scan(keys::document_mutation_prefix(user_.uid()), [&](std::string_view key, std::string_view) {
            dangling.emplace_back(key);
            return true;
        });
        util::hard_assert(dangling.empty(), "empty mutation queue for '{}' has {} document index rows",
                          user_.uid(), dangling.size());
        // The stream token is only meaningful for outstanding batches
        metadata.last_stream_token.clear();
        save_metadata(metadata);
    }
}

auto MutationQueue::load_metadata() -> MutationQueueMetadata {
    auto bytes = txn().get(keys::mutation_queue_meta(user_.uid()));
    if (!bytes) return MutationQueueMetadata{};
    return decode_mutation_queue_metadata(*bytes);
}

void MutationQueue::save_metadata(const MutationQueueMetadata& metadata) {
    txn().put(keys::mutation_queue_meta(user_.uid()), encode_mutation_queue_metadata(metadata));
}

auto MutationQueue::is_empty() -> bool {
    auto empty = true;
    txn().scan(keys::mutation_prefix(user_.uid()), [&](std::string_view, std::string_view) {
        empty = false;
        return false;
    });
    return empty;
}

void MutationQueue::acknowledge_batch(const MutationBatch& batch, ByteString stream_token) {
    auto metadata = load_metadata();
    util::hard_assert(batch.batch_id() > metadata.last_acknowledged_batch_id,
                      "batch {} acknowledged out of order (last acknowledged {})",
                      batch.batch_id(), metadata.last_acknowledged_batch_id);
    metadata.last_acknowledged_batch_id = batch.batch_id();
    metadata.last_stream_token = std::move(stream_token);
    save_metadata(metadata);
}

void MutationQueue::set_last_stream_token(ByteString stream_token) {
    auto metadata = load_metadata();
    metadata.last_stream_token = std::move(stream_token);
    save_metadata(metadata);
}

auto MutationQueue::add_mutation_batch(SnapshotVersion local_write_time,
                                       std::vector<Mutation> base_mutations,
                                       std::vector<Mutation> mutations) -> MutationBatch {
    auto& t = txn();
    auto next = t.get(keys::next_batch_id);
    util::hard_assert(next.has_value(), "mutation queue used before start()");
    auto batch_id = static_cast<BatchId>(decode_sequence_number(*next));
    t.put(std::string{keys::next_batch_id}, encode_sequence_number(batch_id + 1));

    auto batch = MutationBatch{batch_id, local_write_time, std::move(base_mutations), std::move(mutations)};
    t.put(keys::mutation(user_.uid(), batch_id), encode_mutation_batch(batch));
    for (const auto& key : batch.keys()) {
        t.put(keys::document_mutation(user_.uid(), key, batch_id), std::string{});
        persistence_.index_manager().add_to_collection_parent_index(key.collection_path());
    }
    util::logger()->debug("queued batch {} with {} mutations", batch_id, batch.mutations().size());
    return batch;
}

auto MutationQueue::lookup_mutation_batch(BatchId batch_id) -> std::optional<MutationBatch> {
    auto bytes = txn().get(keys::mutation(user_.uid(), batch_id));
    if (!bytes) return std::nullopt;
    return decode_mutation_batch(*bytes);
}

auto MutationQueue::get_next_mutation_batch_after_batch_id(BatchId batch_id)
    -> std::optional<MutationBatch> {
    auto next_id = std::max(batch_id, load_metadata().last_acknowledged_batch_id) + 1;
    auto result = std::optional<MutationBatch>{};
    txn().scan(keys::mutation_prefix(user_.uid()), [&](std::string_view, std::string_view value) {
        result = decode_mutation_batch(value);
        return false;
    }, keys::mutation(user_.uid(), next_id));
    return result;
}

auto MutationQueue::get_highest_unacknowledged_batch_id() -> BatchId {
    auto highest = unknown_batch_id;
    txn().scan(keys::mutation_prefix(user_.uid()), [&](std::string_view key, std::string_view) {
        highest = static_cast<BatchId>(keys::decode_id(keys::last_component(key)));
        return true;
    });
    return highest;
}

auto MutationQueue::get_all_mutation_batches() -> std::vector<MutationBatch> {
    auto result = std::vector<MutationBatch>{};
    txn().scan(keys::mutation_prefix(user_.uid()), [&](std::string_view, std::string_view value) {
        result.push_back(decode_mutation_batch(value));
        return true;
    });
    return result;
}

auto MutationQueue::load_batches(const std::set<BatchId>& batch_ids) -> std::vector<MutationBatch> {
    auto result = std::vector<MutationBatch>{};
    result.reserve(batch_ids.size());
    for (auto batch_id : batch_ids) {
        auto batch = lookup_mutation_batch(batch_id);
        util::hard_assert(batch.has_value(), "document index names missing batch {}", batch_id);
        result.push_back(std::move(*batch));
    }
    return result;
}

auto MutationQueue::get_all_mutation_batches_affecting_document_key(const DocumentKey& key)
    -> std::vector<MutationBatch> {
    return get_all_mutation_batches_affecting_document_keys(DocumentKeySet{key});
}

auto MutationQueue::get_all_mutation_batches_affecting_document_keys(const DocumentKeySet& doc_keys)
    -> std::vector<MutationBatch> {
    auto batch_ids = std::set<BatchId>{};
    for (const auto& key : doc_keys) {
        txn().scan(keys::document_mutation_prefix(user_.uid(), key),
                   [&](std::string_view row, std::string_view) {
                       batch_ids.insert(static_cast<BatchId>(keys::decode_id(keys::last_component(row))));
                       return true;
                   });
    }
    return load_batches(batch_ids);
}

auto MutationQueue::get_all_mutation_batches_affecting_query(const Query& query)
    -> std::vector<MutationBatch> {
    util::hard_assert(!query.is_collection_group_query(),
                      "collection group queries are resolved per collection");
    const auto& path = query.path();
    auto prefix = keys::document_mutation_prefix(user_.uid(), path);
    auto user_prefix_size = keys::document_mutation_prefix(user_.uid()).size();
    auto batch_ids = std::set<BatchId>{};
    txn().scan(prefix, [&](std::string_view row, std::string_view) {
        auto [doc_path, batch_id] = parse_document_mutation(row.substr(user_prefix_size));
        // Only documents directly in the collection; deeper paths belong
        // to subcollections
        if (doc_path.size() == path.size() + 1) batch_ids.insert(batch_id);
        return true;
    });
    return load_batches(batch_ids);
}

void MutationQueue::remove_mutation_batch(const MutationBatch& batch) {
    auto& t = txn();
    auto oldest = std::optional<BatchId>{};
    t.scan(keys::mutation_prefix(user_.uid()), [&](std::string_view key, std::string_view) {
        oldest = static_cast<BatchId>(keys::decode_id(keys::last_component(key)));
        return false;
    });
    util::hard_assert(oldest && *oldest == batch.batch_id(),
                      "can only remove the oldest batch: removing {}, oldest is {}",
                      batch.batch_id(), oldest ? *oldest : unknown_batch_id);

    t.erase(keys::mutation(user_.uid(), batch.batch_id()));
    for (const auto& key : batch.keys()) {
        t.erase(keys::document_mutation(user_.uid(), key, batch.batch_id()));
        persistence_.reference_delegate().remove_mutation_reference(key);
    }
}

auto MutationQueue::any_queue_contains_key(Transaction& txn, const DocumentKey& key) -> bool {
    auto uids = std::vector<std::string>{};
    txn.scan(keys::mutation_queue_meta_prefix, [&](std::string_view row, std::string_view) {
        uids.push_back(keys::unescape(row.substr(keys::mutation_queue_meta_prefix.size())));
        return true;
    });
    for (const auto& uid : uids) {
        auto found = false;
        txn.scan(keys::document_mutation_prefix(uid, key), [&](std::string_view, std::string_view) {
            found = true;
            return false;
        });
        if (found) return true;
    }
    return false;
}

}  // namespace docsync_cpp::local

#pragma once

// Per-user queue of pending mutation batches.
//
// Batches are stored by id with a document → batch index so the batches
// affecting a key, a key set or a collection are found without decoding
// the whole queue. Batch ids are global and never reused.
//
// Internal header — not installed.

#include "local_serializer.hpp"
#include "persistence.hpp"

#include <docsync-cpp/credentials.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/query.hpp>

#include <optional>
#include <set>
#include <vector>

namespace docsync_cpp::local {

class MutationQueue {
public:
    MutationQueue(Persistence& persistence, User user);

    // Load the queue metadata. Must run in a transaction.
    void start();

    auto user() const -> const User& { return user_; }

    auto is_empty() -> bool;

    // Record that `batch` was acknowledged with `stream_token`.
    void acknowledge_batch(const MutationBatch& batch, ByteString stream_token);

    auto last_stream_token() -> ByteString { return load_metadata().last_stream_token; }
    void set_last_stream_token(ByteString stream_token);

    auto add_mutation_batch(SnapshotVersion local_write_time, std::vector<Mutation> base_mutations,
                            std::vector<Mutation> mutations) -> MutationBatch;

    auto lookup_mutation_batch(BatchId batch_id) -> std::optional<MutationBatch>;

    // The first batch after `batch_id` that was not acknowledged yet.
    auto get_next_mutation_batch_after_batch_id(BatchId batch_id) -> std::optional<MutationBatch>;

    // The id of the newest batch, or unknown_batch_id if empty.
    auto get_highest_unacknowledged_batch_id() -> BatchId;

    auto get_all_mutation_batches() -> std::vector<MutationBatch>;

    // Batches in id order, each at most once.
    auto get_all_mutation_batches_affecting_document_key(const DocumentKey& key)
        -> std::vector<MutationBatch>;
    auto get_all_mutation_batches_affecting_document_keys(const DocumentKeySet& keys)
        -> std::vector<MutationBatch>;

    // Batches touching documents directly in the query's collection. Not
    // valid for collection-group queries.
    auto get_all_mutation_batches_affecting_query(const Query& query) -> std::vector<MutationBatch>;

    // Remove the oldest batch. Removing any other batch is fatal.
    void remove_mutation_batch(const MutationBatch& batch);

    // True if any user's queue has a batch writing `key`.
    static auto any_queue_contains_key(Transaction& txn, const DocumentKey& key) -> bool;

private:
    auto txn() -> Transaction& { return persistence_.current_transaction(); }
    auto load_metadata() -> MutationQueueMetadata;
    void save_metadata(const MutationQueueMetadata& metadata);
    auto load_batches(const std::set<BatchId>& batch_ids) -> std::vector<MutationBatch>;

    Persistence& persistence_;
    User user_;
};

}  // namespace docsync_cpp::local

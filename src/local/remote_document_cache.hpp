#pragma once

// The last confirmed version of every cached document, stamped with the
// snapshot version it was read at.
//
// Internal header — not installed.

#include "persistence.hpp"

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/index.hpp>
#include <docsync-cpp/query.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace docsync_cpp::local {

class IndexManager;

// Statistics collected while answering one query.
struct QueryContext {
    std::size_t documents_read_count{0};
};

class RemoteDocumentChangeBuffer;

class RemoteDocumentCache {
public:
    // Scans of at least this many documents decode on the Taskflow executor.
    static constexpr std::size_t parallel_decode_threshold = 256;

    RemoteDocumentCache(Persistence& persistence, IndexManager& index_manager);

    // Store `doc` read at `read_time` and record its collection parent.
    void add(const MutableDocument& doc, SnapshotVersion read_time);
    void remove(const DocumentKey& key);

    // The cached document, or an invalid document.
    auto get(const DocumentKey& key) -> MutableDocument;
    auto get_all(const DocumentKeySet& keys) -> MutableDocumentMap;

    // Documents directly in the query's collection that were read after
    // `offset` (or have pending writes) and that match the query or have
    // pending writes. Not valid for collection-group queries.
    auto get_documents_matching_query(const Query& query, const IndexOffset& offset,
                                      const DocumentKeySet& mutated_keys,
                                      QueryContext* context = nullptr) -> MutableDocumentMap;

    // At most `limit` documents of `collection_group` read after `offset`,
    // the earliest read first.
    auto get_all_from_collection_group(const std::string& collection_group,
                                       const IndexOffset& offset, std::size_t limit)
        -> MutableDocumentMap;

    // Approximate bytes held by cached documents.
    auto get_size() -> std::int64_t;

    auto new_change_buffer() -> RemoteDocumentChangeBuffer;

private:
    auto txn() -> Transaction& { return persistence_.current_transaction(); }

    // Decode the documents directly in `collection` read after `offset`.
    auto scan_collection(const ResourcePath& collection, const IndexOffset& offset,
                         const DocumentKeySet& mutated_keys, QueryContext* context)
        -> std::vector<MutableDocument>;

    Persistence& persistence_;
    IndexManager& index_manager_;
};

// Stages cache writes made while applying one remote event or
// acknowledgement. Reads through the buffer see the staged writes.
class RemoteDocumentChangeBuffer {
public:
    explicit RemoteDocumentChangeBuffer(RemoteDocumentCache& cache) : cache_{cache} {}

    // Stage `doc`, which must carry its read time.
    void add_entry(const MutableDocument& doc);

    // Stage the removal of `key`.
    void remove_entry(const DocumentKey& key);

    auto get_entry(const DocumentKey& key) -> MutableDocument;
    auto get_entries(const DocumentKeySet& keys) -> MutableDocumentMap;

    // Write every staged change into the surrounding transaction.
    void apply();

private:
    RemoteDocumentCache& cache_;
    std::map<DocumentKey, MutableDocument> changes_;
    bool applied_{false};
};

}  // namespace docsync_cpp::local

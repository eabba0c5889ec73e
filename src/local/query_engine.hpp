#pragma once

// Runs queries against the local cache, scanning as little as possible.
//
// Execution order:
//   1. a field index, when one applies to the query's target;
//   2. the target's previous results plus every document changed since the
//      last snapshot without limbo documents;
//   3. a full scan of the collection.
// Paths 1 and 2 fall through when they cannot guarantee a complete result.
//
// Internal header — not installed.

#include "index_manager.hpp"
#include "local_documents_view.hpp"
#include "remote_document_cache.hpp"

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/snapshot.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace docsync_cpp::local {

// Decides when a scanned query earns an automatically created index.
class IndexingPolicy {
public:
    virtual ~IndexingPolicy() = default;

    virtual auto should_create_index(const Query& query, std::int64_t documents_read,
                                     std::size_t result_count) const -> bool = 0;
};

// Index once a scan reads at least `min_documents_read` documents and more
// than `max_read_ratio` documents per result.
class DefaultIndexingPolicy : public IndexingPolicy {
public:
    static constexpr std::int64_t default_min_documents_read = 100;
    static constexpr double default_max_read_ratio = 2.0;

    DefaultIndexingPolicy() = default;
    DefaultIndexingPolicy(std::int64_t min_documents_read, double max_read_ratio)
        : min_documents_read_{min_documents_read}, max_read_ratio_{max_read_ratio} {}

    auto should_create_index(const Query& query, std::int64_t documents_read,
                             std::size_t result_count) const -> bool override;

private:
    std::int64_t min_documents_read_{default_min_documents_read};
    double max_read_ratio_{default_max_read_ratio};
};

class QueryEngine {
public:
    QueryEngine();

    // Must be called before the first query and after every user change.
    void initialize(LocalDocumentsView* local_documents, IndexManager* index_manager);

    void set_index_auto_creation_enabled(bool enabled) { index_auto_creation_enabled_ = enabled; }
    void set_indexing_policy(std::unique_ptr<IndexingPolicy> policy) { policy_ = std::move(policy); }

    // Runs inside a persistence transaction. `remote_keys` are the target's
    // keys as of `last_limbo_free_snapshot_version`; pass none to skip the
    // previous-results path.
    auto get_documents_matching_query(const Query& query,
                                      SnapshotVersion last_limbo_free_snapshot_version,
                                      const DocumentKeySet& remote_keys) -> DocumentMap;

private:
    auto perform_query_using_index(const Query& query) -> std::optional<DocumentMap>;
    auto perform_query_using_remote_keys(const Query& query, const DocumentKeySet& remote_keys,
                                         SnapshotVersion last_limbo_free_snapshot_version)
        -> std::optional<DocumentMap>;
    auto execute_full_collection_scan(const Query& query, QueryContext& context) -> DocumentMap;
    auto append_remaining_results(const DocumentSet& indexed_results, const Query& query,
                                  const IndexOffset& offset) -> DocumentMap;
    void create_cache_indexes(const Query& query, const QueryContext& context, std::size_t result_count);

    LocalDocumentsView* local_documents_{nullptr};
    IndexManager* index_manager_{nullptr};
    std::unique_ptr<IndexingPolicy> policy_;
    bool index_auto_creation_enabled_{false};
};

}  // namespace docsync_cpp::local

#include "query_engine.hpp"

#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

namespace docsync_cpp::local {

namespace {

// The documents of `documents` that match `query`, in query order.
auto apply_query(const Query& query, const DocumentMap& documents) -> DocumentSet {
    auto results = DocumentSet{query};
    for (const auto& [key, doc] : documents) {
        if (doc.is_found_document() && query.matches(doc)) results.insert(doc);
    }
    return results;
}

// True if a limit query's previous results cannot be trusted: a document
// left the result, or the document at the limit edge changed after the
// results were computed.
auto needs_refill(const Query& query, const DocumentSet& sorted_previous_results,
                  const DocumentKeySet& remote_keys, SnapshotVersion limbo_free_snapshot_version)
    -> bool {
    if (!query.has_limit()) return false;
    if (remote_keys.size() != sorted_previous_results.size()) return true;
    if (sorted_previous_results.empty()) return false;

    const auto& edge = query.limit_type() == LimitType::first ? sorted_previous_results.last()
                                                              : sorted_previous_results.first();
    return edge.has_pending_writes() || edge.version() > limbo_free_snapshot_version;
}

}  // namespace

auto DefaultIndexingPolicy::should_create_index(const Query&, std::int64_t documents_read,
                                                std::size_t result_count) const -> bool {
    if (documents_read < min_documents_read_) return false;
    return static_cast<double>(documents_read) > max_read_ratio_ * static_cast<double>(result_count);
}

QueryEngine::QueryEngine() : policy_{std::make_unique<DefaultIndexingPolicy>()} {}

void QueryEngine::initialize(LocalDocumentsView* local_documents, IndexManager* index_manager) {
    local_documents_ = local_documents;
    index_manager_ = index_manager;
}

auto QueryEngine::get_documents_matching_query(const Query& query,
                                               SnapshotVersion last_limbo_free_snapshot_version,
                                               const DocumentKeySet& remote_keys) -> DocumentMap {
    util::hard_assert(local_documents_ && index_manager_, "query engine used before initialize");

    if (auto result = perform_query_using_index(query)) return std::move(*result);

    if (auto result = perform_query_using_remote_keys(query, remote_keys, last_limbo_free_snapshot_version)) {
        return std::move(*result);
    }

    auto context = QueryContext{};
    auto results = execute_full_collection_scan(query, context);
    if (index_auto_creation_enabled_) create_cache_indexes(query, context, results.size());
    return results;
}

auto QueryEngine::perform_query_using_index(const Query& query) -> std::optional<DocumentMap> {
    // Key lookups cannot beat a scan when every document matches
    if (query.matches_all_documents()) return std::nullopt;

    auto target = query.to_target();
    auto index_type = index_manager_->get_index_type(target);
    if (index_type == IndexType::none) return std::nullopt;

    if (query.has_limit() && index_type == IndexType::partial) {
        // The index cannot order or cut the results; the view applies the limit
        return perform_query_using_index(query.without_limit());
    }

    auto keys = index_manager_->get_documents_matching_target(target);
    if (!keys) return std::nullopt;

    auto indexed_documents = local_documents_->get_documents(DocumentKeySet{keys->begin(), keys->end()});
    auto offset = index_manager_->get_min_offset(target);
    auto previous_results = apply_query(query, indexed_documents);

    if (needs_refill(query, previous_results, DocumentKeySet{keys->begin(), keys->end()},
                     offset.read_time)) {
        return perform_query_using_index(query.without_limit());
    }

    util::logger()->debug("query engine: index lookup for {} returned {} of {} candidates",
                          query.canonical_id(), previous_results.size(), keys->size());
    return append_remaining_results(previous_results, query, offset);
}

auto QueryEngine::perform_query_using_remote_keys(const Query& query, const DocumentKeySet& remote_keys,
                                                  SnapshotVersion last_limbo_free_snapshot_version)
    -> std::optional<DocumentMap> {
    if (query.matches_all_documents()) return std::nullopt;

    // Without a limbo-free snapshot the previous results may be incomplete
    if (last_limbo_free_snapshot_version.is_none()) return std::nullopt;

    auto documents = local_documents_->get_documents(remote_keys);
    auto previous_results = apply_query(query, documents);

    if (needs_refill(query, previous_results, remote_keys, last_limbo_free_snapshot_version)) {
        return std::nullopt;
    }

    util::logger()->debug("query engine: re-using previous results for {} from {}",
                          query.canonical_id(), last_limbo_free_snapshot_version.to_string());
    return append_remaining_results(previous_results, query,
                                    IndexOffset::create_successor(last_limbo_free_snapshot_version,
                                                                  unknown_batch_id));
}

auto QueryEngine::execute_full_collection_scan(const Query& query, QueryContext& context) -> DocumentMap {
    util::logger()->debug("query engine: full collection scan for {}", query.canonical_id());
    return local_documents_->get_documents_matching_query(query, IndexOffset::none(), &context);
}

auto QueryEngine::append_remaining_results(const DocumentSet& indexed_results, const Query& query,
                                           const IndexOffset& offset) -> DocumentMap {
    // Documents changed since the offset may now match, or no longer match
    auto remaining = local_documents_->get_documents_matching_query(query, offset);
    for (const auto& doc : indexed_results) remaining.emplace(doc.key(), doc);
    return remaining;
}

void QueryEngine::create_cache_indexes(const Query& query, const QueryContext& context,
                                       std::size_t result_count) {
    auto documents_read = static_cast<std::int64_t>(context.documents_read_count);
    if (!policy_->should_create_index(query, documents_read, result_count)) return;

    util::logger()->info("query engine: creating cache index for {} ({} documents read, {} results)",
                         query.canonical_id(), documents_read, result_count);
    index_manager_->create_target_indexes(query.to_target());
}

}  // namespace docsync_cpp::local

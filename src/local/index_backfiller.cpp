#include "index_backfiller.hpp"

#include "../util/log.hpp"

#include <algorithm>
#include <set>

namespace docsync_cpp::local {

namespace {

// The offset after every document in `result`, never behind `existing`.
auto new_offset(const IndexOffset& existing, const LocalDocumentsResult& result) -> IndexOffset {
    auto max_offset = existing;
    for (const auto& [key, doc] : result.documents) {
        auto offset = IndexOffset::from_document(doc);
        if (offset > max_offset) max_offset = offset;
    }
    return IndexOffset{max_offset.read_time, max_offset.document_key,
                       std::max(result.batch_id, existing.largest_batch_id)};
}

}  // namespace

auto IndexBackfiller::write_index_entries(LocalDocumentsView& local_documents) -> std::size_t {
    auto processed = std::set<std::string>{};
    auto documents_remaining = max_documents_to_process_;

    while (documents_remaining > 0) {
        auto collection_group = index_manager_.get_next_collection_group_to_update();
        if (!collection_group || processed.contains(*collection_group)) break;

        auto written = write_entries_for_collection_group(local_documents, *collection_group,
                                                          documents_remaining);
        documents_remaining -= std::min(written, documents_remaining);
        processed.insert(*collection_group);
    }

    auto total = max_documents_to_process_ - documents_remaining;
    if (total > 0) util::logger()->debug("index backfiller: indexed {} documents", total);
    return total;
}

auto IndexBackfiller::write_entries_for_collection_group(LocalDocumentsView& local_documents,
                                                         const std::string& collection_group,
                                                         std::size_t documents_remaining) -> std::size_t {
    auto existing_offset = index_manager_.get_min_offset(collection_group);
    auto next = local_documents.get_next_documents(collection_group, existing_offset, documents_remaining);
    index_manager_.update_index_entries(next.documents);
    // Advancing the group also makes it the most recently backfilled
    index_manager_.update_collection_group(collection_group, new_offset(existing_offset, next));
    return next.documents.size();
}

}  // namespace docsync_cpp::local

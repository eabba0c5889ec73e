#pragma once

// Incrementally brings field indexes up to date with the cache.
//
// Each run walks collection groups that have field indexes, least
// recently backfilled first, indexes the documents changed after each
// group's offset and advances the offset.
//
// Internal header — not installed.

#include "index_manager.hpp"
#include "local_documents_view.hpp"

#include <docsync-cpp/index.hpp>

#include <cstddef>
#include <string>

namespace docsync_cpp::local {

class IndexBackfiller {
public:
    static constexpr std::size_t default_max_documents_to_process = 50;

    explicit IndexBackfiller(IndexManager& index_manager,
                             std::size_t max_documents_to_process = default_max_documents_to_process)
        : index_manager_{index_manager}, max_documents_to_process_{max_documents_to_process} {}

    // Index up to the configured number of documents. Runs inside a
    // persistence transaction. Returns the number of documents processed.
    auto write_index_entries(LocalDocumentsView& local_documents) -> std::size_t;

    auto max_documents_to_process() const -> std::size_t { return max_documents_to_process_; }

private:
    auto write_entries_for_collection_group(LocalDocumentsView& local_documents,
                                            const std::string& collection_group,
                                            std::size_t documents_remaining) -> std::size_t;

    IndexManager& index_manager_;
    std::size_t max_documents_to_process_;
};

}  // namespace docsync_cpp::local

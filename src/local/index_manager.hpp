#pragma once

// Cache indexes: the collection-parent index that resolves
// collection-group queries, and field indexes that answer equality (`==`,
// `in`) filters without scanning a collection.
//
// Field index entries are keyed by the canonical ids of the indexed field
// values, so a lookup on any prefix of an index's fields is a key-prefix
// scan. Documents that lack an indexed field are not indexed.
//
// Internal header — not installed.

#include "persistence.hpp"

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/index.hpp>
#include <docsync-cpp/query.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsync_cpp::local {

enum class IndexType : std::uint8_t {
    none,     // No index applies.
    partial,  // An index narrows the candidates; other filters still apply.
    full,     // An index answers every filter of the target.
};

auto to_string_view(IndexType type) noexcept -> std::string_view;

class IndexManager {
public:
    explicit IndexManager(Persistence& persistence);

    // Record that documents exist under `collection_path`.
    void add_to_collection_parent_index(const ResourcePath& collection_path);

    // Every parent path of a collection named `collection_id`.
    auto get_collection_parents(const std::string& collection_id) -> std::vector<ResourcePath>;

    // Store `index` under a fresh id and return it.
    auto add_field_index(FieldIndex index) -> FieldIndex;
    void delete_field_index(const FieldIndex& index);
    void delete_all_field_indexes();

    auto get_field_indexes() -> std::vector<FieldIndex>;
    auto get_field_indexes(const std::string& collection_group) -> std::vector<FieldIndex>;

    auto get_index_type(const Target& target) -> IndexType;

    // Candidate keys for `target` from its best index, or nullopt if no
    // index applies. Candidates must be re-checked against the query.
    auto get_documents_matching_target(const Target& target) -> std::optional<std::vector<DocumentKey>>;

    // Bring the entries of every index over each document's group up to
    // date.
    void update_index_entries(const DocumentMap& documents);

    // Documents after the returned offset are not yet in the target's index.
    auto get_min_offset(const Target& target) -> IndexOffset;
    auto get_min_offset(const std::string& collection_group) -> IndexOffset;

    // Advance every index of `collection_group` to `offset`.
    void update_collection_group(const std::string& collection_group, const IndexOffset& offset);

    // The group whose indexes were backfilled least recently.
    auto get_next_collection_group_to_update() -> std::optional<std::string>;

    // Create an index serving the target's equality filters, if none exists.
    void create_target_indexes(const Target& target);

private:
    struct IndexMatch {
        FieldIndex index;
        std::size_t matched_fields{0};
    };

    auto txn() -> Transaction& { return persistence_.current_transaction(); }
    auto best_index(const Target& target) -> std::optional<IndexMatch>;
    void save_index(const FieldIndex& index);
    void delete_entries(std::int32_t index_id);

    Persistence& persistence_;
};

}  // namespace docsync_cpp::local

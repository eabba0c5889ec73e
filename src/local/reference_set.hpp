#pragma once

// In-memory (key, id) references: documents pinned by views (id = target
// id) and by pending writes. Lookups by key and by id.
//
// Internal header — not installed.

#include <docsync-cpp/types.hpp>

#include <cstdint>
#include <set>
#include <utility>

namespace docsync_cpp::local {

class ReferenceSet {
public:
    auto empty() const -> bool { return by_key_.empty(); }

    void add_reference(const DocumentKey& key, std::int32_t id);
    void add_references(const DocumentKeySet& keys, std::int32_t id);

    void remove_reference(const DocumentKey& key, std::int32_t id);
    void remove_references(const DocumentKeySet& keys, std::int32_t id);

    // Remove every reference with `id` and return their keys.
    auto remove_references_for_id(std::int32_t id) -> DocumentKeySet;

    void remove_all_references();

    auto references_for_id(std::int32_t id) const -> DocumentKeySet;
    auto contains_key(const DocumentKey& key) const -> bool;

private:
    std::set<std::pair<DocumentKey, std::int32_t>> by_key_;
    std::set<std::pair<std::int32_t, DocumentKey>> by_id_;
};

}  // namespace docsync_cpp::local

#include "reference_set.hpp"

#include <limits>

namespace docsync_cpp::local {

void ReferenceSet::add_reference(const DocumentKey& key, std::int32_t id) {
    by_key_.emplace(key, id);
    by_id_.emplace(id, key);
}

void ReferenceSet::add_references(const DocumentKeySet& keys, std::int32_t id) {
    for (const auto& key : keys) add_reference(key, id);
}

void ReferenceSet::remove_reference(const DocumentKey& key, std::int32_t id) {
    by_key_.erase({key, id});
    by_id_.erase({id, key});
}

void ReferenceSet::remove_references(const DocumentKeySet& keys, std::int32_t id) {
    for (const auto& key : keys) remove_reference(key, id);
}

auto ReferenceSet::remove_references_for_id(std::int32_t id) -> DocumentKeySet {
    auto keys = references_for_id(id);
    for (const auto& key : keys) remove_reference(key, id);
    return keys;
}

void ReferenceSet::remove_all_references() {
    by_key_.clear();
    by_id_.clear();
}

auto ReferenceSet::references_for_id(std::int32_t id) const -> DocumentKeySet {
    auto result = DocumentKeySet{};
    for (auto it = by_id_.lower_bound({id, DocumentKey::empty()}); it != by_id_.end() && it->first == id; ++it) {
        result.insert(it->second);
    }
    return result;
}

auto ReferenceSet::contains_key(const DocumentKey& key) const -> bool {
    auto it = by_key_.lower_bound({key, std::numeric_limits<std::int32_t>::min()});
    return it != by_key_.end() && it->first == key;
}

}  // namespace docsync_cpp::local

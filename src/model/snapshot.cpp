#include <docsync-cpp/snapshot.hpp>

#include <algorithm>

namespace docsync_cpp {

auto to_string_view(OnlineState state) noexcept -> std::string_view {
    switch (state) {
        case OnlineState::unknown: return "unknown";
        case OnlineState::online:  return "online";
        case OnlineState::offline: return "offline";
    }
    return "?";
}

auto to_string_view(DocumentViewChange::Type type) noexcept -> std::string_view {
    switch (type) {
        case DocumentViewChange::Type::added:    return "added";
        case DocumentViewChange::Type::removed:  return "removed";
        case DocumentViewChange::Type::modified: return "modified";
        case DocumentViewChange::Type::metadata: return "metadata";
    }
    return "?";
}

// -- DocumentSet --------------------------------------------------------------

auto DocumentSet::Comparator::operator()(const Document& lhs, const Document& rhs) const -> bool {
    if (query) {
        auto c = query->compare(lhs, rhs);
        if (c != 0) return c < 0;
    }
    return lhs.key() < rhs.key();
}

DocumentSet::DocumentSet() : sorted_{Comparator{nullptr}} {}

DocumentSet::DocumentSet(const Query& query)
    : sorted_{Comparator{std::make_shared<const Query>(query)}} {}

auto DocumentSet::get(const DocumentKey& key) const -> const Document* {
    auto it = by_key_.find(key);
    return it == by_key_.end() ? nullptr : &it->second;
}

auto DocumentSet::index_of(const DocumentKey& key) const -> std::ptrdiff_t {
    auto it = by_key_.find(key);
    if (it == by_key_.end()) return -1;
    return std::distance(sorted_.begin(), sorted_.find(it->second));
}

void DocumentSet::insert(const Document& doc) {
    erase(doc.key());
    by_key_.emplace(doc.key(), doc);
    sorted_.insert(doc);
}

void DocumentSet::erase(const DocumentKey& key) {
    auto it = by_key_.find(key);
    if (it == by_key_.end()) return;
    sorted_.erase(it->second);
    by_key_.erase(it);
}

auto DocumentSet::operator==(const DocumentSet& other) const -> bool {
    return size() == other.size() && std::equal(begin(), end(), other.begin());
}

// -- ViewSnapshot -------------------------------------------------------------

auto ViewSnapshot::from_initial_documents(Query query, const DocumentSet& documents,
                                          DocumentKeySet mutated_keys, bool from_cache,
                                          bool excludes_metadata_changes,
                                          bool has_cached_results) -> ViewSnapshot {
    auto changes = std::vector<DocumentViewChange>{};
    for (const auto& doc : documents) {
        changes.push_back(DocumentViewChange{DocumentViewChange::Type::added, doc});
    }
    auto empty = DocumentSet{query};
    return ViewSnapshot{
        .query = std::move(query),
        .documents = documents,
        .old_documents = std::move(empty),
        .document_changes = std::move(changes),
        .mutated_keys = std::move(mutated_keys),
        .from_cache = from_cache,
        .sync_state_changed = true,
        .excludes_metadata_changes = excludes_metadata_changes,
        .has_cached_results = has_cached_results,
    };
}

}  // namespace docsync_cpp

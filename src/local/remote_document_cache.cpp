#include "remote_document_cache.hpp"

#include "index_manager.hpp"
#include "keys.hpp"
#include "local_serializer.hpp"
#include "../util/executor.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

namespace docsync_cpp::local {

namespace {

// True if `doc` sorts after `offset` by read time, then key.
auto is_after(const IndexOffset& offset, const MutableDocument& doc) -> bool {
    if (offset.read_time != doc.read_time()) return offset.read_time < doc.read_time();
    return offset.document_key < doc.key();
}

auto read_order(const MutableDocument& a, const MutableDocument& b) -> bool {
    if (a.read_time() != b.read_time()) return a.read_time() < b.read_time();
    return a.key() < b.key();
}

}  // namespace

RemoteDocumentCache::RemoteDocumentCache(Persistence& persistence, IndexManager& index_manager)
    : persistence_{persistence}, index_manager_{index_manager} {}

void RemoteDocumentCache::add(const MutableDocument& doc, SnapshotVersion read_time) {
    util::hard_assert(!read_time.is_none(), "cannot add {} with an unset read time",
                      doc.key().to_string());
    auto stamped = doc;
    stamped.set_read_time(read_time);
    txn().put(keys::remote_document(doc.key()), encode_document(stamped));
    index_manager_.add_to_collection_parent_index(doc.key().collection_path());
}

void RemoteDocumentCache::remove(const DocumentKey& key) {
    txn().erase(keys::remote_document(key));
}

auto RemoteDocumentCache::get(const DocumentKey& key) -> MutableDocument {
    auto bytes = txn().get(keys::remote_document(key));
    if (!bytes) return MutableDocument::invalid(key);
    return decode_document(*bytes);
}

auto RemoteDocumentCache::get_all(const DocumentKeySet& doc_keys) -> MutableDocumentMap {
    auto result = MutableDocumentMap{};
    for (const auto& key : doc_keys) result.emplace(key, get(key));
    return result;
}

auto RemoteDocumentCache::scan_collection(const ResourcePath& collection, const IndexOffset& offset,
                                          const DocumentKeySet& mutated_keys, QueryContext* context)
    -> std::vector<MutableDocument> {
    auto prefix = keys::remote_document_prefix(collection);
    auto rows = std::vector<std::string>{};
    txn().scan(prefix, [&](std::string_view key, std::string_view value) {
        // Skip documents in subcollections: exactly one more path segment
        auto rest = key.substr(prefix.size());
        if (std::count(rest.begin(), rest.end(), keys::segment_end) == 1) rows.emplace_back(value);
        return true;
    });
    if (context) context->documents_read_count += rows.size();

    auto docs = std::vector<MutableDocument>(rows.size());
    if (rows.size() >= parallel_decode_threshold) {
        util::parallel_for(rows.size(), [&](std::size_t i) { docs[i] = decode_document(rows[i]); });
    } else {
        for (std::size_t i = 0; i < rows.size(); ++i) docs[i] = decode_document(rows[i]);
    }

    std::erase_if(docs, [&](const MutableDocument& doc) {
        return !is_after(offset, doc) && !mutated_keys.contains(doc.key());
    });
    return docs;
}

auto RemoteDocumentCache::get_documents_matching_query(const Query& query, const IndexOffset& offset,
                                                       const DocumentKeySet& mutated_keys,
                                                       QueryContext* context) -> MutableDocumentMap {
    util::hard_assert(!query.is_collection_group_query(),
                      "collection group queries are resolved per collection");
    auto result = MutableDocumentMap{};
    for (auto& doc : scan_collection(query.path(), offset, mutated_keys, context)) {
        if (!doc.is_found_document()) continue;
        if (!query.matches(doc) && !mutated_keys.contains(doc.key())) continue;
        result.emplace(doc.key(), std::move(doc));
    }
    return result;
}

auto RemoteDocumentCache::get_all_from_collection_group(const std::string& collection_group,
                                                        const IndexOffset& offset, std::size_t limit)
    -> MutableDocumentMap {
    auto candidates = std::vector<MutableDocument>{};
    for (const auto& parent : index_manager_.get_collection_parents(collection_group)) {
        auto docs = scan_collection(parent.child(collection_group), offset, {}, nullptr);
        std::move(docs.begin(), docs.end(), std::back_inserter(candidates));
    }
    std::sort(candidates.begin(), candidates.end(), read_order);
    if (candidates.size() > limit) candidates.resize(limit);

    auto result = MutableDocumentMap{};
    for (auto& doc : candidates) result.emplace(doc.key(), std::move(doc));
    return result;
}

auto RemoteDocumentCache::get_size() -> std::int64_t {
    auto size = std::int64_t{0};
    txn().scan("rd/", [&](std::string_view key, std::string_view value) {
        size += static_cast<std::int64_t>(key.size() + value.size());
        return true;
    });
    return size;
}

auto RemoteDocumentCache::new_change_buffer() -> RemoteDocumentChangeBuffer {
    return RemoteDocumentChangeBuffer{*this};
}

// -- RemoteDocumentChangeBuffer -----------------------------------------------

void RemoteDocumentChangeBuffer::add_entry(const MutableDocument& doc) {
    util::hard_assert(!applied_, "change buffer reused after apply");
    changes_.insert_or_assign(doc.key(), doc);
}

void RemoteDocumentChangeBuffer::remove_entry(const DocumentKey& key) {
    util::hard_assert(!applied_, "change buffer reused after apply");
    changes_.insert_or_assign(key, MutableDocument::invalid(key));
}

auto RemoteDocumentChangeBuffer::get_entry(const DocumentKey& key) -> MutableDocument {
    if (auto it = changes_.find(key); it != changes_.end()) return it->second;
    return cache_.get(key);
}

auto RemoteDocumentChangeBuffer::get_entries(const DocumentKeySet& doc_keys) -> MutableDocumentMap {
    auto result = MutableDocumentMap{};
    for (const auto& key : doc_keys) result.emplace(key, get_entry(key));
    return result;
}

void RemoteDocumentChangeBuffer::apply() {
    util::hard_assert(!applied_, "change buffer applied twice");
    applied_ = true;
    for (const auto& [key, doc] : changes_) {
        if (doc.is_valid_document()) {
            cache_.add(doc, doc.read_time());
        } else {
            cache_.remove(key);
        }
    }
}

}  // namespace docsync_cpp::local

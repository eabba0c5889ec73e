/// @file snapshot.hpp
/// @brief Query results delivered to listeners: DocumentSet, changes and
/// ViewSnapshot.

#pragma once

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/types.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace docsync_cpp {

/// Whether the client believes it can reach the backend.
enum class OnlineState : std::uint8_t {
    unknown,  ///< Not yet known; listeners wait before raising cached results.
    online,   ///< The watch stream is healthy.
    offline,  ///< Connection attempts failed; cached results are final.
};

auto to_string_view(OnlineState state) noexcept -> std::string_view;

/// Documents ordered by a query's comparator, with lookup by key.
class DocumentSet {
public:
    /// An empty set ordered by document key.
    DocumentSet();

    /// An empty set ordered by `query`.
    explicit DocumentSet(const Query& query);

    auto size() const -> std::size_t { return by_key_.size(); }
    auto empty() const -> bool { return by_key_.empty(); }
    auto contains(const DocumentKey& key) const -> bool { return by_key_.contains(key); }

    /// The document with `key`, or nullptr.
    auto get(const DocumentKey& key) const -> const Document*;

    /// First and last in query order. The set must not be empty.
    auto first() const -> const Document& { return *sorted_.begin(); }
    auto last() const -> const Document& { return *sorted_.rbegin(); }

    /// Position of `key` in query order, or -1.
    auto index_of(const DocumentKey& key) const -> std::ptrdiff_t;

    /// Insert or replace the document with the same key.
    void insert(const Document& doc);

    /// Remove `key` if present.
    void erase(const DocumentKey& key);

    auto begin() const { return sorted_.begin(); }
    auto end() const { return sorted_.end(); }

    /// The documents in query order.
    auto to_vector() const -> std::vector<Document> { return {sorted_.begin(), sorted_.end()}; }

    auto operator==(const DocumentSet& other) const -> bool;

private:
    struct Comparator {
        std::shared_ptr<const Query> query;
        auto operator()(const Document& lhs, const Document& rhs) const -> bool;
    };

    std::map<DocumentKey, Document> by_key_;
    std::set<Document, Comparator> sorted_;
};

/// One change in a view snapshot.
struct DocumentViewChange {
    enum class Type : std::uint8_t { added, removed, modified, metadata };

    Type type{Type::added};
    Document document;

    auto operator==(const DocumentViewChange&) const -> bool = default;
};

auto to_string_view(DocumentViewChange::Type type) noexcept -> std::string_view;

/// The result of a query at one point in time, as seen by a listener.
struct ViewSnapshot {
    Query query;
    DocumentSet documents;
    DocumentSet old_documents;
    std::vector<DocumentViewChange> document_changes;
    DocumentKeySet mutated_keys;       ///< Documents with pending local writes.
    bool from_cache{true};             ///< Not yet confirmed by the backend.
    bool sync_state_changed{false};
    bool excludes_metadata_changes{false};
    bool has_cached_results{false};    ///< The target had results persisted before.

    /// The snapshot a new listener receives for an existing view.
    static auto from_initial_documents(Query query, const DocumentSet& documents,
                                       DocumentKeySet mutated_keys, bool from_cache,
                                       bool excludes_metadata_changes,
                                       bool has_cached_results) -> ViewSnapshot;

    auto has_pending_writes() const -> bool { return !mutated_keys.empty(); }

    auto operator==(const ViewSnapshot&) const -> bool = default;
};

/// Whether a one-shot read may use the cache, the server, or both.
enum class Source : std::uint8_t {
    default_source,  ///< Server if online, cache otherwise.
    server,          ///< Fail with `unavailable` when offline.
    cache,           ///< Never contact the server.
};

/// Options for `Client::listen`.
struct ListenOptions {
    bool include_document_metadata_changes{false};
    bool include_query_metadata_changes{false};
    bool wait_for_sync_when_online{false};  ///< Hold cached results until synced.
};

}  // namespace docsync_cpp

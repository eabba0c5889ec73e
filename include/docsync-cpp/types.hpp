/// @file types.hpp
/// @brief Core identity types: SnapshotVersion, ResourcePath, DocumentKey,
/// DatabaseId, and the id aliases used across the engine.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <limits>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace docsync_cpp {

/// Identifies a mutation batch. Strictly increasing per user.
using BatchId = std::int32_t;

/// Batch id meaning "no batch".
inline constexpr BatchId unknown_batch_id = -1;

/// Identifies a listen target. Even ids are allocated by the target cache,
/// odd ids by the sync engine for limbo resolution.
using TargetId = std::int32_t;

/// LRU sequence number, incremented once per persistence transaction.
using ListenSequenceNumber = std::int64_t;

/// Sequence number meaning "not assigned".
inline constexpr ListenSequenceNumber invalid_sequence_number = -1;

/// Opaque cursor issued by the backend (resume tokens, stream tokens).
using ByteString = std::string;

/// A point in server time with microsecond precision.
///
/// Snapshot versions order remote events; the remote version of a document
/// never decreases. `SnapshotVersion::none()` is the minimum.
struct SnapshotVersion {
    std::int64_t micros{0};  ///< Microseconds since the Unix epoch.

    constexpr SnapshotVersion() = default;
    explicit constexpr SnapshotVersion(std::int64_t us) : micros{us} {}

    /// The minimum version, used for "never seen".
    static constexpr auto none() -> SnapshotVersion { return SnapshotVersion{}; }

    /// The maximum representable version.
    static constexpr auto max() -> SnapshotVersion {
        return SnapshotVersion{std::numeric_limits<std::int64_t>::max()};
    }

    constexpr auto is_none() const -> bool { return micros == 0; }

    auto to_string() const -> std::string;

    auto operator<=>(const SnapshotVersion&) const = default;
    auto operator==(const SnapshotVersion&) const -> bool = default;
};

/// A slash-separated path of non-empty segments.
///
/// Paths compare segment by segment; a path sorts before any longer path
/// it is a prefix of.
class ResourcePath {
public:
    ResourcePath() = default;
    explicit ResourcePath(std::vector<std::string> segments)
        : segments_{std::move(segments)} {}
    ResourcePath(std::initializer_list<std::string> segments)
        : segments_{segments} {}

    /// Parse "a/b/c". Empty segments are rejected with Exception.
    static auto from_string(std::string_view path) -> ResourcePath;

    auto segments() const -> const std::vector<std::string>& { return segments_; }
    auto size() const -> std::size_t { return segments_.size(); }
    auto empty() const -> bool { return segments_.empty(); }
    auto operator[](std::size_t i) const -> const std::string& { return segments_[i]; }

    auto first_segment() const -> const std::string& { return segments_.front(); }
    auto last_segment() const -> const std::string& { return segments_.back(); }

    auto child(std::string_view segment) const -> ResourcePath;
    auto append(const ResourcePath& other) const -> ResourcePath;
    auto pop_last() const -> ResourcePath;
    auto pop_first(std::size_t count = 1) const -> ResourcePath;

    auto is_prefix_of(const ResourcePath& other) const -> bool;
    auto is_immediate_parent_of(const ResourcePath& other) const -> bool;

    /// "a/b/c"
    auto canonical_string() const -> std::string;

    auto operator<=>(const ResourcePath&) const = default;
    auto operator==(const ResourcePath&) const -> bool = default;

private:
    std::vector<std::string> segments_;
};

/// Identifies a document: a resource path with an even number of segments.
///
/// The default-constructed key has an empty path; it sorts before every
/// real key and is used as the open end of index offsets.
class DocumentKey {
public:
    DocumentKey() = default;

    /// Construct from a path. Throws Exception (invalid_argument) if the
    /// path does not have an even, non-zero number of segments.
    explicit DocumentKey(ResourcePath path);

    /// Parse "collection/doc[/sub/doc...]".
    static auto from_path_string(std::string_view path) -> DocumentKey;

    /// The empty key, smaller than every valid key.
    static auto empty() -> DocumentKey { return DocumentKey{}; }

    auto path() const -> const ResourcePath& { return path_; }
    auto is_empty() const -> bool { return path_.empty(); }

    /// The id of the collection that directly contains the document.
    auto collection_group() const -> const std::string&;

    /// The path of the collection that directly contains the document.
    auto collection_path() const -> ResourcePath { return path_.pop_last(); }

    /// The last path segment.
    auto document_id() const -> const std::string& { return path_.last_segment(); }

    /// True if the document lives directly in `collection`.
    auto has_collection_path(const ResourcePath& collection) const -> bool;

    auto to_string() const -> std::string { return path_.canonical_string(); }

    static auto is_document_path(const ResourcePath& path) -> bool {
        return !path.empty() && path.size() % 2 == 0;
    }

    auto operator<=>(const DocumentKey&) const = default;
    auto operator==(const DocumentKey&) const -> bool = default;

private:
    ResourcePath path_;
};

/// An ordered set of document keys.
using DocumentKeySet = std::set<DocumentKey>;

/// Names the project and database the client talks to. Used to build the
/// fully qualified resource names the backend hashes into Bloom filters.
struct DatabaseId {
    std::string project_id;
    std::string database_id{"(default)"};

    /// "projects/{p}/databases/{d}/documents/{path}"
    auto document_resource_name(const DocumentKey& key) const -> std::string;

    auto operator<=>(const DatabaseId&) const = default;
    auto operator==(const DatabaseId&) const -> bool = default;
};

}  // namespace docsync_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<docsync_cpp::ResourcePath> {
    auto operator()(const docsync_cpp::ResourcePath& path) const noexcept -> std::size_t {
        // FNV-1a over the segments, with a separator byte between them
        auto h = std::size_t{14695981039346656037ULL};
        for (const auto& segment : path.segments()) {
            for (auto c : segment) {
                h ^= static_cast<std::size_t>(static_cast<unsigned char>(c));
                h *= std::size_t{1099511628211ULL};
            }
            h ^= std::size_t{0x2f};
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

template <>
struct std::hash<docsync_cpp::DocumentKey> {
    auto operator()(const docsync_cpp::DocumentKey& key) const noexcept -> std::size_t {
        return std::hash<docsync_cpp::ResourcePath>{}(key.path());
    }
};

/// @endcond

/// @file document.hpp
/// @brief The tagged document variant held by every cache and view.

#pragma once

#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace docsync_cpp {

/// The cache knows nothing about the document.
struct InvalidContents {
    auto operator==(const InvalidContents&) const -> bool = default;
};

/// The document exists at `version` with `data`.
struct FoundContents {
    SnapshotVersion version;
    SnapshotVersion create_time;
    ObjectValue data = ObjectValue::object();
    auto operator==(const FoundContents&) const -> bool = default;
};

/// The document is known not to exist at `version`.
struct NoDocumentContents {
    SnapshotVersion version;
    auto operator==(const NoDocumentContents&) const -> bool = default;
};

/// The document was written at `version` but its contents are unknown
/// (a patch was acknowledged for a document the cache never held).
struct UnknownContents {
    SnapshotVersion version;
    auto operator==(const UnknownContents&) const -> bool = default;
};

/// The closed set of document states.
using DocumentContents = std::variant<
    InvalidContents,
    FoundContents,
    NoDocumentContents,
    UnknownContents
>;

/// Whether the document reflects local writes the backend has not seen or
/// writes it acknowledged but the watch stream has not yet delivered.
enum class DocumentState : std::uint8_t {
    synced,
    has_local_mutations,
    has_committed_mutations,
};

/// A document in one of the four DocumentContents states.
///
/// MutableDocument is a value type. Caches hand out copies; mutations
/// transform a copy in place through the `convert_to_*` and `set_*`
/// methods, which return `*this` for chaining.
class MutableDocument {
public:
    MutableDocument() = default;

    static auto invalid(DocumentKey key) -> MutableDocument;
    static auto found(DocumentKey key, SnapshotVersion version, ObjectValue data) -> MutableDocument;
    static auto no_document(DocumentKey key, SnapshotVersion version) -> MutableDocument;
    static auto unknown(DocumentKey key, SnapshotVersion version) -> MutableDocument;

    auto convert_to_found(SnapshotVersion version, ObjectValue data) -> MutableDocument&;
    auto convert_to_no_document(SnapshotVersion version) -> MutableDocument&;
    auto convert_to_unknown(SnapshotVersion version) -> MutableDocument&;
    auto set_has_committed_mutations() -> MutableDocument&;
    auto set_has_local_mutations() -> MutableDocument&;
    auto set_read_time(SnapshotVersion read_time) -> MutableDocument&;
    auto set_create_time(SnapshotVersion create_time) -> MutableDocument&;

    auto key() const -> const DocumentKey& { return key_; }
    auto contents() const -> const DocumentContents& { return contents_; }
    auto state() const -> DocumentState { return state_; }
    auto read_time() const -> SnapshotVersion { return read_time_; }

    /// The version the document was last written at (none for Invalid).
    auto version() const -> SnapshotVersion;

    /// The creation time, or none if unknown or not found.
    auto create_time() const -> SnapshotVersion;

    /// The document data. Empty object unless found.
    auto data() const -> const ObjectValue&;

    /// Mutable access to the data of a found document.
    auto mutable_data() -> ObjectValue&;

    /// The value at `path`, or nullopt. The key path yields a reference value.
    auto field(const FieldPath& path) const -> std::optional<FieldValue>;

    auto is_valid_document() const -> bool { return !std::holds_alternative<InvalidContents>(contents_); }
    auto is_found_document() const -> bool { return std::holds_alternative<FoundContents>(contents_); }
    auto is_no_document() const -> bool { return std::holds_alternative<NoDocumentContents>(contents_); }
    auto is_unknown_document() const -> bool { return std::holds_alternative<UnknownContents>(contents_); }

    auto has_local_mutations() const -> bool { return state_ == DocumentState::has_local_mutations; }
    auto has_committed_mutations() const -> bool { return state_ == DocumentState::has_committed_mutations; }
    auto has_pending_writes() const -> bool { return state_ != DocumentState::synced; }

    auto to_string() const -> std::string;

    auto operator==(const MutableDocument&) const -> bool = default;

private:
    MutableDocument(DocumentKey key, DocumentContents contents)
        : key_{std::move(key)}, contents_{std::move(contents)} {}

    DocumentKey key_;
    DocumentContents contents_{InvalidContents{}};
    DocumentState state_{DocumentState::synced};
    SnapshotVersion read_time_;
};

/// Documents handed to views and listeners. Same representation; the name
/// marks values that are no longer mutated.
using Document = MutableDocument;

/// Documents by key, in key order.
using DocumentMap = std::map<DocumentKey, Document>;
using MutableDocumentMap = std::map<DocumentKey, MutableDocument>;

}  // namespace docsync_cpp

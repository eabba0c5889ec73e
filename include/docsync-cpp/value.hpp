/// @file value.hpp
/// @brief Field values, field paths and the value ordering used by queries.
///
/// Document data is a nlohmann::json object. Types JSON cannot express are
/// encoded as single-key tagged objects:
///
/// | Type              | Encoding                                   |
/// |-------------------|--------------------------------------------|
/// | timestamp         | `{"__timestamp__": <micros>}`              |
/// | server timestamp  | `{"__server_timestamp__": <local micros>}` |
/// | reference         | `{"__reference__": "<path>"}`              |
/// | bytes             | JSON binary                                |

#pragma once

#include <docsync-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <compare>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace docsync_cpp {

/// A single field value.
using FieldValue = nlohmann::json;

/// The data of a document: always a JSON object.
using ObjectValue = nlohmann::json;

/// The position of a value in the cross-type sort order.
enum class TypeOrder : std::uint8_t {
    null_value = 0,
    boolean = 1,
    number = 2,
    timestamp = 3,
    server_timestamp = 4,
    string = 5,
    bytes = 6,
    reference = 7,
    array = 8,
    map = 9,
};

/// A dot-separated path into an ObjectValue.
class FieldPath {
public:
    FieldPath() = default;
    explicit FieldPath(std::vector<std::string> segments)
        : segments_{std::move(segments)} {}
    FieldPath(std::initializer_list<std::string> segments)
        : segments_{segments} {}

    /// Parse "a.b.c". Empty segments are rejected with Exception.
    static auto from_dot_separated(std::string_view path) -> FieldPath;

    /// The special path naming the document key.
    static auto key_path() -> FieldPath { return FieldPath{std::string{key_field_name}}; }

    auto segments() const -> const std::vector<std::string>& { return segments_; }
    auto size() const -> std::size_t { return segments_.size(); }
    auto empty() const -> bool { return segments_.empty(); }
    auto is_key_field() const -> bool {
        return segments_.size() == 1 && segments_[0] == key_field_name;
    }

    auto child(std::string_view segment) const -> FieldPath;
    auto is_prefix_of(const FieldPath& other) const -> bool;

    auto canonical_string() const -> std::string;

    auto operator<=>(const FieldPath&) const = default;
    auto operator==(const FieldPath&) const -> bool = default;

    static constexpr std::string_view key_field_name = "__name__";

private:
    std::vector<std::string> segments_;
};

/// A set of field paths. A mask covering a path also covers its children.
using FieldMask = std::set<FieldPath>;

/// True if `mask` contains `path` or one of its prefixes.
auto mask_covers(const FieldMask& mask, const FieldPath& path) -> bool;

// -- Tagged value construction ------------------------------------------------

auto timestamp_value(SnapshotVersion time) -> FieldValue;
auto server_timestamp_value(SnapshotVersion local_write_time) -> FieldValue;
auto reference_value(const DocumentKey& key) -> FieldValue;
auto bytes_value(std::vector<std::uint8_t> bytes) -> FieldValue;

auto is_timestamp(const FieldValue& value) -> bool;
auto is_server_timestamp(const FieldValue& value) -> bool;
auto is_reference(const FieldValue& value) -> bool;
auto is_number(const FieldValue& value) -> bool;
auto is_nan(const FieldValue& value) -> bool;

/// The timestamp carried by a timestamp value, or nullopt.
auto timestamp_of(const FieldValue& value) -> std::optional<SnapshotVersion>;

/// The document key carried by a reference value, or nullopt.
auto reference_of(const FieldValue& value) -> std::optional<DocumentKey>;

// -- Ordering -----------------------------------------------------------------

auto type_order(const FieldValue& value) -> TypeOrder;

/// Total order over field values. Integers and doubles compare
/// numerically; NaN sorts before every other number and equals itself.
auto compare_values(const FieldValue& lhs, const FieldValue& rhs) -> std::weak_ordering;

/// Equality under compare_values (so 1 == 1.0).
auto values_equal(const FieldValue& lhs, const FieldValue& rhs) -> bool;

/// True if `array` is an array holding an element equal to `element`.
auto array_contains(const FieldValue& array, const FieldValue& element) -> bool;

/// Stable textual form used in canonical ids and index entries.
auto canonical_id(const FieldValue& value) -> std::string;

// -- Object access ------------------------------------------------------------

/// The value at `path`, or nullptr if any segment is missing.
auto get_field(const ObjectValue& object, const FieldPath& path) -> const FieldValue*;

/// Set the value at `path`, creating intermediate maps.
void set_field(ObjectValue& object, const FieldPath& path, FieldValue value);

/// Remove the value at `path` if present.
void delete_field(ObjectValue& object, const FieldPath& path);

/// Every leaf path in `object` (maps are descended into, other values are
/// leaves). Empty maps are leaves.
auto leaf_paths(const ObjectValue& object) -> FieldMask;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const SetMutation& m) { ... },
///     [](const DeleteMutation&) { ... },
///     [](auto&&) { ... },
/// }, mutation.kind());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace docsync_cpp

/// @file query.hpp
/// @brief Query and Target: filters, ordering, limits and cursors.

#pragma once

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsync_cpp {

/// Comparison operators supported by field filters.
enum class FilterOperator : std::uint8_t {
    less_than,
    less_than_or_equal,
    equal,
    not_equal,
    greater_than,
    greater_than_or_equal,
    array_contains,
    array_contains_any,
    in,
    not_in,
};

auto to_string_view(FilterOperator op) noexcept -> std::string_view;

/// `field <op> value`.
struct FieldFilter {
    FieldPath field;
    FilterOperator op{FilterOperator::equal};
    FieldValue value;

    /// True for <, <=, >, >=, != and not-in.
    auto is_inequality() const -> bool;

    auto matches(const Document& doc) const -> bool;
    auto canonical_id() const -> std::string;

    auto operator==(const FieldFilter&) const -> bool = default;
};

enum class Direction : std::uint8_t { ascending, descending };

/// Sort by `field` in `direction`.
struct OrderBy {
    FieldPath field;
    Direction direction{Direction::ascending};

    auto compare(const Document& lhs, const Document& rhs) const -> int;
    auto canonical_id() const -> std::string;

    auto operator==(const OrderBy&) const -> bool = default;
};

/// A cursor position: one value per order-by field.
struct Bound {
    std::vector<FieldValue> position;
    bool inclusive{true};

    /// Compare the cursor position with `doc` under `order_by`: <0 if the
    /// position sorts before the document, 0 if equal, >0 if after.
    auto compare_to_document(const std::vector<OrderBy>& order_by, const Document& doc) const -> int;

    auto canonical_id() const -> std::string;

    auto operator==(const Bound&) const -> bool = default;
};

enum class LimitType : std::uint8_t { first, last };

/// The backend-facing form of a query. Limit-to-last queries are flipped
/// into limit-to-first targets with reversed ordering and cursors.
class Target {
public:
    Target() = default;
    Target(ResourcePath path, std::optional<std::string> collection_group,
           std::vector<FieldFilter> filters, std::vector<OrderBy> order_by,
           std::optional<std::int32_t> limit, std::optional<Bound> start_at,
           std::optional<Bound> end_at);

    auto path() const -> const ResourcePath& { return path_; }
    auto collection_group() const -> const std::optional<std::string>& { return collection_group_; }
    auto filters() const -> const std::vector<FieldFilter>& { return filters_; }
    auto order_by() const -> const std::vector<OrderBy>& { return order_by_; }
    auto limit() const -> std::optional<std::int32_t> { return limit_; }
    auto start_at() const -> const std::optional<Bound>& { return start_at_; }
    auto end_at() const -> const std::optional<Bound>& { return end_at_; }

    /// True if the target names a single document.
    auto is_document_query() const -> bool;

    /// A stable string that identifies equivalent targets.
    auto canonical_id() const -> const std::string& { return canonical_id_; }

    auto operator==(const Target& other) const -> bool { return canonical_id_ == other.canonical_id_; }

private:
    ResourcePath path_;
    std::optional<std::string> collection_group_;
    std::vector<FieldFilter> filters_;
    std::vector<OrderBy> order_by_;
    std::optional<std::int32_t> limit_;
    std::optional<Bound> start_at_;
    std::optional<Bound> end_at_;
    std::string canonical_id_;
};

/// A query over a collection, a collection group, or a single document.
///
/// Queries are immutable values; the builder methods return modified
/// copies.
///
/// @code
/// auto q = Query::collection(ResourcePath::from_string("rooms/a/messages"))
///              .where(FieldPath{"sent"}, FilterOperator::greater_than, 10)
///              .order_by(FieldPath{"sent"}, Direction::descending)
///              .limit_to_first(20);
/// @endcode
class Query {
public:
    Query() = default;

    /// All documents directly in `collection_path`, or the single document
    /// if the path has an even number of segments.
    static auto collection(ResourcePath path) -> Query;

    /// All documents in every collection named `collection_id`.
    static auto collection_group(std::string collection_id) -> Query;

    /// The single document `key`.
    static auto document(const DocumentKey& key) -> Query;

    auto where(FieldPath field, FilterOperator op, FieldValue value) const -> Query;
    auto order_by(FieldPath field, Direction direction = Direction::ascending) const -> Query;
    auto limit_to_first(std::int32_t limit) const -> Query;
    auto limit_to_last(std::int32_t limit) const -> Query;
    auto without_limit() const -> Query;
    auto start_at(std::vector<FieldValue> position) const -> Query;
    auto start_after(std::vector<FieldValue> position) const -> Query;
    auto end_at(std::vector<FieldValue> position) const -> Query;
    auto end_before(std::vector<FieldValue> position) const -> Query;

    auto path() const -> const ResourcePath& { return path_; }
    auto collection_group_id() const -> const std::optional<std::string>& { return collection_group_; }
    auto filters() const -> const std::vector<FieldFilter>& { return filters_; }
    auto explicit_order_by() const -> const std::vector<OrderBy>& { return explicit_order_by_; }
    auto limit() const -> std::optional<std::int32_t> { return limit_; }
    auto limit_type() const -> LimitType { return limit_type_; }
    auto start_bound() const -> const std::optional<Bound>& { return start_at_; }
    auto end_bound() const -> const std::optional<Bound>& { return end_at_; }

    auto has_limit() const -> bool { return limit_.has_value(); }
    auto is_document_query() const -> bool;
    auto is_collection_group_query() const -> bool { return collection_group_.has_value(); }

    /// True for an unfiltered, unlimited, uncursored collection query.
    auto matches_all_documents() const -> bool;

    /// The explicit order-by, followed by every inequality field not
    /// explicitly ordered, followed by the document key.
    auto normalized_order_by() const -> std::vector<OrderBy>;

    /// True if `doc` exists and satisfies path, filters, order-by fields
    /// and cursors.
    auto matches(const Document& doc) const -> bool;

    /// Order documents by the normalized order-by.
    auto compare(const Document& lhs, const Document& rhs) const -> int;

    /// Rewrite a collection-group query as a collection query at `path`.
    auto as_collection_query_at_path(ResourcePath path) const -> Query;

    auto to_target() const -> Target;

    auto canonical_id() const -> std::string;

    auto operator==(const Query& other) const -> bool;

private:
    auto matches_path(const Document& doc) const -> bool;
    auto matches_filters(const Document& doc) const -> bool;
    auto matches_order_by(const Document& doc) const -> bool;
    auto matches_bounds(const Document& doc) const -> bool;
    auto inequality_fields() const -> FieldMask;

    ResourcePath path_;
    std::optional<std::string> collection_group_;
    std::vector<FieldFilter> filters_;
    std::vector<OrderBy> explicit_order_by_;
    std::optional<std::int32_t> limit_;
    LimitType limit_type_{LimitType::first};
    std::optional<Bound> start_at_;
    std::optional<Bound> end_at_;
};

/// Why a target is being listened to.
enum class QueryPurpose : std::uint8_t {
    listen,
    existence_filter_mismatch,
    existence_filter_mismatch_bloom,
    limbo_resolution,
};

auto to_string_view(QueryPurpose purpose) noexcept -> std::string_view;

/// A target plus the bookkeeping the local and remote stores keep for it.
struct TargetData {
    Target target;
    TargetId target_id{0};
    ListenSequenceNumber sequence_number{invalid_sequence_number};
    QueryPurpose purpose{QueryPurpose::listen};
    SnapshotVersion snapshot_version;                 ///< Of the last consistent snapshot.
    SnapshotVersion last_limbo_free_snapshot_version; ///< Last version with no limbo documents.
    ByteString resume_token;
    std::optional<std::int32_t> expected_count;       ///< Sent when resuming.

    auto with_sequence_number(ListenSequenceNumber seq) const -> TargetData;
    auto with_resume_token(ByteString token, SnapshotVersion version) const -> TargetData;
    auto with_expected_count(std::int32_t count) const -> TargetData;
    auto with_last_limbo_free_snapshot_version(SnapshotVersion version) const -> TargetData;

    auto operator==(const TargetData&) const -> bool = default;
};

}  // namespace docsync_cpp

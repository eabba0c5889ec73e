#include <docsync-cpp/query.hpp>

#include <algorithm>

namespace docsync_cpp {

namespace {

auto compare_field(const FieldPath& field, const Document& lhs, const Document& rhs) -> int {
    if (field.is_key_field()) {
        auto c = lhs.key() <=> rhs.key();
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    auto l = lhs.field(field);
    auto r = rhs.field(field);
    if (!l || !r) return static_cast<int>(l.has_value()) - static_cast<int>(r.has_value());
    auto c = compare_values(*l, *r);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

auto bound_canonical_id(const std::optional<Bound>& bound) -> std::string {
    return bound ? bound->canonical_id() : std::string{"null"};
}

}  // namespace

auto to_string_view(FilterOperator op) noexcept -> std::string_view {
    switch (op) {
        case FilterOperator::less_than:             return "<";
        case FilterOperator::less_than_or_equal:    return "<=";
        case FilterOperator::equal:                 return "==";
        case FilterOperator::not_equal:             return "!=";
        case FilterOperator::greater_than:          return ">";
        case FilterOperator::greater_than_or_equal: return ">=";
        case FilterOperator::array_contains:        return "array-contains";
        case FilterOperator::array_contains_any:    return "array-contains-any";
        case FilterOperator::in:                    return "in";
        case FilterOperator::not_in:                return "not-in";
    }
    return "?";
}

auto to_string_view(QueryPurpose purpose) noexcept -> std::string_view {
    switch (purpose) {
        case QueryPurpose::listen:                          return "listen";
        case QueryPurpose::existence_filter_mismatch:       return "existence-filter-mismatch";
        case QueryPurpose::existence_filter_mismatch_bloom: return "existence-filter-mismatch-bloom";
        case QueryPurpose::limbo_resolution:                return "limbo-resolution";
    }
    return "?";
}

// -- FieldFilter --------------------------------------------------------------

auto FieldFilter::is_inequality() const -> bool {
    switch (op) {
        case FilterOperator::less_than:
        case FilterOperator::less_than_or_equal:
        case FilterOperator::greater_than:
        case FilterOperator::greater_than_or_equal:
        case FilterOperator::not_equal:
        case FilterOperator::not_in:
            return true;
        default:
            return false;
    }
}

auto FieldFilter::matches(const Document& doc) const -> bool {
    auto other = doc.field(field);

    switch (op) {
        case FilterOperator::array_contains:
            return other && array_contains(*other, value);
        case FilterOperator::array_contains_any:
            if (!other || !other->is_array() || !value.is_array()) return false;
            return std::any_of(other->begin(), other->end(),
                               [&](const FieldValue& v) { return array_contains(value, v); });
        case FilterOperator::in:
            return other && array_contains(value, *other);
        case FilterOperator::not_in:
            if (array_contains(value, FieldValue{})) return false;
            return other && !array_contains(value, *other);
        case FilterOperator::not_equal:
            return other && !values_equal(*other, value);
        default:
            break;
    }

    if (!other || type_order(*other) != type_order(value)) return false;
    auto c = compare_values(*other, value);
    switch (op) {
        case FilterOperator::less_than:             return c < 0;
        case FilterOperator::less_than_or_equal:    return c <= 0;
        case FilterOperator::equal:                 return c == 0;
        case FilterOperator::greater_than:          return c > 0;
        case FilterOperator::greater_than_or_equal: return c >= 0;
        default:                                    return false;
    }
}

auto FieldFilter::canonical_id() const -> std::string {
    return field.canonical_string() + std::string{to_string_view(op)} + docsync_cpp::canonical_id(value);
}

// -- OrderBy and Bound --------------------------------------------------------

auto OrderBy::compare(const Document& lhs, const Document& rhs) const -> int {
    auto c = compare_field(field, lhs, rhs);
    return direction == Direction::ascending ? c : -c;
}

auto OrderBy::canonical_id() const -> std::string {
    return field.canonical_string() + (direction == Direction::ascending ? "asc" : "desc");
}

auto Bound::compare_to_document(const std::vector<OrderBy>& order_by, const Document& doc) const
    -> int {
    auto n = std::min(position.size(), order_by.size());
    for (std::size_t i = 0; i < n; ++i) {
        const auto& ob = order_by[i];
        auto c = 0;
        if (ob.field.is_key_field()) {
            auto key = reference_of(position[i]);
            if (!key) return -1;
            auto o = *key <=> doc.key();
            c = o < 0 ? -1 : (o > 0 ? 1 : 0);
        } else {
            auto value = doc.field(ob.field);
            if (!value) return 1;
            auto o = compare_values(position[i], *value);
            c = o < 0 ? -1 : (o > 0 ? 1 : 0);
        }
        if (ob.direction == Direction::descending) c = -c;
        if (c != 0) return c;
    }
    return 0;
}

auto Bound::canonical_id() const -> std::string {
    auto result = std::string{inclusive ? "b:" : "a:"};
    for (std::size_t i = 0; i < position.size(); ++i) {
        if (i > 0) result += ',';
        result += docsync_cpp::canonical_id(position[i]);
    }
    return result;
}

// -- Target -------------------------------------------------------------------

Target::Target(ResourcePath path, std::optional<std::string> collection_group,
               std::vector<FieldFilter> filters, std::vector<OrderBy> order_by,
               std::optional<std::int32_t> limit, std::optional<Bound> start_at,
               std::optional<Bound> end_at)
    : path_{std::move(path)},
      collection_group_{std::move(collection_group)},
      filters_{std::move(filters)},
      order_by_{std::move(order_by)},
      limit_{limit},
      start_at_{std::move(start_at)},
      end_at_{std::move(end_at)} {
    auto id = path_.canonical_string();
    if (collection_group_) id += "|cg:" + *collection_group_;
    id += "|f:";
    for (const auto& f : filters_) id += f.canonical_id();
    id += "|ob:";
    for (const auto& ob : order_by_) id += ob.canonical_id();
    if (limit_) id += "|l:" + std::to_string(*limit_);
    if (start_at_) id += "|lb:" + bound_canonical_id(start_at_);
    if (end_at_) id += "|ub:" + bound_canonical_id(end_at_);
    canonical_id_ = std::move(id);
}

auto Target::is_document_query() const -> bool {
    return DocumentKey::is_document_path(path_) && !collection_group_ && filters_.empty();
}

// -- Query --------------------------------------------------------------------

auto Query::collection(ResourcePath path) -> Query {
    auto q = Query{};
    q.path_ = std::move(path);
    return q;
}

auto Query::collection_group(std::string collection_id) -> Query {
    auto q = Query{};
    q.collection_group_ = std::move(collection_id);
    return q;
}

auto Query::document(const DocumentKey& key) -> Query {
    return collection(key.path());
}

auto Query::where(FieldPath field, FilterOperator op, FieldValue value) const -> Query {
    auto q = *this;
    q.filters_.push_back(FieldFilter{std::move(field), op, std::move(value)});
    return q;
}

auto Query::order_by(FieldPath field, Direction direction) const -> Query {
    auto q = *this;
    q.explicit_order_by_.push_back(OrderBy{std::move(field), direction});
    return q;
}

auto Query::limit_to_first(std::int32_t limit) const -> Query {
    auto q = *this;
    q.limit_ = limit;
    q.limit_type_ = LimitType::first;
    return q;
}

auto Query::limit_to_last(std::int32_t limit) const -> Query {
    auto q = *this;
    q.limit_ = limit;
    q.limit_type_ = LimitType::last;
    return q;
}

auto Query::without_limit() const -> Query {
    auto q = *this;
    q.limit_.reset();
    q.limit_type_ = LimitType::first;
    return q;
}

auto Query::start_at(std::vector<FieldValue> position) const -> Query {
    auto q = *this;
    q.start_at_ = Bound{std::move(position), true};
    return q;
}

auto Query::start_after(std::vector<FieldValue> position) const -> Query {
    auto q = *this;
    q.start_at_ = Bound{std::move(position), false};
    return q;
}

auto Query::end_at(std::vector<FieldValue> position) const -> Query {
    auto q = *this;
    q.end_at_ = Bound{std::move(position), true};
    return q;
}

auto Query::end_before(std::vector<FieldValue> position) const -> Query {
    auto q = *this;
    q.end_at_ = Bound{std::move(position), false};
    return q;
}

auto Query::is_document_query() const -> bool {
    return DocumentKey::is_document_path(path_) && !collection_group_ && filters_.empty();
}

auto Query::matches_all_documents() const -> bool {
    return filters_.empty() && !limit_ && !start_at_ && !end_at_ &&
           (explicit_order_by_.empty() ||
            (explicit_order_by_.size() == 1 && explicit_order_by_[0].field.is_key_field()));
}

auto Query::inequality_fields() const -> FieldMask {
    auto result = FieldMask{};
    for (const auto& f : filters_) {
        if (f.is_inequality()) result.insert(f.field);
    }
    return result;
}

auto Query::normalized_order_by() const -> std::vector<OrderBy> {
    auto result = explicit_order_by_;
    auto ordered = FieldMask{};
    for (const auto& ob : result) ordered.insert(ob.field);

    auto last_direction = result.empty() ? Direction::ascending : result.back().direction;
    for (const auto& field : inequality_fields()) {
        if (!ordered.contains(field) && !field.is_key_field()) {
            result.push_back(OrderBy{field, last_direction});
            ordered.insert(field);
        }
    }
    if (!ordered.contains(FieldPath::key_path())) {
        result.push_back(OrderBy{FieldPath::key_path(), last_direction});
    }
    return result;
}

auto Query::matches_path(const Document& doc) const -> bool {
    const auto& doc_path = doc.key().path();
    if (collection_group_) {
        return doc.key().collection_group() == *collection_group_ && path_.is_prefix_of(doc_path);
    }
    if (DocumentKey::is_document_path(path_)) return path_ == doc_path;
    return doc.key().has_collection_path(path_);
}

auto Query::matches_filters(const Document& doc) const -> bool {
    return std::all_of(filters_.begin(), filters_.end(),
                       [&](const FieldFilter& f) { return f.matches(doc); });
}

auto Query::matches_order_by(const Document& doc) const -> bool {
    for (const auto& ob : normalized_order_by()) {
        if (!ob.field.is_key_field() && !doc.field(ob.field)) return false;
    }
    return true;
}

auto Query::matches_bounds(const Document& doc) const -> bool {
    auto order_by = normalized_order_by();
    if (start_at_) {
        auto c = start_at_->compare_to_document(order_by, doc);
        if (start_at_->inclusive ? c > 0 : c >= 0) return false;
    }
    if (end_at_) {
        auto c = end_at_->compare_to_document(order_by, doc);
        if (end_at_->inclusive ? c < 0 : c <= 0) return false;
    }
    return true;
}

auto Query::matches(const Document& doc) const -> bool {
    return doc.is_found_document() && matches_path(doc) && matches_order_by(doc) &&
           matches_filters(doc) && matches_bounds(doc);
}

auto Query::compare(const Document& lhs, const Document& rhs) const -> int {
    for (const auto& ob : normalized_order_by()) {
        auto c = ob.compare(lhs, rhs);
        if (c != 0) return c;
    }
    return 0;
}

auto Query::as_collection_query_at_path(ResourcePath path) const -> Query {
    auto q = *this;
    q.path_ = std::move(path);
    q.collection_group_.reset();
    return q;
}

auto Query::to_target() const -> Target {
    auto order_by = normalized_order_by();
    if (limit_type_ == LimitType::first) {
        return Target{path_, collection_group_, filters_, std::move(order_by), limit_, start_at_, end_at_};
    }
    // Limit-to-last runs as limit-to-first in reverse order
    for (auto& ob : order_by) {
        ob.direction = ob.direction == Direction::ascending ? Direction::descending : Direction::ascending;
    }
    return Target{path_, collection_group_, filters_, std::move(order_by), limit_, end_at_, start_at_};
}

auto Query::canonical_id() const -> std::string {
    return to_target().canonical_id() + (limit_type_ == LimitType::first ? "|lt:f" : "|lt:l");
}

auto Query::operator==(const Query& other) const -> bool {
    return canonical_id() == other.canonical_id();
}

// -- TargetData ---------------------------------------------------------------

auto TargetData::with_sequence_number(ListenSequenceNumber seq) const -> TargetData {
    auto data = *this;
    data.sequence_number = seq;
    return data;
}

auto TargetData::with_resume_token(ByteString token, SnapshotVersion version) const -> TargetData {
    auto data = *this;
    data.resume_token = std::move(token);
    data.snapshot_version = version;
    data.expected_count.reset();
    return data;
}

auto TargetData::with_expected_count(std::int32_t count) const -> TargetData {
    auto data = *this;
    data.expected_count = count;
    return data;
}

auto TargetData::with_last_limbo_free_snapshot_version(SnapshotVersion version) const -> TargetData {
    auto data = *this;
    data.last_limbo_free_snapshot_version = version;
    return data;
}

}  // namespace docsync_cpp

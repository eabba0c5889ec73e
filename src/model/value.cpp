#include <docsync-cpp/error.hpp>
#include <docsync-cpp/value.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace docsync_cpp {

namespace {

constexpr auto timestamp_tag = "__timestamp__";
constexpr auto server_timestamp_tag = "__server_timestamp__";
constexpr auto reference_tag = "__reference__";

auto is_tagged(const FieldValue& value, const char* tag) -> bool {
    return value.is_object() && value.size() == 1 && value.contains(tag);
}

auto to_ordering(int c) -> std::weak_ordering {
    if (c < 0) return std::weak_ordering::less;
    if (c > 0) return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}

auto compare_integers(const FieldValue& lhs, const FieldValue& rhs) -> std::weak_ordering {
    constexpr auto int_max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (lhs.is_number_unsigned() && rhs.is_number_unsigned()) {
        return lhs.get<std::uint64_t>() <=> rhs.get<std::uint64_t>();
    }
    if (lhs.is_number_unsigned() && lhs.get<std::uint64_t>() > int_max) {
        return std::weak_ordering::greater;
    }
    if (rhs.is_number_unsigned() && rhs.get<std::uint64_t>() > int_max) {
        return std::weak_ordering::less;
    }
    return lhs.get<std::int64_t>() <=> rhs.get<std::int64_t>();
}

auto compare_numbers(const FieldValue& lhs, const FieldValue& rhs) -> std::weak_ordering {
    if (lhs.is_number_integer() && rhs.is_number_integer()) {
        return compare_integers(lhs, rhs);
    }
    auto l = lhs.get<double>();
    auto r = rhs.get<double>();
    auto l_nan = std::isnan(l);
    auto r_nan = std::isnan(r);
    if (l_nan || r_nan) {
        if (l_nan && r_nan) return std::weak_ordering::equivalent;
        return l_nan ? std::weak_ordering::less : std::weak_ordering::greater;
    }
    if (l < r) return std::weak_ordering::less;
    if (l > r) return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}

auto format_double(double d) -> std::string {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (std::trunc(d) == d && std::fabs(d) < 9.0e15) {
        return std::to_string(static_cast<std::int64_t>(d));
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    return buf;
}

auto hex(const std::vector<std::uint8_t>& bytes) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        result += digits[b >> 4];
        result += digits[b & 0x0F];
    }
    return result;
}

void collect_leaf_paths(const ObjectValue& object, const FieldPath& prefix, FieldMask& out) {
    for (const auto& [key, value] : object.items()) {
        auto path = prefix.child(key);
        if (value.is_object() && !value.empty() && type_order(value) == TypeOrder::map) {
            collect_leaf_paths(value, path, out);
        } else {
            out.insert(std::move(path));
        }
    }
}

}  // namespace

// -- FieldPath ----------------------------------------------------------------

auto FieldPath::from_dot_separated(std::string_view path) -> FieldPath {
    auto segments = std::vector<std::string>{};
    auto start = std::size_t{0};
    while (true) {
        auto end = path.find('.', start);
        if (end == std::string_view::npos) end = path.size();
        auto segment = path.substr(start, end - start);
        if (segment.empty()) {
            throw Exception{ErrorCode::invalid_argument,
                            "invalid field path: " + std::string{path}};
        }
        segments.emplace_back(segment);
        if (end == path.size()) break;
        start = end + 1;
    }
    return FieldPath{std::move(segments)};
}

auto FieldPath::child(std::string_view segment) const -> FieldPath {
    auto segments = segments_;
    segments.emplace_back(segment);
    return FieldPath{std::move(segments)};
}

auto FieldPath::is_prefix_of(const FieldPath& other) const -> bool {
    if (segments_.size() > other.segments_.size()) return false;
    return std::equal(segments_.begin(), segments_.end(), other.segments_.begin());
}

auto FieldPath::canonical_string() const -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) result += '.';
        result += segments_[i];
    }
    return result;
}

auto mask_covers(const FieldMask& mask, const FieldPath& path) -> bool {
    return std::any_of(mask.begin(), mask.end(),
                       [&](const FieldPath& p) { return p.is_prefix_of(path); });
}

// -- Tagged values ------------------------------------------------------------

auto timestamp_value(SnapshotVersion time) -> FieldValue {
    return FieldValue::object({{timestamp_tag, time.micros}});
}

auto server_timestamp_value(SnapshotVersion local_write_time) -> FieldValue {
    return FieldValue::object({{server_timestamp_tag, local_write_time.micros}});
}

auto reference_value(const DocumentKey& key) -> FieldValue {
    return FieldValue::object({{reference_tag, key.to_string()}});
}

auto bytes_value(std::vector<std::uint8_t> bytes) -> FieldValue {
    return FieldValue::binary(std::move(bytes));
}

auto is_timestamp(const FieldValue& value) -> bool {
    return is_tagged(value, timestamp_tag) && value[timestamp_tag].is_number_integer();
}

auto is_server_timestamp(const FieldValue& value) -> bool {
    return is_tagged(value, server_timestamp_tag) &&
           value[server_timestamp_tag].is_number_integer();
}

auto is_reference(const FieldValue& value) -> bool {
    return is_tagged(value, reference_tag) && value[reference_tag].is_string();
}

auto is_number(const FieldValue& value) -> bool {
    return value.is_number();
}

auto is_nan(const FieldValue& value) -> bool {
    return value.is_number_float() && std::isnan(value.get<double>());
}

auto timestamp_of(const FieldValue& value) -> std::optional<SnapshotVersion> {
    if (is_timestamp(value)) return SnapshotVersion{value[timestamp_tag].get<std::int64_t>()};
    return std::nullopt;
}

auto reference_of(const FieldValue& value) -> std::optional<DocumentKey> {
    if (!is_reference(value)) return std::nullopt;
    auto path = ResourcePath::from_string(value[reference_tag].get<std::string>());
    if (!DocumentKey::is_document_path(path)) return std::nullopt;
    return DocumentKey{std::move(path)};
}

// -- Ordering -----------------------------------------------------------------

auto type_order(const FieldValue& value) -> TypeOrder {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return TypeOrder::null_value;
        case nlohmann::json::value_t::boolean:
            return TypeOrder::boolean;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return TypeOrder::number;
        case nlohmann::json::value_t::string:
            return TypeOrder::string;
        case nlohmann::json::value_t::binary:
            return TypeOrder::bytes;
        case nlohmann::json::value_t::array:
            return TypeOrder::array;
        case nlohmann::json::value_t::object:
            if (is_timestamp(value)) return TypeOrder::timestamp;
            if (is_server_timestamp(value)) return TypeOrder::server_timestamp;
            if (is_reference(value)) return TypeOrder::reference;
            return TypeOrder::map;
    }
    return TypeOrder::null_value;
}

auto compare_values(const FieldValue& lhs, const FieldValue& rhs) -> std::weak_ordering {
    auto lt = type_order(lhs);
    auto rt = type_order(rhs);
    if (lt != rt) return static_cast<int>(lt) <=> static_cast<int>(rt);

    switch (lt) {
        case TypeOrder::null_value:
            return std::weak_ordering::equivalent;
        case TypeOrder::boolean:
            return lhs.get<bool>() <=> rhs.get<bool>();
        case TypeOrder::number:
            return compare_numbers(lhs, rhs);
        case TypeOrder::timestamp:
            return lhs[timestamp_tag].get<std::int64_t>() <=> rhs[timestamp_tag].get<std::int64_t>();
        case TypeOrder::server_timestamp:
            return lhs[server_timestamp_tag].get<std::int64_t>() <=>
                   rhs[server_timestamp_tag].get<std::int64_t>();
        case TypeOrder::string:
            return to_ordering(lhs.get_ref<const std::string&>().compare(
                rhs.get_ref<const std::string&>()));
        case TypeOrder::bytes:
            return static_cast<const std::vector<std::uint8_t>&>(lhs.get_binary()) <=>
                   static_cast<const std::vector<std::uint8_t>&>(rhs.get_binary());
        case TypeOrder::reference:
            return ResourcePath::from_string(lhs[reference_tag].get<std::string>()) <=>
                   ResourcePath::from_string(rhs[reference_tag].get<std::string>());
        case TypeOrder::array: {
            auto n = std::min(lhs.size(), rhs.size());
            for (std::size_t i = 0; i < n; ++i) {
                auto c = compare_values(lhs[i], rhs[i]);
                if (c != 0) return c;
            }
            return lhs.size() <=> rhs.size();
        }
        case TypeOrder::map: {
            auto li = lhs.begin();
            auto ri = rhs.begin();
            for (; li != lhs.end() && ri != rhs.end(); ++li, ++ri) {
                auto kc = li.key().compare(ri.key());
                if (kc != 0) return to_ordering(kc);
                auto vc = compare_values(li.value(), ri.value());
                if (vc != 0) return vc;
            }
            return lhs.size() <=> rhs.size();
        }
    }
    return std::weak_ordering::equivalent;
}

auto values_equal(const FieldValue& lhs, const FieldValue& rhs) -> bool {
    return compare_values(lhs, rhs) == 0;
}

auto array_contains(const FieldValue& array, const FieldValue& element) -> bool {
    if (!array.is_array()) return false;
    return std::any_of(array.begin(), array.end(),
                       [&](const FieldValue& v) { return values_equal(v, element); });
}

auto canonical_id(const FieldValue& value) -> std::string {
    switch (type_order(value)) {
        case TypeOrder::null_value:
            return "null";
        case TypeOrder::boolean:
            return value.get<bool>() ? "true" : "false";
        case TypeOrder::number:
            if (value.is_number_integer()) return value.dump();
            return format_double(value.get<double>());
        case TypeOrder::timestamp:
            return "time(" + std::to_string(value[timestamp_tag].get<std::int64_t>()) + ")";
        case TypeOrder::server_timestamp:
            return "server_time(" +
                   std::to_string(value[server_timestamp_tag].get<std::int64_t>()) + ")";
        case TypeOrder::string:
            return value.dump();
        case TypeOrder::bytes:
            return "bytes(" + hex(value.get_binary()) + ")";
        case TypeOrder::reference:
            return "ref(" + value[reference_tag].get<std::string>() + ")";
        case TypeOrder::array: {
            auto result = std::string{"["};
            auto first = true;
            for (const auto& element : value) {
                if (!first) result += ',';
                first = false;
                result += canonical_id(element);
            }
            return result + "]";
        }
        case TypeOrder::map: {
            auto result = std::string{"{"};
            auto first = true;
            for (const auto& [key, element] : value.items()) {
                if (!first) result += ',';
                first = false;
                result += key + ':' + canonical_id(element);
            }
            return result + "}";
        }
    }
    return {};
}

// -- Object access ------------------------------------------------------------

auto get_field(const ObjectValue& object, const FieldPath& path) -> const FieldValue* {
    const auto* current = &object;
    for (const auto& segment : path.segments()) {
        if (!current->is_object()) return nullptr;
        auto it = current->find(segment);
        if (it == current->end()) return nullptr;
        current = &*it;
    }
    return current;
}

void set_field(ObjectValue& object, const FieldPath& path, FieldValue value) {
    if (path.empty()) return;
    auto* current = &object;
    const auto& segments = path.segments();
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!current->is_object()) *current = ObjectValue::object();
        auto& next = (*current)[segments[i]];
        if (!next.is_object() || type_order(next) != TypeOrder::map) {
            next = ObjectValue::object();
        }
        current = &next;
    }
    if (!current->is_object()) *current = ObjectValue::object();
    (*current)[segments.back()] = std::move(value);
}

void delete_field(ObjectValue& object, const FieldPath& path) {
    if (path.empty()) return;
    auto* current = &object;
    const auto& segments = path.segments();
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!current->is_object()) return;
        auto it = current->find(segments[i]);
        if (it == current->end()) return;
        current = &*it;
    }
    if (current->is_object()) current->erase(segments.back());
}

auto leaf_paths(const ObjectValue& object) -> FieldMask {
    auto result = FieldMask{};
    if (object.is_object()) collect_leaf_paths(object, FieldPath{}, result);
    return result;
}

}  // namespace docsync_cpp

#include "index_manager.hpp"

#include "keys.hpp"
#include "local_serializer.hpp"

#include <algorithm>
#include <map>

namespace docsync_cpp::local {

namespace {

auto encode_index_value(const FieldValue& value) -> std::string {
    return keys::escape(canonical_id(value)) + keys::segment_end;
}

auto target_collection_group(const Target& target) -> std::optional<std::string> {
    if (target.is_document_query()) return std::nullopt;
    if (target.collection_group()) return *target.collection_group();
    if (target.path().empty()) return std::nullopt;
    return target.path().last_segment();
}

auto is_equality(const FieldFilter& filter) -> bool {
    return filter.op == FilterOperator::equal || filter.op == FilterOperator::in;
}

// The equality filter on `field`, if any.
auto equality_filter(const Target& target, const FieldPath& field) -> const FieldFilter* {
    for (const auto& filter : target.filters()) {
        if (filter.field == field && is_equality(filter) && !field.is_key_field()) return &filter;
    }
    return nullptr;
}

// The encoded entry values of `doc` for `index`, or nullopt if the
// document does not exist or lacks an indexed field.
auto entry_values(const FieldIndex& index, const Document& doc) -> std::optional<std::string> {
    if (!doc.is_found_document()) return std::nullopt;
    auto values = std::string{};
    for (const auto& field : index.fields) {
        const auto* value = get_field(doc.data(), field);
        if (value == nullptr) return std::nullopt;
        values += encode_index_value(*value);
    }
    return values;
}

}  // namespace

auto to_string_view(IndexType type) noexcept -> std::string_view {
    switch (type) {
        case IndexType::none:    return "none";
        case IndexType::partial: return "partial";
        case IndexType::full:    return "full";
    }
    return "?";
}

IndexManager::IndexManager(Persistence& persistence) : persistence_{persistence} {}

// -- Collection parents -------------------------------------------------------

void IndexManager::add_to_collection_parent_index(const ResourcePath& collection_path) {
    util::hard_assert(collection_path.size() % 2 == 1, "expected a collection path, got {}",
                      collection_path.canonical_string());
    auto key = keys::collection_parent(collection_path.last_segment(), collection_path.pop_last());
    if (!txn().contains(key)) txn().put(std::move(key), std::string{});
}

auto IndexManager::get_collection_parents(const std::string& collection_id)
    -> std::vector<ResourcePath> {
    auto prefix = keys::collection_parent_prefix(collection_id);
    auto result = std::vector<ResourcePath>{};
    txn().scan(prefix, [&](std::string_view row, std::string_view) {
        result.push_back(keys::decode_path(row.substr(prefix.size())));
        return true;
    });
    return result;
}

// -- Field index definitions --------------------------------------------------

void IndexManager::save_index(const FieldIndex& index) {
    txn().put(keys::field_index(index.index_id), encode_field_index(index));
}

auto IndexManager::add_field_index(FieldIndex index) -> FieldIndex {
    auto next_id = std::int32_t{1};
    for (const auto& existing : get_field_indexes()) next_id = std::max(next_id, existing.index_id + 1);
    index.index_id = next_id;
    save_index(index);
    util::logger()->debug("added field index {} on {}", index.index_id, index.collection_group);
    return index;
}

void IndexManager::delete_entries(std::int32_t index_id) {
    auto& t = txn();
    auto rows = std::vector<std::string>{};
    auto collect = [&](std::string_view row, std::string_view) {
        rows.emplace_back(row);
        return true;
    };
    t.scan(keys::index_entry_prefix(index_id, {}), collect);
    t.scan(keys::index_document_prefix(index_id), collect);
    for (auto& row : rows) t.erase(std::move(row));
}

void IndexManager::delete_field_index(const FieldIndex& index) {
    delete_entries(index.index_id);
    txn().erase(keys::field_index(index.index_id));
}

void IndexManager::delete_all_field_indexes() {
    for (const auto& index : get_field_indexes()) delete_field_index(index);
}

auto IndexManager::get_field_indexes() -> std::vector<FieldIndex> {
    auto result = std::vector<FieldIndex>{};
    txn().scan(keys::field_index_prefix, [&](std::string_view, std::string_view value) {
        result.push_back(decode_field_index(value));
        return true;
    });
    return result;
}

auto IndexManager::get_field_indexes(const std::string& collection_group) -> std::vector<FieldIndex> {
    auto result = get_field_indexes();
    std::erase_if(result, [&](const FieldIndex& index) { return index.collection_group != collection_group; });
    return result;
}

// -- Target lookups -----------------------------------------------------------

auto IndexManager::best_index(const Target& target) -> std::optional<IndexMatch> {
    auto group = target_collection_group(target);
    if (!group) return std::nullopt;

    auto best = std::optional<IndexMatch>{};
    for (auto& index : get_field_indexes(*group)) {
        auto matched = std::size_t{0};
        while (matched < index.fields.size() && equality_filter(target, index.fields[matched])) {
            ++matched;
        }
        if (matched == 0) continue;
        if (!best || matched > best->matched_fields) best = IndexMatch{std::move(index), matched};
    }
    return best;
}

auto IndexManager::get_index_type(const Target& target) -> IndexType {
    auto match = best_index(target);
    if (!match) return IndexType::none;

    const auto& fields = match->index.fields;
    auto served = std::all_of(target.filters().begin(), target.filters().end(), [&](const FieldFilter& f) {
        auto end = fields.begin() + static_cast<std::ptrdiff_t>(match->matched_fields);
        return is_equality(f) && std::find(fields.begin(), end, f.field) != end;
    });
    return served ? IndexType::full : IndexType::partial;
}

auto IndexManager::get_documents_matching_target(const Target& target)
    -> std::optional<std::vector<DocumentKey>> {
    auto match = best_index(target);
    if (!match) return std::nullopt;

    // One lookup prefix per combination of `in` values
    auto prefixes = std::vector<std::string>{std::string{}};
    for (std::size_t i = 0; i < match->matched_fields; ++i) {
        const auto* filter = equality_filter(target, match->index.fields[i]);
        auto values = std::vector<FieldValue>{};
        if (filter->op == FilterOperator::in && filter->value.is_array()) {
            values.assign(filter->value.begin(), filter->value.end());
        } else {
            values.push_back(filter->value);
        }
        auto next = std::vector<std::string>{};
        for (const auto& prefix : prefixes) {
            for (const auto& value : values) next.push_back(prefix + encode_index_value(value));
        }
        prefixes = std::move(next);
    }

    auto seen = DocumentKeySet{};
    auto& t = txn();
    for (const auto& values : prefixes) {
        auto prefix = keys::index_entry_prefix(match->index.index_id, values);
        t.scan(prefix, [&](std::string_view row, std::string_view) {
            auto path = row.substr(row.rfind(keys::separator) + 1);
            seen.insert(DocumentKey{keys::decode_path(path)});
            return true;
        });
    }
    util::logger()->debug("index {} yielded {} candidates for {}", match->index.index_id, seen.size(),
                          target.canonical_id());
    return std::vector<DocumentKey>{seen.begin(), seen.end()};
}

void IndexManager::update_index_entries(const DocumentMap& documents) {
    auto indexes_by_group = std::map<std::string, std::vector<FieldIndex>>{};
    for (auto& index : get_field_indexes()) {
        indexes_by_group[index.collection_group].push_back(std::move(index));
    }
    auto& t = txn();
    for (const auto& [key, doc] : documents) {
        auto it = indexes_by_group.find(key.collection_group());
        if (it == indexes_by_group.end()) continue;
        for (const auto& index : it->second) {
            auto doc_row = keys::index_document(index.index_id, key);
            auto previous = t.get(doc_row);
            auto current = entry_values(index, doc);
            if (previous == current) continue;
            if (previous) t.erase(keys::index_entry(index.index_id, *previous, key));
            if (current) {
                t.put(keys::index_entry(index.index_id, *current, key), std::string{});
                t.put(std::move(doc_row), *current);
            } else {
                t.erase(std::move(doc_row));
            }
        }
    }
}

// -- Backfill bookkeeping -----------------------------------------------------

auto IndexManager::get_min_offset(const Target& target) -> IndexOffset {
    auto match = best_index(target);
    if (!match) return IndexOffset::none();
    return match->index.state.offset;
}

auto IndexManager::get_min_offset(const std::string& collection_group) -> IndexOffset {
    auto indexes = get_field_indexes(collection_group);
    if (indexes.empty()) return IndexOffset::none();
    auto min = indexes.front().state.offset;
    for (const auto& index : indexes) min = std::min(min, index.state.offset);
    return min;
}

void IndexManager::update_collection_group(const std::string& collection_group,
                                           const IndexOffset& offset) {
    auto indexes = get_field_indexes();
    auto next_sequence_number = ListenSequenceNumber{1};
    for (const auto& index : indexes) {
        next_sequence_number = std::max(next_sequence_number, index.state.sequence_number + 1);
    }
    for (auto& index : indexes) {
        if (index.collection_group != collection_group) continue;
        index.state = FieldIndex::State{next_sequence_number, offset};
        save_index(index);
    }
}

auto IndexManager::get_next_collection_group_to_update() -> std::optional<std::string> {
    auto indexes = get_field_indexes();
    if (indexes.empty()) return std::nullopt;
    auto oldest = std::min_element(indexes.begin(), indexes.end(), [](const FieldIndex& a, const FieldIndex& b) {
        return a.state.sequence_number < b.state.sequence_number;
    });
    return oldest->collection_group;
}

void IndexManager::create_target_indexes(const Target& target) {
    auto group = target_collection_group(target);
    if (!group) return;

    auto index = FieldIndex{};
    index.collection_group = *group;
    for (const auto& filter : target.filters()) {
        if (!is_equality(filter) || filter.field.is_key_field()) continue;
        if (std::find(index.fields.begin(), index.fields.end(), filter.field) == index.fields.end()) {
            index.fields.push_back(filter.field);
        }
    }
    if (index.fields.empty()) return;

    for (const auto& existing : get_field_indexes(*group)) {
        if (existing.same_definition(index)) return;
    }
    add_field_index(std::move(index));
}

}  // namespace docsync_cpp::local

#include <docsync-cpp/mutation.hpp>

#include "../util/hard_assert.hpp"

#include <algorithm>
#include <limits>

namespace docsync_cpp {

namespace {

// Integer addition that saturates instead of overflowing.
auto safe_increment(std::int64_t lhs, std::int64_t rhs) -> std::int64_t {
    if (lhs > 0 && rhs > std::numeric_limits<std::int64_t>::max() - lhs) {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (lhs < 0 && rhs < std::numeric_limits<std::int64_t>::min() - lhs) {
        return std::numeric_limits<std::int64_t>::min();
    }
    return lhs + rhs;
}

auto coerce_to_array(const FieldValue* previous) -> FieldValue {
    if (previous && previous->is_array()) return *previous;
    return FieldValue::array();
}

auto apply_increment(const FieldValue* previous, const FieldValue& operand) -> FieldValue {
    auto base = (previous && previous->is_number()) ? *previous : FieldValue(0);
    if (base.is_number_integer() && operand.is_number_integer()) {
        return safe_increment(base.get<std::int64_t>(), operand.get<std::int64_t>());
    }
    return base.get<double>() + operand.get<double>();
}

// The value a transform produces locally, before the server has seen it.
auto transform_local_value(const TransformOperation& operation, const FieldValue* previous,
                           SnapshotVersion local_write_time) -> FieldValue {
    return std::visit(overload{
        [&](const ServerTimestampTransform&) { return server_timestamp_value(local_write_time); },
        [&](const ArrayUnionTransform& t) {
            auto result = coerce_to_array(previous);
            for (const auto& element : t.elements) {
                if (!array_contains(result, element)) result.push_back(element);
            }
            return result;
        },
        [&](const ArrayRemoveTransform& t) {
            auto result = FieldValue::array();
            for (const auto& existing : coerce_to_array(previous)) {
                auto removed = std::any_of(t.elements.begin(), t.elements.end(),
                                           [&](const FieldValue& e) { return values_equal(e, existing); });
                if (!removed) result.push_back(existing);
            }
            return result;
        },
        [&](const NumericIncrementTransform& t) { return apply_increment(previous, t.operand); },
    }, operation);
}

// The value a transform produces once the server acknowledged it. Array
// transforms are replayed locally; the others take the server's result.
auto transform_remote_value(const TransformOperation& operation, const FieldValue* previous,
                            const FieldValue& server_result) -> FieldValue {
    return std::visit(overload{
        [&](const ArrayUnionTransform&) {
            return transform_local_value(operation, previous, SnapshotVersion::none());
        },
        [&](const ArrayRemoveTransform&) {
            return transform_local_value(operation, previous, SnapshotVersion::none());
        },
        [&](const auto&) { return server_result; },
    }, operation);
}

// The pre-image a non-idempotent transform reads, or nullopt.
auto transform_base_value(const TransformOperation& operation, const FieldValue* previous)
    -> std::optional<FieldValue> {
    if (!std::holds_alternative<NumericIncrementTransform>(operation)) return std::nullopt;
    if (previous && previous->is_number()) return *previous;
    return FieldValue(0);
}

void apply_patch(ObjectValue& data, const PatchMutation& patch) {
    for (const auto& path : patch.mask) {
        if (path.empty()) continue;
        if (const auto* value = get_field(patch.value, path)) {
            set_field(data, path, *value);
        } else {
            delete_field(data, path);
        }
    }
}

}  // namespace

// -- Precondition -------------------------------------------------------------

auto Precondition::exists(bool exists) -> Precondition {
    auto p = Precondition{};
    p.type_ = Type::exists;
    p.exists_ = exists;
    return p;
}

auto Precondition::update_time(SnapshotVersion version) -> Precondition {
    auto p = Precondition{};
    p.type_ = Type::update_time;
    p.update_time_ = version;
    return p;
}

auto Precondition::is_valid_for(const MutableDocument& doc) const -> bool {
    switch (type_) {
        case Type::none:
            return true;
        case Type::exists:
            return exists_ == doc.is_found_document();
        case Type::update_time:
            return doc.is_found_document() && doc.version() == update_time_;
    }
    return false;
}

auto FieldTransform::is_idempotent() const -> bool {
    return !std::holds_alternative<NumericIncrementTransform>(operation);
}

// -- Mutation -----------------------------------------------------------------

Mutation::Mutation(DocumentKey key, MutationKind kind, Precondition precondition,
                   std::vector<FieldTransform> transforms)
    : key_{std::move(key)},
      kind_{std::move(kind)},
      precondition_{precondition},
      field_transforms_{std::move(transforms)} {}

auto Mutation::set(DocumentKey key, ObjectValue value, std::vector<FieldTransform> transforms)
    -> Mutation {
    return Mutation{std::move(key), SetMutation{std::move(value)}, Precondition::none(),
                    std::move(transforms)};
}

auto Mutation::patch(DocumentKey key, ObjectValue value, FieldMask mask, Precondition precondition,
                     std::vector<FieldTransform> transforms) -> Mutation {
    return Mutation{std::move(key), PatchMutation{std::move(value), std::move(mask)}, precondition,
                    std::move(transforms)};
}

auto Mutation::delete_document(DocumentKey key, Precondition precondition) -> Mutation {
    return Mutation{std::move(key), DeleteMutation{}, precondition};
}

auto Mutation::verify(DocumentKey key, SnapshotVersion version) -> Mutation {
    return Mutation{std::move(key), VerifyMutation{}, Precondition::update_time(version)};
}

void Mutation::apply_to_remote_document(MutableDocument& doc, const MutationResult& result) const {
    auto transform_results = [&](const ObjectValue& previous) {
        auto values = std::vector<FieldValue>{};
        if (field_transforms_.empty()) return values;
        util::hard_assert(result.transform_results.has_value() &&
                              result.transform_results->size() == field_transforms_.size(),
                          "server returned {} transform results for {} transforms on {}",
                          result.transform_results ? result.transform_results->size() : 0,
                          field_transforms_.size(), key_.to_string());
        for (std::size_t i = 0; i < field_transforms_.size(); ++i) {
            const auto& transform = field_transforms_[i];
            values.push_back(transform_remote_value(transform.operation,
                                                    get_field(previous, transform.path),
                                                    (*result.transform_results)[i]));
        }
        return values;
    };

    std::visit(overload{
        [&](const SetMutation& m) {
            auto results = transform_results(doc.data());
            auto data = m.value;
            for (std::size_t i = 0; i < results.size(); ++i) {
                set_field(data, field_transforms_[i].path, std::move(results[i]));
            }
            doc.convert_to_found(result.version, std::move(data)).set_has_committed_mutations();
        },
        [&](const PatchMutation& m) {
            if (!precondition_.is_valid_for(doc)) {
                // The patch applied on the server to a document we never saw
                doc.convert_to_unknown(result.version);
                return;
            }
            auto results = transform_results(doc.data());
            auto data = doc.data();
            apply_patch(data, m);
            for (std::size_t i = 0; i < results.size(); ++i) {
                set_field(data, field_transforms_[i].path, std::move(results[i]));
            }
            doc.convert_to_found(result.version, std::move(data)).set_has_committed_mutations();
        },
        [&](const DeleteMutation&) {
            doc.convert_to_no_document(result.version).set_has_committed_mutations();
        },
        [&](const VerifyMutation&) {},
    }, kind_);
}

auto Mutation::apply_to_local_view(MutableDocument& doc, std::optional<FieldMask> previous_mask,
                                   SnapshotVersion local_write_time) const
    -> std::optional<FieldMask> {
    if (!precondition_.is_valid_for(doc)) return previous_mask;

    auto apply_transforms = [&](ObjectValue& data, const ObjectValue& previous) {
        for (const auto& transform : field_transforms_) {
            set_field(data, transform.path,
                      transform_local_value(transform.operation, get_field(previous, transform.path),
                                            local_write_time));
        }
    };

    return std::visit(overload{
        [&](const SetMutation& m) -> std::optional<FieldMask> {
            auto data = m.value;
            apply_transforms(data, doc.data());
            doc.convert_to_found(doc.version(), std::move(data)).set_has_local_mutations();
            return std::nullopt;
        },
        [&](const PatchMutation& m) -> std::optional<FieldMask> {
            auto previous = doc.data();
            auto data = previous;
            apply_patch(data, m);
            apply_transforms(data, previous);
            doc.convert_to_found(doc.version(), std::move(data)).set_has_local_mutations();
            if (!previous_mask) return std::nullopt;
            auto merged = *previous_mask;
            merged.insert(m.mask.begin(), m.mask.end());
            for (const auto& transform : field_transforms_) merged.insert(transform.path);
            return merged;
        },
        [&](const DeleteMutation&) -> std::optional<FieldMask> {
            doc.convert_to_no_document(doc.version()).set_has_local_mutations();
            return std::nullopt;
        },
        [&](const VerifyMutation&) -> std::optional<FieldMask> { return previous_mask; },
    }, kind_);
}

auto Mutation::extract_transform_base_value(const MutableDocument& doc) const
    -> std::optional<ObjectValue> {
    auto base = std::optional<ObjectValue>{};
    for (const auto& transform : field_transforms_) {
        auto existing = doc.field(transform.path);
        auto value = transform_base_value(transform.operation, existing ? &*existing : nullptr);
        if (!value) continue;
        if (!base) base = ObjectValue::object();
        set_field(*base, transform.path, std::move(*value));
    }
    return base;
}

auto Mutation::calculate_overlay_mutation(const MutableDocument& doc,
                                          const std::optional<FieldMask>& mask)
    -> std::optional<Mutation> {
    if (!doc.has_local_mutations()) return std::nullopt;
    if (mask && mask->empty()) return std::nullopt;

    if (!mask) {
        if (doc.is_no_document()) return delete_document(doc.key());
        return Mutation{doc.key(), SetMutation{doc.data()}};
    }

    const auto& data = doc.data();
    auto patch_value = ObjectValue::object();
    auto patch_mask = FieldMask{};
    for (auto path : *mask) {
        if (patch_mask.contains(path)) continue;
        const auto* value = get_field(data, path);
        // A deleted nested field is written back through its parent
        if (!value && path.size() > 1) {
            path = FieldPath{std::vector<std::string>{path.segments().begin(),
                                                      path.segments().end() - 1}};
            value = get_field(data, path);
        }
        if (value) set_field(patch_value, path, *value);
        patch_mask.insert(std::move(path));
    }
    return patch(doc.key(), std::move(patch_value), std::move(patch_mask), Precondition::none());
}

auto Mutation::to_string() const -> std::string {
    auto kind = std::visit(overload{
        [](const SetMutation& m) { return "Set(" + m.value.dump() + ")"; },
        [](const PatchMutation& m) {
            auto fields = std::string{};
            for (const auto& path : m.mask) {
                if (!fields.empty()) fields += ',';
                fields += path.canonical_string();
            }
            return "Patch(" + m.value.dump() + ", [" + fields + "])";
        },
        [](const DeleteMutation&) { return std::string{"Delete"}; },
        [](const VerifyMutation&) { return std::string{"Verify"}; },
    }, kind_);
    return "Mutation(" + key_.to_string() + ", " + kind + ", " +
           std::to_string(field_transforms_.size()) + " transforms)";
}

// -- MutationBatch ------------------------------------------------------------

void MutationBatch::apply_to_remote_document(MutableDocument& doc,
                                             const std::vector<MutationResult>& results) const {
    util::hard_assert(results.size() == mutations_.size(),
                      "batch {} has {} mutations but {} results", batch_id_,
                      mutations_.size(), results.size());
    for (std::size_t i = 0; i < mutations_.size(); ++i) {
        if (mutations_[i].key() == doc.key()) {
            mutations_[i].apply_to_remote_document(doc, results[i]);
        }
    }
}

auto MutationBatch::apply_to_local_view(MutableDocument& doc, std::optional<FieldMask> mask) const
    -> std::optional<FieldMask> {
    // Base mutations restore the values transforms read when the batch was
    // written, so the transforms replay to the same result.
    for (const auto& m : base_mutations_) {
        if (m.key() == doc.key()) mask = m.apply_to_local_view(doc, std::move(mask), local_write_time_);
    }
    for (const auto& m : mutations_) {
        if (m.key() == doc.key()) mask = m.apply_to_local_view(doc, std::move(mask), local_write_time_);
    }
    return mask;
}

auto MutationBatch::apply_to_local_document_set(OverlayedDocumentMap& docs,
                                                const DocumentKeySet& documents_without_remote_version) const
    -> std::map<DocumentKey, Mutation> {
    auto overlays = std::map<DocumentKey, Mutation>{};
    for (const auto& key : keys()) {
        auto it = docs.find(key);
        if (it == docs.end()) {
            it = docs.emplace(key, OverlayedDocument{MutableDocument::invalid(key), FieldMask{}}).first;
        }
        auto& overlayed = it->second;
        auto mask = apply_to_local_view(overlayed.document, overlayed.mutated_fields);
        if (documents_without_remote_version.contains(key)) mask = std::nullopt;
        overlayed.mutated_fields = mask;
        if (auto overlay = Mutation::calculate_overlay_mutation(overlayed.document, mask)) {
            overlays.emplace(key, std::move(*overlay));
        }
        if (!overlayed.document.is_valid_document()) {
            overlayed.document.convert_to_no_document(SnapshotVersion::none());
        }
    }
    return overlays;
}

auto MutationBatch::keys() const -> DocumentKeySet {
    auto result = DocumentKeySet{};
    for (const auto& m : mutations_) result.insert(m.key());
    return result;
}

auto MutationBatchResult::document_versions() const -> std::map<DocumentKey, SnapshotVersion> {
    auto versions = std::map<DocumentKey, SnapshotVersion>{};
    const auto& mutations = batch.mutations();
    for (std::size_t i = 0; i < mutations.size() && i < mutation_results.size(); ++i) {
        versions[mutations[i].key()] = mutation_results[i].version;
    }
    return versions;
}

}  // namespace docsync_cpp

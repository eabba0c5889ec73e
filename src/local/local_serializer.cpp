#include "local_serializer.hpp"

#include "../storage/deserializer.hpp"
#include "../storage/serializer.hpp"

#include <docsync-cpp/error.hpp>

#include <fmt/format.h>

#include <optional>
#include <utility>
#include <variant>

namespace docsync_cpp::local {

namespace {

using storage::Deserializer;
using storage::Serializer;

template <typename T>
auto require(std::optional<T> value, std::string_view what) -> T {
    if (!value) {
        throw Exception{ErrorCode::data_loss, fmt::format("malformed {} record", what)};
    }
    return std::move(*value);
}

enum class ContentsTag : std::uint8_t { invalid = 0, found = 1, no_document = 2, unknown = 3 };
enum class KindTag : std::uint8_t { set = 0, patch = 1, delete_document = 2, verify = 3 };
enum class TransformTag : std::uint8_t {
    server_timestamp = 0, array_union = 1, array_remove = 2, increment = 3,
};

// -- Writers ------------------------------------------------------------------

void write_document(Serializer& s, const MutableDocument& doc) {
    s.write_key(doc.key());
    std::visit(overload{
        [&](const InvalidContents&) {
            s.write_u8(static_cast<std::uint8_t>(ContentsTag::invalid));
        },
        [&](const FoundContents& c) {
            s.write_u8(static_cast<std::uint8_t>(ContentsTag::found));
            s.write_version(c.version);
            s.write_version(c.create_time);
            s.write_value(c.data);
        },
        [&](const NoDocumentContents& c) {
            s.write_u8(static_cast<std::uint8_t>(ContentsTag::no_document));
            s.write_version(c.version);
        },
        [&](const UnknownContents& c) {
            s.write_u8(static_cast<std::uint8_t>(ContentsTag::unknown));
            s.write_version(c.version);
        },
    }, doc.contents());
    s.write_u8(static_cast<std::uint8_t>(doc.state()));
    s.write_version(doc.read_time());
}

void write_precondition(Serializer& s, const Precondition& p) {
    s.write_u8(static_cast<std::uint8_t>(p.type()));
    switch (p.type()) {
        case Precondition::Type::none: break;
        case Precondition::Type::exists: s.write_bool(p.exists_value()); break;
        case Precondition::Type::update_time: s.write_version(p.update_time_value()); break;
    }
}

void write_transform(Serializer& s, const FieldTransform& t) {
    s.write_field_path(t.path);
    std::visit(overload{
        [&](const ServerTimestampTransform&) {
            s.write_u8(static_cast<std::uint8_t>(TransformTag::server_timestamp));
        },
        [&](const ArrayUnionTransform& op) {
            s.write_u8(static_cast<std::uint8_t>(TransformTag::array_union));
            s.write_value(FieldValue(op.elements));
        },
        [&](const ArrayRemoveTransform& op) {
            s.write_u8(static_cast<std::uint8_t>(TransformTag::array_remove));
            s.write_value(FieldValue(op.elements));
        },
        [&](const NumericIncrementTransform& op) {
            s.write_u8(static_cast<std::uint8_t>(TransformTag::increment));
            s.write_value(op.operand);
        },
    }, t.operation);
}

void write_mutation(Serializer& s, const Mutation& m) {
    s.write_key(m.key());
    write_precondition(s, m.precondition());
    std::visit(overload{
        [&](const SetMutation& k) {
            s.write_u8(static_cast<std::uint8_t>(KindTag::set));
            s.write_value(k.value);
        },
        [&](const PatchMutation& k) {
            s.write_u8(static_cast<std::uint8_t>(KindTag::patch));
            s.write_value(k.value);
            s.write_uleb128(k.mask.size());
            for (const auto& path : k.mask) s.write_field_path(path);
        },
        [&](const DeleteMutation&) {
            s.write_u8(static_cast<std::uint8_t>(KindTag::delete_document));
        },
        [&](const VerifyMutation&) {
            s.write_u8(static_cast<std::uint8_t>(KindTag::verify));
        },
    }, m.kind());
    s.write_vector(m.field_transforms(), [&](const FieldTransform& t) { write_transform(s, t); });
}

void write_bound(Serializer& s, const std::optional<Bound>& bound) {
    s.write_bool(bound.has_value());
    if (!bound) return;
    s.write_vector(bound->position, [&](const FieldValue& v) { s.write_value(v); });
    s.write_bool(bound->inclusive);
}

void write_target(Serializer& s, const Target& target) {
    s.write_path(target.path());
    s.write_bool(target.collection_group().has_value());
    if (target.collection_group()) s.write_string(*target.collection_group());
    s.write_vector(target.filters(), [&](const FieldFilter& f) {
        s.write_field_path(f.field);
        s.write_u8(static_cast<std::uint8_t>(f.op));
        s.write_value(f.value);
    });
    s.write_vector(target.order_by(), [&](const OrderBy& o) {
        s.write_field_path(o.field);
        s.write_u8(static_cast<std::uint8_t>(o.direction));
    });
    s.write_bool(target.limit().has_value());
    if (target.limit()) s.write_sleb128(*target.limit());
    write_bound(s, target.start_at());
    write_bound(s, target.end_at());
}

// -- Readers ------------------------------------------------------------------

auto read_document(Deserializer& d) -> MutableDocument {
    auto key = require(d.read_key(), "document");
    auto tag = require(d.read_u8(), "document");
    auto doc = MutableDocument{};
    switch (static_cast<ContentsTag>(tag)) {
        case ContentsTag::invalid:
            doc = MutableDocument::invalid(std::move(key));
            break;
        case ContentsTag::found: {
            auto version = require(d.read_version(), "document");
            auto create_time = require(d.read_version(), "document");
            auto data = require(d.read_value(), "document");
            doc = MutableDocument::found(std::move(key), version, std::move(data));
            doc.set_create_time(create_time);
            break;
        }
        case ContentsTag::no_document:
            doc = MutableDocument::no_document(std::move(key), require(d.read_version(), "document"));
            break;
        case ContentsTag::unknown:
            doc = MutableDocument::unknown(std::move(key), require(d.read_version(), "document"));
            break;
        default:
            throw Exception{ErrorCode::data_loss, fmt::format("unknown document tag {}", tag)};
    }
    switch (static_cast<DocumentState>(require(d.read_u8(), "document"))) {
        case DocumentState::synced: break;
        case DocumentState::has_local_mutations: doc.set_has_local_mutations(); break;
        case DocumentState::has_committed_mutations: doc.set_has_committed_mutations(); break;
        default: throw Exception{ErrorCode::data_loss, "unknown document state"};
    }
    doc.set_read_time(require(d.read_version(), "document"));
    return doc;
}

auto read_precondition(Deserializer& d) -> Precondition {
    switch (static_cast<Precondition::Type>(require(d.read_u8(), "precondition"))) {
        case Precondition::Type::none: return Precondition::none();
        case Precondition::Type::exists: return Precondition::exists(require(d.read_bool(), "precondition"));
        case Precondition::Type::update_time:
            return Precondition::update_time(require(d.read_version(), "precondition"));
    }
    throw Exception{ErrorCode::data_loss, "unknown precondition type"};
}

auto read_elements(Deserializer& d) -> std::vector<FieldValue> {
    auto value = require(d.read_value(), "transform");
    if (!value.is_array()) throw Exception{ErrorCode::data_loss, "transform elements are not an array"};
    return value.get<std::vector<FieldValue>>();
}

auto read_transform(Deserializer& d) -> std::optional<FieldTransform> {
    auto path = require(d.read_field_path(), "transform");
    switch (static_cast<TransformTag>(require(d.read_u8(), "transform"))) {
        case TransformTag::server_timestamp:
            return FieldTransform{std::move(path), ServerTimestampTransform{}};
        case TransformTag::array_union:
            return FieldTransform{std::move(path), ArrayUnionTransform{read_elements(d)}};
        case TransformTag::array_remove:
            return FieldTransform{std::move(path), ArrayRemoveTransform{read_elements(d)}};
        case TransformTag::increment:
            return FieldTransform{std::move(path),
                                  NumericIncrementTransform{require(d.read_value(), "transform")}};
    }
    throw Exception{ErrorCode::data_loss, "unknown transform type"};
}

auto read_mutation(Deserializer& d) -> std::optional<Mutation> {
    auto key = require(d.read_key(), "mutation");
    auto precondition = read_precondition(d);
    auto kind = MutationKind{};
    switch (static_cast<KindTag>(require(d.read_u8(), "mutation"))) {
        case KindTag::set:
            kind = SetMutation{require(d.read_value(), "mutation")};
            break;
        case KindTag::patch: {
            auto value = require(d.read_value(), "mutation");
            auto count = require(d.read_uleb128(), "mutation");
            auto mask = FieldMask{};
            for (std::uint64_t i = 0; i < count; ++i) mask.insert(require(d.read_field_path(), "mutation"));
            kind = PatchMutation{std::move(value), std::move(mask)};
            break;
        }
        case KindTag::delete_document:
            kind = DeleteMutation{};
            break;
        case KindTag::verify:
            kind = VerifyMutation{};
            break;
        default:
            throw Exception{ErrorCode::data_loss, "unknown mutation type"};
    }
    auto transforms = require(d.read_vector<FieldTransform>([&] { return read_transform(d); }),
                              "mutation");
    return Mutation{std::move(key), std::move(kind), precondition, std::move(transforms)};
}

auto read_mutations(Deserializer& d) -> std::vector<Mutation> {
    return require(d.read_vector<Mutation>([&] { return read_mutation(d); }), "mutation batch");
}

auto read_bound(Deserializer& d) -> std::optional<Bound> {
    if (!require(d.read_bool(), "bound")) return std::nullopt;
    auto position = require(d.read_vector<FieldValue>([&] { return d.read_value(); }), "bound");
    auto inclusive = require(d.read_bool(), "bound");
    return Bound{std::move(position), inclusive};
}

auto read_target(Deserializer& d) -> Target {
    auto path = require(d.read_path(), "target");
    auto collection_group = std::optional<std::string>{};
    if (require(d.read_bool(), "target")) collection_group = require(d.read_string(), "target");
    auto filters = require(d.read_vector<FieldFilter>([&]() -> std::optional<FieldFilter> {
        auto field = d.read_field_path();
        auto op = d.read_u8();
        auto value = d.read_value();
        if (!field || !op || !value || *op > static_cast<std::uint8_t>(FilterOperator::not_in)) {
            return std::nullopt;
        }
        return FieldFilter{std::move(*field), static_cast<FilterOperator>(*op), std::move(*value)};
    }), "target");
    auto order_by = require(d.read_vector<OrderBy>([&]() -> std::optional<OrderBy> {
        auto field = d.read_field_path();
        auto direction = d.read_u8();
        if (!field || !direction || *direction > 1) return std::nullopt;
        return OrderBy{std::move(*field), static_cast<Direction>(*direction)};
    }), "target");
    auto limit = std::optional<std::int32_t>{};
    if (require(d.read_bool(), "target")) {
        limit = static_cast<std::int32_t>(require(d.read_sleb128(), "target"));
    }
    auto start_at = read_bound(d);
    auto end_at = read_bound(d);
    return Target{std::move(path), std::move(collection_group), std::move(filters),
                  std::move(order_by), limit, std::move(start_at), std::move(end_at)};
}

}  // namespace

auto encode_document(const MutableDocument& doc) -> std::string {
    auto s = Serializer{};
    write_document(s, doc);
    return s.take();
}

auto decode_document(std::string_view bytes) -> MutableDocument {
    auto d = Deserializer{bytes};
    return read_document(d);
}

auto encode_mutation_batch(const MutationBatch& batch) -> std::string {
    auto s = Serializer{};
    s.write_sleb128(batch.batch_id());
    s.write_version(batch.local_write_time());
    s.write_vector(batch.base_mutations(), [&](const Mutation& m) { write_mutation(s, m); });
    s.write_vector(batch.mutations(), [&](const Mutation& m) { write_mutation(s, m); });
    return s.take();
}

auto decode_mutation_batch(std::string_view bytes) -> MutationBatch {
    auto d = Deserializer{bytes};
    auto batch_id = static_cast<BatchId>(require(d.read_sleb128(), "mutation batch"));
    auto write_time = require(d.read_version(), "mutation batch");
    auto base = read_mutations(d);
    auto mutations = read_mutations(d);
    return MutationBatch{batch_id, write_time, std::move(base), std::move(mutations)};
}

auto encode_overlay(const Overlay& overlay) -> std::string {
    auto s = Serializer{};
    s.write_sleb128(overlay.largest_batch_id);
    write_mutation(s, overlay.mutation);
    return s.take();
}

auto decode_overlay(std::string_view bytes) -> Overlay {
    auto d = Deserializer{bytes};
    auto largest_batch_id = static_cast<BatchId>(require(d.read_sleb128(), "overlay"));
    auto mutation = require(read_mutation(d), "overlay");
    return Overlay{largest_batch_id, std::move(mutation)};
}

auto encode_target_data(const TargetData& target_data) -> std::string {
    auto s = Serializer{};
    write_target(s, target_data.target);
    s.write_sleb128(target_data.target_id);
    s.write_sleb128(target_data.sequence_number);
    s.write_u8(static_cast<std::uint8_t>(target_data.purpose));
    s.write_version(target_data.snapshot_version);
    s.write_version(target_data.last_limbo_free_snapshot_version);
    s.write_string(target_data.resume_token);
    return s.take();
}

auto decode_target_data(std::string_view bytes) -> TargetData {
    auto d = Deserializer{bytes};
    auto result = TargetData{};
    result.target = read_target(d);
    result.target_id = static_cast<TargetId>(require(d.read_sleb128(), "target"));
    result.sequence_number = require(d.read_sleb128(), "target");
    auto purpose = require(d.read_u8(), "target");
    if (purpose > static_cast<std::uint8_t>(QueryPurpose::limbo_resolution)) {
        throw Exception{ErrorCode::data_loss, "unknown query purpose"};
    }
    result.purpose = static_cast<QueryPurpose>(purpose);
    result.snapshot_version = require(d.read_version(), "target");
    result.last_limbo_free_snapshot_version = require(d.read_version(), "target");
    result.resume_token = require(d.read_string(), "target");
    return result;
}

auto encode_field_index(const FieldIndex& index) -> std::string {
    auto s = Serializer{};
    s.write_sleb128(index.index_id);
    s.write_string(index.collection_group);
    s.write_vector(index.fields, [&](const FieldPath& f) { s.write_field_path(f); });
    s.write_sleb128(index.state.sequence_number);
    s.write_version(index.state.offset.read_time);
    s.write_path(index.state.offset.document_key.path());
    s.write_sleb128(index.state.offset.largest_batch_id);
    return s.take();
}

auto decode_field_index(std::string_view bytes) -> FieldIndex {
    auto d = Deserializer{bytes};
    auto index = FieldIndex{};
    index.index_id = static_cast<std::int32_t>(require(d.read_sleb128(), "field index"));
    index.collection_group = require(d.read_string(), "field index");
    index.fields = require(d.read_vector<FieldPath>([&] { return d.read_field_path(); }), "field index");
    index.state.sequence_number = require(d.read_sleb128(), "field index");
    index.state.offset.read_time = require(d.read_version(), "field index");
    // The offset key may be the empty key
    auto path = require(d.read_path(), "field index");
    if (!path.empty()) index.state.offset.document_key = DocumentKey{std::move(path)};
    index.state.offset.largest_batch_id = static_cast<BatchId>(require(d.read_sleb128(), "field index"));
    return index;
}

auto encode_mutation_queue_metadata(const MutationQueueMetadata& metadata) -> std::string {
    auto s = Serializer{};
    s.write_sleb128(metadata.last_acknowledged_batch_id);
    s.write_string(metadata.last_stream_token);
    return s.take();
}

auto decode_mutation_queue_metadata(std::string_view bytes) -> MutationQueueMetadata {
    auto d = Deserializer{bytes};
    auto metadata = MutationQueueMetadata{};
    metadata.last_acknowledged_batch_id =
        static_cast<BatchId>(require(d.read_sleb128(), "mutation queue metadata"));
    metadata.last_stream_token = require(d.read_string(), "mutation queue metadata");
    return metadata;
}

auto encode_target_global(const TargetGlobal& global) -> std::string {
    auto s = Serializer{};
    s.write_sleb128(global.highest_target_id);
    s.write_sleb128(global.highest_listen_sequence_number);
    s.write_version(global.last_remote_snapshot_version);
    s.write_sleb128(global.target_count);
    return s.take();
}

auto decode_target_global(std::string_view bytes) -> TargetGlobal {
    auto d = Deserializer{bytes};
    auto global = TargetGlobal{};
    global.highest_target_id = static_cast<TargetId>(require(d.read_sleb128(), "target global"));
    global.highest_listen_sequence_number = require(d.read_sleb128(), "target global");
    global.last_remote_snapshot_version = require(d.read_version(), "target global");
    global.target_count = require(d.read_sleb128(), "target global");
    return global;
}

auto encode_sequence_number(ListenSequenceNumber seq) -> std::string {
    auto s = Serializer{};
    s.write_sleb128(seq);
    return s.take();
}

auto decode_sequence_number(std::string_view bytes) -> ListenSequenceNumber {
    auto d = Deserializer{bytes};
    return require(d.read_sleb128(), "sequence number");
}

}  // namespace docsync_cpp::local

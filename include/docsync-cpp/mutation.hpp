/// @file mutation.hpp
/// @brief Mutations, preconditions, field transforms and mutation batches.

#pragma once

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docsync_cpp {

// -- Preconditions ------------------------------------------------------------

/// A condition the target document must satisfy for a mutation to apply.
class Precondition {
public:
    enum class Type : std::uint8_t { none, exists, update_time };

    /// No condition.
    static auto none() -> Precondition { return Precondition{}; }

    /// The document must (or must not) exist.
    static auto exists(bool exists) -> Precondition;

    /// The document must exist at exactly `version`.
    static auto update_time(SnapshotVersion version) -> Precondition;

    auto type() const -> Type { return type_; }
    auto is_none() const -> bool { return type_ == Type::none; }
    auto exists_value() const -> bool { return exists_; }
    auto update_time_value() const -> SnapshotVersion { return update_time_; }

    /// True if `doc` satisfies the condition.
    auto is_valid_for(const MutableDocument& doc) const -> bool;

    auto operator==(const Precondition&) const -> bool = default;

private:
    Type type_{Type::none};
    bool exists_{false};
    SnapshotVersion update_time_;
};

// -- Field transforms ---------------------------------------------------------

/// Replace the field with the commit time.
struct ServerTimestampTransform {
    auto operator==(const ServerTimestampTransform&) const -> bool = default;
};

/// Append each element not already present.
struct ArrayUnionTransform {
    std::vector<FieldValue> elements;
    auto operator==(const ArrayUnionTransform&) const -> bool = default;
};

/// Remove every occurrence of each element.
struct ArrayRemoveTransform {
    std::vector<FieldValue> elements;
    auto operator==(const ArrayRemoveTransform&) const -> bool = default;
};

/// Add `operand` to the current numeric value (0 if not numeric).
struct NumericIncrementTransform {
    FieldValue operand;
    auto operator==(const NumericIncrementTransform&) const -> bool = default;
};

using TransformOperation = std::variant<
    ServerTimestampTransform,
    ArrayUnionTransform,
    ArrayRemoveTransform,
    NumericIncrementTransform
>;

/// A transform applied to one field.
struct FieldTransform {
    FieldPath path;
    TransformOperation operation;

    /// True for transforms whose result depends on the previous value and
    /// would change if applied twice (increments).
    auto is_idempotent() const -> bool;

    auto operator==(const FieldTransform&) const -> bool = default;
};

// -- Mutations ----------------------------------------------------------------

/// Overwrite the whole document.
struct SetMutation {
    ObjectValue value = ObjectValue::object();
    auto operator==(const SetMutation&) const -> bool = default;
};

/// Write the fields in `mask`; masked fields absent from `value` are
/// deleted.
struct PatchMutation {
    ObjectValue value = ObjectValue::object();
    FieldMask mask;
    auto operator==(const PatchMutation&) const -> bool = default;
};

/// Delete the document.
struct DeleteMutation {
    auto operator==(const DeleteMutation&) const -> bool = default;
};

/// Check the precondition without writing (transactions).
struct VerifyMutation {
    auto operator==(const VerifyMutation&) const -> bool = default;
};

using MutationKind = std::variant<
    SetMutation,
    PatchMutation,
    DeleteMutation,
    VerifyMutation
>;

/// The server's answer to one mutation.
struct MutationResult {
    SnapshotVersion version;                             ///< Commit version of the document.
    std::optional<std::vector<FieldValue>> transform_results;  ///< One per field transform.

    auto operator==(const MutationResult&) const -> bool = default;
};

/// A write to a single document.
///
/// Mutations are applied twice: optimistically to the local view when
/// written (`apply_to_local_view`) and to the confirmed remote document
/// once the backend acknowledges them (`apply_to_remote_document`). Field
/// transforms use local estimates in the first case and the server's
/// results in the second.
class Mutation {
public:
    Mutation() = default;
    Mutation(DocumentKey key, MutationKind kind, Precondition precondition = Precondition::none(),
             std::vector<FieldTransform> transforms = {});

    static auto set(DocumentKey key, ObjectValue value,
                    std::vector<FieldTransform> transforms = {}) -> Mutation;
    static auto patch(DocumentKey key, ObjectValue value, FieldMask mask,
                      Precondition precondition = Precondition::exists(true),
                      std::vector<FieldTransform> transforms = {}) -> Mutation;
    static auto delete_document(DocumentKey key,
                                Precondition precondition = Precondition::none()) -> Mutation;
    static auto verify(DocumentKey key, SnapshotVersion version) -> Mutation;

    auto key() const -> const DocumentKey& { return key_; }
    auto kind() const -> const MutationKind& { return kind_; }
    auto precondition() const -> const Precondition& { return precondition_; }
    auto field_transforms() const -> const std::vector<FieldTransform>& { return field_transforms_; }

    auto is_set() const -> bool { return std::holds_alternative<SetMutation>(kind_); }
    auto is_patch() const -> bool { return std::holds_alternative<PatchMutation>(kind_); }
    auto is_delete() const -> bool { return std::holds_alternative<DeleteMutation>(kind_); }
    auto is_verify() const -> bool { return std::holds_alternative<VerifyMutation>(kind_); }

    /// Apply the acknowledged mutation to the remote document.
    void apply_to_remote_document(MutableDocument& doc, const MutationResult& result) const;

    /// Apply the pending mutation to a local view of the document.
    ///
    /// `previous_mask` is the set of fields changed by earlier mutations
    /// (nullopt means the whole document). Returns the updated mask.
    auto apply_to_local_view(MutableDocument& doc, std::optional<FieldMask> previous_mask,
                             SnapshotVersion local_write_time) const
        -> std::optional<FieldMask>;

    /// For non-idempotent transforms, a patch capturing the current values
    /// the transforms read. Applied before this mutation when the local
    /// view is rebuilt, so replays do not double-count.
    auto extract_transform_base_value(const MutableDocument& doc) const
        -> std::optional<ObjectValue>;

    /// The mutation that turns the remote document into `doc`'s local view,
    /// restricted to `mask`. Nullopt if `doc` has no local mutations.
    static auto calculate_overlay_mutation(const MutableDocument& doc,
                                           const std::optional<FieldMask>& mask)
        -> std::optional<Mutation>;

    auto to_string() const -> std::string;

    auto operator==(const Mutation&) const -> bool = default;

private:
    DocumentKey key_;
    MutationKind kind_{DeleteMutation{}};
    Precondition precondition_;
    std::vector<FieldTransform> field_transforms_;
};

// -- Batches ------------------------------------------------------------------

/// A local view document and the fields pending writes changed in it
/// (nullopt means the whole document).
struct OverlayedDocument {
    MutableDocument document;
    std::optional<FieldMask> mutated_fields;
};

using OverlayedDocumentMap = std::map<DocumentKey, OverlayedDocument>;

/// A group of mutations written atomically by one local write.
///
/// Batches are immutable once created and are removed from the queue only
/// in batch-id order.
class MutationBatch {
public:
    MutationBatch() = default;
    MutationBatch(BatchId batch_id, SnapshotVersion local_write_time,
                  std::vector<Mutation> base_mutations, std::vector<Mutation> mutations)
        : batch_id_{batch_id},
          local_write_time_{local_write_time},
          base_mutations_{std::move(base_mutations)},
          mutations_{std::move(mutations)} {}

    auto batch_id() const -> BatchId { return batch_id_; }
    auto local_write_time() const -> SnapshotVersion { return local_write_time_; }
    auto base_mutations() const -> const std::vector<Mutation>& { return base_mutations_; }
    auto mutations() const -> const std::vector<Mutation>& { return mutations_; }

    /// Apply the acknowledged batch to a remote document. Only mutations
    /// for `doc.key()` have an effect.
    void apply_to_remote_document(MutableDocument& doc,
                                  const std::vector<MutationResult>& results) const;

    /// Apply the pending batch to a local view. See Mutation::apply_to_local_view.
    auto apply_to_local_view(MutableDocument& doc, std::optional<FieldMask> mask) const
        -> std::optional<FieldMask>;

    /// Apply to every document of the batch in `docs`, updating their
    /// masks, and return the overlay mutation per key that has one. Keys in
    /// `documents_without_remote_version` get whole-document overlays.
    auto apply_to_local_document_set(OverlayedDocumentMap& docs,
                                     const DocumentKeySet& documents_without_remote_version = {}) const
        -> std::map<DocumentKey, Mutation>;

    /// Every key written by the batch.
    auto keys() const -> DocumentKeySet;

    auto operator==(const MutationBatch&) const -> bool = default;

private:
    BatchId batch_id_{unknown_batch_id};
    SnapshotVersion local_write_time_;
    std::vector<Mutation> base_mutations_;
    std::vector<Mutation> mutations_;
};

/// A batch acknowledged by the backend.
struct MutationBatchResult {
    MutationBatch batch;
    SnapshotVersion commit_version;
    std::vector<MutationResult> mutation_results;
    ByteString stream_token;

    /// Per key, the version the backend committed the document at.
    auto document_versions() const -> std::map<DocumentKey, SnapshotVersion>;
};

/// The net pending effect of local writes on one document.
struct Overlay {
    BatchId largest_batch_id{unknown_batch_id};
    Mutation mutation;

    auto key() const -> const DocumentKey& { return mutation.key(); }
    auto operator==(const Overlay&) const -> bool = default;
};

using OverlayMap = std::map<DocumentKey, Overlay>;

}  // namespace docsync_cpp

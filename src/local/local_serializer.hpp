#pragma once

// Encoding of persisted records: documents, mutation batches, overlays,
// target data, field indexes and the metadata singletons.
//
// Decoding throws Exception (data_loss) for malformed records.
//
// Internal header — not installed.

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/index.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/types.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace docsync_cpp::local {

struct MutationQueueMetadata {
    BatchId last_acknowledged_batch_id{unknown_batch_id};
    ByteString last_stream_token;
};

struct TargetGlobal {
    TargetId highest_target_id{0};
    ListenSequenceNumber highest_listen_sequence_number{0};
    SnapshotVersion last_remote_snapshot_version;
    std::int64_t target_count{0};
};

auto encode_document(const MutableDocument& doc) -> std::string;
auto decode_document(std::string_view bytes) -> MutableDocument;

auto encode_mutation_batch(const MutationBatch& batch) -> std::string;
auto decode_mutation_batch(std::string_view bytes) -> MutationBatch;

auto encode_overlay(const Overlay& overlay) -> std::string;
auto decode_overlay(std::string_view bytes) -> Overlay;

auto encode_target_data(const TargetData& target_data) -> std::string;
auto decode_target_data(std::string_view bytes) -> TargetData;

auto encode_field_index(const FieldIndex& index) -> std::string;
auto decode_field_index(std::string_view bytes) -> FieldIndex;

auto encode_mutation_queue_metadata(const MutationQueueMetadata& metadata) -> std::string;
auto decode_mutation_queue_metadata(std::string_view bytes) -> MutationQueueMetadata;

auto encode_target_global(const TargetGlobal& global) -> std::string;
auto decode_target_global(std::string_view bytes) -> TargetGlobal;

auto encode_sequence_number(ListenSequenceNumber seq) -> std::string;
auto decode_sequence_number(std::string_view bytes) -> ListenSequenceNumber;

}  // namespace docsync_cpp::local

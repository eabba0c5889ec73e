#pragma once

// Key layout of the persisted key space.
//
// Path segments are escaped so that 0x00, 0x01 and 0x02 never appear
// unescaped; each encoded segment ends with 0x01 and 0x02 separates key
// components. A document's encoded path is therefore never a byte prefix
// of an unrelated key, and a collection's encoded path is a prefix of the
// keys of every document below it.
//
//   rd/<path>                        remote document
//   mq/<uid>|<batch>                 mutation batch
//   mqm/<uid>                        mutation queue metadata
//   dm/<uid>|<path>|<batch>          document → batch index
//   ov/<uid>|<path>                  overlay
//   ovb/<uid>|<batch>|<path>         batch → overlay index
//   tgt/<id>                         target data
//   tgtc/<canonical id>|<id>         canonical id → target
//   tdk/<id>|<path>                  target → document
//   dtk/<path>|<id>                  document → target
//   orph/<path>                      orphan mark (sequence number)
//   cp/<collection id>|<parent>      collection parent index
//   fi/<id>                          field index definition
//   ie/<id>|<values>|<path>          field index entry
//   ied/<id>|<path>                  document → field index entry values
//   meta/...                         singletons
//
// Internal header — not installed.

#include <docsync-cpp/types.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace docsync_cpp::local::keys {

inline constexpr char segment_end = '\x01';
inline constexpr char separator = '\x02';

inline auto escape(std::string_view s) -> std::string {
    auto out = std::string{};
    out.reserve(s.size());
    for (auto c : s) {
        if (c == '\x00' || c == '\x01' || c == '\x02') {
            out.push_back('\x00');
            out.push_back(static_cast<char>(c + 0x10));
        } else {
            out.push_back(c);
        }
    }
    return out;
}

inline auto unescape(std::string_view s) -> std::string {
    auto out = std::string{};
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\x00' && i + 1 < s.size()) {
            out.push_back(static_cast<char>(s[++i] - 0x10));
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

inline auto encode_path(const ResourcePath& path) -> std::string {
    auto out = std::string{};
    for (const auto& segment : path.segments()) {
        out += escape(segment);
        out.push_back(segment_end);
    }
    return out;
}

inline auto decode_path(std::string_view encoded) -> ResourcePath {
    auto segments = std::vector<std::string>{};
    auto start = std::size_t{0};
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '\x00') {
            ++i;
        } else if (encoded[i] == segment_end) {
            segments.push_back(unescape(encoded.substr(start, i - start)));
            start = i + 1;
        }
    }
    return ResourcePath{std::move(segments)};
}

// Fixed-width decimal so ids sort numerically.
inline auto encode_id(std::int64_t id) -> std::string {
    return fmt::format("{:010d}", id);
}

inline auto decode_id(std::string_view s) -> std::int64_t {
    auto value = std::int64_t{0};
    std::from_chars(s.data(), s.data() + s.size(), value);
    return value;
}

// The component after the last separator.
inline auto last_component(std::string_view key) -> std::string_view {
    auto pos = key.rfind(separator);
    return pos == std::string_view::npos ? key : key.substr(pos + 1);
}

// -- Remote documents ---------------------------------------------------------

inline auto remote_document(const DocumentKey& key) -> std::string {
    return "rd/" + encode_path(key.path());
}

// Every document at or below `path`.
inline auto remote_document_prefix(const ResourcePath& path) -> std::string {
    return "rd/" + encode_path(path);
}

inline auto document_key_from_remote_document(std::string_view key) -> DocumentKey {
    return DocumentKey{decode_path(key.substr(3))};
}

// -- Mutation queue -----------------------------------------------------------

inline auto mutation_prefix(std::string_view uid) -> std::string {
    return "mq/" + escape(uid) + separator;
}

inline auto mutation(std::string_view uid, BatchId batch_id) -> std::string {
    return mutation_prefix(uid) + encode_id(batch_id);
}

inline constexpr std::string_view mutation_queue_meta_prefix = "mqm/";

inline auto mutation_queue_meta(std::string_view uid) -> std::string {
    return std::string{mutation_queue_meta_prefix} + escape(uid);
}

inline auto document_mutation_prefix(std::string_view uid) -> std::string {
    return "dm/" + escape(uid) + separator;
}

// Batches for the document `key`.
inline auto document_mutation_prefix(std::string_view uid, const DocumentKey& key) -> std::string {
    return document_mutation_prefix(uid) + encode_path(key.path()) + separator;
}

// Batches for documents at or below `path`.
inline auto document_mutation_prefix(std::string_view uid, const ResourcePath& path) -> std::string {
    return document_mutation_prefix(uid) + encode_path(path);
}

inline auto document_mutation(std::string_view uid, const DocumentKey& key, BatchId batch_id)
    -> std::string {
    return document_mutation_prefix(uid, key) + encode_id(batch_id);
}

inline constexpr std::string_view next_batch_id = "meta/next_batch_id";

// -- Overlays -----------------------------------------------------------------

inline auto overlay_prefix(std::string_view uid) -> std::string {
    return "ov/" + escape(uid) + separator;
}

inline auto overlay_prefix(std::string_view uid, const ResourcePath& path) -> std::string {
    return overlay_prefix(uid) + encode_path(path);
}

inline auto overlay(std::string_view uid, const DocumentKey& key) -> std::string {
    return overlay_prefix(uid, key.path());
}

inline auto overlay_by_batch_prefix(std::string_view uid, BatchId batch_id) -> std::string {
    return "ovb/" + escape(uid) + separator + encode_id(batch_id) + separator;
}

inline auto overlay_by_batch(std::string_view uid, BatchId batch_id, const DocumentKey& key)
    -> std::string {
    return overlay_by_batch_prefix(uid, batch_id) + encode_path(key.path());
}

// -- Targets ------------------------------------------------------------------

inline constexpr std::string_view target_prefix = "tgt/";

inline auto target(TargetId target_id) -> std::string {
    return std::string{target_prefix} + encode_id(target_id);
}

inline auto target_canonical_prefix(std::string_view canonical_id) -> std::string {
    return "tgtc/" + escape(canonical_id) + separator;
}

inline auto target_canonical(std::string_view canonical_id, TargetId target_id) -> std::string {
    return target_canonical_prefix(canonical_id) + encode_id(target_id);
}

inline auto target_document_prefix(TargetId target_id) -> std::string {
    return "tdk/" + encode_id(target_id) + separator;
}

inline auto target_document(TargetId target_id, const DocumentKey& key) -> std::string {
    return target_document_prefix(target_id) + encode_path(key.path());
}

inline auto document_target_prefix(const DocumentKey& key) -> std::string {
    return "dtk/" + encode_path(key.path()) + separator;
}

inline auto document_target(const DocumentKey& key, TargetId target_id) -> std::string {
    return document_target_prefix(key) + encode_id(target_id);
}

inline constexpr std::string_view orphan_prefix = "orph/";

inline auto orphan(const DocumentKey& key) -> std::string {
    return std::string{orphan_prefix} + encode_path(key.path());
}

inline constexpr std::string_view target_global = "meta/target_global";

// -- Indexes ------------------------------------------------------------------

inline auto collection_parent_prefix(std::string_view collection_id) -> std::string {
    return "cp/" + escape(collection_id) + separator;
}

inline auto collection_parent(std::string_view collection_id, const ResourcePath& parent)
    -> std::string {
    return collection_parent_prefix(collection_id) + encode_path(parent);
}

inline constexpr std::string_view field_index_prefix = "fi/";

inline auto field_index(std::int32_t index_id) -> std::string {
    return std::string{field_index_prefix} + encode_id(index_id);
}

// `values` is the concatenation of encode_index_value over a prefix of the
// index fields.
inline auto index_entry_prefix(std::int32_t index_id, std::string_view values) -> std::string {
    return "ie/" + encode_id(index_id) + separator + std::string{values};
}

inline auto index_entry(std::int32_t index_id, std::string_view values, const DocumentKey& key)
    -> std::string {
    return index_entry_prefix(index_id, values) + separator + encode_path(key.path());
}

inline auto index_document_prefix(std::int32_t index_id) -> std::string {
    return "ied/" + encode_id(index_id) + separator;
}

inline auto index_document(std::int32_t index_id, const DocumentKey& key) -> std::string {
    return index_document_prefix(index_id) + encode_path(key.path());
}

}  // namespace docsync_cpp::local::keys

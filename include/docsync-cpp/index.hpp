/// @file index.hpp
/// @brief Cache index definitions and the read-time offsets that index
/// backfills and cache scans resume from.

#pragma once

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>

#include <compare>
#include <cstdint>
#include <string>
#include <vector>

namespace docsync_cpp {

/// A position in the remote document cache: documents are ordered by read
/// time, then key, then the largest batch id applied to them.
struct IndexOffset {
    SnapshotVersion read_time;
    DocumentKey document_key;
    BatchId largest_batch_id{unknown_batch_id};

    /// Before every document.
    static auto none() -> IndexOffset { return IndexOffset{}; }

    /// The offset of `doc`, so that a scan from it excludes `doc`.
    static auto from_document(const MutableDocument& doc) -> IndexOffset {
        return IndexOffset{doc.read_time(), doc.key(), unknown_batch_id};
    }

    /// The offset directly after every document read at or before
    /// `read_time`.
    static auto create_successor(SnapshotVersion read_time, BatchId largest_batch_id)
        -> IndexOffset {
        return IndexOffset{SnapshotVersion{read_time.micros + 1}, DocumentKey::empty(),
                           largest_batch_id};
    }

    auto operator<=>(const IndexOffset&) const = default;
    auto operator==(const IndexOffset&) const -> bool = default;
};

/// A field index over one collection group.
///
/// Entries store the index's field values in order, so the index answers
/// equality (`==`, `in`) lookups on any prefix of `fields`. Candidates are
/// always re-checked against the query.
struct FieldIndex {
    /// Bookkeeping for incremental backfill.
    struct State {
        ListenSequenceNumber sequence_number{0};  ///< Last backfill that touched the group.
        IndexOffset offset;                        ///< Documents after this are not indexed yet.

        auto operator==(const State&) const -> bool = default;
    };

    std::int32_t index_id{0};
    std::string collection_group;
    std::vector<FieldPath> fields;
    State state;

    /// Identity ignoring id and state.
    auto same_definition(const FieldIndex& other) const -> bool {
        return collection_group == other.collection_group && fields == other.fields;
    }

    auto operator==(const FieldIndex&) const -> bool = default;
};

}  // namespace docsync_cpp

#pragma once

// The aggregated effect of watch changes at one consistent snapshot.
//
// Internal header — not installed.

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/types.hpp>

#include <map>

namespace docsync_cpp::remote {

// What changed for one target since the previous RemoteEvent.
struct TargetChange {
    ByteString resume_token;
    bool current{false};
    DocumentKeySet added_documents;
    DocumentKeySet modified_documents;
    DocumentKeySet removed_documents;

    auto change_count() const -> std::size_t {
        return added_documents.size() + modified_documents.size() + removed_documents.size();
    }

    // A change that only marks the target current or not.
    static auto create_synthesized(bool current, ByteString resume_token = {}) -> TargetChange {
        auto change = TargetChange{};
        change.current = current;
        change.resume_token = std::move(resume_token);
        return change;
    }

    auto operator==(const TargetChange&) const -> bool = default;
};

struct RemoteEvent {
    SnapshotVersion snapshot_version;
    std::map<TargetId, TargetChange> target_changes;
    // Targets whose existence filter disagreed with the local state. They
    // are re-listened without a resume token.
    std::map<TargetId, QueryPurpose> target_mismatches;
    MutableDocumentMap document_updates;
    // Keys only referenced by limbo resolution targets.
    DocumentKeySet resolved_limbo_documents;
};

}  // namespace docsync_cpp::remote

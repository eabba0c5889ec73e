#pragma once

// Persisted targets, the documents each target matches, and the global
// target metadata (highest target id, highest sequence number, last
// remote snapshot version).
//
// Internal header — not installed.

#include "local_serializer.hpp"
#include "persistence.hpp"

#include <docsync-cpp/query.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>

namespace docsync_cpp::local {

class TargetCache {
public:
    explicit TargetCache(Persistence& persistence);

    auto highest_target_id() -> TargetId { return load_global().highest_target_id; }
    auto highest_listen_sequence_number() -> ListenSequenceNumber {
        return load_global().highest_listen_sequence_number;
    }
    void set_highest_listen_sequence_number(ListenSequenceNumber seq);

    auto target_count() -> std::int64_t { return load_global().target_count; }

    auto last_remote_snapshot_version() -> SnapshotVersion {
        return load_global().last_remote_snapshot_version;
    }
    void set_last_remote_snapshot_version(SnapshotVersion version);

    // Add a new target. Its id must not be in use.
    void add_target(const TargetData& target_data);

    // Replace the stored data of an existing target.
    void update_target(const TargetData& target_data);

    // Remove the target and its matching keys.
    void remove_target(const TargetData& target_data);

    auto get_target(const Target& target) -> std::optional<TargetData>;

    void add_matching_keys(const DocumentKeySet& keys, TargetId target_id);
    void remove_matching_keys(const DocumentKeySet& keys, TargetId target_id);
    void remove_matching_keys_for_target_id(TargetId target_id);
    auto get_matching_keys(TargetId target_id) -> DocumentKeySet;

    // True if any target matches `key`.
    auto contains_key(const DocumentKey& key) -> bool;

    // Call `fn` with the sequence number of every target.
    void enumerate_sequence_numbers(const std::function<void(ListenSequenceNumber)>& fn);

    // Remove every target at or below `upper_bound` not in `live_targets`.
    // Returns the number removed.
    auto remove_targets(ListenSequenceNumber upper_bound,
                        const std::unordered_map<TargetId, TargetData>& live_targets) -> std::int64_t;

private:
    auto txn() -> Transaction& { return persistence_.current_transaction(); }
    auto load_global() -> TargetGlobal;
    void save_global(const TargetGlobal& global);
    void save_target(const TargetData& target_data);

    Persistence& persistence_;
};

}  // namespace docsync_cpp::local

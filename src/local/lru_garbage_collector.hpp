#pragma once

// Least-recently-used garbage collection of targets and documents.
//
// Every target and every orphan mark carries the sequence number of the
// transaction that last touched it. A collection run picks the sequence
// number below which the configured percentile falls, removes inactive
// targets at or below it, then removes unpinned orphaned documents at or
// below it.
//
// Internal header — not installed.

#include <docsync-cpp/query.hpp>
#include <docsync-cpp/types.hpp>

#include <cstdint>
#include <unordered_map>

namespace docsync_cpp::local {

class LruReferenceDelegate;

struct LruParams {
    static constexpr std::int64_t collection_disabled = -1;

    std::int64_t min_bytes_threshold{100 * 1024 * 1024};
    std::int32_t percentile_to_collect{10};
    std::int32_t maximum_sequence_numbers_to_collect{1000};

    static auto defaults() -> LruParams { return LruParams{}; }
    static auto disabled() -> LruParams { return LruParams{collection_disabled, 0, 0}; }
    static auto with_cache_size(std::int64_t cache_size) -> LruParams {
        auto params = LruParams{};
        params.min_bytes_threshold = cache_size;
        return params;
    }

    auto operator==(const LruParams&) const -> bool = default;
};

struct LruResults {
    bool did_run{false};
    std::int64_t sequence_numbers_collected{0};
    std::int64_t targets_removed{0};
    std::int64_t documents_removed{0};

    static auto did_not_run() -> LruResults { return LruResults{}; }
};

class LruGarbageCollector {
public:
    LruGarbageCollector(LruReferenceDelegate& delegate, LruParams params);

    auto params() const -> const LruParams& { return params_; }

    // Collect if the cache is over the size threshold. Must run in a
    // transaction. Targets in `live_targets` are never removed.
    auto collect(const std::unordered_map<TargetId, TargetData>& live_targets) -> LruResults;

    // Number of sequence numbers covered by `percentile` of all of them.
    auto calculate_query_count(std::int32_t percentile) -> std::int64_t;

    // The `count`-th lowest sequence number, or invalid_sequence_number
    // when `count` is 0.
    auto nth_sequence_number(std::int64_t count) -> ListenSequenceNumber;

    auto remove_targets(ListenSequenceNumber upper_bound,
                        const std::unordered_map<TargetId, TargetData>& live_targets) -> std::int64_t;
    auto remove_orphaned_documents(ListenSequenceNumber upper_bound) -> std::int64_t;

private:
    auto run_garbage_collection(const std::unordered_map<TargetId, TargetData>& live_targets)
        -> LruResults;

    LruReferenceDelegate& delegate_;
    LruParams params_;
};

}  // namespace docsync_cpp::local

#include "lru_garbage_collector.hpp"

#include "lru_reference_delegate.hpp"
#include "../util/log.hpp"

#include <chrono>
#include <queue>
#include <vector>

namespace docsync_cpp::local {

LruGarbageCollector::LruGarbageCollector(LruReferenceDelegate& delegate, LruParams params)
    : delegate_{delegate}, params_{params} {}

auto LruGarbageCollector::collect(const std::unordered_map<TargetId, TargetData>& live_targets)
    -> LruResults {
    if (params_.min_bytes_threshold == LruParams::collection_disabled) {
        util::logger()->debug("garbage collection skipped; disabled");
        return LruResults::did_not_run();
    }

    auto cache_size = delegate_.byte_size();
    if (cache_size < params_.min_bytes_threshold) {
        util::logger()->debug("garbage collection skipped; cache size {} is lower than threshold {}",
                              cache_size, params_.min_bytes_threshold);
        return LruResults::did_not_run();
    }
    return run_garbage_collection(live_targets);
}

auto LruGarbageCollector::calculate_query_count(std::int32_t percentile) -> std::int64_t {
    auto total = delegate_.get_sequence_number_count();
    return static_cast<std::int64_t>((static_cast<double>(percentile) / 100.0) *
                                     static_cast<double>(total));
}

auto LruGarbageCollector::nth_sequence_number(std::int64_t count) -> ListenSequenceNumber {
    if (count == 0) return invalid_sequence_number;

    // Bounded max-heap holding the `count` smallest values seen so far
    auto heap = std::priority_queue<ListenSequenceNumber>{};
    auto consider = [&](ListenSequenceNumber seq) {
        if (static_cast<std::int64_t>(heap.size()) < count) {
            heap.push(seq);
        } else if (seq < heap.top()) {
            heap.pop();
            heap.push(seq);
        }
    };
    delegate_.enumerate_target_sequence_numbers(consider);
    delegate_.enumerate_orphaned_documents([&](const DocumentKey&, ListenSequenceNumber seq) {
        consider(seq);
    });
    return heap.top();
}

auto LruGarbageCollector::remove_targets(ListenSequenceNumber upper_bound,
                                         const std::unordered_map<TargetId, TargetData>& live_targets)
    -> std::int64_t {
    return delegate_.remove_targets(upper_bound, live_targets);
}

auto LruGarbageCollector::remove_orphaned_documents(ListenSequenceNumber upper_bound) -> std::int64_t {
    return delegate_.remove_orphaned_documents(upper_bound);
}

auto LruGarbageCollector::run_garbage_collection(
    const std::unordered_map<TargetId, TargetData>& live_targets) -> LruResults {
    auto start = std::chrono::steady_clock::now();

    auto sequence_numbers = calculate_query_count(params_.percentile_to_collect);
    if (sequence_numbers > params_.maximum_sequence_numbers_to_collect) {
        util::logger()->debug("capping sequence numbers to collect down to the maximum of {} from {}",
                              params_.maximum_sequence_numbers_to_collect, sequence_numbers);
        sequence_numbers = params_.maximum_sequence_numbers_to_collect;
    }

    auto upper_bound = nth_sequence_number(sequence_numbers);
    auto targets_removed = remove_targets(upper_bound, live_targets);
    auto documents_removed = remove_orphaned_documents(upper_bound);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    util::logger()->info(
        "LRU garbage collection: counted {} sequence numbers up to {}, removed {} targets and {} "
        "documents in {} ms",
        sequence_numbers, upper_bound, targets_removed, documents_removed, elapsed.count());

    return LruResults{true, sequence_numbers, targets_removed, documents_removed};
}

}  // namespace docsync_cpp::local

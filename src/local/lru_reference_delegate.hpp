#pragma once

// Reference delegate for LRU garbage collection.
//
// Hands out one sequence number per transaction, stamps orphan marks on
// documents whose references change, and answers the garbage collector's
// questions about the key space.
//
// Internal header — not installed.

#include "lru_garbage_collector.hpp"
#include "persistence.hpp"

#include <functional>
#include <optional>
#include <unordered_map>

namespace docsync_cpp::local {

class ReferenceSet;

class LruReferenceDelegate final : public ReferenceDelegate {
public:
    LruReferenceDelegate(Persistence& persistence, LruParams params);

    // Resume the sequence numbers after the highest persisted one.
    void start() override;

    void add_in_memory_pins(const ReferenceSet* pins) override { in_memory_pins_ = pins; }

    auto garbage_collector() -> LruGarbageCollector& { return garbage_collector_; }

    void add_reference(const DocumentKey& key) override;
    void remove_reference(const DocumentKey& key) override;
    void remove_mutation_reference(const DocumentKey& key) override;
    void remove_target(const TargetData& target_data) override;
    void update_limbo_document(const DocumentKey& key) override;
    auto current_sequence_number() -> ListenSequenceNumber override;
    void on_transaction_started(std::string_view label) override;
    void on_transaction_finished() override;

    // -- Garbage collector support ---------------------------------------------

    auto get_sequence_number_count() -> std::int64_t;
    void enumerate_target_sequence_numbers(const std::function<void(ListenSequenceNumber)>& fn);
    void enumerate_orphaned_documents(
        const std::function<void(const DocumentKey&, ListenSequenceNumber)>& fn);
    auto remove_targets(ListenSequenceNumber upper_bound,
                        const std::unordered_map<TargetId, TargetData>& live_targets) -> std::int64_t;
    auto remove_orphaned_documents(ListenSequenceNumber upper_bound) -> std::int64_t;
    auto byte_size() -> std::int64_t;

private:
    void write_orphan_mark(const DocumentKey& key);
    auto is_pinned(const DocumentKey& key) -> bool;

    Persistence& persistence_;
    LruGarbageCollector garbage_collector_;
    const ReferenceSet* in_memory_pins_{nullptr};
    ListenSequenceNumber highest_sequence_number_{0};
    std::optional<ListenSequenceNumber> current_sequence_number_;
};

}  // namespace docsync_cpp::local

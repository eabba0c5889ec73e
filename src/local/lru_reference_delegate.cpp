#include "lru_reference_delegate.hpp"

#include "keys.hpp"
#include "local_serializer.hpp"
#include "mutation_queue.hpp"
#include "reference_set.hpp"
#include "remote_document_cache.hpp"
#include "target_cache.hpp"

#include <vector>

namespace docsync_cpp::local {

LruReferenceDelegate::LruReferenceDelegate(Persistence& persistence, LruParams params)
    : persistence_{persistence}, garbage_collector_{*this, params} {}

void LruReferenceDelegate::start() {
    highest_sequence_number_ = persistence_.target_cache().highest_listen_sequence_number();
}

void LruReferenceDelegate::on_transaction_started(std::string_view label) {
    util::hard_assert(!current_sequence_number_, "transaction {} started with a sequence number assigned",
                      label);
}

void LruReferenceDelegate::on_transaction_finished() {
    current_sequence_number_.reset();
}

auto LruReferenceDelegate::current_sequence_number() -> ListenSequenceNumber {
    if (!current_sequence_number_) {
        // Assigned on first use so read-only transactions write nothing
        current_sequence_number_ = ++highest_sequence_number_;
        persistence_.target_cache().set_highest_listen_sequence_number(*current_sequence_number_);
    }
    return *current_sequence_number_;
}

void LruReferenceDelegate::write_orphan_mark(const DocumentKey& key) {
    persistence_.current_transaction().put(keys::orphan(key),
                                           encode_sequence_number(current_sequence_number()));
}

void LruReferenceDelegate::add_reference(const DocumentKey& key) {
    write_orphan_mark(key);
}

void LruReferenceDelegate::remove_reference(const DocumentKey& key) {
    write_orphan_mark(key);
}

void LruReferenceDelegate::remove_mutation_reference(const DocumentKey& key) {
    write_orphan_mark(key);
}

void LruReferenceDelegate::update_limbo_document(const DocumentKey& key) {
    write_orphan_mark(key);
}

void LruReferenceDelegate::remove_target(const TargetData& target_data) {
    persistence_.target_cache().update_target(target_data.with_sequence_number(current_sequence_number()));
}

auto LruReferenceDelegate::is_pinned(const DocumentKey& key) -> bool {
    if (in_memory_pins_ && in_memory_pins_->contains_key(key)) return true;
    if (persistence_.target_cache().contains_key(key)) return true;
    return MutationQueue::any_queue_contains_key(persistence_.current_transaction(), key);
}

auto LruReferenceDelegate::get_sequence_number_count() -> std::int64_t {
    auto count = persistence_.target_cache().target_count();
    persistence_.current_transaction().scan(keys::orphan_prefix, [&](std::string_view, std::string_view) {
        ++count;
        return true;
    });
    return count;
}

void LruReferenceDelegate::enumerate_target_sequence_numbers(
    const std::function<void(ListenSequenceNumber)>& fn) {
    persistence_.target_cache().enumerate_sequence_numbers(fn);
}

void LruReferenceDelegate::enumerate_orphaned_documents(
    const std::function<void(const DocumentKey&, ListenSequenceNumber)>& fn) {
    persistence_.current_transaction().scan(keys::orphan_prefix, [&](std::string_view row, std::string_view value) {
        fn(DocumentKey{keys::decode_path(row.substr(keys::orphan_prefix.size()))},
           decode_sequence_number(value));
        return true;
    });
}

auto LruReferenceDelegate::remove_targets(ListenSequenceNumber upper_bound,
                                          const std::unordered_map<TargetId, TargetData>& live_targets)
    -> std::int64_t {
    return persistence_.target_cache().remove_targets(upper_bound, live_targets);
}

auto LruReferenceDelegate::remove_orphaned_documents(ListenSequenceNumber upper_bound) -> std::int64_t {
    auto candidates = std::vector<DocumentKey>{};
    enumerate_orphaned_documents([&](const DocumentKey& key, ListenSequenceNumber seq) {
        if (seq <= upper_bound) candidates.push_back(key);
    });

    auto removed = std::int64_t{0};
    auto& txn = persistence_.current_transaction();
    for (const auto& key : candidates) {
        if (is_pinned(key)) continue;
        persistence_.remote_document_cache().remove(key);
        txn.erase(keys::orphan(key));
        ++removed;
    }
    return removed;
}

auto LruReferenceDelegate::byte_size() -> std::int64_t {
    return persistence_.remote_document_cache().get_size();
}

}  // namespace docsync_cpp::local

#include "target_cache.hpp"

#include "keys.hpp"

#include <algorithm>
#include <vector>

namespace docsync_cpp::local {

TargetCache::TargetCache(Persistence& persistence) : persistence_{persistence} {}

auto TargetCache::load_global() -> TargetGlobal {
    auto bytes = txn().get(keys::target_global);
    if (!bytes) return TargetGlobal{};
    return decode_target_global(*bytes);
}

void TargetCache::save_global(const TargetGlobal& global) {
    txn().put(std::string{keys::target_global}, encode_target_global(global));
}

void TargetCache::set_highest_listen_sequence_number(ListenSequenceNumber seq) {
    auto global = load_global();
    if (seq <= global.highest_listen_sequence_number) return;
    global.highest_listen_sequence_number = seq;
    save_global(global);
}

void TargetCache::set_last_remote_snapshot_version(SnapshotVersion version) {
    auto global = load_global();
    global.last_remote_snapshot_version = version;
    save_global(global);
}

void TargetCache::save_target(const TargetData& target_data) {
    txn().put(keys::target(target_data.target_id), encode_target_data(target_data));
    txn().put(keys::target_canonical(target_data.target.canonical_id(), target_data.target_id),
              std::string{});

    auto global = load_global();
    global.highest_target_id = std::max(global.highest_target_id, target_data.target_id);
    global.highest_listen_sequence_number =
        std::max(global.highest_listen_sequence_number, target_data.sequence_number);
    save_global(global);
}

void TargetCache::add_target(const TargetData& target_data) {
    util::hard_assert(!txn().contains(keys::target(target_data.target_id)),
                      "target {} already exists", target_data.target_id);
    save_target(target_data);
    auto global = load_global();
    ++global.target_count;
    save_global(global);
}

void TargetCache::update_target(const TargetData& target_data) {
    util::hard_assert(txn().contains(keys::target(target_data.target_id)),
                      "updating unknown target {}", target_data.target_id);
    save_target(target_data);
}

void TargetCache::remove_target(const TargetData& target_data) {
    remove_matching_keys_for_target_id(target_data.target_id);
    txn().erase(keys::target(target_data.target_id));
    txn().erase(keys::target_canonical(target_data.target.canonical_id(), target_data.target_id));
    auto global = load_global();
    --global.target_count;
    save_global(global);
}

auto TargetCache::get_target(const Target& target) -> std::optional<TargetData> {
    auto ids = std::vector<TargetId>{};
    txn().scan(keys::target_canonical_prefix(target.canonical_id()),
               [&](std::string_view row, std::string_view) {
                   ids.push_back(static_cast<TargetId>(keys::decode_id(keys::last_component(row))));
                   return true;
               });
    for (auto target_id : ids) {
        auto bytes = txn().get(keys::target(target_id));
        if (!bytes) continue;
        auto target_data = decode_target_data(*bytes);
        if (target_data.target == target) return target_data;
    }
    return std::nullopt;
}

void TargetCache::add_matching_keys(const DocumentKeySet& doc_keys, TargetId target_id) {
    auto& delegate = persistence_.reference_delegate();
    for (const auto& key : doc_keys) {
        txn().put(keys::target_document(target_id, key), std::string{});
        txn().put(keys::document_target(key, target_id), std::string{});
        delegate.add_reference(key);
    }
}

void TargetCache::remove_matching_keys(const DocumentKeySet& doc_keys, TargetId target_id) {
    auto& delegate = persistence_.reference_delegate();
    for (const auto& key : doc_keys) {
        txn().erase(keys::target_document(target_id, key));
        txn().erase(keys::document_target(key, target_id));
        delegate.remove_reference(key);
    }
}

void TargetCache::remove_matching_keys_for_target_id(TargetId target_id) {
    remove_matching_keys(get_matching_keys(target_id), target_id);
}

auto TargetCache::get_matching_keys(TargetId target_id) -> DocumentKeySet {
    auto prefix = keys::target_document_prefix(target_id);
    auto result = DocumentKeySet{};
    txn().scan(prefix, [&](std::string_view row, std::string_view) {
        result.insert(DocumentKey{keys::decode_path(row.substr(prefix.size()))});
        return true;
    });
    return result;
}

auto TargetCache::contains_key(const DocumentKey& key) -> bool {
    auto found = false;
    txn().scan(keys::document_target_prefix(key), [&](std::string_view, std::string_view) {
        found = true;
        return false;
    });
    return found;
}

void TargetCache::enumerate_sequence_numbers(const std::function<void(ListenSequenceNumber)>& fn) {
    txn().scan(keys::target_prefix, [&](std::string_view, std::string_view value) {
        fn(decode_target_data(value).sequence_number);
        return true;
    });
}

auto TargetCache::remove_targets(ListenSequenceNumber upper_bound,
                                 const std::unordered_map<TargetId, TargetData>& live_targets)
    -> std::int64_t {
    auto doomed = std::vector<TargetData>{};
    txn().scan(keys::target_prefix, [&](std::string_view, std::string_view value) {
        auto target_data = decode_target_data(value);
        if (target_data.sequence_number <= upper_bound &&
            !live_targets.contains(target_data.target_id)) {
            doomed.push_back(std::move(target_data));
        }
        return true;
    });
    for (const auto& target_data : doomed) remove_target(target_data);
    return static_cast<std::int64_t>(doomed.size());
}

}  // namespace docsync_cpp::local

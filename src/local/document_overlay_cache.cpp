#include "document_overlay_cache.hpp"

#include "keys.hpp"
#include "local_serializer.hpp"

#include <vector>

namespace docsync_cpp::local {

DocumentOverlayCache::DocumentOverlayCache(Persistence& persistence, User user)
    : persistence_{persistence}, user_{std::move(user)} {}

auto DocumentOverlayCache::get_overlay(const DocumentKey& key) -> std::optional<Overlay> {
    auto bytes = txn().get(keys::overlay(user_.uid(), key));
    if (!bytes) return std::nullopt;
    return decode_overlay(*bytes);
}

auto DocumentOverlayCache::get_overlays(const DocumentKeySet& doc_keys) -> OverlayMap {
    auto result = OverlayMap{};
    for (const auto& key : doc_keys) {
        if (auto overlay = get_overlay(key)) result.emplace(key, std::move(*overlay));
    }
    return result;
}

void DocumentOverlayCache::remove_overlay(const DocumentKey& key) {
    if (auto existing = get_overlay(key)) {
        txn().erase(keys::overlay_by_batch(user_.uid(), existing->largest_batch_id, key));
        txn().erase(keys::overlay(user_.uid(), key));
    }
}

void DocumentOverlayCache::save_overlays(BatchId largest_batch_id,
                                         const std::map<DocumentKey, Mutation>& overlays) {
    auto& t = txn();
    for (const auto& [key, mutation] : overlays) {
        remove_overlay(key);
        t.put(keys::overlay(user_.uid(), key), encode_overlay(Overlay{largest_batch_id, mutation}));
        t.put(keys::overlay_by_batch(user_.uid(), largest_batch_id, key), std::string{});
    }
}

void DocumentOverlayCache::remove_overlays_for_batch_id(BatchId batch_id) {
    auto& t = txn();
    auto prefix = keys::overlay_by_batch_prefix(user_.uid(), batch_id);
    auto doc_keys = std::vector<DocumentKey>{};
    t.scan(prefix, [&](std::string_view row, std::string_view) {
        doc_keys.emplace_back(keys::decode_path(row.substr(prefix.size())));
        return true;
    });
    for (const auto& key : doc_keys) {
        t.erase(keys::overlay_by_batch(user_.uid(), batch_id, key));
        t.erase(keys::overlay(user_.uid(), key));
    }
}

auto DocumentOverlayCache::get_overlays_for_collection(const ResourcePath& collection,
                                                       BatchId since_batch_id) -> OverlayMap {
    auto result = OverlayMap{};
    txn().scan(keys::overlay_prefix(user_.uid(), collection),
               [&](std::string_view, std::string_view value) {
                   auto overlay = decode_overlay(value);
                   if (overlay.key().has_collection_path(collection) &&
                       overlay.largest_batch_id > since_batch_id) {
                       result.emplace(overlay.key(), std::move(overlay));
                   }
                   return true;
               });
    return result;
}

auto DocumentOverlayCache::get_overlays_for_collection_group(const std::string& collection_group,
                                                             BatchId since_batch_id,
                                                             std::size_t count) -> OverlayMap {
    auto by_batch = std::map<BatchId, std::vector<Overlay>>{};
    txn().scan(keys::overlay_prefix(user_.uid()), [&](std::string_view, std::string_view value) {
        auto overlay = decode_overlay(value);
        if (overlay.key().collection_group() == collection_group &&
            overlay.largest_batch_id > since_batch_id) {
            by_batch[overlay.largest_batch_id].push_back(std::move(overlay));
        }
        return true;
    });

    auto result = OverlayMap{};
    for (auto& [batch_id, overlays] : by_batch) {
        for (auto& overlay : overlays) result.emplace(overlay.key(), std::move(overlay));
        if (result.size() >= count) break;
    }
    return result;
}

}  // namespace docsync_cpp::local

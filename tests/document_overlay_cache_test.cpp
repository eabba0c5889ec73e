#include "../src/local/document_overlay_cache.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace docsync_cpp;
using namespace docsync_cpp::local;
using namespace docsync_cpp::test;

namespace {

class DocumentOverlayCacheTest : public ::testing::Test {
protected:
    template <typename Fn>
    auto run(Fn&& fn) {
        return harness.persistence->run("test", std::forward<Fn>(fn));
    }

    void save(BatchId batch_id, std::vector<Mutation> mutations) {
        auto overlays = std::map<DocumentKey, Mutation>{};
        for (auto& m : mutations) overlays.emplace(m.key(), std::move(m));
        run([&] { cache.save_overlays(batch_id, overlays); });
    }

    LocalStoreHarness harness;
    DocumentOverlayCache cache{*harness.persistence, User{"alice"}};
};

}  // namespace

TEST_F(DocumentOverlayCacheTest, saved_overlay_is_readable) {
    save(1, {set_mutation("rooms/a", {{"n", 1}})});
    auto overlay = run([&] { return cache.get_overlay(key("rooms/a")); });
    ASSERT_TRUE(overlay.has_value());
    EXPECT_EQ(overlay->largest_batch_id, 1);
    EXPECT_TRUE(overlay->mutation.is_set());
    EXPECT_FALSE(run([&] { return cache.get_overlay(key("rooms/b")); }).has_value());
}

TEST_F(DocumentOverlayCacheTest, newer_overlay_replaces_older) {
    save(1, {set_mutation("rooms/a", {{"n", 1}})});
    save(2, {delete_mutation("rooms/a")});

    auto overlay = run([&] { return cache.get_overlay(key("rooms/a")); });
    ASSERT_TRUE(overlay.has_value());
    EXPECT_EQ(overlay->largest_batch_id, 2);
    EXPECT_TRUE(overlay->mutation.is_delete());

    // The replaced overlay is no longer indexed under its old batch
    run([&] { cache.remove_overlays_for_batch_id(1); });
    EXPECT_TRUE(run([&] { return cache.get_overlay(key("rooms/a")); }).has_value());
}

TEST_F(DocumentOverlayCacheTest, remove_for_batch_drops_only_that_batch) {
    save(1, {set_mutation("rooms/a", {{"n", 1}}), set_mutation("rooms/b", {{"n", 1}})});
    save(2, {set_mutation("rooms/c", {{"n", 2}})});

    run([&] { cache.remove_overlays_for_batch_id(1); });
    auto overlays = run([&] { return cache.get_overlays({key("rooms/a"), key("rooms/b"), key("rooms/c")}); });
    ASSERT_EQ(overlays.size(), 1u);
    EXPECT_TRUE(overlays.contains(key("rooms/c")));
}

TEST_F(DocumentOverlayCacheTest, collection_scan_respects_batch_and_depth) {
    save(1, {set_mutation("rooms/a", {{"n", 1}})});
    save(2, {set_mutation("rooms/b", {{"n", 2}})});
    save(3, {set_mutation("rooms/a/messages/m1", {{"n", 3}})});

    auto all = run([&] { return cache.get_overlays_for_collection(ResourcePath{"rooms"}, unknown_batch_id); });
    EXPECT_EQ(all.size(), 2u);

    auto after_first = run([&] { return cache.get_overlays_for_collection(ResourcePath{"rooms"}, 1); });
    ASSERT_EQ(after_first.size(), 1u);
    EXPECT_TRUE(after_first.contains(key("rooms/b")));
}

TEST_F(DocumentOverlayCacheTest, collection_group_scan_returns_whole_batches) {
    save(1, {set_mutation("rooms/a/messages/m1", {{"n", 1}}), set_mutation("rooms/b/messages/m2", {{"n", 1}})});
    save(2, {set_mutation("rooms/c/messages/m3", {{"n", 2}})});
    save(3, {set_mutation("rooms/d", {{"n", 3}})});

    auto first = run([&] { return cache.get_overlays_for_collection_group("messages", unknown_batch_id, 1); });
    EXPECT_EQ(first.size(), 2u);

    auto all = run([&] { return cache.get_overlays_for_collection_group("messages", unknown_batch_id, 10); });
    EXPECT_EQ(all.size(), 3u);
}

TEST_F(DocumentOverlayCacheTest, overlays_are_per_user) {
    save(1, {set_mutation("rooms/a", {{"n", 1}})});
    auto other = DocumentOverlayCache{*harness.persistence, User{"bob"}};
    EXPECT_FALSE(run([&] { return other.get_overlay(key("rooms/a")); }).has_value());
}

#include "../src/local/lru_garbage_collector.hpp"
#include "../src/local/remote_document_cache.hpp"
#include "../src/local/target_cache.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace docsync_cpp;
using namespace docsync_cpp::local;
using namespace docsync_cpp::test;

namespace {

auto eager_params() -> LruParams {
    auto params = LruParams{};
    params.min_bytes_threshold = 0;
    params.percentile_to_collect = 100;
    return params;
}

class LruGarbageCollectorTest : public ::testing::Test {
protected:
    template <typename Fn>
    auto run(Fn&& fn) {
        return harness.persistence->run("test", std::forward<Fn>(fn));
    }

    auto gc() -> LruGarbageCollector& { return harness.delegate->garbage_collector(); }
    auto targets() -> TargetCache& { return harness.persistence->target_cache(); }
    auto remote_documents() -> RemoteDocumentCache& { return harness.persistence->remote_document_cache(); }

    void add_target(std::string_view path, TargetId target_id, ListenSequenceNumber seq) {
        run([&] { targets().add_target(TargetData{query(path).to_target(), target_id, seq, QueryPurpose::listen}); });
    }

    void cache_documents(const std::vector<std::string>& paths) {
        run([&] {
            for (const auto& path : paths) remote_documents().add(doc(path, 1, {{"n", 1}}), version(1));
        });
    }

    auto cached(std::string_view path) -> bool {
        return run([&] { return remote_documents().get(key(path)).is_valid_document(); });
    }

    LocalStoreHarness harness{User::unauthenticated(), eager_params()};
};

}  // namespace

TEST(LruParamsTest, presets) {
    EXPECT_EQ(LruParams::disabled().min_bytes_threshold, LruParams::collection_disabled);
    EXPECT_EQ(LruParams::with_cache_size(42).min_bytes_threshold, 42);
    EXPECT_EQ(LruParams::defaults().percentile_to_collect, 10);
}

TEST(LruGarbageCollectorStandaloneTest, disabled_collection_does_not_run) {
    auto harness = LocalStoreHarness{User::unauthenticated(), LruParams::disabled()};
    auto results = harness.local_store->collect_garbage(harness.delegate->garbage_collector());
    EXPECT_FALSE(results.did_run);
}

TEST(LruGarbageCollectorStandaloneTest, small_cache_is_not_collected) {
    auto harness = LocalStoreHarness{User::unauthenticated(), LruParams::with_cache_size(1 << 20)};
    auto results = harness.local_store->collect_garbage(harness.delegate->garbage_collector());
    EXPECT_FALSE(results.did_run);
}

TEST_F(LruGarbageCollectorTest, one_sequence_number_per_writing_transaction) {
    auto first = run([&] {
        auto seq = harness.delegate->current_sequence_number();
        EXPECT_EQ(harness.delegate->current_sequence_number(), seq);
        return seq;
    });
    run([&] { return targets().target_count(); });
    auto second = run([&] { return harness.delegate->current_sequence_number(); });
    EXPECT_EQ(second, first + 1);
    EXPECT_EQ(run([&] { return targets().highest_listen_sequence_number(); }), second);
}

TEST_F(LruGarbageCollectorTest, nth_sequence_number_counts_from_the_lowest) {
    add_target("a", 2, 5);
    add_target("b", 4, 1);
    add_target("c", 6, 9);
    add_target("d", 8, 3);

    EXPECT_EQ(run([&] { return gc().calculate_query_count(50); }), 2);
    EXPECT_EQ(run([&] { return gc().nth_sequence_number(2); }), 3);
    EXPECT_EQ(run([&] { return gc().nth_sequence_number(4); }), 9);
    EXPECT_EQ(run([&] { return gc().nth_sequence_number(0); }), invalid_sequence_number);
}

TEST_F(LruGarbageCollectorTest, orphan_marks_count_as_sequence_numbers) {
    add_target("a", 2, 1);
    run([&] {
        harness.delegate->remove_reference(key("rooms/x"));
        harness.delegate->remove_reference(key("rooms/y"));
    });
    EXPECT_EQ(run([&] { return harness.delegate->get_sequence_number_count(); }), 3);
}

TEST_F(LruGarbageCollectorTest, live_targets_survive) {
    add_target("a", 2, 1);
    add_target("b", 4, 2);
    auto live = std::unordered_map<TargetId, TargetData>{
        {2, TargetData{query("a").to_target(), 2, 1, QueryPurpose::listen}}};

    EXPECT_EQ(run([&] { return gc().remove_targets(10, live); }), 1);
    EXPECT_EQ(run([&] { return targets().target_count(); }), 1);
}

TEST_F(LruGarbageCollectorTest, pinned_documents_are_not_removed) {
    cache_documents({"rooms/a", "rooms/b", "rooms/c", "rooms/d"});
    add_target("rooms", 2, 1);
    run([&] {
        targets().add_matching_keys({key("rooms/a")}, 2);
        for (const auto* path : {"rooms/b", "rooms/c", "rooms/d"}) harness.delegate->remove_reference(key(path));
    });
    // Pending write
    harness.local_store->write_locally({set_mutation("rooms/c", {{"n", 2}})});
    // View reference
    harness.local_store->notify_local_view_changes({LocalViewChanges{2, true, {key("rooms/d")}, {}}});

    EXPECT_EQ(run([&] { return gc().remove_orphaned_documents(1000); }), 1);
    EXPECT_TRUE(cached("rooms/a"));
    EXPECT_FALSE(cached("rooms/b"));
    EXPECT_TRUE(cached("rooms/c"));
    EXPECT_TRUE(cached("rooms/d"));
}

TEST_F(LruGarbageCollectorTest, released_target_documents_are_collected_eventually) {
    cache_documents({"rooms/a"});
    auto target_data = harness.local_store->allocate_target(query("rooms").to_target());
    run([&] { targets().add_matching_keys({key("rooms/a")}, target_data.target_id); });
    harness.local_store->release_target(target_data.target_id);

    // The first run drops the target and re-marks its documents as orphans
    auto first = harness.local_store->collect_garbage(gc());
    EXPECT_TRUE(first.did_run);
    EXPECT_EQ(first.targets_removed, 1);
    EXPECT_TRUE(cached("rooms/a"));

    auto second = harness.local_store->collect_garbage(gc());
    EXPECT_EQ(second.documents_removed, 1);
    EXPECT_FALSE(cached("rooms/a"));
}

TEST_F(LruGarbageCollectorTest, active_target_keeps_its_documents) {
    cache_documents({"rooms/a"});
    auto target_data = harness.local_store->allocate_target(query("rooms").to_target());
    run([&] { targets().add_matching_keys({key("rooms/a")}, target_data.target_id); });

    auto results = harness.local_store->collect_garbage(gc());
    EXPECT_TRUE(results.did_run);
    EXPECT_EQ(results.targets_removed, 0);
    EXPECT_EQ(results.documents_removed, 0);
    EXPECT_TRUE(cached("rooms/a"));
}

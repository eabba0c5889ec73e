#include "../src/local/index_manager.hpp"
#include "../src/local/remote_document_cache.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace docsync_cpp;
using namespace docsync_cpp::local;
using namespace docsync_cpp::test;

namespace {

auto field_index(std::string group, std::vector<FieldPath> fields) -> FieldIndex {
    auto index = FieldIndex{};
    index.collection_group = std::move(group);
    index.fields = std::move(fields);
    return index;
}

auto sorted(std::vector<DocumentKey> keys) -> std::vector<DocumentKey> {
    std::sort(keys.begin(), keys.end());
    return keys;
}

class IndexManagerTest : public ::testing::Test {
protected:
    template <typename Fn>
    auto run(Fn&& fn) {
        return harness.persistence->run("test", std::forward<Fn>(fn));
    }

    auto indexes() -> IndexManager& { return harness.persistence->index_manager(); }

    void index_documents(const std::vector<MutableDocument>& docs) {
        auto map = DocumentMap{};
        for (const auto& d : docs) map.emplace(d.key(), d);
        run([&] { indexes().update_index_entries(map); });
    }

    LocalStoreHarness harness;
};

}  // namespace

// -- Collection parents -------------------------------------------------------

TEST_F(IndexManagerTest, collection_parents_are_recorded_once) {
    run([&] {
        indexes().add_to_collection_parent_index(ResourcePath::from_string("rooms/a/messages"));
        indexes().add_to_collection_parent_index(ResourcePath::from_string("rooms/b/messages"));
        indexes().add_to_collection_parent_index(ResourcePath::from_string("rooms/a/messages"));
        indexes().add_to_collection_parent_index(ResourcePath::from_string("messages"));
    });
    auto parents = run([&] { return indexes().get_collection_parents("messages"); });
    ASSERT_EQ(parents.size(), 3u);
    EXPECT_TRUE(std::find(parents.begin(), parents.end(), ResourcePath::from_string("rooms/b")) != parents.end());
    EXPECT_TRUE(std::find(parents.begin(), parents.end(), ResourcePath{}) != parents.end());
    EXPECT_TRUE(run([&] { return indexes().get_collection_parents("rooms"); }).empty());
}

TEST_F(IndexManagerTest, document_path_is_not_a_collection_parent) {
    EXPECT_THROW(run([&] { indexes().add_to_collection_parent_index(ResourcePath::from_string("rooms/a")); }),
                 InternalError);
}

// -- Field index definitions --------------------------------------------------

TEST_F(IndexManagerTest, added_indexes_get_fresh_ids) {
    auto first = run([&] { return indexes().add_field_index(field_index("rooms", {FieldPath{"color"}})); });
    auto second = run([&] { return indexes().add_field_index(field_index("users", {FieldPath{"age"}})); });
    EXPECT_NE(first.index_id, second.index_id);
    EXPECT_EQ(run([&] { return indexes().get_field_indexes(); }).size(), 2u);
    EXPECT_EQ(run([&] { return indexes().get_field_indexes("rooms"); }).size(), 1u);

    run([&] { indexes().delete_field_index(first); });
    auto remaining = run([&] { return indexes().get_field_indexes(); });
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].collection_group, "users");

    run([&] { indexes().delete_all_field_indexes(); });
    EXPECT_TRUE(run([&] { return indexes().get_field_indexes(); }).empty());
}

TEST_F(IndexManagerTest, index_type_depends_on_served_filters) {
    run([&] { indexes().add_field_index(field_index("rooms", {FieldPath{"color"}})); });

    auto by_color = query("rooms").where(FieldPath{"color"}, FilterOperator::equal, "red");
    auto by_color_and_size = by_color.where(FieldPath{"size"}, FilterOperator::greater_than, 3);
    auto by_size = query("rooms").where(FieldPath{"size"}, FilterOperator::equal, 3);

    EXPECT_EQ(run([&] { return indexes().get_index_type(by_color.to_target()); }), IndexType::full);
    EXPECT_EQ(run([&] { return indexes().get_index_type(by_color_and_size.to_target()); }), IndexType::partial);
    EXPECT_EQ(run([&] { return indexes().get_index_type(by_size.to_target()); }), IndexType::none);
    EXPECT_EQ(to_string_view(IndexType::partial), "partial");
}

// -- Entries ------------------------------------------------------------------

TEST_F(IndexManagerTest, equality_lookup_returns_indexed_documents) {
    run([&] { indexes().add_field_index(field_index("rooms", {FieldPath{"color"}})); });
    index_documents({doc("rooms/a", 1, {{"color", "red"}}), doc("rooms/b", 1, {{"color", "blue"}}),
                     doc("rooms/c", 1, {{"color", "red"}}), doc("rooms/d", 1, {{"size", 3}})});

    auto target = query("rooms").where(FieldPath{"color"}, FilterOperator::equal, "red").to_target();
    auto keys = run([&] { return indexes().get_documents_matching_target(target); });
    ASSERT_TRUE(keys.has_value());
    EXPECT_EQ(sorted(*keys), (std::vector<DocumentKey>{key("rooms/a"), key("rooms/c")}));
}

TEST_F(IndexManagerTest, in_filter_expands_to_one_lookup_per_value) {
    run([&] { indexes().add_field_index(field_index("rooms", {FieldPath{"color"}})); });
    index_documents({doc("rooms/a", 1, {{"color", "red"}}), doc("rooms/b", 1, {{"color", "blue"}}),
                     doc("rooms/c", 1, {{"color", "green"}})});

    auto target = query("rooms")
                      .where(FieldPath{"color"}, FilterOperator::in, FieldValue::array({"red", "green"}))
                      .to_target();
    auto keys = run([&] { return indexes().get_documents_matching_target(target); });
    ASSERT_TRUE(keys.has_value());
    EXPECT_EQ(sorted(*keys), (std::vector<DocumentKey>{key("rooms/a"), key("rooms/c")}));
}

TEST_F(IndexManagerTest, composite_index_matches_longest_prefix) {
    run([&] { indexes().add_field_index(field_index("rooms", {FieldPath{"color"}, FieldPath{"size"}})); });
    index_documents({doc("rooms/a", 1, {{"color", "red"}, {"size", 1}}),
                     doc("rooms/b", 1, {{"color", "red"}, {"size", 2}})});

    auto both = query("rooms")
                    .where(FieldPath{"color"}, FilterOperator::equal, "red")
                    .where(FieldPath{"size"}, FilterOperator::equal, 2)
                    .to_target();
    auto keys = run([&] { return indexes().get_documents_matching_target(both); });
    ASSERT_TRUE(keys.has_value());
    EXPECT_EQ(*keys, (std::vector<DocumentKey>{key("rooms/b")}));

    // Only the leading field is constrained
    auto color_only = query("rooms").where(FieldPath{"color"}, FilterOperator::equal, "red").to_target();
    keys = run([&] { return indexes().get_documents_matching_target(color_only); });
    ASSERT_TRUE(keys.has_value());
    EXPECT_EQ(keys->size(), 2u);
}

TEST_F(IndexManagerTest, updated_documents_move_between_entries) {
    run([&] { indexes().add_field_index(field_index("rooms", {FieldPath{"color"}})); });
    index_documents({doc("rooms/a", 1, {{"color", "red"}})});
    index_documents({doc("rooms/a", 2, {{"color", "blue"}})});

    auto red = query("rooms").where(FieldPath{"color"}, FilterOperator::equal, "red").to_target();
    auto blue = query("rooms").where(FieldPath{"color"}, FilterOperator::equal, "blue").to_target();
    EXPECT_TRUE(run([&] { return indexes().get_documents_matching_target(red); })->empty());
    EXPECT_EQ(run([&] { return indexes().get_documents_matching_target(blue); })->size(), 1u);

    index_documents({deleted_doc("rooms/a", 3)});
    EXPECT_TRUE(run([&] { return indexes().get_documents_matching_target(blue); })->empty());
}

TEST_F(IndexManagerTest, unindexed_target_has_no_candidates) {
    auto target = query("rooms").where(FieldPath{"color"}, FilterOperator::equal, "red").to_target();
    EXPECT_FALSE(run([&] { return indexes().get_documents_matching_target(target); }).has_value());
}

TEST_F(IndexManagerTest, create_target_indexes_is_idempotent) {
    auto target = query("rooms")
                      .where(FieldPath{"color"}, FilterOperator::equal, "red")
                      .where(FieldPath{"size"}, FilterOperator::less_than, 4)
                      .to_target();
    run([&] { indexes().create_target_indexes(target); });
    run([&] { indexes().create_target_indexes(target); });

    auto created = run([&] { return indexes().get_field_indexes("rooms"); });
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0].fields, (std::vector<FieldPath>{FieldPath{"color"}}));
}

// -- Backfill -----------------------------------------------------------------

TEST_F(IndexManagerTest, collection_group_offsets_advance_in_rotation) {
    run([&] {
        indexes().add_field_index(field_index("rooms", {FieldPath{"color"}}));
        indexes().add_field_index(field_index("users", {FieldPath{"age"}}));
    });
    auto first = run([&] { return indexes().get_next_collection_group_to_update(); });
    ASSERT_TRUE(first.has_value());

    auto offset = IndexOffset{version(5), key(*first + "/x"), 1};
    run([&] { indexes().update_collection_group(*first, offset); });
    EXPECT_EQ(run([&] { return indexes().get_min_offset(*first); }), offset);

    auto second = run([&] { return indexes().get_next_collection_group_to_update(); });
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*second, *first);
}

TEST_F(IndexManagerTest, backfiller_indexes_cached_documents) {
    run([&] {
        auto& cache = harness.persistence->remote_document_cache();
        cache.add(doc("rooms/a", 1, {{"color", "red"}}), version(1));
        cache.add(doc("rooms/b", 1, {{"color", "blue"}}), version(2));
        cache.add(doc("rooms/c", 1, {{"color", "red"}}), version(3));
    });
    harness.local_store->configure_field_indexes({field_index("rooms", {FieldPath{"color"}})});
    EXPECT_TRUE(harness.local_store->has_field_indexes());

    EXPECT_EQ(harness.local_store->backfill_indexes(), 3u);
    // Nothing changed since the last pass
    EXPECT_EQ(harness.local_store->backfill_indexes(), 0u);

    auto target = query("rooms").where(FieldPath{"color"}, FilterOperator::equal, "red").to_target();
    auto keys = run([&] { return indexes().get_documents_matching_target(target); });
    ASSERT_TRUE(keys.has_value());
    EXPECT_EQ(sorted(*keys), (std::vector<DocumentKey>{key("rooms/a"), key("rooms/c")}));
    EXPECT_EQ(run([&] { return indexes().get_min_offset(target); }).read_time, version(3));
}

TEST_F(IndexManagerTest, reconfiguring_keeps_unchanged_definitions) {
    harness.local_store->configure_field_indexes({field_index("rooms", {FieldPath{"color"}})});
    auto before = run([&] { return indexes().get_field_indexes(); });

    harness.local_store->configure_field_indexes(
        {field_index("rooms", {FieldPath{"color"}}), field_index("users", {FieldPath{"age"}})});
    auto after = run([&] { return indexes().get_field_indexes("rooms"); });
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0].index_id, before[0].index_id);

    harness.local_store->configure_field_indexes({});
    EXPECT_FALSE(harness.local_store->has_field_indexes());
}

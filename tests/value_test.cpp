#include <docsync-cpp/error.hpp>
#include <docsync-cpp/value.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace docsync_cpp;

// -- FieldPath ----------------------------------------------------------------

TEST(FieldPath, from_dot_separated) {
    auto path = FieldPath::from_dot_separated("a.b.c");
    EXPECT_EQ(path, (FieldPath{"a", "b", "c"}));
    EXPECT_EQ(path.canonical_string(), "a.b.c");
    EXPECT_THROW(FieldPath::from_dot_separated("a..b"), Exception);
    EXPECT_THROW(FieldPath::from_dot_separated(""), Exception);
}

TEST(FieldPath, key_path) {
    EXPECT_TRUE(FieldPath::key_path().is_key_field());
    EXPECT_FALSE((FieldPath{"name"}).is_key_field());
}

TEST(FieldPath, mask_covers_children) {
    auto mask = FieldMask{FieldPath{"a"}, FieldPath{"b", "c"}};
    EXPECT_TRUE(mask_covers(mask, FieldPath{"a", "x"}));
    EXPECT_TRUE(mask_covers(mask, FieldPath{"b", "c"}));
    EXPECT_FALSE(mask_covers(mask, FieldPath{"b"}));
    EXPECT_FALSE(mask_covers(mask, FieldPath{"c"}));
}

// -- Type order ---------------------------------------------------------------

TEST(Value, type_order_of_tagged_values) {
    EXPECT_EQ(type_order(FieldValue{}), TypeOrder::null_value);
    EXPECT_EQ(type_order(FieldValue(true)), TypeOrder::boolean);
    EXPECT_EQ(type_order(FieldValue(1.5)), TypeOrder::number);
    EXPECT_EQ(type_order(timestamp_value(SnapshotVersion{10})), TypeOrder::timestamp);
    EXPECT_EQ(type_order(server_timestamp_value(SnapshotVersion{10})), TypeOrder::server_timestamp);
    EXPECT_EQ(type_order(FieldValue("s")), TypeOrder::string);
    EXPECT_EQ(type_order(bytes_value({1, 2})), TypeOrder::bytes);
    EXPECT_EQ(type_order(reference_value(DocumentKey::from_path_string("a/b"))), TypeOrder::reference);
    EXPECT_EQ(type_order(FieldValue::array({1})), TypeOrder::array);
    EXPECT_EQ(type_order(FieldValue::object({{"k", 1}})), TypeOrder::map);
}

TEST(Value, types_compare_by_type_order_first) {
    EXPECT_TRUE(compare_values(FieldValue{}, FieldValue(false)) < 0);
    EXPECT_TRUE(compare_values(FieldValue(true), FieldValue(0)) < 0);
    EXPECT_TRUE(compare_values(FieldValue(1000), timestamp_value(SnapshotVersion{1})) < 0);
    EXPECT_TRUE(compare_values(FieldValue("z"), bytes_value({0})) < 0);
    EXPECT_TRUE(compare_values(FieldValue::array({}), FieldValue::object()) < 0);
}

TEST(Value, integers_and_doubles_compare_numerically) {
    EXPECT_TRUE(values_equal(FieldValue(1), FieldValue(1.0)));
    EXPECT_TRUE(compare_values(FieldValue(1), FieldValue(1.5)) < 0);
    EXPECT_TRUE(compare_values(FieldValue(-1.5), FieldValue(-2)) > 0);
}

TEST(Value, large_unsigned_sorts_above_signed) {
    auto big = FieldValue(std::numeric_limits<std::uint64_t>::max());
    EXPECT_TRUE(compare_values(big, FieldValue(std::numeric_limits<std::int64_t>::max())) > 0);
}

TEST(Value, nan_sorts_first_and_equals_itself) {
    auto nan = FieldValue(std::nan(""));
    EXPECT_TRUE(is_nan(nan));
    EXPECT_TRUE(values_equal(nan, nan));
    EXPECT_TRUE(compare_values(nan, FieldValue(-std::numeric_limits<double>::infinity())) < 0);
}

TEST(Value, arrays_compare_elementwise_then_by_length) {
    EXPECT_TRUE(compare_values(FieldValue::array({1, 2}), FieldValue::array({1, 3})) < 0);
    EXPECT_TRUE(compare_values(FieldValue::array({1}), FieldValue::array({1, 0})) < 0);
}

TEST(Value, maps_compare_by_sorted_keys) {
    EXPECT_TRUE(compare_values(FieldValue::object({{"a", 2}}), FieldValue::object({{"b", 1}})) < 0);
    EXPECT_TRUE(compare_values(FieldValue::object({{"a", 1}}), FieldValue::object({{"a", 2}})) < 0);
}

TEST(Value, references_compare_by_path) {
    auto a = reference_value(DocumentKey::from_path_string("c/a"));
    auto b = reference_value(DocumentKey::from_path_string("c/b"));
    EXPECT_TRUE(compare_values(a, b) < 0);
    EXPECT_EQ(reference_of(a), DocumentKey::from_path_string("c/a"));
}

TEST(Value, timestamp_round_trip_through_tag) {
    auto value = timestamp_value(SnapshotVersion{1234});
    EXPECT_TRUE(is_timestamp(value));
    EXPECT_FALSE(is_server_timestamp(value));
    EXPECT_EQ(timestamp_of(value), SnapshotVersion{1234});
    EXPECT_FALSE(timestamp_of(FieldValue(1234)).has_value());
}

TEST(Value, array_contains_uses_value_equality) {
    auto array = FieldValue::array({1, "two", 3.0});
    EXPECT_TRUE(array_contains(array, FieldValue(3)));
    EXPECT_TRUE(array_contains(array, FieldValue("two")));
    EXPECT_FALSE(array_contains(array, FieldValue(2)));
    EXPECT_FALSE(array_contains(FieldValue(1), FieldValue(1)));
}

TEST(Value, canonical_id_is_stable) {
    EXPECT_EQ(canonical_id(FieldValue(3)), "3");
    EXPECT_EQ(canonical_id(FieldValue(3.0)), "3");
    EXPECT_EQ(canonical_id(FieldValue("x")), "\"x\"");
    EXPECT_EQ(canonical_id(FieldValue::array({1, true})), "[1,true]");
    EXPECT_EQ(canonical_id(FieldValue::object({{"b", 1}, {"a", nullptr}})), "{a:null,b:1}");
    EXPECT_EQ(canonical_id(bytes_value({0xAB})), "bytes(ab)");
}

// -- Object access ------------------------------------------------------------

TEST(Value, set_get_and_delete_nested_fields) {
    auto object = ObjectValue::object();
    set_field(object, FieldPath{"a", "b"}, 1);
    set_field(object, FieldPath{"c"}, "x");

    ASSERT_NE(get_field(object, FieldPath{"a", "b"}), nullptr);
    EXPECT_EQ(*get_field(object, FieldPath{"a", "b"}), 1);
    EXPECT_EQ(get_field(object, FieldPath{"a", "missing"}), nullptr);
    EXPECT_EQ(get_field(object, FieldPath{"c", "deeper"}), nullptr);

    delete_field(object, FieldPath{"a", "b"});
    EXPECT_EQ(get_field(object, FieldPath{"a", "b"}), nullptr);
    ASSERT_NE(get_field(object, FieldPath{"a"}), nullptr);
    EXPECT_TRUE(get_field(object, FieldPath{"a"})->empty());
}

TEST(Value, set_field_replaces_non_map_parents) {
    auto object = ObjectValue{{"a", 5}};
    set_field(object, FieldPath{"a", "b"}, true);
    EXPECT_EQ(object, (ObjectValue{{"a", {{"b", true}}}}));
}

TEST(Value, leaf_paths_stop_at_tagged_values_and_empty_maps) {
    auto object = ObjectValue{
        {"a", {{"b", 1}, {"c", ObjectValue::object()}}},
        {"t", timestamp_value(SnapshotVersion{5})},
        {"s", "x"},
    };
    auto leaves = leaf_paths(object);
    EXPECT_EQ(leaves, (FieldMask{FieldPath{"a", "b"}, FieldPath{"a", "c"}, FieldPath{"t"}, FieldPath{"s"}}));
}

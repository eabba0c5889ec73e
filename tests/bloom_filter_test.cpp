#include "../src/remote/bloom_filter.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace docsync_cpp;
using namespace docsync_cpp::remote;

namespace {

auto resource_name(int i) -> std::string {
    return "projects/p/databases/(default)/documents/rooms/doc" + std::to_string(i);
}

void expect_invalid(std::string bitmap, std::int32_t padding, std::int32_t hash_count) {
    try {
        BloomFilter{std::move(bitmap), padding, hash_count};
        ADD_FAILURE() << "expected invalid_argument";
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::invalid_argument);
    }
}

}  // namespace

TEST(BloomFilter, rejects_invalid_parameters) {
    expect_invalid("\x01", 8, 1);
    expect_invalid("\x01", -1, 1);
    expect_invalid("\x01", 0, -1);
    expect_invalid("\x01", 0, 0);
    expect_invalid("", 1, 1);
}

TEST(BloomFilter, empty_filter_contains_nothing) {
    auto filter = BloomFilter{"", 0, 0};
    EXPECT_EQ(filter.bit_count(), 0);
    EXPECT_FALSE(filter.might_contain(""));
    EXPECT_FALSE(filter.might_contain(resource_name(1)));
}

TEST(BloomFilter, padding_shortens_bit_count) {
    auto filter = BloomFilter::with_bit_count(100, 7);
    EXPECT_EQ(filter.bit_count(), 100);
    EXPECT_EQ(filter.bitmap().size(), 13u);
    EXPECT_EQ(filter.padding(), 4);
}

TEST(BloomFilter, saturated_and_cleared_bitmaps) {
    auto all_set = BloomFilter{std::string(4, '\xff'), 0, 3};
    auto all_clear = BloomFilter{std::string(4, '\0'), 0, 3};
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(all_set.might_contain(resource_name(i)));
        EXPECT_FALSE(all_clear.might_contain(resource_name(i)));
    }

    // One usable bit: every probe lands on bit 0
    auto single_bit = BloomFilter{"\x01", 7, 5};
    EXPECT_EQ(single_bit.bit_count(), 1);
    EXPECT_TRUE(single_bit.might_contain(resource_name(3)));
}

TEST(BloomFilter, never_reports_false_negatives) {
    auto filter = BloomFilter::with_bit_count(2048, 5);
    for (int i = 0; i < 200; ++i) filter.add(resource_name(i));
    for (int i = 0; i < 200; ++i) {
        EXPECT_TRUE(filter.might_contain(resource_name(i))) << resource_name(i);
    }
}

TEST(BloomFilter, false_positives_are_rare) {
    auto filter = BloomFilter::with_bit_count(1000, 7);
    for (int i = 0; i < 50; ++i) filter.add(resource_name(i));

    auto false_positives = 0;
    for (int i = 1000; i < 2000; ++i) {
        if (filter.might_contain(resource_name(i))) ++false_positives;
    }
    EXPECT_LT(false_positives, 20);
}

TEST(BloomFilter, decoded_filter_matches_the_built_one) {
    auto built = BloomFilter::with_bit_count(500, 4);
    for (int i = 0; i < 30; ++i) built.add(resource_name(i));

    auto decoded = BloomFilter{built.bitmap(), built.padding(), built.hash_count()};
    EXPECT_EQ(decoded.bit_count(), built.bit_count());
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(decoded.might_contain(resource_name(i)), built.might_contain(resource_name(i)));
    }
}

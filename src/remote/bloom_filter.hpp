#pragma once

// Bloom filter of document resource names sent with existence filters.
// Internal header — not installed.
//
// - Bitmap bytes, little-endian bit order within each byte
// - `padding` (0..7) unused bits at the end of the last byte
// - `hash_count` probes at (h1 + i * h2) mod bit_count, where h1 and h2
//   are the little-endian 64-bit halves of the first 16 bytes of the
//   SHA-256 digest of the name

#include <docsync-cpp/error.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace docsync_cpp::remote {

class BloomFilter {
public:
    // Validates the parameters. Throws Exception (invalid_argument) for a
    // padding outside 0..7, a negative hash count, a zero hash count on a
    // non-empty bitmap, or padding on an empty bitmap.
    BloomFilter(std::string bitmap, std::int32_t padding, std::int32_t hash_count);

    // An empty filter sized for `bit_count` bits, for building filters.
    static auto with_bit_count(std::int32_t bit_count, std::int32_t hash_count) -> BloomFilter;

    auto bit_count() const -> std::int32_t { return bit_count_; }
    auto hash_count() const -> std::int32_t { return hash_count_; }
    auto bitmap() const -> const std::string& { return bitmap_; }
    auto padding() const -> std::int32_t {
        return static_cast<std::int32_t>(bitmap_.size() * 8) - bit_count_;
    }

    // False positives are possible, false negatives are not.
    auto might_contain(std::string_view value) const -> bool;

    void add(std::string_view value);

private:
    struct Hash {
        std::uint64_t h1;
        std::uint64_t h2;
    };

    static auto hash(std::string_view value) -> Hash;
    auto bit_index(const Hash& hash, std::int32_t i) const -> std::int32_t;
    auto is_bit_set(std::int32_t index) const -> bool;
    void set_bit(std::int32_t index);

    std::string bitmap_;
    std::int32_t bit_count_{0};
    std::int32_t hash_count_{0};
};

}  // namespace docsync_cpp::remote

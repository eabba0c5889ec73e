#include "bloom_filter.hpp"

#include "../crypto/sha256.hpp"

namespace docsync_cpp::remote {

BloomFilter::BloomFilter(std::string bitmap, std::int32_t padding, std::int32_t hash_count)
    : bitmap_{std::move(bitmap)}, hash_count_{hash_count} {
    if (padding < 0 || padding >= 8) {
        throw Exception{ErrorCode::invalid_argument,
                        "invalid bloom filter padding: " + std::to_string(padding)};
    }
    if (hash_count < 0) {
        throw Exception{ErrorCode::invalid_argument,
                        "invalid bloom filter hash count: " + std::to_string(hash_count)};
    }
    if (!bitmap_.empty() && hash_count == 0) {
        throw Exception{ErrorCode::invalid_argument, "bloom filter with bits needs a hash count"};
    }
    if (bitmap_.empty() && padding != 0) {
        throw Exception{ErrorCode::invalid_argument,
                        "empty bloom filter with padding: " + std::to_string(padding)};
    }
    bit_count_ = static_cast<std::int32_t>(bitmap_.size() * 8) - padding;
}

auto BloomFilter::with_bit_count(std::int32_t bit_count, std::int32_t hash_count) -> BloomFilter {
    auto bytes = static_cast<std::size_t>((bit_count + 7) / 8);
    auto padding = static_cast<std::int32_t>(bytes * 8) - bit_count;
    return BloomFilter{std::string(bytes, '\0'), padding, hash_count};
}

auto BloomFilter::hash(std::string_view value) -> Hash {
    auto digest = crypto::sha256(value);
    auto read_le64 = [&](std::size_t offset) {
        auto v = std::uint64_t{0};
        for (std::size_t i = 0; i < 8; ++i) {
            v |= static_cast<std::uint64_t>(digest[offset + i]) << (8 * i);
        }
        return v;
    };
    return Hash{read_le64(0), read_le64(8)};
}

auto BloomFilter::bit_index(const Hash& hash, std::int32_t i) const -> std::int32_t {
    // Unsigned arithmetic wraps modulo 2^64 as the probe sequence requires
    auto combined = hash.h1 + static_cast<std::uint64_t>(i) * hash.h2;
    return static_cast<std::int32_t>(combined % static_cast<std::uint64_t>(bit_count_));
}

auto BloomFilter::is_bit_set(std::int32_t index) const -> bool {
    auto byte = static_cast<std::uint8_t>(bitmap_[static_cast<std::size_t>(index / 8)]);
    return (byte & (1u << (index % 8))) != 0;
}

void BloomFilter::set_bit(std::int32_t index) {
    auto& byte = bitmap_[static_cast<std::size_t>(index / 8)];
    byte = static_cast<char>(static_cast<std::uint8_t>(byte) | (1u << (index % 8)));
}

auto BloomFilter::might_contain(std::string_view value) const -> bool {
    if (bit_count_ == 0) return false;
    auto h = hash(value);
    for (std::int32_t i = 0; i < hash_count_; ++i) {
        if (!is_bit_set(bit_index(h, i))) return false;
    }
    return true;
}

void BloomFilter::add(std::string_view value) {
    if (bit_count_ == 0) return;
    auto h = hash(value);
    for (std::int32_t i = 0; i < hash_count_; ++i) {
        set_bit(bit_index(h, i));
    }
}

}  // namespace docsync_cpp::remote

#pragma once

// LEB128 (Little Endian Base 128) variable-length integers over byte
// strings. Persisted records and journal frames use these for every
// length, id and version.
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace docsync_cpp::encoding {

// Result of a decode: the value and the number of bytes consumed.
template <typename T>
struct Decoded {
    T value;
    std::size_t bytes_read;
};

// -- Unsigned -----------------------------------------------------------------

inline void encode_uleb128(std::uint64_t value, std::string& output) {
    do {
        auto byte = static_cast<std::uint8_t>(value & 0x7F);
        value >>= 7;
        if (value != 0) byte |= 0x80;  // more bytes follow
        output.push_back(static_cast<char>(byte));
    } while (value != 0);
}

// Nullopt if the input is truncated or longer than 64 bits.
inline auto decode_uleb128(std::string_view input) -> std::optional<Decoded<std::uint64_t>> {
    auto value = std::uint64_t{0};
    auto shift = 0u;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (shift >= 64) return std::nullopt;
        auto byte = static_cast<std::uint8_t>(input[i]);
        value |= static_cast<std::uint64_t>(byte & 0x7F) << shift;
        shift += 7;
        if ((byte & 0x80) == 0) return Decoded<std::uint64_t>{value, i + 1};
    }
    return std::nullopt;
}

// -- Signed -------------------------------------------------------------------

inline void encode_sleb128(std::int64_t value, std::string& output) {
    auto more = true;
    while (more) {
        auto byte = static_cast<std::uint8_t>(value & 0x7F);
        value >>= 7;  // arithmetic shift keeps the sign
        const bool sign_bit = (byte & 0x40) != 0;
        if ((value == 0 && !sign_bit) || (value == -1 && sign_bit)) {
            more = false;
        } else {
            byte |= 0x80;
        }
        output.push_back(static_cast<char>(byte));
    }
}

inline auto decode_sleb128(std::string_view input) -> std::optional<Decoded<std::int64_t>> {
    auto value = std::int64_t{0};
    auto shift = 0u;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (shift >= 64) return std::nullopt;
        auto byte = static_cast<std::uint8_t>(input[i]);
        value |= static_cast<std::int64_t>(byte & 0x7F) << shift;
        shift += 7;
        if ((byte & 0x80) == 0) {
            if (shift < 64 && (byte & 0x40) != 0) value |= -(std::int64_t{1} << shift);
            return Decoded<std::int64_t>{value, i + 1};
        }
    }
    return std::nullopt;
}

}  // namespace docsync_cpp::encoding

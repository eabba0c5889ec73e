#pragma once

// Frame envelope for the durable key-value journal and snapshot files.
//
// Each file is a sequence of frames:
//   magic (4 bytes: 0x64 0x73 0x6A 0x01)
//   checksum (4 bytes, little-endian CRC-32 of the stored body)
//   flags (1 byte: bit 0 set if the body is DEFLATE-compressed)
//   raw_length (ULEB128, length of the uncompressed body)
//   body_length (ULEB128)
//   body (body_length bytes)
//
// Only the final frame may be cut short, by a write interrupted by a crash.
// A corrupt frame with data after it is lost data, not a torn tail.
//
// Internal header — not installed.

#include "compression.hpp"
#include "../encoding/leb128.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace docsync_cpp::storage {

inline constexpr std::array<char, 4> frame_magic = {'\x64', '\x73', '\x6A', '\x01'};

inline constexpr std::uint8_t frame_flag_deflate = 0x01;

// Encode `body` as one frame, compressing it when that saves space.
inline auto encode_frame(std::string_view body) -> std::string {
    auto flags = std::uint8_t{0};
    auto stored = std::string{body};
    if (body.size() >= deflate_threshold) {
        if (auto compressed = deflate_compress(body); compressed && compressed->size() < body.size()) {
            stored = std::move(*compressed);
            flags |= frame_flag_deflate;
        }
    }

    auto out = std::string{frame_magic.data(), frame_magic.size()};
    auto checksum = crc32(stored);
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((checksum >> (i * 8)) & 0xFF));
    out.push_back(static_cast<char>(flags));
    encoding::encode_uleb128(body.size(), out);
    encoding::encode_uleb128(stored.size(), out);
    out.append(stored);
    return out;
}

struct DecodedFrame {
    std::string body;
    std::size_t bytes_read;
};

// Decode the frame at the start of `data`. Nullopt if it is truncated,
// fails its checksum or does not inflate.
inline auto decode_frame(std::string_view data) -> std::optional<DecodedFrame> {
    if (data.size() < 9) return std::nullopt;
    if (data.substr(0, 4) != std::string_view{frame_magic.data(), frame_magic.size()}) {
        return std::nullopt;
    }

    auto checksum = std::uint32_t{0};
    for (int i = 0; i < 4; ++i) {
        checksum |= static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[4 + i])) << (i * 8);
    }
    auto flags = static_cast<std::uint8_t>(data[8]);
    auto pos = std::size_t{9};

    auto raw_length = encoding::decode_uleb128(data.substr(pos));
    if (!raw_length) return std::nullopt;
    pos += raw_length->bytes_read;

    auto body_length = encoding::decode_uleb128(data.substr(pos));
    if (!body_length) return std::nullopt;
    pos += body_length->bytes_read;

    if (body_length->value > data.size() - pos) return std::nullopt;
    auto stored = data.substr(pos, static_cast<std::size_t>(body_length->value));
    pos += stored.size();

    if (crc32(stored) != checksum) return std::nullopt;

    if ((flags & frame_flag_deflate) != 0) {
        auto body = deflate_decompress(stored, static_cast<std::size_t>(raw_length->value));
        if (!body) return std::nullopt;
        return DecodedFrame{std::move(*body), pos};
    }
    if (stored.size() != raw_length->value) return std::nullopt;
    return DecodedFrame{std::string{stored}, pos};
}

// Whether `data`, which failed to decode, is a frame that runs to or past the
// end of the file.
inline auto is_torn_tail(std::string_view data) -> bool {
    auto magic = std::string_view{frame_magic.data(), frame_magic.size()};
    if (data.substr(0, 4) != magic.substr(0, std::min(data.size(), magic.size()))) return false;
    if (data.size() < 9) return true;
    auto pos = std::size_t{9};

    auto raw_length = encoding::decode_uleb128(data.substr(pos));
    if (!raw_length) return data.size() - pos < 10;
    pos += raw_length->bytes_read;

    auto body_length = encoding::decode_uleb128(data.substr(pos));
    if (!body_length) return data.size() - pos < 10;
    pos += body_length->bytes_read;

    return body_length->value >= data.size() - pos;
}

}  // namespace docsync_cpp::storage

#pragma once

// DEFLATE compression and CRC-32 checksums for journal frames.
//
// Frame bodies larger than the threshold are compressed using raw DEFLATE
// (no zlib/gzip header). The frame flags record whether a body is
// compressed.
//
// Internal header — not installed.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <zlib.h>

namespace docsync_cpp::storage {

// Bodies smaller than this are not compressed.
inline constexpr std::size_t deflate_threshold = 256;

// Compress data using raw DEFLATE (no zlib/gzip header).
inline auto deflate_compress(std::string_view input) -> std::optional<std::string> {
    if (input.empty()) return std::string{};

    auto stream = z_stream{};
    // windowBits = -15 for raw deflate (negative = no header)
    auto ret = ::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                              -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::string(bound, '\0');

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// Decompress raw DEFLATE data into exactly `expected_size` bytes.
// Nullopt if the data is corrupt or inflates to a different size.
inline auto deflate_decompress(std::string_view input, std::size_t expected_size)
    -> std::optional<std::string> {
    if (input.empty()) {
        if (expected_size != 0) return std::nullopt;
        return std::string{};
    }

    auto output = std::string(expected_size, '\0');

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(expected_size);

    auto ret = ::inflateInit2(&stream, -15);
    if (ret != Z_OK) return std::nullopt;

    ret = ::inflate(&stream, Z_FINISH);
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END || stream.total_out != expected_size) return std::nullopt;
    return output;
}

inline auto crc32(std::string_view data) -> std::uint32_t {
    auto crc = ::crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large inputs in pieces
    while (!data.empty()) {
        auto n = std::min<std::size_t>(data.size(), 1u << 30);
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(n));
        data.remove_prefix(n);
    }
    return static_cast<std::uint32_t>(crc);
}

}  // namespace docsync_cpp::storage

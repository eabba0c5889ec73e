#pragma once

// Byte deserializer for persisted records. Every read returns nullopt on
// truncated or malformed input.
// Internal header — not installed.

#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>
#include "../encoding/leb128.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsync_cpp::storage {

class Deserializer {
public:
    explicit Deserializer(std::string_view data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto pos() const -> std::size_t { return pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_bool() -> std::optional<bool> {
        auto v = read_u8();
        if (!v || *v > 1) return std::nullopt;
        return *v == 1;
    }

    auto read_bytes(std::size_t n) -> std::optional<std::string_view> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.substr(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.substr(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_sleb128() -> std::optional<std::int64_t> {
        auto result = encoding::decode_sleb128(data_.substr(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_uleb128();
        if (!len) return std::nullopt;
        auto bytes = read_bytes(static_cast<std::size_t>(*len));
        if (!bytes) return std::nullopt;
        return std::string{*bytes};
    }

    auto read_version() -> std::optional<SnapshotVersion> {
        auto v = read_sleb128();
        if (!v) return std::nullopt;
        return SnapshotVersion{*v};
    }

    auto read_path() -> std::optional<ResourcePath> {
        auto segments = read_segments();
        if (!segments) return std::nullopt;
        return ResourcePath{std::move(*segments)};
    }

    auto read_key() -> std::optional<DocumentKey> {
        auto path = read_path();
        if (!path || !DocumentKey::is_document_path(*path)) return std::nullopt;
        return DocumentKey{std::move(*path)};
    }

    auto read_field_path() -> std::optional<FieldPath> {
        auto segments = read_segments();
        if (!segments) return std::nullopt;
        return FieldPath{std::move(*segments)};
    }

    auto read_value() -> std::optional<FieldValue> {
        auto len = read_uleb128();
        if (!len) return std::nullopt;
        auto bytes = read_bytes(static_cast<std::size_t>(*len));
        if (!bytes) return std::nullopt;
        auto value = FieldValue::from_cbor(bytes->begin(), bytes->end(), true, false);
        if (value.is_discarded()) return std::nullopt;
        return value;
    }

    // Read a count followed by that many items; nullopt if any item fails.
    template <typename T, typename Fn>
    auto read_vector(Fn&& read_item) -> std::optional<std::vector<T>> {
        auto count = read_uleb128();
        if (!count || *count > remaining()) return std::nullopt;
        auto items = std::vector<T>{};
        items.reserve(static_cast<std::size_t>(*count));
        for (std::uint64_t i = 0; i < *count; ++i) {
            auto item = read_item();
            if (!item) return std::nullopt;
            items.push_back(std::move(*item));
        }
        return items;
    }

private:
    auto read_segments() -> std::optional<std::vector<std::string>> {
        return read_vector<std::string>([this] { return read_string(); });
    }

    std::string_view data_;
    std::size_t pos_;
};

}  // namespace docsync_cpp::storage

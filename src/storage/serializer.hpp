#pragma once

// Byte serializer for persisted records.
// Internal header — not installed.

#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>
#include "../encoding/leb128.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace docsync_cpp::storage {

class Serializer {
public:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<char>(v));
    }

    void write_bool(bool v) {
        write_u8(v ? 1 : 0);
    }

    void write_uleb128(std::uint64_t value) {
        encoding::encode_uleb128(value, data_);
    }

    void write_sleb128(std::int64_t value) {
        encoding::encode_sleb128(value, data_);
    }

    // Length-prefixed bytes.
    void write_string(std::string_view s) {
        write_uleb128(s.size());
        data_.append(s);
    }

    void write_version(SnapshotVersion v) {
        write_sleb128(v.micros);
    }

    void write_path(const ResourcePath& path) {
        write_uleb128(path.size());
        for (const auto& segment : path.segments()) write_string(segment);
    }

    void write_key(const DocumentKey& key) {
        write_path(key.path());
    }

    void write_field_path(const FieldPath& path) {
        write_uleb128(path.size());
        for (const auto& segment : path.segments()) write_string(segment);
    }

    // Field values are stored as CBOR, which keeps binary values and
    // distinguishes integers from doubles.
    void write_value(const FieldValue& value) {
        auto cbor = FieldValue::to_cbor(value);
        write_uleb128(cbor.size());
        data_.append(reinterpret_cast<const char*>(cbor.data()), cbor.size());
    }

    template <typename T, typename Fn>
    void write_vector(const std::vector<T>& items, Fn&& write_item) {
        write_uleb128(items.size());
        for (const auto& item : items) write_item(item);
    }

    auto data() const -> const std::string& { return data_; }
    auto take() -> std::string { return std::move(data_); }

private:
    std::string data_;
};

}  // namespace docsync_cpp::storage

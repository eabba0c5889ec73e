#include "kv_store.hpp"

#include "../storage/deserializer.hpp"
#include "../storage/frame.hpp"
#include "../storage/serializer.hpp"
#include "../util/log.hpp"

#include <docsync-cpp/error.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace docsync_cpp::local {

namespace {

constexpr auto lock_file_name = "LOCK";
constexpr auto snapshot_file_name = "snapshot.bin";
constexpr auto journal_file_name = "journal.bin";

// Snapshot frames are cut at roughly this many body bytes.
constexpr std::size_t snapshot_frame_bytes = 1024 * 1024;

constexpr std::uint8_t op_delete = 0;
constexpr std::uint8_t op_put = 1;

auto encode_batch(const WriteBatch& batch) -> std::string {
    auto s = storage::Serializer{};
    s.write_uleb128(batch.size());
    for (const auto& [key, value] : batch) {
        s.write_u8(value ? op_put : op_delete);
        s.write_string(key);
        if (value) s.write_string(*value);
    }
    return s.take();
}

auto read_file(const std::filesystem::path& path) -> std::string {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        throw Exception{ErrorCode::unavailable, "cannot open " + path.string()};
    }
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

}  // namespace

// -- KvStore ------------------------------------------------------------------

auto KvStore::get(std::string_view key) const -> std::optional<std::string> {
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

void KvStore::apply(const WriteBatch& batch) {
    if (batch.empty()) return;
    persist(batch);
    for (const auto& [key, value] : batch) {
        if (value) {
            put_committed(key, *value);
        } else {
            erase_committed(key);
        }
    }
}

void KvStore::put_committed(std::string key, std::string value) {
    auto it = data_.find(key);
    if (it != data_.end()) {
        byte_size_ -= static_cast<std::int64_t>(it->second.size());
        byte_size_ += static_cast<std::int64_t>(value.size());
        it->second = std::move(value);
        return;
    }
    byte_size_ += static_cast<std::int64_t>(key.size() + value.size());
    data_.emplace(std::move(key), std::move(value));
}

void KvStore::erase_committed(std::string_view key) {
    auto it = data_.find(key);
    if (it == data_.end()) return;
    byte_size_ -= static_cast<std::int64_t>(it->first.size() + it->second.size());
    data_.erase(it);
}

// -- FileKvStore --------------------------------------------------------------

FileKvStore::FileKvStore(std::filesystem::path directory)
    : directory_{std::move(directory)} {
    auto ec = std::error_code{};
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw Exception{ErrorCode::unavailable,
                        "cannot create " + directory_.string() + ": " + ec.message()};
    }
    acquire_lock();
    try {
        load();
    } catch (const Exception&) {
        close();
        throw;
    }
}

FileKvStore::~FileKvStore() {
    close();
}

void FileKvStore::acquire_lock() {
    auto path = directory_ / lock_file_name;
    lock_fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (lock_fd_ < 0) {
        throw Exception{ErrorCode::unavailable,
                        "cannot open " + path.string() + ": " + std::strerror(errno)};
    }
    if (::flock(lock_fd_, LOCK_EX | LOCK_NB) != 0) {
        auto err = errno;
        ::close(lock_fd_);
        lock_fd_ = -1;
        if (err == EWOULDBLOCK) {
            throw Exception{ErrorCode::failed_precondition,
                            "persistence directory " + directory_.string() +
                                " is in use by another client"};
        }
        throw Exception{ErrorCode::unavailable,
                        "cannot lock " + path.string() + ": " + std::strerror(err)};
    }
}

void FileKvStore::close() {
    if (lock_fd_ >= 0) {
        ::flock(lock_fd_, LOCK_UN);
        ::close(lock_fd_);
        lock_fd_ = -1;
    }
}

void FileKvStore::load() {
    auto snapshot = directory_ / snapshot_file_name;
    if (std::filesystem::exists(snapshot)) replay(snapshot, false);

    auto journal = directory_ / journal_file_name;
    if (!std::filesystem::exists(journal)) return;

    auto valid = replay(journal, true);
    auto size = std::filesystem::file_size(journal);
    if (valid < size) {
        util::logger()->warn("discarding {} bytes of torn journal tail in {}",
                             size - valid, directory_.string());
        std::filesystem::resize_file(journal, valid);
    }
    journal_bytes_ = static_cast<std::int64_t>(valid);
}

auto FileKvStore::replay(const std::filesystem::path& file, bool tolerate_torn_tail)
    -> std::uintmax_t {
    auto contents = read_file(file);
    auto view = std::string_view{contents};
    auto pos = std::size_t{0};
    auto frames = std::size_t{0};
    while (pos < view.size()) {
        auto frame = storage::decode_frame(view.substr(pos));
        if (!frame) {
            if (tolerate_torn_tail && storage::is_torn_tail(view.substr(pos))) break;
            throw Exception{ErrorCode::data_loss,
                            "corrupt frame at offset " + std::to_string(pos) + " of " + file.string()};
        }
        apply_record(frame->body);
        pos += frame->bytes_read;
        ++frames;
    }
    util::logger()->debug("replayed {} frames from {}", frames, file.string());
    return pos;
}

void FileKvStore::apply_record(std::string_view body) {
    auto d = storage::Deserializer{body};
    auto count = d.read_uleb128();
    if (!count) throw Exception{ErrorCode::data_loss, "malformed journal record"};
    for (std::uint64_t i = 0; i < *count; ++i) {
        auto op = d.read_u8();
        auto key = d.read_string();
        if (!op || !key) throw Exception{ErrorCode::data_loss, "malformed journal record"};
        if (*op == op_put) {
            auto value = d.read_string();
            if (!value) throw Exception{ErrorCode::data_loss, "malformed journal record"};
            put_committed(std::move(*key), std::move(*value));
        } else if (*op == op_delete) {
            erase_committed(*key);
        } else {
            throw Exception{ErrorCode::data_loss, "unknown journal op " + std::to_string(*op)};
        }
    }
}

void FileKvStore::append(const std::string& frame) {
    auto path = directory_ / journal_file_name;
    auto out = std::ofstream{path, std::ios::binary | std::ios::app};
    out.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    out.flush();
    if (!out) {
        throw Exception{ErrorCode::unavailable, "cannot append to " + path.string()};
    }
    journal_bytes_ += static_cast<std::int64_t>(frame.size());
}

void FileKvStore::persist(const WriteBatch& batch) {
    if (lock_fd_ < 0) {
        throw Exception{ErrorCode::failed_precondition, "persistence is closed"};
    }
    append(storage::encode_frame(encode_batch(batch)));
    if (journal_bytes_ > compaction_threshold && journal_bytes_ > byte_size_) {
        // Compaction runs before the batch is visible, so fold it in now
        auto next = data_;
        for (const auto& [key, value] : batch) {
            if (value) next[key] = *value; else next.erase(key);
        }
        auto saved = std::move(data_);
        data_ = std::move(next);
        compact();
        data_ = std::move(saved);
    }
}

void FileKvStore::compact() {
    auto tmp = directory_ / "snapshot.tmp";
    {
        auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        auto chunk = WriteBatch{};
        auto chunk_bytes = std::size_t{0};
        auto flush = [&] {
            if (chunk.empty()) return;
            auto frame = storage::encode_frame(encode_batch(chunk));
            out.write(frame.data(), static_cast<std::streamsize>(frame.size()));
            chunk.clear();
            chunk_bytes = 0;
        };
        for (const auto& [key, value] : data_) {
            chunk_bytes += key.size() + value.size();
            chunk.emplace(key, value);
            if (chunk_bytes >= snapshot_frame_bytes) flush();
        }
        flush();
        out.flush();
        if (!out) throw Exception{ErrorCode::unavailable, "cannot write " + tmp.string()};
    }
    std::filesystem::rename(tmp, directory_ / snapshot_file_name);
    // A crash before the truncate replays the journal over the new
    // snapshot, which yields the same contents
    auto journal = directory_ / journal_file_name;
    if (std::filesystem::exists(journal)) std::filesystem::resize_file(journal, 0);
    util::logger()->debug("compacted {} journal bytes in {}", journal_bytes_, directory_.string());
    journal_bytes_ = 0;
}

}  // namespace docsync_cpp::local

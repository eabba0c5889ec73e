#pragma once

// Ordered key-value stores underneath persistence.
//
// Every store keeps its committed contents in an in-memory ordered map.
// The durable store additionally appends each committed batch to a
// journal file and periodically compacts the journal into a snapshot.
//
// Internal header — not installed.

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace docsync_cpp::local {

// Staged writes of one transaction: a value to put, or nullopt to delete.
using WriteBatch = std::map<std::string, std::optional<std::string>, std::less<>>;

class KvStore {
public:
    using Map = std::map<std::string, std::string, std::less<>>;

    virtual ~KvStore() = default;

    auto get(std::string_view key) const -> std::optional<std::string>;

    // Committed contents in key order.
    auto contents() const -> const Map& { return data_; }

    // Make `batch` durable, then visible.
    void apply(const WriteBatch& batch);

    // Approximate size of the committed keys and values.
    auto byte_size() const -> std::int64_t { return byte_size_; }

    virtual void close() {}

protected:
    virtual void persist(const WriteBatch& batch) = 0;

    void put_committed(std::string key, std::string value);
    void erase_committed(std::string_view key);

    Map data_;
    std::int64_t byte_size_{0};
};

class MemoryKvStore final : public KvStore {
protected:
    void persist(const WriteBatch&) override {}
};

// Files in `directory`:
//   LOCK          advisory lock held while the store is open
//   snapshot.bin  frames holding the compacted contents
//   journal.bin   frames holding batches committed since the snapshot
class FileKvStore final : public KvStore {
public:
    // Journals larger than this are compacted once they also exceed the
    // live data size.
    static constexpr std::int64_t compaction_threshold = 4 * 1024 * 1024;

    // Open or create the store. Throws Exception (failed_precondition) if
    // another client holds the lock, (data_loss) if the snapshot is
    // unreadable, (unavailable) on I/O failure.
    explicit FileKvStore(std::filesystem::path directory);
    ~FileKvStore() override;

    FileKvStore(const FileKvStore&) = delete;
    auto operator=(const FileKvStore&) -> FileKvStore& = delete;

    void close() override;

    auto directory() const -> const std::filesystem::path& { return directory_; }
    auto journal_bytes() const -> std::int64_t { return journal_bytes_; }

    // Rewrite the snapshot from the committed contents and empty the journal.
    void compact();

protected:
    void persist(const WriteBatch& batch) override;

private:
    void acquire_lock();
    void load();
    auto replay(const std::filesystem::path& file, bool tolerate_torn_tail) -> std::uintmax_t;
    void apply_record(std::string_view body);
    void append(const std::string& frame);

    std::filesystem::path directory_;
    int lock_fd_{-1};
    std::int64_t journal_bytes_{0};
};

}  // namespace docsync_cpp::local

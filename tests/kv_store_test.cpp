#include "../src/local/kv_store.hpp"
#include "../src/local/persistence.hpp"
#include "test_util.hpp"

#include <docsync-cpp/error.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace docsync_cpp;
using namespace docsync_cpp::local;

namespace {

auto put(std::string key, std::string value) -> WriteBatch {
    auto batch = WriteBatch{};
    batch.emplace(std::move(key), std::move(value));
    return batch;
}

}  // namespace

// -- MemoryKvStore ------------------------------------------------------------

TEST(MemoryKvStore, apply_puts_and_deletes) {
    auto store = MemoryKvStore{};
    store.apply(put("a", "1"));
    store.apply(put("b", "22"));
    EXPECT_EQ(store.get("a"), "1");
    EXPECT_EQ(store.byte_size(), 1 + 1 + 1 + 2);

    auto erase = WriteBatch{};
    erase.emplace("a", std::nullopt);
    store.apply(erase);
    EXPECT_FALSE(store.get("a").has_value());
    EXPECT_EQ(store.contents().size(), 1u);
    EXPECT_EQ(store.byte_size(), 3);
}

TEST(MemoryKvStore, overwrite_adjusts_byte_size) {
    auto store = MemoryKvStore{};
    store.apply(put("k", "short"));
    store.apply(put("k", "a much longer value"));
    EXPECT_EQ(store.byte_size(), static_cast<std::int64_t>(1 + std::string{"a much longer value"}.size()));
}

// -- FileKvStore --------------------------------------------------------------

TEST(FileKvStore, contents_survive_reopen) {
    auto dir = test::TempDir{};
    {
        auto store = FileKvStore{dir.path()};
        store.apply(put("doc/a", "alpha"));
        store.apply(put("doc/b", "beta"));
        auto erase = WriteBatch{};
        erase.emplace("doc/a", std::nullopt);
        store.apply(erase);
    }
    auto store = FileKvStore{dir.path()};
    EXPECT_FALSE(store.get("doc/a").has_value());
    EXPECT_EQ(store.get("doc/b"), "beta");
}

TEST(FileKvStore, second_open_of_locked_directory_fails) {
    auto dir = test::TempDir{};
    auto first = FileKvStore{dir.path()};
    try {
        auto second = FileKvStore{dir.path()};
        FAIL() << "expected Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::failed_precondition);
    }
}

TEST(FileKvStore, lock_is_released_on_close) {
    auto dir = test::TempDir{};
    auto first = FileKvStore{dir.path()};
    first.close();
    EXPECT_NO_THROW(FileKvStore{dir.path()});
}

TEST(FileKvStore, writes_after_close_fail) {
    auto dir = test::TempDir{};
    auto store = FileKvStore{dir.path()};
    store.close();
    EXPECT_THROW(store.apply(put("a", "1")), Exception);
    EXPECT_FALSE(store.get("a").has_value());
}

TEST(FileKvStore, torn_journal_tail_is_discarded) {
    auto dir = test::TempDir{};
    {
        auto store = FileKvStore{dir.path()};
        store.apply(put("a", "1"));
    }
    {
        // A crash in the middle of the next append
        auto out = std::ofstream{dir.path() / "journal.bin", std::ios::binary | std::ios::app};
        out << "\x64\x73\x6A";
    }
    auto store = FileKvStore{dir.path()};
    EXPECT_EQ(store.get("a"), "1");
    store.apply(put("b", "2"));
    store.close();

    auto reopened = FileKvStore{dir.path()};
    EXPECT_EQ(reopened.get("a"), "1");
    EXPECT_EQ(reopened.get("b"), "2");
}

TEST(FileKvStore, corrupt_frame_before_the_tail_is_data_loss) {
    auto dir = test::TempDir{};
    auto journal = dir.path() / "journal.bin";
    auto first_frame_end = std::uintmax_t{0};
    {
        auto store = FileKvStore{dir.path()};
        store.apply(put("a", "first"));
        first_frame_end = std::filesystem::file_size(journal);
        store.apply(put("b", "second"));
        store.apply(put("c", "third"));
    }
    auto size_before = std::filesystem::file_size(journal);
    {
        // Flip the last byte of the middle frame's body
        auto file = std::fstream{journal, std::ios::binary | std::ios::in | std::ios::out};
        auto offset = static_cast<std::streamoff>(first_frame_end) + 20;
        file.seekg(offset);
        auto byte = static_cast<char>(file.get());
        file.seekp(offset);
        file.put(static_cast<char>(byte ^ 0x5A));
    }
    try {
        auto store = FileKvStore{dir.path()};
        FAIL() << "expected Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::data_loss);
    }
    EXPECT_EQ(std::filesystem::file_size(journal), size_before);
}

TEST(FileKvStore, corrupt_final_frame_is_discarded) {
    auto dir = test::TempDir{};
    auto journal = dir.path() / "journal.bin";
    {
        auto store = FileKvStore{dir.path()};
        store.apply(put("a", "first"));
        store.apply(put("b", "second"));
    }
    {
        auto file = std::fstream{journal, std::ios::binary | std::ios::in | std::ios::out};
        file.seekg(-1, std::ios::end);
        auto byte = static_cast<char>(file.get());
        file.seekp(-1, std::ios::end);
        file.put(static_cast<char>(byte ^ 0x5A));
    }
    auto store = FileKvStore{dir.path()};
    EXPECT_EQ(store.get("a"), "first");
    EXPECT_FALSE(store.get("b").has_value());
}

TEST(FileKvStore, compaction_empties_journal_and_keeps_contents) {
    auto dir = test::TempDir{};
    {
        auto store = FileKvStore{dir.path()};
        for (int i = 0; i < 20; ++i) store.apply(put("k" + std::to_string(i), std::string(100, 'v')));
        EXPECT_GT(store.journal_bytes(), 0);
        store.compact();
        EXPECT_EQ(store.journal_bytes(), 0);
        store.apply(put("after", "compaction"));
    }
    auto store = FileKvStore{dir.path()};
    EXPECT_EQ(store.contents().size(), 21u);
    EXPECT_EQ(store.get("after"), "compaction");
}

TEST(FileKvStore, corrupt_snapshot_is_data_loss) {
    auto dir = test::TempDir{};
    {
        auto store = FileKvStore{dir.path()};
        store.apply(put("a", "1"));
        store.compact();
    }
    {
        auto out = std::ofstream{dir.path() / "snapshot.bin", std::ios::binary | std::ios::trunc};
        out << "garbage that is not a frame";
    }
    try {
        auto store = FileKvStore{dir.path()};
        FAIL() << "expected Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::data_loss);
    }
}

// -- Persistence transactions -------------------------------------------------

TEST(Persistence, transaction_reads_its_own_writes) {
    auto persistence = Persistence::memory();
    persistence->run("write", [&] {
        auto& txn = persistence->current_transaction();
        txn.put("x/1", "one");
        EXPECT_EQ(txn.get("x/1"), "one");
        EXPECT_FALSE(persistence->store().get("x/1").has_value());
    });
    EXPECT_EQ(persistence->store().get("x/1"), "one");
}

TEST(Persistence, throwing_transaction_discards_writes) {
    auto persistence = Persistence::memory();
    EXPECT_THROW(persistence->run("fail", [&] {
        persistence->current_transaction().put("x/1", "one");
        throw Exception{ErrorCode::aborted, "stop"};
    }), Exception);
    EXPECT_FALSE(persistence->store().get("x/1").has_value());
    EXPECT_FALSE(persistence->in_transaction());
}

TEST(Persistence, scan_visits_prefix_in_order_with_pending_writes) {
    auto persistence = Persistence::memory();
    persistence->run("seed", [&] {
        auto& txn = persistence->current_transaction();
        txn.put("p/b", "2");
        txn.put("p/d", "4");
        txn.put("q/a", "x");
    });
    auto keys = std::vector<std::string>{};
    persistence->run("scan", [&] {
        auto& txn = persistence->current_transaction();
        txn.put("p/a", "1");
        txn.erase("p/d");
        txn.scan("p/", [&](std::string_view key, std::string_view) {
            keys.emplace_back(key);
            return true;
        });
    });
    EXPECT_EQ(keys, (std::vector<std::string>{"p/a", "p/b"}));
}

TEST(Persistence, durable_directory_is_exclusive) {
    auto dir = test::TempDir{};
    auto first = Persistence::durable(dir.path());
    EXPECT_THROW(Persistence::durable(dir.path()), Exception);
    first->shutdown();
    EXPECT_NO_THROW(Persistence::durable(dir.path()));
}

#include "test_util.hpp"

#include "../src/core/sync_engine.hpp"
#include "../src/remote/remote_store.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace docsync_cpp;
using namespace docsync_cpp::core;
using namespace docsync_cpp::remote;
using namespace docsync_cpp::test;

namespace {

// Stands in for the event manager.
class RecordingCallback final : public SyncEngineCallback {
public:
    void on_view_snapshots(std::vector<ViewSnapshot>&& new_snapshots) override {
        for (auto& snapshot : new_snapshots) snapshots.push_back(std::move(snapshot));
    }

    void on_error(const Query& query, const Error& error) override {
        errors.emplace_back(query.canonical_id(), error.code);
    }

    void handle_online_state_change(OnlineState online_state) override { online_states.push_back(online_state); }

    std::vector<ViewSnapshot> snapshots;
    std::vector<std::pair<std::string, ErrorCode>> errors;
    std::vector<OnlineState> online_states;
};

auto keys_of(const ViewSnapshot& snapshot) -> std::vector<DocumentKey> {
    auto result = std::vector<DocumentKey>{};
    for (const auto& d : snapshot.documents) result.push_back(d.key());
    return result;
}

auto target_change(WatchTargetChangeState state, std::vector<TargetId> ids, ByteString token = {}) -> WatchChange {
    return WatchTargetChange{state, std::move(ids), std::move(token), std::nullopt};
}

auto document_added(TargetId target_id, MutableDocument document) -> WatchChange {
    auto k = document.key();
    return DocumentWatchChange{{target_id}, {}, std::move(k), std::move(document)};
}

auto document_left(TargetId target_id, std::string_view path) -> WatchChange {
    return DocumentWatchChange{{}, {target_id}, key(path), std::nullopt};
}

class SyncEngineTest : public ::testing::Test {
protected:
    template <typename Fn>
    auto on_queue(Fn&& fn) {
        return queue.enqueue_blocking(std::forward<Fn>(fn));
    }

    void SetUp() override { build(100); }

    void TearDown() override {
        queue.enqueue_blocking([&] { remote_store->shutdown(); });
        queue.shutdown();
    }

    void build(std::size_t max_concurrent_limbo_resolutions) {
        remote_store = std::make_unique<RemoteStore>(*harness.local_store, queue, datastore, credentials,
                                                     std::make_shared<EmptyAppCheckProvider>(),
                                                     DatabaseId{"project"});
        sync_engine = std::make_unique<SyncEngine>(*harness.local_store, *remote_store, User{"alice"},
                                                   max_concurrent_limbo_resolutions);
        remote_store->set_sync_engine(sync_engine.get());
        sync_engine->set_callback(&recorder);
        on_queue([&] { remote_store->start(); });
    }

    auto listen(std::string_view path) -> TargetId {
        auto q = query(path);
        return on_queue([&] { return sync_engine->listen(q); });
    }

    // Listen and play the backend accepting the watch connection.
    auto listen_and_open(std::string_view path) -> TargetId {
        auto target_id = listen(path);
        drain(queue);
        datastore->watch_observer()->on_stream_open();
        drain(queue);
        return target_id;
    }

    void watch(WatchChange change, SnapshotVersion snapshot_version = SnapshotVersion::none()) {
        datastore->watch_observer()->on_watch_change(std::move(change), snapshot_version);
        drain(queue);
    }

    // The backend sends `paths` for the target and marks it current.
    void sync(TargetId target_id, const std::vector<std::string>& paths, std::int64_t at) {
        watch(target_change(WatchTargetChangeState::added, {target_id}));
        for (const auto& path : paths) watch(document_added(target_id, doc(path, at, {{"n", 1}})));
        watch(target_change(WatchTargetChangeState::current, {target_id}, "resume"), version(at));
    }

    auto write(std::string_view path, std::optional<Error>* result = nullptr) -> BatchId {
        auto mutation = set_mutation(path, {{"n", 2}});
        return on_queue([&] {
            auto on_complete = WriteCallback{};
            if (result) on_complete = [result](std::optional<Error> error) { *result = std::move(error); };
            return sync_engine->write_mutations({mutation}, std::move(on_complete));
        });
    }

    void complete_handshake() {
        drain(queue);
        datastore->write_observer()->on_stream_open();
        drain(queue);
        datastore->write_observer()->on_write_response(WriteResponse{"token-1", {}, {}});
        drain(queue);
    }

    void acknowledge(std::int64_t at) {
        datastore->write_observer()->on_write_response(
            WriteResponse{"token-2", version(at), {MutationResult{version(at), std::nullopt}}});
        drain(queue);
    }

    auto last_snapshot() -> ViewSnapshot {
        return on_queue([&] { return recorder.snapshots.back(); });
    }

    LocalStoreHarness harness{User{"alice"}};
    util::AsyncQueue queue;
    std::shared_ptr<FakeDatastore> datastore = std::make_shared<FakeDatastore>();
    std::shared_ptr<FakeCredentialsProvider> credentials = std::make_shared<FakeCredentialsProvider>(User{"alice"});
    RecordingCallback recorder;
    std::unique_ptr<RemoteStore> remote_store;
    std::unique_ptr<SyncEngine> sync_engine;
};

// Only one limbo resolution may be in flight.
class SyncEngineLimboTest : public SyncEngineTest {
protected:
    void SetUp() override { build(1); }
};

}  // namespace

// -- Listens ------------------------------------------------------------------

TEST_F(SyncEngineTest, listen_raises_cached_snapshot_and_listens_remotely) {
    auto target_id = listen_and_open("rooms");

    ASSERT_EQ(recorder.snapshots.size(), 1u);
    EXPECT_TRUE(recorder.snapshots[0].from_cache);
    EXPECT_TRUE(recorder.snapshots[0].documents.empty());

    auto requests = datastore->watch_requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].target_id, target_id);
    EXPECT_EQ(target_id % 2, 0);
}

TEST_F(SyncEngineTest, duplicate_listen_is_fatal) {
    listen("rooms");
    EXPECT_THROW(listen("rooms"), InternalError);
}

TEST_F(SyncEngineTest, backend_documents_sync_the_view) {
    auto target_id = listen_and_open("rooms");
    sync(target_id, {"rooms/a", "rooms/b"}, 5);

    auto snapshot = last_snapshot();
    EXPECT_FALSE(snapshot.from_cache);
    EXPECT_EQ(keys_of(snapshot), (std::vector<DocumentKey>{key("rooms/a"), key("rooms/b")}));
    EXPECT_EQ(on_queue([&] { return harness.local_store->get_remote_document_keys(target_id); }),
              (DocumentKeySet{key("rooms/a"), key("rooms/b")}));
    EXPECT_EQ(on_queue([&] { return sync_engine->get_remote_keys_for_target(target_id); }),
              (DocumentKeySet{key("rooms/a"), key("rooms/b")}));
}

TEST_F(SyncEngineTest, relisten_starts_from_the_cache) {
    auto target_id = listen_and_open("rooms");
    sync(target_id, {"rooms/a"}, 5);
    on_queue([&] { sync_engine->stop_listening(query("rooms")); });
    EXPECT_EQ(datastore->unwatch_requests(), (std::vector<TargetId>{target_id}));

    auto before = recorder.snapshots.size();
    auto relistened = listen("rooms");
    EXPECT_EQ(relistened, target_id);
    ASSERT_EQ(recorder.snapshots.size(), before + 1);
    EXPECT_EQ(keys_of(recorder.snapshots.back()), (std::vector<DocumentKey>{key("rooms/a")}));
    EXPECT_TRUE(recorder.snapshots.back().has_cached_results);
}

TEST_F(SyncEngineTest, rejected_listen_reports_the_error) {
    auto target_id = listen_and_open("rooms");
    watch(WatchTargetChange{WatchTargetChangeState::removed, {target_id}, {},
                            Error{ErrorCode::permission_denied, "missing permissions"}});

    EXPECT_EQ(recorder.errors, (std::vector<std::pair<std::string, ErrorCode>>{
                                   {query("rooms").canonical_id(), ErrorCode::permission_denied}}));

    // The query can be listened to again
    EXPECT_NO_THROW(listen("rooms"));
}

TEST_F(SyncEngineTest, going_offline_marks_views_from_cache) {
    auto target_id = listen_and_open("rooms");
    sync(target_id, {"rooms/a"}, 5);
    ASSERT_FALSE(last_snapshot().from_cache);

    on_queue([&] { remote_store->disable_network(); });
    EXPECT_EQ(recorder.online_states.back(), OnlineState::offline);
    EXPECT_TRUE(last_snapshot().from_cache);
}

// -- Writes -------------------------------------------------------------------

TEST_F(SyncEngineTest, local_write_is_raised_before_the_ack) {
    listen("rooms");
    auto result = std::optional<Error>{Error{ErrorCode::unknown, "not called"}};
    auto batch_id = write("rooms/a", &result);
    EXPECT_EQ(batch_id, 1);

    auto snapshot = last_snapshot();
    EXPECT_EQ(keys_of(snapshot), (std::vector<DocumentKey>{key("rooms/a")}));
    EXPECT_TRUE(snapshot.has_pending_writes());

    complete_handshake();
    acknowledge(10);
    EXPECT_FALSE(result.has_value());
}

TEST_F(SyncEngineTest, rejected_write_reverts_the_view) {
    listen("rooms");
    auto result = std::optional<Error>{};
    write("rooms/a", &result);
    complete_handshake();

    datastore->write_observer()->on_stream_close(Error{ErrorCode::permission_denied, "read only"});
    drain(queue);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->code, ErrorCode::permission_denied);
    EXPECT_TRUE(last_snapshot().documents.empty());
}

TEST_F(SyncEngineTest, pending_writes_callback_waits_for_every_batch) {
    auto immediate = std::optional<std::optional<Error>>{};
    on_queue([&] { sync_engine->register_pending_writes_callback([&](std::optional<Error> e) { immediate = e; }); });
    ASSERT_TRUE(immediate.has_value());
    EXPECT_FALSE(immediate->has_value());

    write("rooms/a");
    write("rooms/b");
    auto done = false;
    on_queue([&] { sync_engine->register_pending_writes_callback([&](std::optional<Error>) { done = true; }); });

    complete_handshake();
    acknowledge(10);
    EXPECT_FALSE(done);
    acknowledge(11);
    EXPECT_TRUE(done);
}

TEST_F(SyncEngineTest, user_change_swaps_pending_writes) {
    listen("rooms");
    write("rooms/a");
    auto cancelled = std::optional<Error>{};
    on_queue([&] {
        sync_engine->register_pending_writes_callback([&](std::optional<Error> e) { cancelled = std::move(e); });
    });

    on_queue([&] { sync_engine->handle_credential_change(User{"bob"}); });
    EXPECT_TRUE(last_snapshot().documents.empty());
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(cancelled->code, ErrorCode::cancelled);

    on_queue([&] { sync_engine->handle_credential_change(User{"alice"}); });
    EXPECT_EQ(keys_of(last_snapshot()), (std::vector<DocumentKey>{key("rooms/a")}));
}

// -- Limbo resolution ---------------------------------------------------------

TEST_F(SyncEngineLimboTest, documents_missing_from_the_target_are_resolved) {
    auto target_id = listen_and_open("rooms");
    sync(target_id, {"rooms/a", "rooms/b", "rooms/c"}, 5);

    // The backend drops b and c without saying why
    watch(document_left(target_id, "rooms/b"));
    watch(document_left(target_id, "rooms/c"));
    watch(target_change(WatchTargetChangeState::no_change, {}), version(6));

    EXPECT_TRUE(last_snapshot().from_cache);
    auto active = on_queue([&] { return sync_engine->active_limbo_document_resolutions(); });
    ASSERT_EQ(active.size(), 1u);
    ASSERT_TRUE(active.contains(key("rooms/b")));
    auto limbo_target_id = active.at(key("rooms/b"));
    EXPECT_EQ(limbo_target_id % 2, 1);
    EXPECT_EQ(on_queue([&] { return sync_engine->enqueued_limbo_document_resolutions(); }),
              (std::deque<DocumentKey>{key("rooms/c")}));

    auto limbo_request = datastore->active_targets().at(limbo_target_id);
    EXPECT_EQ(limbo_request.purpose, QueryPurpose::limbo_resolution);
    EXPECT_TRUE(limbo_request.target.is_document_query());

    // The limbo target comes back current without the document: deleted
    watch(target_change(WatchTargetChangeState::added, {limbo_target_id}));
    watch(target_change(WatchTargetChangeState::current, {limbo_target_id}), version(7));

    EXPECT_EQ(keys_of(last_snapshot()), (std::vector<DocumentKey>{key("rooms/a"), key("rooms/c")}));
    EXPECT_EQ(datastore->unwatch_requests(), (std::vector<TargetId>{limbo_target_id}));

    // The freed slot goes to c
    active = on_queue([&] { return sync_engine->active_limbo_document_resolutions(); });
    ASSERT_EQ(active.size(), 1u);
    EXPECT_TRUE(active.contains(key("rooms/c")));
    EXPECT_TRUE(on_queue([&] { return sync_engine->enqueued_limbo_document_resolutions().empty(); }));
}

TEST_F(SyncEngineLimboTest, rejected_limbo_listen_deletes_the_document) {
    auto target_id = listen_and_open("rooms");
    sync(target_id, {"rooms/a", "rooms/b"}, 5);
    watch(document_left(target_id, "rooms/b"));
    watch(target_change(WatchTargetChangeState::no_change, {}), version(6));

    auto active = on_queue([&] { return sync_engine->active_limbo_document_resolutions(); });
    ASSERT_TRUE(active.contains(key("rooms/b")));

    watch(WatchTargetChange{WatchTargetChangeState::removed, {active.at(key("rooms/b"))}, {},
                            Error{ErrorCode::permission_denied, "missing permissions"}});

    EXPECT_TRUE(recorder.errors.empty());
    EXPECT_EQ(keys_of(last_snapshot()), (std::vector<DocumentKey>{key("rooms/a")}));
    EXPECT_TRUE(on_queue([&] { return sync_engine->active_limbo_document_resolutions().empty(); }));
}

#include "test_util.hpp"

#include <docsync-cpp/client.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace docsync_cpp;
using namespace docsync_cpp::test;
using namespace std::chrono_literals;

namespace {

// Collects snapshots delivered on the client's thread.
class SnapshotInbox {
public:
    auto listener() -> SnapshotListener {
        return [this](Result<ViewSnapshot> result) {
            auto lock = std::lock_guard{mutex_};
            if (result) {
                snapshots_.push_back(std::move(result).value());
            } else {
                errors_.push_back(result.error());
            }
            cv_.notify_all();
        };
    }

    // The n-th snapshot (1-based), waiting up to five seconds for it.
    auto wait_for(std::size_t n) -> std::optional<ViewSnapshot> {
        auto lock = std::unique_lock{mutex_};
        if (!cv_.wait_for(lock, 5s, [&] { return snapshots_.size() >= n; })) return std::nullopt;
        return snapshots_[n - 1];
    }

    auto count() -> std::size_t {
        auto lock = std::lock_guard{mutex_};
        return snapshots_.size();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<ViewSnapshot> snapshots_;
    std::vector<Error> errors_;
};

template <typename Pred>
auto wait_until(Pred pred) -> bool {
    for (int i = 0; i < 500; ++i) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

template <typename T>
auto error_code_of(std::future<T>& future) -> std::optional<ErrorCode> {
    try {
        future.get();
    } catch (const Exception& e) {
        return e.code();
    }
    return std::nullopt;
}

// A provider whose user never signs in.
class SilentCredentialsProvider final : public CredentialsProvider {
public:
    void get_token(TokenCallback) override {}
    void invalidate_token() override {}
    void set_change_listener(ChangeListener listener) override { listener_ = std::move(listener); }

private:
    ChangeListener listener_;
};

auto memory_settings() -> Settings {
    auto settings = Settings{};
    settings.project_id = "demo";
    settings.persistence_enabled = false;
    return settings;
}

class ClientTest : public ::testing::Test {
protected:
    // Play the backend accepting the write stream handshake.
    void complete_write_handshake() {
        ASSERT_TRUE(wait_until([&] { return datastore->write_observer() != nullptr && datastore->write_open(); }));
        datastore->write_observer()->on_stream_open();
        ASSERT_TRUE(wait_until([&] { return datastore->handshakes() == 1; }));
        datastore->write_observer()->on_write_response(WriteResponse{"token-1", {}, {}});
    }

    std::shared_ptr<FakeDatastore> datastore = std::make_shared<FakeDatastore>();
    std::shared_ptr<FakeCredentialsProvider> credentials = std::make_shared<FakeCredentialsProvider>(User{"alice"});
    Client client{memory_settings(), datastore, credentials};
};

}  // namespace

TEST(ClientConstruction, invalid_settings_are_rejected) {
    auto settings = memory_settings();
    settings.cache_size_bytes = 10;
    try {
        auto client = Client{settings, std::make_shared<FakeDatastore>()};
        ADD_FAILURE() << "accepted a tiny cache";
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::invalid_argument);
    }
}

TEST_F(ClientTest, written_document_is_readable_from_the_cache) {
    auto batch_id = client.write({set_mutation("rooms/a", {{"name", "lobby"}})}).get();
    EXPECT_EQ(batch_id, 1);

    auto doc = client.get_document(key("rooms/a"), Source::cache).get();
    EXPECT_TRUE(doc.is_found_document());
    EXPECT_TRUE(doc.has_local_mutations());
    EXPECT_EQ(doc.data(), (ObjectValue{{"name", "lobby"}}));

    auto docs = client.get_documents({key("rooms/a"), key("rooms/b")}).get();
    EXPECT_TRUE(docs.at(key("rooms/a")).is_found_document());
    EXPECT_FALSE(docs.at(key("rooms/b")).is_found_document());
}

TEST_F(ClientTest, cache_miss_is_unavailable) {
    auto future = client.get_document(key("rooms/missing"), Source::cache);
    EXPECT_EQ(error_code_of(future), ErrorCode::unavailable);
}

TEST_F(ClientTest, cached_query_sees_local_writes) {
    client.write({set_mutation("rooms/a", {{"n", 1}}), set_mutation("rooms/b", {{"n", 2}}),
                  set_mutation("halls/c", {{"n", 3}})})
        .get();

    auto snapshot = client.run_query(query("rooms"), Source::cache).get();
    EXPECT_EQ(snapshot.documents.size(), 2u);
    EXPECT_TRUE(snapshot.from_cache);
    EXPECT_TRUE(snapshot.has_pending_writes());
}

TEST_F(ClientTest, offline_reads_answer_from_the_cache) {
    client.write({set_mutation("rooms/a", {{"n", 1}})}).get();
    client.disable_network().get();

    auto doc = client.get_document(key("rooms/a")).get();
    EXPECT_TRUE(doc.is_found_document());

    auto missing = client.get_document(key("rooms/missing"));
    EXPECT_EQ(error_code_of(missing), ErrorCode::unavailable);

    auto from_server = client.run_query(query("rooms"), Source::server);
    EXPECT_EQ(error_code_of(from_server), ErrorCode::unavailable);

    auto snapshot = client.run_query(query("rooms")).get();
    EXPECT_EQ(snapshot.documents.size(), 1u);
}

TEST_F(ClientTest, online_read_waits_for_the_backend) {
    auto future = client.get_document(key("rooms/a"));
    ASSERT_TRUE(wait_until([&] { return datastore->watch_open(); }));
    datastore->watch_observer()->on_stream_open();
    ASSERT_TRUE(wait_until([&] { return !datastore->active_targets().empty(); }));
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);

    auto target_id = datastore->active_targets().begin()->first;
    auto* watch = datastore->watch_observer();
    watch->on_watch_change(WatchTargetChange{WatchTargetChangeState::added, {target_id}, {}, std::nullopt},
                           SnapshotVersion::none());
    watch->on_watch_change(DocumentWatchChange{{target_id}, {}, key("rooms/a"), doc("rooms/a", 5, {{"n", 7}})},
                           SnapshotVersion::none());
    watch->on_watch_change(WatchTargetChange{WatchTargetChangeState::current, {target_id}, "resume", std::nullopt},
                           version(5));

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto result = future.get();
    EXPECT_EQ(result.data(), (ObjectValue{{"n", 7}}));
    EXPECT_EQ(result.version(), version(5));

    // The one-shot listen is released afterwards
    EXPECT_TRUE(wait_until([&] { return datastore->unwatch_requests().size() == 1; }));
}

TEST_F(ClientTest, listener_receives_snapshots_until_removed) {
    client.write({set_mutation("rooms/a", {{"n", 1}})}).get();

    auto inbox = SnapshotInbox{};
    auto registration = client.listen(query("rooms"), ListenOptions{}, inbox.listener());
    auto first = inbox.wait_for(1);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->documents.size(), 1u);
    EXPECT_TRUE(first->has_pending_writes());

    client.write({set_mutation("rooms/b", {{"n", 2}})}).get();
    auto second = inbox.wait_for(2);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->documents.size(), 2u);

    registration.remove();
    registration.remove();
    client.write({set_mutation("rooms/c", {{"n", 3}})}).get();
    // A read after the write is ordered behind any snapshot it raised
    client.get_documents({key("rooms/c")}).get();
    EXPECT_EQ(inbox.count(), 2u);
}

TEST_F(ClientTest, acknowledged_write_completes_callbacks) {
    auto acknowledged = std::promise<std::optional<Error>>{};
    client.write({set_mutation("rooms/a", {{"n", 1}})},
                 [&](std::optional<Error> error) { acknowledged.set_value(std::move(error)); })
        .get();
    auto pending = client.wait_for_pending_writes();

    complete_write_handshake();
    ASSERT_TRUE(wait_until([&] { return datastore->writes().size() == 1; }));
    datastore->write_observer()->on_write_response(
        WriteResponse{"token-2", version(10), {MutationResult{version(10), std::nullopt}}});

    auto result = acknowledged.get_future();
    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(result.get().has_value());
    ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
    EXPECT_NO_THROW(pending.get());

    auto doc = client.get_document(key("rooms/a"), Source::cache).get();
    EXPECT_EQ(doc.version(), version(10));
    EXPECT_FALSE(doc.has_local_mutations());
}

TEST_F(ClientTest, rejected_write_is_reported) {
    auto rejected = std::promise<std::optional<Error>>{};
    client.write({set_mutation("rooms/a", {{"n", 1}})},
                 [&](std::optional<Error> error) { rejected.set_value(std::move(error)); })
        .get();

    complete_write_handshake();
    ASSERT_TRUE(wait_until([&] { return datastore->writes().size() == 1; }));
    datastore->write_observer()->on_stream_close(Error{ErrorCode::permission_denied, "read only"});

    auto result = rejected.get_future();
    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    auto error = result.get();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::permission_denied);

    auto missing = client.get_document(key("rooms/a"), Source::cache);
    EXPECT_EQ(error_code_of(missing), ErrorCode::unavailable);
}

TEST_F(ClientTest, user_change_cancels_pending_write_waits) {
    client.write({set_mutation("rooms/a", {{"n", 1}})}).get();
    auto pending = client.wait_for_pending_writes();
    // Registered before the user changes
    client.get_documents({}).get();

    credentials->change_user(User{"bob"});
    ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(error_code_of(pending), ErrorCode::cancelled);

    // Bob does not see Alice's pending write
    auto missing = client.get_document(key("rooms/a"), Source::cache);
    EXPECT_EQ(error_code_of(missing), ErrorCode::unavailable);
}

TEST_F(ClientTest, field_indexes_can_be_configured) {
    auto index = FieldIndex{};
    index.collection_group = "rooms";
    index.fields = {FieldPath{"color"}};
    EXPECT_NO_THROW(client.configure_field_indexes({index}).get());
    EXPECT_NO_THROW(client.configure_field_indexes({}).get());
}

TEST_F(ClientTest, terminated_client_rejects_calls) {
    EXPECT_EQ(client.settings().project_id, "demo");
    client.terminate();
    client.terminate();

    auto write = client.write({set_mutation("rooms/a", {{"n", 1}})});
    EXPECT_EQ(error_code_of(write), ErrorCode::failed_precondition);
    EXPECT_THROW(client.listen(query("rooms"), {}, [](Result<ViewSnapshot>) {}), Exception);
}

TEST(ClientPersistence, pending_writes_survive_a_restart) {
    auto dir = TempDir{};
    auto settings = Settings{};
    settings.project_id = "demo";
    settings.data_directory = dir.path();

    {
        auto client = Client{settings, std::make_shared<FakeDatastore>()};
        client.write({set_mutation("rooms/a", {{"n", 1}})}).get();
        client.terminate();
    }

    auto client = Client{settings, std::make_shared<FakeDatastore>()};
    auto doc = client.get_document(key("rooms/a"), Source::cache).get();
    EXPECT_TRUE(doc.is_found_document());
    EXPECT_TRUE(doc.has_local_mutations());
}

TEST(ClientLifetime, registration_outlives_the_client) {
    auto registration = ListenerRegistration{};
    auto inbox = SnapshotInbox{};
    {
        auto client = Client{memory_settings(), std::make_shared<FakeDatastore>()};
        client.write({set_mutation("rooms/a", {{"n", 1}})}).get();
        registration = client.listen(query("rooms"), ListenOptions{}, inbox.listener());
        ASSERT_TRUE(inbox.wait_for(1).has_value());
    }
    registration.remove();
    EXPECT_EQ(inbox.count(), 1u);
}

TEST(ClientLifetime, terminate_does_not_wait_for_a_user) {
    auto client = Client{memory_settings(), std::make_shared<FakeDatastore>(),
                         std::make_shared<SilentCredentialsProvider>()};
    auto write = client.write({set_mutation("rooms/a", {{"n", 1}})});
    auto registration = client.listen(query("rooms"), ListenOptions{}, [](Result<ViewSnapshot>) {});
    EXPECT_EQ(write.wait_for(50ms), std::future_status::timeout);

    client.terminate();
    ASSERT_EQ(write.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(error_code_of(write), ErrorCode::failed_precondition);
    registration.remove();
}

/// @file client.hpp
/// @brief The Client facade: one offline-first sync engine per instance.
///
/// Every operation is enqueued on the client's worker thread and reports
/// back through a std::future or a callback. Futures throw Exception on
/// failure.
///
/// @code
/// auto client = docsync_cpp::Client{settings, datastore};
/// auto key = docsync_cpp::DocumentKey::from_path_string("rooms/a");
/// client.write({docsync_cpp::Mutation::set(key, {{"name", "lobby"}})}).get();
/// auto doc = client.get_document(key, docsync_cpp::Source::cache).get();
/// @endcode

#pragma once

#include <docsync-cpp/credentials.hpp>
#include <docsync-cpp/datastore.hpp>
#include <docsync-cpp/document.hpp>
#include <docsync-cpp/error.hpp>
#include <docsync-cpp/index.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/settings.hpp>
#include <docsync-cpp/snapshot.hpp>

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace docsync_cpp {

namespace detail {
class ClientState;
}

/// Called with every snapshot of a listened query, or once with an error
/// after which the listener is removed.
using SnapshotListener = std::function<void(Result<ViewSnapshot>)>;

/// Called once a write is acknowledged (nullopt) or rejected.
using WriteCallback = std::function<void(std::optional<Error>)>;

/// Handle to an active listener. Moving transfers ownership; destruction
/// does not remove the listener. A registration may outlive its client;
/// removing it then only mutes the callback.
class ListenerRegistration {
public:
    ListenerRegistration() = default;
    explicit ListenerRegistration(std::function<void()> remover)
        : remover_{std::move(remover)} {}

    ListenerRegistration(ListenerRegistration&&) noexcept = default;
    auto operator=(ListenerRegistration&&) noexcept -> ListenerRegistration& = default;
    ListenerRegistration(const ListenerRegistration&) = delete;
    auto operator=(const ListenerRegistration&) -> ListenerRegistration& = delete;

    /// Stop delivering snapshots. Idempotent.
    void remove() {
        if (remover_) {
            auto remover = std::move(remover_);
            remover_ = nullptr;
            remover();
        }
    }

private:
    std::function<void()> remover_;
};

class Client {
public:
    /// Start the client. The components are built once the credentials
    /// provider reports its first user; calls made before then wait for it.
    /// Durable persistence that another process holds falls back to memory
    /// persistence with a warning.
    Client(Settings settings, std::shared_ptr<Datastore> datastore,
           std::shared_ptr<CredentialsProvider> credentials = std::make_shared<EmptyCredentialsProvider>(),
           std::shared_ptr<AppCheckProvider> app_check = std::make_shared<EmptyAppCheckProvider>());

    /// Terminates if terminate() was not called.
    ~Client();

    Client(const Client&) = delete;
    auto operator=(const Client&) -> Client& = delete;
    Client(Client&&) = delete;
    auto operator=(Client&&) -> Client& = delete;

    /// Read one document. With Source::cache a missing document fails with
    /// `unavailable`; otherwise the result may be a no-document.
    auto get_document(const DocumentKey& key, Source source = Source::default_source)
        -> std::future<Document>;

    /// Read several documents from the cache (local view).
    auto get_documents(const DocumentKeySet& keys) -> std::future<DocumentMap>;

    /// Run a query once.
    auto run_query(const Query& query, Source source = Source::default_source)
        -> std::future<ViewSnapshot>;

    /// Apply `mutations` atomically. The future resolves with the batch id
    /// once the write is applied locally; `on_complete` runs when the
    /// backend acknowledges or rejects it.
    auto write(std::vector<Mutation> mutations, WriteCallback on_complete = {})
        -> std::future<BatchId>;

    /// Listen to `query`. Snapshots are delivered on the client's thread.
    auto listen(const Query& query, ListenOptions options, SnapshotListener listener)
        -> ListenerRegistration;

    /// Resolves once every write issued so far is acknowledged or
    /// rejected. Fails with `cancelled` if the user changes first.
    auto wait_for_pending_writes() -> std::future<void>;

    auto enable_network() -> std::future<void>;
    auto disable_network() -> std::future<void>;

    /// Replace the configured field indexes and start backfilling them.
    auto configure_field_indexes(std::vector<FieldIndex> indexes) -> std::future<void>;

    /// Drain the queue, stop the streams and release persistence. Further
    /// calls, and calls still waiting for the first user, fail with
    /// `failed_precondition`.
    void terminate();

    auto settings() const -> const Settings&;

private:
    std::unique_ptr<detail::ClientState> state_;
};

}  // namespace docsync_cpp

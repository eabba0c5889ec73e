#include <docsync-cpp/client.hpp>

#include "core/event_manager.hpp"
#include "core/sync_engine.hpp"
#include "core/view.hpp"
#include "local/local_store.hpp"
#include "local/lru_garbage_collector.hpp"
#include "local/lru_reference_delegate.hpp"
#include "local/persistence.hpp"
#include "local/query_engine.hpp"
#include "remote/remote_store.hpp"
#include "util/async_queue.hpp"
#include "util/log.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace docsync_cpp {

namespace detail {

class ClientState {
public:
    static constexpr auto initial_gc_delay = std::chrono::minutes{1};
    static constexpr auto regular_gc_delay = std::chrono::minutes{5};
    static constexpr auto initial_backfill_delay = std::chrono::seconds{15};
    static constexpr auto regular_backfill_delay = std::chrono::minutes{1};

    ClientState(Settings settings, std::shared_ptr<Datastore> datastore,
                std::shared_ptr<CredentialsProvider> credentials, std::shared_ptr<AppCheckProvider> app_check)
        : queue_{},
          settings_{std::move(settings)},
          datastore_{std::move(datastore)},
          credentials_{std::move(credentials)},
          app_check_{std::move(app_check)} {
        settings_.validate();
        util::set_log_level(settings_.log_level);

        handle_->state = this;

        // The components are built for the first user; calls made before it
        // is known wait on the queue
        auto first_user = std::make_shared<std::atomic<bool>>(true);
        credentials_->set_change_listener([this, first_user](User user) {
            if (first_user->exchange(false)) {
                queue_.enqueue([this, user = std::move(user)] { initialize(user); });
                return;
            }
            queue_.enqueue([this, user = std::move(user)] { sync_engine_->handle_credential_change(user); });
        });
    }

    ~ClientState() { terminate(); }

    ClientState(const ClientState&) = delete;
    auto operator=(const ClientState&) -> ClientState& = delete;

    auto settings() const -> const Settings& { return settings_; }

    // Run `fn` on the queue and deliver its result. Exceptions reach the
    // future; internal errors stop the queue.
    template <typename T, typename Fn>
    auto run_async(Fn fn) -> std::future<T> {
        auto promise = std::make_shared<std::promise<T>>();
        auto future = promise->get_future();
        if (terminated_.load()) {
            promise->set_exception(terminated_error());
            return future;
        }
        enqueue_when_ready([promise, fn = std::move(fn)]() mutable {
            try {
                if constexpr (std::is_void_v<T>) {
                    fn();
                    promise->set_value();
                } else {
                    promise->set_value(fn());
                }
            } catch (const Exception&) {
                promise->set_exception(std::current_exception());
            }
        }, [promise] { promise->set_exception(terminated_error()); });
        return future;
    }

    // Like run_async, but `fn` settles the promise itself, possibly later.
    template <typename T, typename Fn>
    auto run_deferred(Fn fn) -> std::future<T> {
        auto promise = std::make_shared<std::promise<T>>();
        auto future = promise->get_future();
        if (terminated_.load()) {
            promise->set_exception(terminated_error());
            return future;
        }
        enqueue_when_ready([promise, fn = std::move(fn)]() mutable {
            try {
                fn(promise);
            } catch (const Exception&) {
                promise->set_exception(std::current_exception());
            }
        }, [promise] { promise->set_exception(terminated_error()); });
        return future;
    }

    auto get_document(const DocumentKey& key, Source source) -> std::future<Document> {
        if (source == Source::cache) {
            return run_async<Document>([this, key] {
                auto doc = local_store_->read_document(key);
                if (doc.is_found_document() || doc.is_no_document()) return doc;
                throw Exception{ErrorCode::unavailable,
                                "document " + key.to_string() + " is not in the cache; it may exist on the server"};
            });
        }

        return run_deferred<Document>([this, key, source](std::shared_ptr<std::promise<Document>> promise) {
            listen_once(Query::document(key), [key, source, promise](Result<ViewSnapshot> result) {
                if (!result) {
                    promise->set_exception(std::make_exception_ptr(Exception{result.error()}));
                    return;
                }
                const auto& snapshot = *result;
                const auto* doc = snapshot.documents.get(key);
                if (doc == nullptr && snapshot.from_cache) {
                    promise->set_exception(std::make_exception_ptr(
                        Exception{ErrorCode::unavailable, "failed to get document because the client is offline"}));
                } else if (doc != nullptr && snapshot.from_cache && source == Source::server) {
                    promise->set_exception(std::make_exception_ptr(Exception{
                        ErrorCode::unavailable,
                        "failed to get document from the server; a cached version exists locally"}));
                } else if (doc != nullptr) {
                    promise->set_value(*doc);
                } else {
                    promise->set_value(MutableDocument::no_document(key, SnapshotVersion::none()));
                }
            });
        });
    }

    auto get_documents(const DocumentKeySet& keys) -> std::future<DocumentMap> {
        return run_async<DocumentMap>([this, keys] { return local_store_->get_documents(keys); });
    }

    auto run_query(const Query& query, Source source) -> std::future<ViewSnapshot> {
        if (source == Source::cache) {
            return run_async<ViewSnapshot>([this, query] {
                auto query_result = local_store_->execute_query(query, /*use_previous_results=*/true);
                auto view = core::View{query, std::move(query_result.remote_keys)};
                auto view_doc_changes = view.compute_doc_changes(query_result.documents);
                auto view_change =
                    view.apply_changes(view_doc_changes, remote::TargetChange::create_synthesized(false));
                return std::move(*view_change.snapshot);
            });
        }

        return run_deferred<ViewSnapshot>([this, query, source](std::shared_ptr<std::promise<ViewSnapshot>> promise) {
            listen_once(query, [source, promise](Result<ViewSnapshot> result) {
                if (!result) {
                    promise->set_exception(std::make_exception_ptr(Exception{result.error()}));
                } else if (result->from_cache && source == Source::server) {
                    promise->set_exception(std::make_exception_ptr(
                        Exception{ErrorCode::unavailable, "failed to get documents from the server"}));
                } else {
                    promise->set_value(std::move(result).value());
                }
            });
        });
    }

    auto write(std::vector<Mutation> mutations, WriteCallback on_complete) -> std::future<BatchId> {
        return run_async<BatchId>([this, mutations = std::move(mutations), on_complete = std::move(on_complete)] {
            return sync_engine_->write_mutations(mutations, on_complete);
        });
    }

    auto listen(const Query& query, ListenOptions options, SnapshotListener listener) -> ListenerRegistration {
        if (terminated_.load()) throw Exception{terminated_error_value()};

        // Snapshots already queued are dropped once removed
        auto muted = std::make_shared<std::atomic<bool>>(false);
        auto query_listener = std::make_shared<core::QueryListener>(
            query, options, [muted, listener = std::move(listener)](Result<ViewSnapshot> result) {
                if (!muted->load()) listener(std::move(result));
            });

        enqueue_when_ready([this, query_listener] { event_manager_->add_query_listener(query_listener); });
        // The registration may outlive the client
        return ListenerRegistration{[handle = handle_, muted, query_listener] {
            muted->store(true);
            auto lock = std::lock_guard{handle->mutex};
            if (handle->state == nullptr) return;
            auto* state = handle->state;
            state->enqueue_when_ready(
                [state, query_listener] { state->event_manager_->remove_query_listener(query_listener); });
        }};
    }

    auto wait_for_pending_writes() -> std::future<void> {
        return run_deferred<void>([this](std::shared_ptr<std::promise<void>> promise) {
            sync_engine_->register_pending_writes_callback([promise](std::optional<Error> error) {
                if (error) {
                    promise->set_exception(std::make_exception_ptr(Exception{std::move(*error)}));
                } else {
                    promise->set_value();
                }
            });
        });
    }

    auto enable_network() -> std::future<void> {
        return run_async<void>([this] { remote_store_->enable_network(); });
    }

    auto disable_network() -> std::future<void> {
        return run_async<void>([this] { remote_store_->disable_network(); });
    }

    auto configure_field_indexes(std::vector<FieldIndex> indexes) -> std::future<void> {
        return run_async<void>([this, indexes = std::move(indexes)] {
            local_store_->configure_field_indexes(indexes);
            local_store_->backfill_indexes();
        });
    }

    void terminate() {
        if (terminated_.exchange(true)) return;
        util::logger()->debug("client: terminating");

        {
            auto lock = std::lock_guard{handle_->mutex};
            handle_->state = nullptr;
        }
        credentials_->set_change_listener(nullptr);
        queue_.start_shutdown();
        try {
            queue_.enqueue_blocking([this] { tear_down(); });
        } catch (const std::exception& e) {
            util::logger()->error("client: terminating after an earlier failure: {}", e.what());
        }
        queue_.shutdown();
    }

private:
    // Lets listener registrations reach the client while it runs.
    struct Handle {
        std::mutex mutex;
        ClientState* state{nullptr};
    };

    // An operation waiting for the first user, and how to fail it if the
    // client terminates first.
    struct WaitingOperation {
        util::AsyncQueue::Operation run;
        std::function<void()> cancel;
    };

    // Outlives every component holding a reference to it.
    util::AsyncQueue queue_;

    static auto terminated_error_value() -> Error {
        return Error{ErrorCode::failed_precondition, "the client has been terminated"};
    }
    static auto terminated_error() -> std::exception_ptr {
        return std::make_exception_ptr(Exception{terminated_error_value()});
    }

    // Run `op` on the queue once the components exist.
    void enqueue_when_ready(util::AsyncQueue::Operation op, std::function<void()> cancel = {}) {
        queue_.enqueue([this, op = std::move(op), cancel = std::move(cancel)]() mutable {
            if (initialized_) {
                op();
            } else {
                waiting_for_user_.push_back(WaitingOperation{std::move(op), std::move(cancel)});
            }
        });
    }

    void initialize(const User& user) {
        util::logger()->debug("client: initializing for user '{}'", user.uid());

        persistence_ = open_persistence();
        auto lru_params = settings_.cache_size_bytes == Settings::cache_size_unlimited
                              ? local::LruParams::disabled()
                              : local::LruParams::with_cache_size(settings_.cache_size_bytes);
        reference_delegate_ = std::make_unique<local::LruReferenceDelegate>(*persistence_, lru_params);
        persistence_->set_reference_delegate(reference_delegate_.get());

        query_engine_ = std::make_unique<local::QueryEngine>();
        query_engine_->set_index_auto_creation_enabled(settings_.automatic_index_creation);

        local_store_ = std::make_unique<local::LocalStore>(*persistence_, *query_engine_, user);
        local_store_->start();

        remote_store_ = std::make_unique<remote::RemoteStore>(*local_store_, queue_, datastore_, credentials_,
                                                              app_check_, settings_.database());
        sync_engine_ = std::make_unique<core::SyncEngine>(
            *local_store_, *remote_store_, user,
            static_cast<std::size_t>(settings_.max_concurrent_limbo_resolutions));
        remote_store_->set_sync_engine(sync_engine_.get());
        event_manager_ = std::make_unique<core::EventManager>(*sync_engine_);

        remote_store_->start();

        if (lru_params.min_bytes_threshold != local::LruParams::collection_disabled) {
            schedule_garbage_collection(initial_gc_delay);
        }
        schedule_index_backfill(initial_backfill_delay);

        initialized_ = true;
        auto waiting = std::exchange(waiting_for_user_, {});
        for (auto& operation : waiting) operation.run();
    }

    auto open_persistence() -> std::unique_ptr<local::Persistence> {
        if (!settings_.persistence_enabled) return local::Persistence::memory();
        try {
            return local::Persistence::durable(settings_.data_directory);
        } catch (const Exception& e) {
            if (e.code() != ErrorCode::failed_precondition) throw;
            util::logger()->warn("client: durable persistence unavailable ({}); falling back to memory persistence",
                                 e.what());
            return local::Persistence::memory();
        }
    }

    void schedule_garbage_collection(std::chrono::milliseconds delay) {
        gc_task_ = queue_.enqueue_after_delay(delay, util::TimerId::garbage_collection, [this] {
            gc_task_ = {};
            auto results = local_store_->collect_garbage(reference_delegate_->garbage_collector());
            if (results.did_run) {
                util::logger()->debug("client: garbage collection removed {} targets and {} documents",
                                      results.targets_removed, results.documents_removed);
            }
            schedule_garbage_collection(regular_gc_delay);
        });
    }

    void schedule_index_backfill(std::chrono::milliseconds delay) {
        backfill_task_ = queue_.enqueue_after_delay(delay, util::TimerId::index_backfill, [this] {
            backfill_task_ = {};
            auto indexed = local_store_->backfill_indexes();
            if (indexed > 0) util::logger()->debug("client: backfilled {} documents into indexes", indexed);
            schedule_index_backfill(regular_backfill_delay);
        });
    }

    // Listen until the first raised snapshot, then stop.
    void listen_once(const Query& query, std::function<void(Result<ViewSnapshot>)> on_first) {
        auto done = std::make_shared<bool>(false);
        auto self = std::make_shared<std::shared_ptr<core::QueryListener>>();
        auto options = ListenOptions{.include_document_metadata_changes = true,
                                     .include_query_metadata_changes = true,
                                     .wait_for_sync_when_online = true};
        auto listener = std::make_shared<core::QueryListener>(
            query, options, [this, done, self, on_first = std::move(on_first)](Result<ViewSnapshot> result) {
                if (*done) return;
                *done = true;
                // The event manager is still iterating its listeners
                queue_.enqueue([this, self] {
                    if (*self) event_manager_->remove_query_listener(*self);
                    self->reset();
                });
                on_first(std::move(result));
            });
        *self = listener;
        event_manager_->add_query_listener(listener);
    }

    void tear_down() {
        if (!waiting_for_user_.empty()) {
            util::logger()->debug("client: failing {} calls made before a user was known", waiting_for_user_.size());
        }
        for (auto& operation : std::exchange(waiting_for_user_, {})) {
            if (operation.cancel) operation.cancel();
        }
        gc_task_.cancel();
        backfill_task_.cancel();
        if (remote_store_) remote_store_->shutdown();
        if (persistence_) persistence_->shutdown();
    }

    Settings settings_;
    std::shared_ptr<Datastore> datastore_;
    std::shared_ptr<CredentialsProvider> credentials_;
    std::shared_ptr<AppCheckProvider> app_check_;
    std::atomic<bool> terminated_{false};
    std::shared_ptr<Handle> handle_{std::make_shared<Handle>()};

    // Queue-confined
    bool initialized_{false};
    std::vector<WaitingOperation> waiting_for_user_;

    std::unique_ptr<local::Persistence> persistence_;
    std::unique_ptr<local::LruReferenceDelegate> reference_delegate_;
    std::unique_ptr<local::QueryEngine> query_engine_;
    std::unique_ptr<local::LocalStore> local_store_;
    std::unique_ptr<remote::RemoteStore> remote_store_;
    std::unique_ptr<core::SyncEngine> sync_engine_;
    std::unique_ptr<core::EventManager> event_manager_;
    util::DelayedOperation gc_task_;
    util::DelayedOperation backfill_task_;
};

}  // namespace detail

// -- Client -------------------------------------------------------------------

Client::Client(Settings settings, std::shared_ptr<Datastore> datastore,
               std::shared_ptr<CredentialsProvider> credentials, std::shared_ptr<AppCheckProvider> app_check)
    : state_{std::make_unique<detail::ClientState>(std::move(settings), std::move(datastore), std::move(credentials),
                                                   std::move(app_check))} {}

Client::~Client() {
    state_->terminate();
}

auto Client::get_document(const DocumentKey& key, Source source) -> std::future<Document> {
    return state_->get_document(key, source);
}

auto Client::get_documents(const DocumentKeySet& keys) -> std::future<DocumentMap> {
    return state_->get_documents(keys);
}

auto Client::run_query(const Query& query, Source source) -> std::future<ViewSnapshot> {
    return state_->run_query(query, source);
}

auto Client::write(std::vector<Mutation> mutations, WriteCallback on_complete) -> std::future<BatchId> {
    return state_->write(std::move(mutations), std::move(on_complete));
}

auto Client::listen(const Query& query, ListenOptions options, SnapshotListener listener) -> ListenerRegistration {
    return state_->listen(query, options, std::move(listener));
}

auto Client::wait_for_pending_writes() -> std::future<void> {
    return state_->wait_for_pending_writes();
}

auto Client::enable_network() -> std::future<void> {
    return state_->enable_network();
}

auto Client::disable_network() -> std::future<void> {
    return state_->disable_network();
}

auto Client::configure_field_indexes(std::vector<FieldIndex> indexes) -> std::future<void> {
    return state_->configure_field_indexes(std::move(indexes));
}

void Client::terminate() {
    state_->terminate();
}

auto Client::settings() const -> const Settings& {
    return state_->settings();
}

}  // namespace docsync_cpp

#pragma once

// The remote store: owns the watch and write streams, tracks the targets
// the client listens to and the write pipeline, and turns stream traffic
// into calls on the sync engine.
//
// Internal header — not installed.

#include "online_state_tracker.hpp"
#include "remote_event.hpp"
#include "watch_change_aggregator.hpp"
#include "watch_stream.hpp"
#include "write_stream.hpp"
#include "../local/local_store.hpp"
#include "../util/async_queue.hpp"

#include <docsync-cpp/credentials.hpp>
#include <docsync-cpp/datastore.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/snapshot.hpp>

#include <cstddef>
#include <deque>
#include <map>
#include <memory>

namespace docsync_cpp::remote {

// What the remote store reports to the sync engine.
class RemoteStoreCallback {
public:
    virtual ~RemoteStoreCallback() = default;

    virtual void apply_remote_event(const RemoteEvent& remote_event) = 0;
    virtual void handle_rejected_listen(TargetId target_id, const Error& error) = 0;
    virtual void handle_successful_write(const MutationBatchResult& batch_result) = 0;
    virtual void handle_rejected_write(BatchId batch_id, const Error& error) = 0;
    virtual void handle_online_state_change(OnlineState online_state) = 0;

    // The keys the client holds for the target, including limbo targets.
    virtual auto get_remote_keys_for_target(TargetId target_id) const -> DocumentKeySet = 0;
};

class RemoteStore final : public TargetMetadataProvider, public WatchStreamCallback, public WriteStreamCallback {
public:
    static constexpr std::size_t max_pending_writes = 10;

    RemoteStore(local::LocalStore& local_store, util::AsyncQueue& queue, std::shared_ptr<Datastore> datastore,
                std::shared_ptr<CredentialsProvider> credentials, std::shared_ptr<AppCheckProvider> app_check,
                DatabaseId database_id);

    void set_sync_engine(RemoteStoreCallback* sync_engine) { sync_engine_ = sync_engine; }

    void start();
    void enable_network();
    void disable_network();

    // Stop the streams and report an unknown online state.
    void shutdown();

    // Restart the streams with fresh tokens and the new user's writes.
    void handle_credential_change();

    auto is_network_enabled() const -> bool { return is_network_enabled_; }
    auto online_state() const -> OnlineState { return online_state_tracker_.state(); }

    void listen(const TargetData& target_data);
    void stop_listening(TargetId target_id);

    // Send pending writes until the pipeline is full.
    void fill_write_pipeline();

    auto outstanding_writes() const -> std::size_t { return write_pipeline_.size(); }

    // -- TargetMetadataProvider -------------------------------------------------

    auto get_remote_keys_for_target(TargetId target_id) const -> DocumentKeySet override;
    auto get_target_data_for_target(TargetId target_id) const -> std::optional<TargetData> override;
    auto database_id() const -> const DatabaseId& override { return database_id_; }

    // -- Stream callbacks -------------------------------------------------------

    void on_watch_stream_open() override;
    void on_watch_stream_change(const WatchChange& change, SnapshotVersion snapshot_version) override;
    void on_watch_stream_close(const Error& status) override;

    void on_write_stream_open() override;
    void on_write_stream_handshake_complete() override;
    void on_write_stream_mutation_result(SnapshotVersion commit_version,
                                         std::vector<MutationResult> results) override;
    void on_write_stream_close(const Error& status) override;

private:
    auto callback() const -> RemoteStoreCallback&;
    auto can_use_network() const -> bool { return is_network_enabled_; }

    void disable_network_internal();
    void restart_network();

    auto should_start_watch_stream() const -> bool;
    void start_watch_stream();
    void clean_up_watch_stream_state();
    void send_watch_request(const TargetData& target_data);
    void send_unwatch_request(TargetId target_id);
    void raise_watch_snapshot(SnapshotVersion snapshot_version);
    void process_target_error(const WatchTargetChange& change);

    auto can_add_to_write_pipeline() const -> bool;
    void add_to_write_pipeline(const MutationBatch& batch);
    auto should_start_write_stream() const -> bool;
    void start_write_stream();
    void handle_handshake_error(const Error& status);
    void handle_write_error(const Error& status);

    local::LocalStore& local_store_;
    util::AsyncQueue& queue_;
    DatabaseId database_id_;
    RemoteStoreCallback* sync_engine_{nullptr};

    std::shared_ptr<WatchStream> watch_stream_;
    std::shared_ptr<WriteStream> write_stream_;
    std::unique_ptr<WatchChangeAggregator> watch_change_aggregator_;
    OnlineStateTracker online_state_tracker_;

    // Targets the client wants, by id, with their latest resume tokens.
    std::map<TargetId, TargetData> listen_targets_;

    // Batches sent (or to be sent once the handshake completes), oldest first.
    std::deque<MutationBatch> write_pipeline_;

    bool is_network_enabled_{false};
};

}  // namespace docsync_cpp::remote

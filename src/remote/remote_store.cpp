#include "remote_store.hpp"

#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

namespace docsync_cpp::remote {

RemoteStore::RemoteStore(local::LocalStore& local_store, util::AsyncQueue& queue,
                         std::shared_ptr<Datastore> datastore, std::shared_ptr<CredentialsProvider> credentials,
                         std::shared_ptr<AppCheckProvider> app_check, DatabaseId database_id)
    : local_store_{local_store},
      queue_{queue},
      database_id_{std::move(database_id)},
      watch_stream_{std::make_shared<WatchStream>(queue, datastore, credentials, app_check, *this)},
      write_stream_{std::make_shared<WriteStream>(queue, datastore, credentials, app_check, *this)},
      online_state_tracker_{queue, [this](OnlineState state) { callback().handle_online_state_change(state); }} {}

auto RemoteStore::callback() const -> RemoteStoreCallback& {
    util::hard_assert(sync_engine_ != nullptr, "remote store used without a sync engine");
    return *sync_engine_;
}

// -- Network control ----------------------------------------------------------

void RemoteStore::start() {
    enable_network();
}

void RemoteStore::enable_network() {
    is_network_enabled_ = true;
    if (!can_use_network()) return;

    write_stream_->set_last_stream_token(local_store_.last_stream_token());

    if (should_start_watch_stream()) {
        start_watch_stream();
    } else {
        online_state_tracker_.update_state(OnlineState::unknown);
    }

    // Starts the write stream if there are writes
    fill_write_pipeline();
}

void RemoteStore::disable_network() {
    is_network_enabled_ = false;
    disable_network_internal();
    // Reads now answer from the cache
    online_state_tracker_.update_state(OnlineState::offline);
}

void RemoteStore::disable_network_internal() {
    watch_stream_->stop();
    write_stream_->stop();

    if (!write_pipeline_.empty()) {
        util::logger()->debug("remote store: stopping write stream with {} pending writes", write_pipeline_.size());
        write_pipeline_.clear();
    }
    clean_up_watch_stream_state();
}

void RemoteStore::shutdown() {
    util::logger()->debug("remote store: shutting down");
    is_network_enabled_ = false;
    disable_network_internal();
    // Unknown rather than offline so listeners do not raise cached results
    online_state_tracker_.update_state(OnlineState::unknown);
}

void RemoteStore::handle_credential_change() {
    if (!can_use_network()) return;
    util::logger()->debug("remote store: restarting streams for new credentials");
    restart_network();
}

void RemoteStore::restart_network() {
    is_network_enabled_ = false;
    disable_network_internal();
    online_state_tracker_.update_state(OnlineState::unknown);
    enable_network();
}

// -- Watch --------------------------------------------------------------------

void RemoteStore::listen(const TargetData& target_data) {
    auto target_id = target_data.target_id;
    util::hard_assert(!listen_targets_.contains(target_id), "listen called with duplicate target id {}",
                      target_id);
    listen_targets_.emplace(target_id, target_data);

    if (should_start_watch_stream()) {
        // The request goes out once the stream opens
        start_watch_stream();
    } else if (watch_stream_->is_open()) {
        send_watch_request(target_data);
    }
}

void RemoteStore::stop_listening(TargetId target_id) {
    auto target = listen_targets_.find(target_id);
    util::hard_assert(target != listen_targets_.end(), "stop_listening on unwatched target {}", target_id);
    listen_targets_.erase(target);

    if (watch_stream_->is_open()) send_unwatch_request(target_id);

    if (listen_targets_.empty()) {
        if (watch_stream_->is_open()) {
            watch_stream_->mark_idle();
        } else if (can_use_network()) {
            // Nothing left to prove the connection healthy with
            online_state_tracker_.update_state(OnlineState::unknown);
        }
    }
}

void RemoteStore::send_watch_request(const TargetData& target_data) {
    // Changes for the target are ignored until the backend acknowledges
    watch_change_aggregator_->record_pending_target_request(target_data.target_id);

    if (!target_data.resume_token.empty() || target_data.snapshot_version > SnapshotVersion::none()) {
        auto expected_count = callback().get_remote_keys_for_target(target_data.target_id).size();
        watch_stream_->watch_query(target_data.with_expected_count(static_cast<std::int32_t>(expected_count)));
    } else {
        watch_stream_->watch_query(target_data);
    }
}

void RemoteStore::send_unwatch_request(TargetId target_id) {
    watch_change_aggregator_->record_pending_target_request(target_id);
    watch_stream_->unwatch_target_id(target_id);
}

auto RemoteStore::should_start_watch_stream() const -> bool {
    return can_use_network() && !watch_stream_->is_started() && !listen_targets_.empty();
}

void RemoteStore::start_watch_stream() {
    util::hard_assert(should_start_watch_stream(), "start_watch_stream when the stream is not needed");
    watch_change_aggregator_ = std::make_unique<WatchChangeAggregator>(*this);
    watch_stream_->start();
    online_state_tracker_.handle_watch_stream_start();
}

void RemoteStore::clean_up_watch_stream_state() {
    watch_change_aggregator_.reset();
}

void RemoteStore::on_watch_stream_open() {
    // Restore every listen
    for (const auto& [target_id, target_data] : listen_targets_) send_watch_request(target_data);
}

void RemoteStore::on_watch_stream_change(const WatchChange& change, SnapshotVersion snapshot_version) {
    // Any message means the backend is reachable
    online_state_tracker_.update_state(OnlineState::online);

    if (const auto* target_change = std::get_if<WatchTargetChange>(&change)) {
        if (target_change->state == WatchTargetChangeState::removed && target_change->cause) {
            // Errors are raised right away, not at the next snapshot
            process_target_error(*target_change);
            return;
        }
        watch_change_aggregator_->handle_target_change(*target_change);
    } else if (const auto* document_change = std::get_if<DocumentWatchChange>(&change)) {
        watch_change_aggregator_->handle_document_change(*document_change);
    } else {
        watch_change_aggregator_->handle_existence_filter(std::get<ExistenceFilterWatchChange>(change));
    }

    if (!snapshot_version.is_none() && snapshot_version >= local_store_.get_last_remote_snapshot_version()) {
        raise_watch_snapshot(snapshot_version);
    }
}

void RemoteStore::on_watch_stream_close(const Error& status) {
    if (status.code == ErrorCode::ok) {
        util::hard_assert(!should_start_watch_stream(), "watch stream stopped cleanly while still needed");
    }

    clean_up_watch_stream_state();

    if (should_start_watch_stream()) {
        online_state_tracker_.handle_watch_stream_failure(status);
        start_watch_stream();
    } else {
        // No targets, so no connection attempt to judge the state by
        online_state_tracker_.update_state(OnlineState::unknown);
    }
}

void RemoteStore::raise_watch_snapshot(SnapshotVersion snapshot_version) {
    util::hard_assert(!snapshot_version.is_none(), "raising a snapshot at version none");
    auto remote_event = watch_change_aggregator_->create_remote_event(snapshot_version);

    // The local store persists these when it applies the event
    for (const auto& [target_id, change] : remote_event.target_changes) {
        if (change.resume_token.empty()) continue;
        auto target = listen_targets_.find(target_id);
        if (target == listen_targets_.end()) continue;
        target->second = target->second.with_resume_token(change.resume_token, snapshot_version);
    }

    // Re-listen to mismatched targets from scratch
    for (const auto& [target_id, purpose] : remote_event.target_mismatches) {
        auto target = listen_targets_.find(target_id);
        if (target == listen_targets_.end()) continue;

        target->second = target->second.with_resume_token(ByteString{}, target->second.snapshot_version);
        send_unwatch_request(target_id);

        // Only this request carries the mismatch purpose; later re-listens
        // of the target are ordinary
        auto request = TargetData{};
        request.target = target->second.target;
        request.target_id = target_id;
        request.sequence_number = target->second.sequence_number;
        request.purpose = purpose;
        send_watch_request(request);
    }

    callback().apply_remote_event(remote_event);
}

void RemoteStore::process_target_error(const WatchTargetChange& change) {
    util::hard_assert(change.cause.has_value(), "target error without a cause");
    for (auto target_id : change.target_ids) {
        auto target = listen_targets_.find(target_id);
        // Already removed
        if (target == listen_targets_.end()) continue;

        listen_targets_.erase(target);
        watch_change_aggregator_->remove_target(target_id);
        callback().handle_rejected_listen(target_id, *change.cause);
    }
}

auto RemoteStore::get_remote_keys_for_target(TargetId target_id) const -> DocumentKeySet {
    return callback().get_remote_keys_for_target(target_id);
}

auto RemoteStore::get_target_data_for_target(TargetId target_id) const -> std::optional<TargetData> {
    auto target = listen_targets_.find(target_id);
    if (target == listen_targets_.end()) return std::nullopt;
    return target->second;
}

// -- Write --------------------------------------------------------------------

auto RemoteStore::can_add_to_write_pipeline() const -> bool {
    return can_use_network() && write_pipeline_.size() < max_pending_writes;
}

void RemoteStore::fill_write_pipeline() {
    auto last_batch_id = write_pipeline_.empty() ? unknown_batch_id : write_pipeline_.back().batch_id();
    while (can_add_to_write_pipeline()) {
        auto batch = local_store_.next_mutation_batch(last_batch_id);
        if (!batch) {
            if (write_pipeline_.empty()) write_stream_->mark_idle();
            break;
        }
        last_batch_id = batch->batch_id();
        add_to_write_pipeline(*batch);
    }

    if (should_start_write_stream()) start_write_stream();
}

void RemoteStore::add_to_write_pipeline(const MutationBatch& batch) {
    write_pipeline_.push_back(batch);
    // Otherwise the batch is flushed when the handshake completes
    if (write_stream_->is_open() && write_stream_->handshake_complete()) {
        write_stream_->write_mutations(batch.mutations());
    }
}

auto RemoteStore::should_start_write_stream() const -> bool {
    return can_use_network() && !write_stream_->is_started() && !write_pipeline_.empty();
}

void RemoteStore::start_write_stream() {
    util::hard_assert(should_start_write_stream(), "start_write_stream when the stream is not needed");
    write_stream_->start();
}

void RemoteStore::on_write_stream_open() {
    write_stream_->write_handshake();
}

void RemoteStore::on_write_stream_handshake_complete() {
    local_store_.set_last_stream_token(write_stream_->last_stream_token());
    for (const auto& batch : write_pipeline_) write_stream_->write_mutations(batch.mutations());
}

void RemoteStore::on_write_stream_mutation_result(SnapshotVersion commit_version,
                                                  std::vector<MutationResult> results) {
    util::hard_assert(!write_pipeline_.empty(), "write result for an empty pipeline");
    auto batch = std::move(write_pipeline_.front());
    write_pipeline_.pop_front();

    auto batch_result = MutationBatchResult{std::move(batch), commit_version, std::move(results),
                                            write_stream_->last_stream_token()};
    callback().handle_successful_write(batch_result);

    // A slot freed up
    fill_write_pipeline();
}

void RemoteStore::on_write_stream_close(const Error& status) {
    if (status.code == ErrorCode::ok) {
        util::hard_assert(!should_start_write_stream(), "write stream stopped cleanly while still needed");
    }

    if (status.code != ErrorCode::ok && !write_pipeline_.empty()) {
        if (write_stream_->handshake_complete()) {
            handle_write_error(status);
        } else {
            // The backend may be unable to use the stream token
            handle_handshake_error(status);
        }
    }

    if (should_start_write_stream()) start_write_stream();
}

void RemoteStore::handle_handshake_error(const Error& status) {
    if (!is_permanent_error(status.code)) return;
    util::logger()->debug("remote store: handshake failed permanently ({}), resetting stream token",
                          to_string_view(status.code));
    write_stream_->set_last_stream_token({});
    local_store_.set_last_stream_token({});
}

void RemoteStore::handle_write_error(const Error& status) {
    // Transient errors are retried with the same pipeline
    if (!is_permanent_write_error(status.code)) return;

    auto batch = std::move(write_pipeline_.front());
    write_pipeline_.pop_front();

    // The request was bad, not the backend; reconnect right away
    write_stream_->inhibit_backoff();
    callback().handle_rejected_write(batch.batch_id(), status);

    fill_write_pipeline();
}

}  // namespace docsync_cpp::remote

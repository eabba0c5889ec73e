/// @file datastore.hpp
/// @brief The transport the client consumes: typed watch changes, write
/// responses, and the stream connections that carry them.
///
/// A transport implements Datastore and maps its wire encoding onto these
/// types. Observer callbacks may be invoked on any thread; the client
/// re-dispatches them onto its own queue.

#pragma once

#include <docsync-cpp/credentials.hpp>
#include <docsync-cpp/document.hpp>
#include <docsync-cpp/error.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace docsync_cpp {

// -- Watch changes ------------------------------------------------------------

/// A document was added, changed or removed for some targets.
struct DocumentWatchChange {
    std::vector<TargetId> updated_target_ids;
    std::vector<TargetId> removed_target_ids;
    DocumentKey key;
    /// The new state: found or no-document. Nullopt when the document only
    /// left the targets in `removed_target_ids`.
    std::optional<MutableDocument> new_document;
};

enum class WatchTargetChangeState : std::uint8_t {
    no_change,
    added,
    removed,
    current,
    reset,
};

auto to_string_view(WatchTargetChangeState state) noexcept -> std::string_view;

/// A state change for a set of targets. An empty `target_ids` addresses
/// every target.
struct WatchTargetChange {
    WatchTargetChangeState state{WatchTargetChangeState::no_change};
    std::vector<TargetId> target_ids;
    ByteString resume_token;
    std::optional<Error> cause;  ///< Set when the backend removed the target with an error.
};

/// The parameters of a Bloom filter of document resource names.
struct BloomFilterParams {
    ByteString bitmap;
    std::int32_t padding{0};
    std::int32_t hash_count{0};
};

/// The number of documents the backend holds for a target, optionally with
/// a Bloom filter of their names.
struct ExistenceFilter {
    std::int32_t count{0};
    std::optional<BloomFilterParams> unchanged_names;
};

struct ExistenceFilterWatchChange {
    ExistenceFilter filter;
    TargetId target_id{0};
};

using WatchChange = std::variant<
    DocumentWatchChange,
    WatchTargetChange,
    ExistenceFilterWatchChange
>;

// -- Write responses ----------------------------------------------------------

/// The handshake response (empty results) or the result of one batch.
struct WriteResponse {
    ByteString stream_token;
    SnapshotVersion commit_version;
    std::vector<MutationResult> mutation_results;
};

// -- Stream connections -------------------------------------------------------

/// Receives messages from an open watch connection.
class WatchStreamObserver {
public:
    virtual ~WatchStreamObserver() = default;

    virtual void on_stream_open() = 0;

    /// `snapshot_version` is set on global target changes (no target ids,
    /// no cause) and is none otherwise.
    virtual void on_watch_change(WatchChange change, SnapshotVersion snapshot_version) = 0;

    /// The connection closed. `ok` for a clean close.
    virtual void on_stream_close(Error status) = 0;
};

/// Receives messages from an open write connection.
class WriteStreamObserver {
public:
    virtual ~WriteStreamObserver() = default;

    virtual void on_stream_open() = 0;
    virtual void on_write_response(WriteResponse response) = 0;
    virtual void on_stream_close(Error status) = 0;
};

/// An open listen connection.
class WatchStreamConnection {
public:
    virtual ~WatchStreamConnection() = default;

    /// Listen to `target_data.target`, resuming from its resume token or
    /// snapshot version and sending its expected count when resuming.
    virtual void watch(const TargetData& target_data) = 0;

    virtual void unwatch(TargetId target_id) = 0;

    /// Close without a final on_stream_close.
    virtual void close() = 0;
};

/// An open write connection.
class WriteStreamConnection {
public:
    virtual ~WriteStreamConnection() = default;

    /// The first message of every connection.
    virtual void write_handshake() = 0;

    virtual void write(const ByteString& stream_token, const std::vector<Mutation>& mutations) = 0;

    virtual void close() = 0;
};

/// Opens stream connections to the backend.
///
/// Every connection gets its own observer. The transport keeps it alive for
/// as long as it may still deliver messages, including after `close()`;
/// messages from a closed connection are dropped by the client.
class Datastore {
public:
    virtual ~Datastore() = default;

    virtual auto open_watch_stream(const StreamTokens& tokens, std::shared_ptr<WatchStreamObserver> observer)
        -> std::unique_ptr<WatchStreamConnection> = 0;

    virtual auto open_write_stream(const StreamTokens& tokens, std::shared_ptr<WriteStreamObserver> observer)
        -> std::unique_ptr<WriteStreamConnection> = 0;
};

}  // namespace docsync_cpp

#pragma once

// Transactional persistence over an ordered key-value store.
//
// Every state change runs inside `Persistence::run`, which buffers writes
// in a Transaction and commits them atomically when the callback returns.
// Reads inside a transaction see its own buffered writes. Caches reach the
// active transaction through `current_transaction()`.
//
// Internal header — not installed.

#include "kv_store.hpp"
#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

#include <docsync-cpp/query.hpp>
#include <docsync-cpp/types.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace docsync_cpp::local {

class IndexManager;
class ReferenceSet;
class RemoteDocumentCache;
class TargetCache;

class Transaction {
public:
    // Return false to stop a scan.
    using ScanFn = std::function<bool(std::string_view key, std::string_view value)>;

    explicit Transaction(const KvStore& store) : store_{store} {}

    auto get(std::string_view key) const -> std::optional<std::string>;
    auto contains(std::string_view key) const -> bool { return get(key).has_value(); }

    void put(std::string key, std::string value);
    void erase(std::string key);

    // Visit the entries whose key starts with `prefix` in key order,
    // beginning at `start` when it sorts after the prefix. Keys written
    // during the scan may or may not be visited.
    void scan(std::string_view prefix, const ScanFn& fn, std::string_view start = {}) const;

    auto writes() const -> const WriteBatch& { return writes_; }

private:
    const KvStore& store_;
    WriteBatch writes_;
};

// Receives reference changes so garbage collection knows which documents
// are still needed.
class ReferenceDelegate {
public:
    virtual ~ReferenceDelegate() = default;

    // Load persisted state. Runs in a transaction.
    virtual void start() = 0;

    // Documents referenced by local views; never collected.
    virtual void add_in_memory_pins(const ReferenceSet* pins) = 0;

    // A document was added to a target.
    virtual void add_reference(const DocumentKey& key) = 0;

    // A document was removed from a target.
    virtual void remove_reference(const DocumentKey& key) = 0;

    // A mutation batch touching the document was removed.
    virtual void remove_mutation_reference(const DocumentKey& key) = 0;

    // The target is no longer listened to.
    virtual void remove_target(const TargetData& target_data) = 0;

    // A limbo document was resolved.
    virtual void update_limbo_document(const DocumentKey& key) = 0;

    // The sequence number of the active transaction.
    virtual auto current_sequence_number() -> ListenSequenceNumber = 0;

    virtual void on_transaction_started(std::string_view label) = 0;
    // Called after commit and after rollback.
    virtual void on_transaction_finished() = 0;
};

class Persistence {
public:
    explicit Persistence(std::unique_ptr<KvStore> store);
    ~Persistence();

    Persistence(const Persistence&) = delete;
    auto operator=(const Persistence&) -> Persistence& = delete;

    static auto memory() -> std::unique_ptr<Persistence>;

    // Throws Exception (failed_precondition) if another client holds the
    // directory.
    static auto durable(const std::filesystem::path& directory) -> std::unique_ptr<Persistence>;

    // Release the store. Later transactions are fatal.
    void shutdown();
    auto is_started() const -> bool { return started_; }

    auto store() const -> const KvStore& { return *store_; }

    auto remote_document_cache() -> RemoteDocumentCache& { return *remote_document_cache_; }
    auto target_cache() -> TargetCache& { return *target_cache_; }
    auto index_manager() -> IndexManager& { return *index_manager_; }

    void set_reference_delegate(ReferenceDelegate* delegate) { reference_delegate_ = delegate; }
    auto reference_delegate() -> ReferenceDelegate&;

    auto in_transaction() const -> bool { return transaction_ != nullptr; }

    // The active transaction. Fatal outside `run`.
    auto current_transaction() -> Transaction&;

    // Run `fn` in a transaction and commit its writes. If `fn` throws,
    // the writes are discarded and the exception propagates.
    template <typename Fn>
    auto run(std::string_view label, Fn&& fn) -> std::invoke_result_t<Fn&> {
        using R = std::invoke_result_t<Fn&>;
        begin_transaction(label);
        try {
            if constexpr (std::is_void_v<R>) {
                fn();
                commit_transaction();
            } else {
                auto result = fn();
                commit_transaction();
                return result;
            }
        } catch (...) {
            abort_transaction();
            throw;
        }
    }

private:
    void begin_transaction(std::string_view label);
    void commit_transaction();
    void abort_transaction();

    std::unique_ptr<KvStore> store_;
    std::unique_ptr<Transaction> transaction_;
    std::string transaction_label_;
    std::unique_ptr<IndexManager> index_manager_;
    std::unique_ptr<RemoteDocumentCache> remote_document_cache_;
    std::unique_ptr<TargetCache> target_cache_;
    ReferenceDelegate* reference_delegate_{nullptr};
    bool started_{true};
};

}  // namespace docsync_cpp::local

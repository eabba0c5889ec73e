#include "persistence.hpp"

#include "index_manager.hpp"
#include "remote_document_cache.hpp"
#include "target_cache.hpp"

namespace docsync_cpp::local {

// -- Transaction --------------------------------------------------------------

auto Transaction::get(std::string_view key) const -> std::optional<std::string> {
    if (auto it = writes_.find(key); it != writes_.end()) return it->second;
    return store_.get(key);
}

void Transaction::put(std::string key, std::string value) {
    writes_.insert_or_assign(std::move(key), std::optional<std::string>{std::move(value)});
}

void Transaction::erase(std::string key) {
    writes_.insert_or_assign(std::move(key), std::nullopt);
}

void Transaction::scan(std::string_view prefix, const ScanFn& fn, std::string_view start) const {
    auto from = std::string{start > prefix ? start : prefix};
    const auto& committed = store_.contents();
    auto c = committed.lower_bound(from);
    auto w = writes_.lower_bound(from);
    auto in_range = [prefix](std::string_view key) { return key.starts_with(prefix); };

    while (true) {
        auto c_ok = c != committed.end() && in_range(c->first);
        auto w_ok = w != writes_.end() && in_range(w->first);
        if (!c_ok && !w_ok) return;

        if (w_ok && (!c_ok || w->first <= c->first)) {
            // Buffered writes shadow committed entries with the same key
            if (c_ok && c->first == w->first) ++c;
            const auto& [key, value] = *w;
            ++w;
            if (value && !fn(key, *value)) return;
        } else {
            const auto& [key, value] = *c;
            ++c;
            if (!fn(key, value)) return;
        }
    }
}

// -- Persistence --------------------------------------------------------------

Persistence::Persistence(std::unique_ptr<KvStore> store)
    : store_{std::move(store)},
      index_manager_{std::make_unique<IndexManager>(*this)},
      remote_document_cache_{std::make_unique<RemoteDocumentCache>(*this, *index_manager_)},
      target_cache_{std::make_unique<TargetCache>(*this)} {}

Persistence::~Persistence() {
    shutdown();
}

auto Persistence::memory() -> std::unique_ptr<Persistence> {
    return std::make_unique<Persistence>(std::make_unique<MemoryKvStore>());
}

auto Persistence::durable(const std::filesystem::path& directory) -> std::unique_ptr<Persistence> {
    return std::make_unique<Persistence>(std::make_unique<FileKvStore>(directory));
}

void Persistence::shutdown() {
    if (!started_) return;
    util::hard_assert(!transaction_, "shutdown during transaction {}", transaction_label_);
    started_ = false;
    store_->close();
}

auto Persistence::reference_delegate() -> ReferenceDelegate& {
    util::hard_assert(reference_delegate_ != nullptr, "no reference delegate installed");
    return *reference_delegate_;
}

auto Persistence::current_transaction() -> Transaction& {
    util::hard_assert(transaction_ != nullptr, "no active transaction");
    return *transaction_;
}

void Persistence::begin_transaction(std::string_view label) {
    util::hard_assert(started_, "transaction {} after persistence shutdown", label);
    util::hard_assert(!transaction_, "transaction {} started during {}", label, transaction_label_);
    util::logger()->trace("starting transaction: {}", label);
    transaction_label_ = std::string{label};
    transaction_ = std::make_unique<Transaction>(*store_);
    if (reference_delegate_) reference_delegate_->on_transaction_started(label);
}

void Persistence::commit_transaction() {
    auto transaction = std::move(transaction_);
    if (reference_delegate_) reference_delegate_->on_transaction_finished();
    store_->apply(transaction->writes());
    transaction_label_.clear();
}

void Persistence::abort_transaction() {
    util::logger()->debug("transaction {} rolled back", transaction_label_);
    transaction_.reset();
    transaction_label_.clear();
    if (reference_delegate_) reference_delegate_->on_transaction_finished();
}

}  // namespace docsync_cpp::local

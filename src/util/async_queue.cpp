#include "async_queue.hpp"

#include "hard_assert.hpp"
#include "log.hpp"

#include <algorithm>

namespace docsync_cpp::util {

auto to_string_view(TimerId id) noexcept -> std::string_view {
    switch (id) {
        case TimerId::all:                               return "all";
        case TimerId::listen_stream_idle:                return "listen_stream_idle";
        case TimerId::listen_stream_connection_backoff:  return "listen_stream_connection_backoff";
        case TimerId::write_stream_idle:                 return "write_stream_idle";
        case TimerId::write_stream_connection_backoff:   return "write_stream_connection_backoff";
        case TimerId::online_state_timeout:              return "online_state_timeout";
        case TimerId::garbage_collection:                return "garbage_collection";
        case TimerId::index_backfill:                    return "index_backfill";
    }
    return "?";
}

void DelayedOperation::cancel() {
    if (queue_) {
        queue_->cancel_delayed(id_);
        queue_ = nullptr;
    }
}

AsyncQueue::AsyncQueue()
    : worker_{[this](std::stop_token st) { worker_loop(st); }} {}

AsyncQueue::~AsyncQueue() {
    shutdown();
}

void AsyncQueue::enqueue(Operation op) {
    push(std::move(op), false);
}

void AsyncQueue::enqueue_even_while_shutting_down(Operation op) {
    push(std::move(op), true);
}

void AsyncQueue::push(Operation op, bool even_while_shutting_down) {
    {
        auto lock = std::scoped_lock{mutex_};
        if (failure_) std::rethrow_exception(failure_);
        if (shutting_down_.load() && !even_while_shutting_down) {
            logger()->debug("dropping operation enqueued after shutdown");
            return;
        }
        tasks_.push_back(std::move(op));
    }
    cv_.notify_one();
}

auto AsyncQueue::enqueue_after_delay(std::chrono::milliseconds delay, TimerId timer_id, Operation op)
    -> DelayedOperation {
    auto id = std::uint64_t{0};
    {
        auto lock = std::scoped_lock{mutex_};
        if (shutting_down_.load()) return DelayedOperation{};
        id = next_delayed_id_++;
        delayed_.push_back(Delayed{id, timer_id, Clock::now() + delay, std::move(op)});
    }
    cv_.notify_one();
    return DelayedOperation{this, id};
}

void AsyncQueue::cancel_delayed(std::uint64_t id) {
    auto lock = std::scoped_lock{mutex_};
    std::erase_if(delayed_, [id](const Delayed& d) { return d.id == id; });
}

auto AsyncQueue::is_scheduled(TimerId timer_id) const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return std::any_of(delayed_.begin(), delayed_.end(),
                       [timer_id](const Delayed& d) { return d.timer_id == timer_id; });
}

auto AsyncQueue::is_current_queue() const -> bool {
    return std::this_thread::get_id() == worker_.get_id();
}

void AsyncQueue::verify_is_current_queue() const {
    util::hard_assert(is_current_queue(), "operation must run on the async queue");
}

void AsyncQueue::start_shutdown() {
    {
        auto lock = std::scoped_lock{mutex_};
        shutting_down_.store(true);
        delayed_.clear();
    }
    cv_.notify_all();
}

void AsyncQueue::shutdown() {
    start_shutdown();
    if (worker_.joinable() && !is_current_queue()) {
        {
            auto lock = std::scoped_lock{mutex_};
            worker_.request_stop();
        }
        cv_.notify_all();
        worker_.join();
    }
}

void AsyncQueue::run_delays_until(TimerId last_timer_id) {
    enqueue_blocking([this, last_timer_id] {
        auto scheduled = std::vector<Delayed>{};
        {
            auto lock = std::scoped_lock{mutex_};
            scheduled = delayed_;
        }
        std::sort(scheduled.begin(), scheduled.end(),
                  [](const Delayed& a, const Delayed& b) { return a.due < b.due; });
        for (auto& d : scheduled) {
            auto still_scheduled = false;
            {
                auto lock = std::scoped_lock{mutex_};
                auto it = std::find_if(delayed_.begin(), delayed_.end(),
                                       [&](const Delayed& x) { return x.id == d.id; });
                if (it != delayed_.end()) {
                    delayed_.erase(it);
                    still_scheduled = true;
                }
            }
            if (!still_scheduled) continue;
            d.op();
            if (last_timer_id != TimerId::all && d.timer_id == last_timer_id) break;
        }
    });
}

void AsyncQueue::run(Operation& op) {
    try {
        op();
    } catch (const std::exception& e) {
        logger()->critical("async queue operation failed: {}", e.what());
        auto lock = std::scoped_lock{mutex_};
        failure_ = std::current_exception();
        tasks_.clear();
        delayed_.clear();
    }
}

void AsyncQueue::worker_loop(std::stop_token st) {
    while (true) {
        auto op = Operation{};
        {
            auto lock = std::unique_lock{mutex_};
            while (true) {
                // Promote due delayed operations in due-time order
                auto now = Clock::now();
                auto due = std::vector<Delayed>{};
                for (auto it = delayed_.begin(); it != delayed_.end();) {
                    if (it->due <= now) {
                        due.push_back(std::move(*it));
                        it = delayed_.erase(it);
                    } else {
                        ++it;
                    }
                }
                std::sort(due.begin(), due.end(),
                          [](const Delayed& a, const Delayed& b) { return a.due < b.due; });
                for (auto& d : due) tasks_.push_back(std::move(d.op));

                if (!tasks_.empty()) break;
                if (st.stop_requested()) return;

                if (delayed_.empty()) {
                    cv_.wait(lock);
                } else {
                    auto next = std::min_element(delayed_.begin(), delayed_.end(),
                                                 [](const Delayed& a, const Delayed& b) { return a.due < b.due; });
                    cv_.wait_until(lock, next->due);
                }
            }
            op = std::move(tasks_.front());
            tasks_.pop_front();
        }
        run(op);
    }
}

}  // namespace docsync_cpp::util

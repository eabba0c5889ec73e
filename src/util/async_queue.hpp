#pragma once

// Internal header — not installed.
// Single-worker std::jthread queue that runs every engine operation in
// FIFO order, plus delayed operations keyed by TimerId.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

namespace docsync_cpp::util {

// Identifies a kind of delayed operation so tests can run it on demand.
enum class TimerId : std::uint8_t {
    all,  // Sentinel for run_delays_until: run everything scheduled.
    listen_stream_idle,
    listen_stream_connection_backoff,
    write_stream_idle,
    write_stream_connection_backoff,
    online_state_timeout,
    garbage_collection,
    index_backfill,
};

auto to_string_view(TimerId id) noexcept -> std::string_view;

class AsyncQueue;

// Handle to a scheduled delayed operation.
class DelayedOperation {
public:
    DelayedOperation() = default;
    DelayedOperation(AsyncQueue* queue, std::uint64_t id) : queue_{queue}, id_{id} {}

    // Cancel if not yet run. Must be called on the queue.
    void cancel();

    auto is_scheduled() const -> bool { return queue_ != nullptr; }

private:
    AsyncQueue* queue_{nullptr};
    std::uint64_t id_{0};
};

class AsyncQueue {
public:
    using Operation = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    AsyncQueue();
    ~AsyncQueue();

    AsyncQueue(const AsyncQueue&) = delete;
    auto operator=(const AsyncQueue&) -> AsyncQueue& = delete;
    AsyncQueue(AsyncQueue&&) = delete;
    auto operator=(AsyncQueue&&) -> AsyncQueue& = delete;

    // Run `op` after every operation enqueued before it. Dropped once
    // shutdown has started.
    void enqueue(Operation op);

    // Run `op` even after shutdown has started (teardown steps).
    void enqueue_even_while_shutting_down(Operation op);

    // Schedule `op` after `delay`. Multiple operations may share a TimerId.
    auto enqueue_after_delay(std::chrono::milliseconds delay, TimerId timer_id, Operation op)
        -> DelayedOperation;

    // Run `fn` on the queue and wait for its result. Exceptions thrown by
    // `fn` are rethrown here. Must not be called from the queue.
    template <typename Fn>
    auto enqueue_blocking(Fn&& fn) -> std::invoke_result_t<Fn> {
        using R = std::invoke_result_t<Fn>;
        // Owned by the operation, so a dropped operation breaks the promise
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        auto result = task->get_future();
        push(Operation{[task] { (*task)(); }}, true);
        return result.get();
    }

    // Stop accepting operations; already enqueued ones still run.
    void start_shutdown();

    // Start shutdown and wait until the queue is drained.
    void shutdown();

    auto is_shutting_down() const -> bool { return shutting_down_.load(); }

    // True on the worker thread.
    auto is_current_queue() const -> bool;

    // Fatal if not on the worker thread.
    void verify_is_current_queue() const;

    auto is_scheduled(TimerId timer_id) const -> bool;

    // Testing: run scheduled delayed operations in due-time order on the
    // queue, stopping after the first with `last_timer_id`.
    void run_delays_until(TimerId last_timer_id);

private:
    friend class DelayedOperation;

    struct Delayed {
        std::uint64_t id;
        TimerId timer_id;
        Clock::time_point due;
        Operation op;
    };

    void push(Operation op, bool even_while_shutting_down);
    void cancel_delayed(std::uint64_t id);
    void worker_loop(std::stop_token st);
    void run(Operation& op);

    std::deque<Operation> tasks_;
    std::vector<Delayed> delayed_;
    std::uint64_t next_delayed_id_{1};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutting_down_{false};
    std::exception_ptr failure_;
    std::jthread worker_;
};

}  // namespace docsync_cpp::util

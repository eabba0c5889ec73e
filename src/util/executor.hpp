#pragma once

// Process-global Taskflow executor.
//
// Used for CPU-bound fan-out that does not touch engine state, such as
// decoding large remote document scans. Engine state itself is only
// touched on the AsyncQueue.
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>

#include <cstddef>
#include <exception>
#include <mutex>

namespace docsync_cpp::util {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

// Run fn(i) for every i in [0, count) on the global executor and wait.
// The first exception thrown by fn is rethrown here once every task is done.
template <typename Fn>
void parallel_for(std::size_t count, Fn&& fn) {
    if (count == 0) return;
    auto mutex = std::mutex{};
    auto failure = std::exception_ptr{};
    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, count, std::size_t{1}, [&](std::size_t i) {
        try {
            fn(i);
        } catch (...) {
            auto lock = std::lock_guard{mutex};
            if (!failure) failure = std::current_exception();
        }
    });
    global_executor().run(taskflow).wait();
    if (failure) std::rethrow_exception(failure);
}

}  // namespace docsync_cpp::util

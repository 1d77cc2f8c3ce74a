//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Coroutine.h
// Purpose: Eager Task<T> settled through std::future, and co_await support for std::future (C++20)
//==========================================================================================================

#pragma once

#include <chrono>
#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <thread>
#include <utility>

namespace mcphub {
namespace async {

template <typename T>
class Task;

namespace detail {

// Shared promise state. The body runs to its first suspension on the caller's thread and
// the frame is released as soon as it finishes; the std::future is the only observer.
template <typename T>
struct TaskPromiseBase {
    std::promise<T> result;

    Task<T> get_return_object() { return Task<T>(result.get_future()); }
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { result.set_exception(std::current_exception()); }
};

template <typename T>
struct TaskPromise : TaskPromiseBase<T> {
    template <typename U>
    requires std::convertible_to<U, T>
    void return_value(U&& v) { this->result.set_value(std::forward<U>(v)); }
};

template <>
struct TaskPromise<void> : TaskPromiseBase<void> {
    void return_void() { this->result.set_value(); }
};

} // namespace detail

//==========================================================================================================
// Task
// Purpose: Return type for hub coroutines. Usage: Task<T> run() { co_return value; } -> run().toFuture()
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;
    using promise_type = detail::TaskPromise<T>;

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    friend struct detail::TaskPromiseBase<T>;
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}

    std::future<T> fut;
};

//==========================================================================================================
// FutureAwaiter
// Purpose: co_await on a std::future. A detached helper thread blocks on the future and resumes the
//          coroutine there; a stored exception is rethrown from await_resume().
//==========================================================================================================
template <typename T>
class FutureAwaiter {
public:
    explicit FutureAwaiter(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const { return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread([this, h]() {
            fut.wait();
            h.resume();
        }).detach();
    }

    T await_resume() { return fut.get(); }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaiter<T> awaitFuture(std::future<T>&& fut) {
    return FutureAwaiter<T>(std::move(fut));
}

} // namespace async
} // namespace mcphub

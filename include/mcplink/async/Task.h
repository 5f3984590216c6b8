//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine task that publishes its result through std::future, plus a co_await adapter
//          for std::future
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <exception>
#include <future>
#include <thread>
#include <utility>

namespace mcplink {
namespace async {

//==========================================================================================================
// Task
// Purpose: Return type for coroutines whose caller wants a std::future. The body starts running
//          immediately; co_return fulfils the future and an escaping exception is stored in it.
// Usage:
//   Task<int> compute() { co_return 42; }
//   std::future<int> f = compute().toFuture();
//==========================================================================================================
template <typename T>
class Task {
public:
    struct promise_type {
        std::promise<T> result;

        Task get_return_object() { return Task(result.get_future()); }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { result.set_exception(std::current_exception()); }
        template <typename U>
        void return_value(U&& v) { result.set_value(std::forward<U>(v)); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T> f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <>
class Task<void> {
public:
    struct promise_type {
        std::promise<void> result;

        Task get_return_object() { return Task(result.get_future()); }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { result.set_exception(std::current_exception()); }
        void return_void() { result.set_value(); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void> f) : fut(std::move(f)) {}
    std::future<void> fut;
};

//==========================================================================================================
// Awaited
// Purpose: co_await adapter for std::future<T>. A ready future resumes inline; otherwise a detached
//          thread waits and resumes the coroutine on that thread. get() rethrows a stored exception.
//==========================================================================================================
template <typename T>
class Awaited {
public:
    explicit Awaited(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

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
Awaited<T> awaitFuture(std::future<T>&& fut) {
    return Awaited<T>(std::move(fut));
}

} // namespace async
} // namespace mcplink

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine type whose result is observed through std::future
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <utility>

namespace mcpm {
namespace async {

namespace detail {
template <typename T>
struct TaskPromiseBase {
    std::promise<T> promise;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};
} // namespace detail

//==========================================================================================================
// Task<T>
// Purpose: Coroutine return type. The body starts immediately on the calling thread and continues on an
//          AwaitScheduler pool thread after each suspension; toFuture() hands the result to the caller.
// Usage:
//   Task<JSONValue> probe() { auto r = co_await makeFutureAwaitable(...); co_return r; }
//   std::future<JSONValue> f = probe().toFuture();
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type : detail::TaskPromiseBase<T> {
        Task get_return_object() noexcept { return Task{ this->promise.get_future() }; }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <>
class Task<void> {
public:
    struct promise_type : detail::TaskPromiseBase<void> {
        Task get_return_object() noexcept { return Task{ promise.get_future() }; }
        void return_void() { promise.set_value(); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

} // namespace async
} // namespace mcpm

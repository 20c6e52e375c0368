//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: co_await support for std::future inside Task coroutines
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <type_traits>
#include <utility>

#include "mcpm/async/AwaitScheduler.h"

namespace mcpm {
namespace async {

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: Suspends the coroutine until the future is ready, then resumes it on the AwaitScheduler pool.
//          Exceptions stored in the future are rethrown from await_resume().
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        using namespace std::chrono_literals;
        return fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        // The awaitable lives in the suspended frame, so `this` stays valid until resume.
        AwaitScheduler::Instance().Watch(
            [this]() { return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }, h);
    }

    T await_resume() {
        if constexpr (std::is_void_v<T>) {
            fut.get();
        } else {
            return fut.get();
        }
    }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace mcpm

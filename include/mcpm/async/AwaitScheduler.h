//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AwaitScheduler.h
// Purpose: Shared watcher that resumes coroutines suspended on std::future
//==========================================================================================================

#pragma once

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mcpm {
namespace async {

//==========================================================================================================
// AwaitScheduler
// Purpose: One watcher thread polls the futures of suspended coroutines; ready ones are resumed on a
//          small Boost.Asio thread pool. No pool thread ever blocks on a future.
//==========================================================================================================
class AwaitScheduler {
public:
    static AwaitScheduler& Instance();

    AwaitScheduler(const AwaitScheduler&) = delete;
    AwaitScheduler& operator=(const AwaitScheduler&) = delete;

    // `ready` is polled from the watcher thread until it returns true; `h` is then resumed on the pool.
    void Watch(std::function<bool()> ready, std::coroutine_handle<> h);

    // Coroutines currently suspended and not yet handed to the pool.
    std::size_t Waiting() const;

private:
    AwaitScheduler();
    ~AwaitScheduler();

    struct Entry {
        std::function<bool()> ready;
        std::coroutine_handle<> handle;
    };

    void run(std::stop_token st);

    class Pool;
    std::unique_ptr<Pool> pool;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::vector<Entry> incoming;
    std::size_t watched{0};
    std::jthread watcher;
};

} // namespace async
} // namespace mcpm

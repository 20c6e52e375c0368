//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AwaitScheduler.cpp
// Purpose: Watcher thread and resume pool behind FutureAwaitable
//==========================================================================================================

#include "mcpm/async/AwaitScheduler.h"

#include <chrono>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"

namespace mcpm {
namespace async {

namespace {
constexpr auto PollInterval = std::chrono::milliseconds(1);
constexpr std::size_t ResumeThreads = 2;
} // namespace

class AwaitScheduler::Pool {
public:
    boost::asio::thread_pool threads{ResumeThreads};
};

AwaitScheduler& AwaitScheduler::Instance() {
    static AwaitScheduler instance;
    return instance;
}

AwaitScheduler::AwaitScheduler() : pool(std::make_unique<Pool>()) {
    watcher = std::jthread([this](std::stop_token st) { run(st); });
}

AwaitScheduler::~AwaitScheduler() {
    watcher.request_stop();
    if (watcher.joinable()) {
        watcher.join();
    }
    pool->threads.join();
}

void AwaitScheduler::Watch(std::function<bool()> ready, std::coroutine_handle<> h) {
    {
        std::lock_guard<std::mutex> lk(mutex);
        incoming.push_back(Entry{std::move(ready), h});
        ++watched;
    }
    cv.notify_one();
}

std::size_t AwaitScheduler::Waiting() const {
    std::lock_guard<std::mutex> lk(mutex);
    return watched;
}

void AwaitScheduler::run(std::stop_token st) {
    std::vector<Entry> active;
    while (!st.stop_requested()) {
        {
            std::unique_lock<std::mutex> lk(mutex);
            if (active.empty()) {
                cv.wait(lk, st, [this]() { return !incoming.empty(); });
            } else {
                cv.wait_for(lk, st, PollInterval, [this]() { return !incoming.empty(); });
            }
            for (auto& e : incoming) {
                active.push_back(std::move(e));
            }
            incoming.clear();
        }
        std::size_t resumed = 0;
        for (auto it = active.begin(); it != active.end();) {
            if (it->ready()) {
                auto h = it->handle;
                boost::asio::post(pool->threads, [h]() { h.resume(); });
                it = active.erase(it);
                ++resumed;
            } else {
                ++it;
            }
        }
        if (resumed > 0) {
            std::lock_guard<std::mutex> lk(mutex);
            watched -= resumed;
        }
    }
    if (!active.empty()) {
        LOG_DEBUG("AwaitScheduler: {} coroutine(s) still suspended at shutdown", active.size());
    }
}

} // namespace async
} // namespace mcpm

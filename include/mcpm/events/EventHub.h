//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventHub.h
// Purpose: Multi-subscriber callback list with re-entrancy safe subscribe/unsubscribe
//==========================================================================================================

#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "logging/Logger.h"

namespace mcpm {
namespace events {

using Unsubscribe = std::function<void()>;

//==========================================================================================================
// EventHub<Args...>
// Purpose: Ordered fan-out of events to subscribers.
// Notes:
//   - Emit() iterates a snapshot of the subscriber list taken under the lock, so subscribing or
//     unsubscribing from inside a callback never skips or double-delivers to other subscribers.
//   - A subscriber removed during an emission is not called after removal.
//   - The returned unsubscribe function is idempotent and safe to call after the hub is gone.
//   - Exceptions thrown by a subscriber are logged and do not stop delivery to the others.
//==========================================================================================================
template <typename... Args>
class EventHub {
public:
    using Callback = std::function<void(const Args&...)>;

    EventHub() : state(std::make_shared<State>()) {}
    EventHub(const EventHub&) = delete;
    EventHub& operator=(const EventHub&) = delete;

    Unsubscribe Subscribe(Callback cb) {
        auto entry = std::make_shared<Entry>();
        entry->cb = std::move(cb);
        {
            std::lock_guard<std::mutex> lk(state->mutex);
            auto next = std::make_shared<List>(*state->list);
            next->push_back(entry);
            state->list = std::move(next);
        }
        std::weak_ptr<State> weakState = state;
        std::weak_ptr<Entry> weakEntry = entry;
        return [weakState, weakEntry]() {
            auto e = weakEntry.lock();
            if (!e) {
                return;
            }
            e->active.store(false);
            auto s = weakState.lock();
            if (!s) {
                return;
            }
            std::lock_guard<std::mutex> lk(s->mutex);
            auto next = std::make_shared<List>();
            next->reserve(s->list->size());
            for (const auto& other : *s->list) {
                if (other != e) {
                    next->push_back(other);
                }
            }
            s->list = std::move(next);
        };
    }

    void Emit(const Args&... args) const {
        std::shared_ptr<const List> snapshot;
        {
            std::lock_guard<std::mutex> lk(state->mutex);
            snapshot = state->list;
        }
        for (const auto& entry : *snapshot) {
            if (!entry->active.load()) {
                continue;
            }
            try {
                entry->cb(args...);
            } catch (const std::exception& e) {
                LOG_ERROR("Event subscriber threw: {}", e.what());
            }
        }
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lk(state->mutex);
        return state->list->size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lk(state->mutex);
        for (const auto& entry : *state->list) {
            entry->active.store(false);
        }
        state->list = std::make_shared<List>();
    }

private:
    struct Entry {
        Callback cb;
        std::atomic<bool> active{true};
    };
    using List = std::vector<std::shared_ptr<Entry>>;
    struct State {
        std::mutex mutex;
        std::shared_ptr<List> list = std::make_shared<List>();
    };

    std::shared_ptr<State> state;
};

} // namespace events
} // namespace mcpm

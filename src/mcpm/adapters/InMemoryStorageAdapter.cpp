//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryStorageAdapter.cpp
// Purpose: Map-backed storage double
//==========================================================================================================

#include "mcpm/adapters/InMemoryStorageAdapter.hpp"

#include "mcpm/errors/Errors.h"

namespace mcpm {
namespace adapters {

using errors::ErrorCode;
using errors::ManagerError;

std::optional<std::string> InMemoryStorageAdapter::Read(const std::string& key) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = keys.find(key);
    if (it == keys.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryStorageAdapter::Write(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lk(mutex);
    if (failWrites) {
        throw ManagerError(ErrorCode::StorageError, "Storage write failed for key " + key);
    }
    keys[key] = value;
}

void InMemoryStorageAdapter::Delete(const std::string& key) {
    std::lock_guard<std::mutex> lk(mutex);
    keys.erase(key);
}

std::optional<JSONValue> InMemoryStorageAdapter::ReadConfig(const std::string& name) {
    std::string text;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = configs.find(name);
        if (it == configs.end()) {
            return std::nullopt;
        }
        text = it->second;
    }
    try {
        return ParseJSON(text);
    } catch (const std::exception& e) {
        throw ManagerError(ErrorCode::StorageError, "Malformed configuration " + name + ": " + e.what());
    }
}

void InMemoryStorageAdapter::WriteConfig(const std::string& name, const JSONValue& document) {
    std::lock_guard<std::mutex> lk(mutex);
    if (failWrites) {
        throw ManagerError(ErrorCode::StorageError, "Storage write failed for " + name);
    }
    configs[name] = SerializeJSON(document);
    ++configWrites;
}

std::shared_ptr<InMemoryStorageAdapter::Hub> InMemoryStorageAdapter::hubFor(const std::string& name) {
    auto& hub = watchers[name];
    if (!hub) {
        hub = std::make_shared<Hub>();
    }
    return hub;
}

events::Unsubscribe InMemoryStorageAdapter::WatchConfig(const std::string& name, ConfigWatcher watcher) {
    std::shared_ptr<Hub> hub;
    {
        std::lock_guard<std::mutex> lk(mutex);
        hub = hubFor(name);
    }
    return hub->Subscribe(std::move(watcher));
}

void InMemoryStorageAdapter::ExternalWriteConfig(const std::string& name, const JSONValue& document) {
    std::shared_ptr<Hub> hub;
    {
        std::lock_guard<std::mutex> lk(mutex);
        configs[name] = SerializeJSON(document);
        hub = hubFor(name);
    }
    hub->Emit(std::optional<JSONValue>(document));
}

void InMemoryStorageAdapter::ExternalDeleteConfig(const std::string& name) {
    std::shared_ptr<Hub> hub;
    {
        std::lock_guard<std::mutex> lk(mutex);
        configs.erase(name);
        hub = hubFor(name);
    }
    hub->Emit(std::optional<JSONValue>());
}

void InMemoryStorageAdapter::SetRawConfig(const std::string& name, const std::string& text) {
    std::lock_guard<std::mutex> lk(mutex);
    configs[name] = text;
}

void InMemoryStorageAdapter::SetFailWrites(bool fail) {
    std::lock_guard<std::mutex> lk(mutex);
    failWrites = fail;
}

std::size_t InMemoryStorageAdapter::KeyCount() const {
    std::lock_guard<std::mutex> lk(mutex);
    return keys.size();
}

std::size_t InMemoryStorageAdapter::ConfigWriteCount() const {
    std::lock_guard<std::mutex> lk(mutex);
    return configWrites;
}

} // namespace adapters
} // namespace mcpm

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryStorageAdapter.hpp
// Purpose: Map-backed storage double
//==========================================================================================================
#pragma once

#include <map>
#include <memory>
#include <mutex>

#include "mcpm/adapters/StorageAdapter.h"

namespace mcpm {
namespace adapters {

class InMemoryStorageAdapter : public IStorageAdapter {
public:
    std::optional<std::string> Read(const std::string& key) override;
    void Write(const std::string& key, const std::string& value) override;
    void Delete(const std::string& key) override;

    std::optional<JSONValue> ReadConfig(const std::string& name) override;
    void WriteConfig(const std::string& name, const JSONValue& document) override;
    events::Unsubscribe WatchConfig(const std::string& name, ConfigWatcher watcher) override;

    /////////////////////////////////////////// Test helpers ///////////////////////////////////////////
    // Simulates an edit by another program: stores the document and notifies watchers synchronously.
    void ExternalWriteConfig(const std::string& name, const JSONValue& document);
    void ExternalDeleteConfig(const std::string& name);
    // Stores raw text so ReadConfig can be made to fail on malformed JSON.
    void SetRawConfig(const std::string& name, const std::string& text);
    // Subsequent writes throw StorageError while set.
    void SetFailWrites(bool fail);

    std::size_t KeyCount() const;
    std::size_t ConfigWriteCount() const;

private:
    using Hub = events::EventHub<std::optional<JSONValue>>;
    std::shared_ptr<Hub> hubFor(const std::string& name);

    mutable std::mutex mutex;
    std::map<std::string, std::string> keys;
    std::map<std::string, std::string> configs;     // serialized text
    std::map<std::string, std::shared_ptr<Hub>> watchers;
    bool failWrites{false};
    std::size_t configWrites{0};
};

} // namespace adapters
} // namespace mcpm

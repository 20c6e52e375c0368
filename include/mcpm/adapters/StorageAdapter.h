//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StorageAdapter.h
// Purpose: Key/value and configuration document storage used by the registry and token manager
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>

#include "mcpm/JSONRPCTypes.h"
#include "mcpm/events/EventHub.h"

namespace mcpm {
namespace adapters {

//==========================================================================================================
// IStorageAdapter
// Purpose: Two storage tiers.
//   - Ephemeral keys (Read/Write/Delete): short-lived values such as pending OAuth sessions.
//   - Durable configuration documents (ReadConfig/WriteConfig/WatchConfig): JSON documents by name.
// Notes:
//   - Failures throw errors::ManagerError(StorageError).
//   - Writes are atomic for readers: a reader sees the old or the new document, never a mix.
//   - WatchConfig reports changes made outside this adapter instance; the adapter's own WriteConfig
//     calls are not echoed back. A deleted document is reported as std::nullopt.
//==========================================================================================================
class IStorageAdapter {
public:
    using ConfigWatcher = std::function<void(const std::optional<JSONValue>&)>;

    virtual ~IStorageAdapter() = default;

    virtual std::optional<std::string> Read(const std::string& key) = 0;
    virtual void Write(const std::string& key, const std::string& value) = 0;
    virtual void Delete(const std::string& key) = 0;

    //==========================================================================================================
    // ReadConfig
    // Purpose: Loads a configuration document.
    // Returns:
    //   The parsed document, or std::nullopt when it does not exist. Malformed JSON throws StorageError.
    //==========================================================================================================
    virtual std::optional<JSONValue> ReadConfig(const std::string& name) = 0;
    virtual void WriteConfig(const std::string& name, const JSONValue& document) = 0;
    virtual events::Unsubscribe WatchConfig(const std::string& name, ConfigWatcher watcher) = 0;
};

} // namespace adapters
} // namespace mcpm

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostStorageAdapter.hpp
// Purpose: Directory-backed storage with atomic replace and inotify change watching
//==========================================================================================================
#pragma once

#include <filesystem>
#include <memory>

#include "mcpm/adapters/StorageAdapter.h"

namespace mcpm {
namespace adapters {

//==========================================================================================================
// HostStorageAdapter
// Purpose: Stores configuration documents as <root>/<name> and ephemeral keys as <root>/state/<key>.
// Notes:
//   - Files are written to a temporary sibling, fsync'ed and renamed over the target (mode 0600).
//   - Keys and document names are restricted to [A-Za-z0-9._-] and may not start with '.'.
//   - WatchConfig starts a single inotify thread on first use; content identical to what this
//     instance last wrote or reported is not reported again.
//==========================================================================================================
class HostStorageAdapter : public IStorageAdapter {
public:
    explicit HostStorageAdapter(std::filesystem::path root);
    ~HostStorageAdapter() override;

    HostStorageAdapter(const HostStorageAdapter&) = delete;
    HostStorageAdapter& operator=(const HostStorageAdapter&) = delete;

    std::optional<std::string> Read(const std::string& key) override;
    void Write(const std::string& key, const std::string& value) override;
    void Delete(const std::string& key) override;

    std::optional<JSONValue> ReadConfig(const std::string& name) override;
    void WriteConfig(const std::string& name, const JSONValue& document) override;
    events::Unsubscribe WatchConfig(const std::string& name, ConfigWatcher watcher) override;

    const std::filesystem::path& Root() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace adapters
} // namespace mcpm

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvAdapter.h
// Purpose: Resolution of "$NAME" references in server env values and arguments
//==========================================================================================================

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpm {
namespace adapters {

//==========================================================================================================
// IEnvAdapter
// Purpose: Looks up host environment variables on behalf of a server launch.
//==========================================================================================================
class IEnvAdapter {
public:
    virtual ~IEnvAdapter() = default;

    //==========================================================================================================
    // Resolve
    // Purpose: Expands a single value.
    // Args:
    //   value: Returned unchanged unless it starts with '$'. "$NAME" and "${NAME}" name a host variable.
    // Returns:
    //   The variable's value. Throws errors::ManagerError(EnvVarNotFound) when it is unset.
    //==========================================================================================================
    virtual std::string Resolve(const std::string& value) = 0;

    virtual std::map<std::string, std::string> ResolveAll(const std::map<std::string, std::string>& env) = 0;
    virtual std::vector<std::string> ResolveArgs(const std::vector<std::string>& args) = 0;
};

//==========================================================================================================
// EnvAdapterBase
// Purpose: Reference parsing plus a per-instance cache of successful lookups. Misses are never cached,
//          so a variable exported later is picked up by the next Resolve().
//==========================================================================================================
class EnvAdapterBase : public IEnvAdapter {
public:
    std::string Resolve(const std::string& value) override;
    std::map<std::string, std::string> ResolveAll(const std::map<std::string, std::string>& env) override;
    std::vector<std::string> ResolveArgs(const std::vector<std::string>& args) override;

    void ClearCache();

protected:
    virtual std::optional<std::string> lookup(const std::string& name) = 0;

private:
    std::mutex mutex;
    std::unordered_map<std::string, std::string> cache;
};

// Reads the process environment.
class HostEnvAdapter : public EnvAdapterBase {
protected:
    std::optional<std::string> lookup(const std::string& name) override;
};

// Variables held in a map; counts lookups that reached the map.
class InMemoryEnvAdapter : public EnvAdapterBase {
public:
    InMemoryEnvAdapter() = default;
    explicit InMemoryEnvAdapter(std::map<std::string, std::string> vars);

    void Set(const std::string& name, const std::string& value);
    void Unset(const std::string& name);
    std::size_t LookupCount() const;

protected:
    std::optional<std::string> lookup(const std::string& name) override;

private:
    mutable std::mutex varsMutex;
    std::map<std::string, std::string> vars;
    std::size_t lookups{0};
};

} // namespace adapters
} // namespace mcpm

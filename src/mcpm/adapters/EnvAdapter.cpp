//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvAdapter.cpp
// Purpose: Resolution of "$NAME" references in server env values and arguments
//==========================================================================================================

#include "mcpm/adapters/EnvAdapter.h"

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpm/errors/Errors.h"

namespace mcpm {
namespace adapters {

namespace {
// Variable name of a reference, or nullopt for literal values.
std::optional<std::string> referenceName(const std::string& value) {
    if (value.size() < 2 || value[0] != '$') {
        return std::nullopt;
    }
    if (value[1] == '{') {
        if (value.size() < 4 || value.back() != '}') {
            return std::nullopt;
        }
        return value.substr(2, value.size() - 3);
    }
    return value.substr(1);
}
} // namespace

std::string EnvAdapterBase::Resolve(const std::string& value) {
    auto name = referenceName(value);
    if (!name.has_value()) {
        return value;
    }
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = cache.find(*name);
        if (it != cache.end()) {
            return it->second;
        }
    }
    auto found = lookup(*name);
    if (!found.has_value()) {
        LOG_WARN("Environment variable {} is not set", *name);
        throw errors::ManagerError(errors::ErrorCode::EnvVarNotFound,
                                   "Environment variable " + *name + " is not set");
    }
    std::lock_guard<std::mutex> lk(mutex);
    cache[*name] = *found;
    return *found;
}

std::map<std::string, std::string> EnvAdapterBase::ResolveAll(const std::map<std::string, std::string>& env) {
    std::map<std::string, std::string> out;
    for (const auto& [key, value] : env) {
        out[key] = Resolve(value);
    }
    return out;
}

std::vector<std::string> EnvAdapterBase::ResolveArgs(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    out.reserve(args.size());
    for (const auto& a : args) {
        out.push_back(Resolve(a));
    }
    return out;
}

void EnvAdapterBase::ClearCache() {
    std::lock_guard<std::mutex> lk(mutex);
    cache.clear();
}

std::optional<std::string> HostEnvAdapter::lookup(const std::string& name) {
    return GetEnv(name);
}

InMemoryEnvAdapter::InMemoryEnvAdapter(std::map<std::string, std::string> v) : vars(std::move(v)) {}

void InMemoryEnvAdapter::Set(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lk(varsMutex);
    vars[name] = value;
}

void InMemoryEnvAdapter::Unset(const std::string& name) {
    std::lock_guard<std::mutex> lk(varsMutex);
    vars.erase(name);
}

std::size_t InMemoryEnvAdapter::LookupCount() const {
    std::lock_guard<std::mutex> lk(varsMutex);
    return lookups;
}

std::optional<std::string> InMemoryEnvAdapter::lookup(const std::string& name) {
    std::lock_guard<std::mutex> lk(varsMutex);
    ++lookups;
    auto it = vars.find(name);
    if (it == vars.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace adapters
} // namespace mcpm

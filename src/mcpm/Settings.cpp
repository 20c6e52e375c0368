//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Settings.cpp
// Purpose: Process-wide manager settings read from MCPM_* environment variables
//==========================================================================================================

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpm/Settings.h"

namespace mcpm {

namespace {
uint64_t numberSetting(const char* name, uint64_t fallback) {
    bool malformed = false;
    uint64_t v = GetEnvUInt64OrDefault(name, fallback, &malformed);
    if (malformed) {
        LOG_WARN("{}='{}' is not a valid number; using {}", name, GetEnvOrDefault(name, ""), fallback);
    }
    return v;
}

std::string defaultConfigDir() {
    const std::string xdg = GetEnvOrDefault("XDG_CONFIG_HOME", "");
    if (!xdg.empty()) {
        return xdg + "/mcpm";
    }
    const std::string home = GetEnvOrDefault("HOME", "");
    if (!home.empty()) {
        return home + "/.config/mcpm";
    }
    return ".mcpm";
}
} // namespace

Settings Settings::FromEnvironment() {
    Settings s;
    s.configDir = GetEnvOrDefault("MCPM_CONFIG_DIR", "");
    if (s.configDir.empty()) {
        s.configDir = defaultConfigDir();
    }
    s.configFile = GetEnvOrDefault("MCPM_CONFIG_FILE", s.configFile);
    s.probeTimeoutMs = numberSetting("MCPM_PROBE_TIMEOUT_MS", s.probeTimeoutMs);
    s.shutdownGraceMs = numberSetting("MCPM_SHUTDOWN_GRACE_MS", s.shutdownGraceMs);
    s.requestTimeoutMs = numberSetting("MCPM_REQUEST_TIMEOUT_MS", s.requestTimeoutMs);
    s.historyLimit = numberSetting("MCPM_HISTORY_LIMIT", s.historyLimit);
    if (s.historyLimit == 0) {
        LOG_WARN("MCPM_HISTORY_LIMIT must be positive; using 100");
        s.historyLimit = 100;
    }
    s.oauthScheme = GetEnvOrDefault("MCPM_OAUTH_SCHEME", s.oauthScheme);
    s.oauthSessionTtlMs = numberSetting("MCPM_OAUTH_SESSION_TTL_MS", s.oauthSessionTtlMs);
    s.builtinRoot = GetEnvOrDefault("MCPM_BUILTIN_ROOT", "");
    s.restartMaxAttempts = numberSetting("MCPM_RESTART_MAX_ATTEMPTS", s.restartMaxAttempts);
    s.restartDelayMs = numberSetting("MCPM_RESTART_DELAY_MS", s.restartDelayMs);
    s.healthCheckIntervalMs = numberSetting("MCPM_HEALTH_CHECK_INTERVAL_MS", s.healthCheckIntervalMs);
    return s;
}

std::string Settings::ConfigName() const {
    return configFile;
}

} // namespace mcpm

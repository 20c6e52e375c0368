//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Settings.h
// Purpose: Process-wide manager settings read from MCPM_* environment variables
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>

namespace mcpm {

struct Settings {
    std::string configDir;                      // MCPM_CONFIG_DIR
    std::string configFile{"mcpServers.json"};  // MCPM_CONFIG_FILE
    uint64_t probeTimeoutMs{30000};             // MCPM_PROBE_TIMEOUT_MS
    uint64_t shutdownGraceMs{5000};             // MCPM_SHUTDOWN_GRACE_MS
    uint64_t requestTimeoutMs{30000};           // MCPM_REQUEST_TIMEOUT_MS, 0 disables
    uint64_t historyLimit{100};                 // MCPM_HISTORY_LIMIT
    std::string oauthScheme{"mcp-app"};         // MCPM_OAUTH_SCHEME
    uint64_t oauthSessionTtlMs{600000};         // MCPM_OAUTH_SESSION_TTL_MS
    std::string builtinRoot;                    // MCPM_BUILTIN_ROOT, empty skips built-ins
    uint64_t restartMaxAttempts{3};             // MCPM_RESTART_MAX_ATTEMPTS, 0 disables auto-restart
    uint64_t restartDelayMs{5000};              // MCPM_RESTART_DELAY_MS
    uint64_t healthCheckIntervalMs{30000};      // MCPM_HEALTH_CHECK_INTERVAL_MS, 0 disables

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Reads every MCPM_* setting; malformed numbers fall back to the default with a warning.
    // Notes:
    //   configDir defaults to $XDG_CONFIG_HOME/mcpm, then $HOME/.config/mcpm, then ./.mcpm.
    //==========================================================================================================
    static Settings FromEnvironment();

    // Document name handed to the storage adapter.
    std::string ConfigName() const;
};

} // namespace mcpm

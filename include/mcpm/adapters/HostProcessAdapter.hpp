//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostProcessAdapter.hpp
// Purpose: POSIX fork/exec process adapter with newline-delimited stdio
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>

#include "mcpm/adapters/ProcessAdapter.h"

namespace mcpm {
namespace adapters {

//==========================================================================================================
// HostProcessAdapter
// Purpose: Launches real children.
// Notes:
//   - Each child calls setsid() and leads its own process group; Kill() signals the whole group with
//     SIGTERM and escalates to SIGKILL after the shutdown grace period.
//   - execvp failures are reported synchronously through a close-on-exec error pipe.
//   - stdout is split into lines (MaxLineBytes cap per line); stderr is a separate line stream.
//   - Writes are queued up to WriteQueueMaxBytes; Send() returns false beyond that.
//   - The destructor kills every child still running and waits for its exit.
//==========================================================================================================
class HostProcessAdapter : public ProcessAdapterBase {
public:
    static constexpr std::size_t MaxLineBytes = 1024 * 1024;            // 1 MiB
    static constexpr std::size_t WriteQueueMaxBytes = 2 * 1024 * 1024;  // 2 MiB

    explicit HostProcessAdapter(std::chrono::milliseconds shutdownGrace = std::chrono::milliseconds(5000));
    ~HostProcessAdapter() override;

protected:
    std::shared_ptr<IProcess> doSpawn(const std::string& id, const ProcessSpec& spec) override;

private:
    std::chrono::milliseconds shutdownGrace;
};

} // namespace adapters
} // namespace mcpm

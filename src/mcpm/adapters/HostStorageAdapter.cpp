//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostStorageAdapter.cpp
// Purpose: Directory-backed storage with atomic replace and inotify change watching
//==========================================================================================================

#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "mcpm/adapters/HostStorageAdapter.hpp"
#include "mcpm/errors/Errors.h"

namespace mcpm {
namespace adapters {

using errors::ErrorCode;
using errors::ManagerError;

namespace {

std::string errnoText(int err) {
    return std::string(::strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

void validateName(const std::string& name) {
    if (name.empty() || name[0] == '.') {
        throw ManagerError(ErrorCode::StorageError, "Invalid storage key: '" + name + "'");
    }
    for (char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '.' || c == '_' || c == '-';
        if (!ok) {
            throw ManagerError(ErrorCode::StorageError, "Invalid storage key: '" + name + "'");
        }
    }
}

std::optional<std::string> readFile(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return std::nullopt;
        }
        throw ManagerError(ErrorCode::StorageError, "Cannot open " + path.string() + ": " + errnoText(errno));
    }
    std::string out;
    char buf[8192];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            int err = errno;
            ::close(fd);
            throw ManagerError(ErrorCode::StorageError, "Cannot read " + path.string() + ": " + errnoText(err));
        }
        break;
    }
    ::close(fd);
    return out;
}

// temp file + fsync + rename; readers never observe a partial document.
void atomicWrite(const std::filesystem::path& path, const std::string& data) {
    static std::atomic<unsigned int> counter{0u};
    std::filesystem::path tmp = path;
    tmp += ".tmp-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1u));

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw ManagerError(ErrorCode::StorageError, "Cannot create " + tmp.string() + ": " + errnoText(errno));
    }
    auto fail = [&](const std::string& what, int err) {
        ::close(fd);
        ::unlink(tmp.c_str());
        throw ManagerError(ErrorCode::StorageError, what + " " + path.string() + ": " + errnoText(err));
    };
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail("Cannot write", errno);
        }
        off += static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        fail("Cannot fsync", errno);
    }
    ::close(fd);
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw ManagerError(ErrorCode::StorageError, "Cannot replace " + path.string() + ": " + errnoText(err));
    }
}

void ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw ManagerError(ErrorCode::StorageError, "Cannot create directory " + dir.string() + ": " + ec.message());
    }
}

} // namespace

class HostStorageAdapter::Impl {
public:
    using Hub = events::EventHub<std::optional<JSONValue>>;

    std::filesystem::path root;
    std::filesystem::path stateDir;

    std::mutex mutex;
    std::map<std::string, std::shared_ptr<Hub>> hubs;
    // Last content written or reported per document; used to suppress echoes.
    std::map<std::string, std::optional<std::string>> lastKnown;

    int inotifyFd{-1};
    int wakeFd{-1};
    int epollFd{-1};
    std::atomic<bool> stopping{false};
    std::thread watchThread;

    explicit Impl(std::filesystem::path r) : root(std::move(r)), stateDir(root / "state") {}

    ~Impl() {
        stopping = true;
        if (wakeFd >= 0) {
            uint64_t one = 1;
            ssize_t wr;
            do {
                wr = ::write(wakeFd, &one, sizeof(one));
            } while (wr < 0 && errno == EINTR);
        }
        if (watchThread.joinable()) {
            watchThread.join();
        }
        if (epollFd >= 0) ::close(epollFd);
        if (wakeFd >= 0) ::close(wakeFd);
        if (inotifyFd >= 0) ::close(inotifyFd);
    }

    // Called with mutex held.
    void startWatcherLocked() {
        if (watchThread.joinable()) {
            return;
        }
        ensureDirectory(root);
        inotifyFd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (inotifyFd < 0) {
            throw ManagerError(ErrorCode::StorageError, "inotify_init1 failed: " + errnoText(errno));
        }
        if (::inotify_add_watch(inotifyFd, root.c_str(), IN_CLOSE_WRITE | IN_MOVED_TO | IN_DELETE | IN_MOVED_FROM) < 0) {
            throw ManagerError(ErrorCode::StorageError, "inotify_add_watch failed on " + root.string() + ": " + errnoText(errno));
        }
        wakeFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        epollFd = ::epoll_create1(EPOLL_CLOEXEC);
        if (wakeFd < 0 || epollFd < 0) {
            throw ManagerError(ErrorCode::StorageError, "Cannot set up watch loop: " + errnoText(errno));
        }
        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = inotifyFd;
        ::epoll_ctl(epollFd, EPOLL_CTL_ADD, inotifyFd, &ev);
        ev.data.fd = wakeFd;
        ::epoll_ctl(epollFd, EPOLL_CTL_ADD, wakeFd, &ev);
        watchThread = std::thread([this]() { watchLoop(); });
        LOG_DEBUG("HostStorageAdapter: watching {}", root.string());
    }

    void watchLoop() {
        alignas(struct inotify_event) char buf[4096];
        while (!stopping.load()) {
            epoll_event events[2];
            int n = ::epoll_wait(epollFd, events, 2, -1);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("HostStorageAdapter: epoll_wait failed: {}", errnoText(errno));
                return;
            }
            if (stopping.load()) {
                return;
            }
            std::vector<std::string> touched;
            for (;;) {
                ssize_t len = ::read(inotifyFd, buf, sizeof(buf));
                if (len <= 0) {
                    break;
                }
                for (char* p = buf; p < buf + len;) {
                    auto* ie = reinterpret_cast<struct inotify_event*>(p);
                    if (ie->len > 0) {
                        touched.emplace_back(ie->name);
                    }
                    p += sizeof(struct inotify_event) + ie->len;
                }
            }
            for (const auto& name : touched) {
                deliver(name);
            }
        }
    }

    void deliver(const std::string& name) {
        std::shared_ptr<Hub> hub;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = hubs.find(name);
            if (it == hubs.end() || it->second->Size() == 0) {
                return;
            }
            hub = it->second;
        }
        std::optional<std::string> text;
        try {
            text = readFile(root / name);
        } catch (const ManagerError& e) {
            LOG_WARN("HostStorageAdapter: {}", e.what());
            return;
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto known = lastKnown.find(name);
            if (known != lastKnown.end() && known->second == text) {
                return;
            }
            lastKnown[name] = text;
        }
        if (!text.has_value()) {
            LOG_INFO("HostStorageAdapter: {} was removed", name);
            hub->Emit(std::optional<JSONValue>());
            return;
        }
        try {
            JSONValue doc = ParseJSON(*text);
            LOG_INFO("HostStorageAdapter: {} changed on disk", name);
            hub->Emit(std::optional<JSONValue>(std::move(doc)));
        } catch (const std::exception& e) {
            LOG_WARN("HostStorageAdapter: ignoring malformed {}: {}", name, e.what());
        }
    }
};

HostStorageAdapter::HostStorageAdapter(std::filesystem::path root)
    : pImpl(std::make_unique<Impl>(std::move(root))) {}

HostStorageAdapter::~HostStorageAdapter() = default;

const std::filesystem::path& HostStorageAdapter::Root() const {
    return pImpl->root;
}

std::optional<std::string> HostStorageAdapter::Read(const std::string& key) {
    validateName(key);
    return readFile(pImpl->stateDir / key);
}

void HostStorageAdapter::Write(const std::string& key, const std::string& value) {
    FUNC_SCOPE();
    validateName(key);
    ensureDirectory(pImpl->stateDir);
    atomicWrite(pImpl->stateDir / key, value);
}

void HostStorageAdapter::Delete(const std::string& key) {
    validateName(key);
    const auto path = pImpl->stateDir / key;
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        throw ManagerError(ErrorCode::StorageError, "Cannot delete " + path.string() + ": " + errnoText(errno));
    }
}

std::optional<JSONValue> HostStorageAdapter::ReadConfig(const std::string& name) {
    validateName(name);
    auto text = readFile(pImpl->root / name);
    if (!text.has_value()) {
        return std::nullopt;
    }
    try {
        return ParseJSON(*text);
    } catch (const std::exception& e) {
        throw ManagerError(ErrorCode::StorageError, "Malformed configuration " + name + ": " + e.what());
    }
}

void HostStorageAdapter::WriteConfig(const std::string& name, const JSONValue& document) {
    FUNC_SCOPE();
    validateName(name);
    ensureDirectory(pImpl->root);
    const std::string text = SerializeJSON(document);
    {
        // Recorded before the rename so the watcher recognises its own write.
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->lastKnown[name] = text;
    }
    atomicWrite(pImpl->root / name, text);
    LOG_DEBUG("HostStorageAdapter: wrote {} ({} bytes)", name, text.size());
}

events::Unsubscribe HostStorageAdapter::WatchConfig(const std::string& name, ConfigWatcher watcher) {
    validateName(name);
    std::shared_ptr<Impl::Hub> hub;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->startWatcherLocked();
        auto& slot = pImpl->hubs[name];
        if (!slot) {
            slot = std::make_shared<Impl::Hub>();
        }
        hub = slot;
        if (pImpl->lastKnown.find(name) == pImpl->lastKnown.end()) {
            pImpl->lastKnown[name] = readFile(pImpl->root / name);
        }
    }
    return hub->Subscribe(std::move(watcher));
}

} // namespace adapters
} // namespace mcpm

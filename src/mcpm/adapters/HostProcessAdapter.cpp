//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostProcessAdapter.cpp
// Purpose: fork/exec child processes with epoll-driven stdout/stderr readers and a waitpid monitor
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "mcpm/adapters/HostProcessAdapter.hpp"
#include "mcpm/errors/Errors.h"

extern char** environ;

namespace mcpm {
namespace adapters {

namespace {

std::once_flag sigpipeOnce;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void signalWake(int fd) {
    if (fd < 0) {
        return;
    }
    uint64_t one = 1;
    for (;;) {
        ssize_t w = ::write(fd, &one, sizeof(one));
        if (w >= 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("HostProcess: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
        break;
    }
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

//==========================================================================================================
// HostProcess
// Purpose: One forked child. Reader, writer and monitor threads each hold a strong reference, so the
//          object outlives the child and is destroyed by whichever thread finishes last.
//==========================================================================================================
class HostProcess : public ProcessEventSource, public std::enable_shared_from_this<HostProcess> {
public:
    HostProcess(std::string id, pid_t pid, int stdinFd, int stdoutFd, int stderrFd,
                std::chrono::milliseconds grace)
        : id(std::move(id)), pid(pid), stdinFd(stdinFd), stdoutFd(stdoutFd), stderrFd(stderrFd), grace(grace) {
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("HostProcess: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~HostProcess() override {
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(wakeEventFd);
    }

    void start() {
        auto self = shared_from_this();
        std::thread([self]() { self->readerLoop(); }).detach();
        std::thread([self]() { self->writerLoop(); }).detach();
        std::thread([self]() { self->monitorLoop(); }).detach();
    }

    const std::string& Id() const override { return id; }
    int Pid() const override { return static_cast<int>(pid); }
    bool IsRunning() const override { return running.load(); }

    bool Send(const std::string& line) override {
        if (!running.load()) {
            return false;
        }
        std::string chunk;
        chunk.reserve(line.size() + 1);
        chunk.append(line);
        chunk.push_back('\n');
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (writerStop) {
                return false;
            }
            if (queuedBytes + chunk.size() > HostProcessAdapter::WriteQueueMaxBytes) {
                LOG_ERROR("HostProcess[{}]: write queue overflow (queued={} add={} max={})",
                          id, queuedBytes, chunk.size(), HostProcessAdapter::WriteQueueMaxBytes);
                return false;
            }
            queuedBytes += chunk.size();
            writeQueue.emplace_back(std::move(chunk));
        }
        cvWrite.notify_one();
        return true;
    }

    void Kill() override {
        FUNC_SCOPE();
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            if (reaped || killRequested) {
                return;
            }
            killRequested = true;
            if (::killpg(pid, SIGTERM) != 0 && errno != ESRCH) {
                LOG_WARN("HostProcess[{}]: SIGTERM failed (errno={} msg={})", id, errno, ::strerror(errno));
            }
        }
        LOG_INFO("HostProcess[{}]: SIGTERM sent to process group {}", id, pid);
        auto self = shared_from_this();
        std::thread([self]() { self->escalate(); }).detach();
    }

    bool waitForExit(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(stateMutex);
        return cvState.wait_for(lk, timeout, [this]() { return reaped; });
    }

private:
    void escalate() {
        std::unique_lock<std::mutex> lk(stateMutex);
        if (cvState.wait_for(lk, grace, [this]() { return reaped; })) {
            return;
        }
        // Still under stateMutex: the monitor cannot reap (and free the pid) while we signal.
        LOG_WARN("HostProcess[{}]: grace period of {} ms elapsed; sending SIGKILL", id,
                 static_cast<long long>(grace.count()));
        if (::killpg(pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG_WARN("HostProcess[{}]: SIGKILL failed (errno={} msg={})", id, errno, ::strerror(errno));
        }
    }

    void drainLines(std::string& buffer, bool& discarding, bool isStdout) {
        std::size_t pos = 0;
        for (;;) {
            std::size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) {
                break;
            }
            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (discarding) {
                discarding = false;
                continue;
            }
            if (line.size() > HostProcessAdapter::MaxLineBytes) {
                LOG_WARN("HostProcess[{}]: dropping oversized line ({} bytes)", id, line.size());
                continue;
            }
            if (line.empty()) {
                continue;
            }
            if (isStdout) {
                emitMessage(line);
            } else {
                emitStderr(line);
            }
        }
        buffer.erase(0, pos);
        if (buffer.size() > HostProcessAdapter::MaxLineBytes) {
            LOG_WARN("HostProcess[{}]: line exceeds {} bytes; discarding until next newline", id,
                     HostProcessAdapter::MaxLineBytes);
            buffer.clear();
            discarding = true;
        }
    }

    void readerLoop() {
        setNonBlocking(stdoutFd);
        setNonBlocking(stderrFd);
        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("HostProcess[{}]: epoll_create1 failed (errno={} msg={})", id, errno, ::strerror(errno));
            markReaderDone();
            return;
        }
        for (int fd : {stdoutFd, stderrFd, wakeEventFd}) {
            if (fd < 0) continue;
            epoll_event ev{};
            ev.events = EPOLLIN | EPOLLRDHUP;
            ev.data.fd = fd;
            (void)::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &ev);
        }

        bool outOpen = true;
        bool errOpen = true;
        std::string outBuf;
        std::string errBuf;
        bool outDiscarding = false;
        bool errDiscarding = false;
        std::vector<char> tmp(64 * 1024);
        constexpr int waitTimeoutMs = 100;

        auto drainFd = [&](int fd, std::string& buf, bool& discarding, bool isStdout, bool& open) {
            for (;;) {
                ssize_t n = ::read(fd, tmp.data(), tmp.size());
                if (n > 0) {
                    buf.append(tmp.data(), static_cast<std::size_t>(n));
                    drainLines(buf, discarding, isStdout);
                    continue;
                }
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    return;
                }
                if (n < 0) {
                    LOG_WARN("HostProcess[{}]: read error (errno={} msg={})", id, errno, ::strerror(errno));
                }
                // EOF: flush a final unterminated line.
                if (!buf.empty() && !discarding) {
                    buf.push_back('\n');
                    drainLines(buf, discarding, isStdout);
                }
                buf.clear();
                (void)::epoll_ctl(ep, EPOLL_CTL_DEL, fd, nullptr);
                open = false;
                return;
            }
        };

        while ((outOpen || errOpen) && !stopReading.load()) {
            epoll_event events[3];
            int rc = ::epoll_wait(ep, events, 3, waitTimeoutMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("HostProcess[{}]: epoll_wait failed (errno={} msg={})", id, errno, ::strerror(errno));
                break;
            }
            for (int i = 0; i < rc; ++i) {
                const int fd = events[i].data.fd;
                if (fd == wakeEventFd) {
                    uint64_t v = 0;
                    ssize_t r;
                    do {
                        r = ::read(fd, &v, sizeof(v));
                    } while (r < 0 && errno == EINTR);
                } else if (fd == stdoutFd && outOpen) {
                    drainFd(stdoutFd, outBuf, outDiscarding, true, outOpen);
                } else if (fd == stderrFd && errOpen) {
                    drainFd(stderrFd, errBuf, errDiscarding, false, errOpen);
                }
            }
        }
        ::close(ep);
        markReaderDone();
    }

    void markReaderDone() {
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            readerDone = true;
        }
        cvState.notify_all();
    }

    void writerLoop() {
        for (;;) {
            std::string chunk;
            {
                std::unique_lock<std::mutex> lk(writeMutex);
                cvWrite.wait(lk, [this]() { return writerStop || !writeQueue.empty(); });
                if (writerStop) {
                    writeQueue.clear();
                    queuedBytes = 0;
                    break;
                }
                chunk = std::move(writeQueue.front());
                writeQueue.pop_front();
            }
            std::size_t total = 0;
            bool failed = false;
            while (total < chunk.size()) {
                ssize_t w = ::write(stdinFd, chunk.data() + total, chunk.size() - total);
                if (w > 0) {
                    total += static_cast<std::size_t>(w);
                } else if (w < 0 && errno == EINTR) {
                    continue;
                } else {
                    LOG_DEBUG("HostProcess[{}]: stdin write failed (errno={} msg={})", id, errno, ::strerror(errno));
                    failed = true;
                    break;
                }
            }
            {
                std::lock_guard<std::mutex> lk(writeMutex);
                queuedBytes = (queuedBytes >= chunk.size()) ? queuedBytes - chunk.size() : 0;
                if (failed) {
                    writerStop = true;
                }
            }
            if (failed) {
                break;
            }
        }
    }

    void monitorLoop() {
        siginfo_t info{};
        bool waited = false;
        for (;;) {
            // WNOWAIT leaves the child a zombie so its pid (and process group id) stay reserved.
            if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) == 0) {
                waited = true;
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("HostProcess[{}]: waitid failed (errno={} msg={})", id, errno, ::strerror(errno));
            break;
        }

        {
            // Let the reader drain what the child wrote before it died.
            std::unique_lock<std::mutex> lk(stateMutex);
            cvState.wait_for(lk, std::chrono::milliseconds(250), [this]() { return readerDone; });
        }
        stopReading.store(true);
        signalWake(wakeEventFd);

        ProcessExit exit;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            int status = 0;
            pid_t r = -1;
            if (waited) {
                do {
                    r = ::waitpid(pid, &status, 0);
                } while (r < 0 && errno == EINTR);
            }
            if (r == pid) {
                if (WIFEXITED(status)) {
                    exit.exitCode = WEXITSTATUS(status);
                } else if (WIFSIGNALED(status)) {
                    exit.signal = WTERMSIG(status);
                }
            }
            exit.killed = killRequested;
            reaped = true;
            running.store(false);
        }
        cvState.notify_all();
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            writerStop = true;
        }
        cvWrite.notify_all();

        if (exit.exitCode.has_value()) {
            LOG_INFO("HostProcess[{}]: pid {} exited with code {}", id, pid, *exit.exitCode);
        } else if (exit.signal.has_value()) {
            LOG_INFO("HostProcess[{}]: pid {} terminated by signal {}", id, pid, *exit.signal);
        } else {
            LOG_WARN("HostProcess[{}]: pid {} exit status unavailable", id, pid);
        }
        emitExit(exit);
    }

    const std::string id;
    const pid_t pid;
    int stdinFd;
    int stdoutFd;
    int stderrFd;
    int wakeEventFd{-1};
    const std::chrono::milliseconds grace;

    std::atomic<bool> running{true};
    std::atomic<bool> stopReading{false};

    std::mutex stateMutex;          // guards reaped, readerDone, killRequested
    std::condition_variable cvState;
    bool reaped{false};
    bool readerDone{false};
    bool killRequested{false};

    std::mutex writeMutex;          // guards writeQueue, queuedBytes, writerStop
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    bool writerStop{false};
};

struct PipeSet {
    int in[2]{-1, -1};
    int out[2]{-1, -1};
    int err[2]{-1, -1};
    int exec[2]{-1, -1};

    void closeAll() {
        for (int* p : {in, out, err, exec}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    }
};

} // namespace

HostProcessAdapter::HostProcessAdapter(std::chrono::milliseconds shutdownGrace)
    : shutdownGrace(shutdownGrace) {
    // A child that dies with unread input must not take the host down with SIGPIPE.
    std::call_once(sigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });
}

HostProcessAdapter::~HostProcessAdapter() {
    FUNC_SCOPE();
    auto procs = trackedProcesses();
    for (const auto& p : procs) {
        p->Kill();
    }
    for (const auto& p : procs) {
        if (auto host = std::dynamic_pointer_cast<HostProcess>(p)) {
            if (!host->waitForExit(shutdownGrace + std::chrono::seconds(2))) {
                LOG_WARN("HostProcessAdapter: process {} did not exit during shutdown", host->Id());
            }
        }
    }
    detachAll();
}

std::shared_ptr<IProcess> HostProcessAdapter::doSpawn(const std::string& id, const ProcessSpec& spec) {
    FUNC_SCOPE();
    using errors::ErrorCode;
    using errors::ManagerError;

    if (spec.command.empty()) {
        throw ManagerError(ErrorCode::ProcessStartFailed, "No command configured", id);
    }

    // Everything the child needs is built before fork(); the child only makes async-signal-safe calls.
    std::vector<std::string> argvStore;
    argvStore.reserve(spec.args.size() + 1);
    argvStore.push_back(spec.command);
    argvStore.insert(argvStore.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& s : argvStore) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [k, v] : spec.env) {
        merged[k] = v;
    }
    std::vector<std::string> envStore;
    envStore.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        envStore.push_back(k + "=" + v);
    }
    std::vector<char*> envp;
    for (auto& s : envStore) {
        envp.push_back(s.data());
    }
    envp.push_back(nullptr);

    struct sigaction dfl{};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    const char* cwd = spec.cwd.empty() ? nullptr : spec.cwd.c_str();

    PipeSet pipes;
    for (int* p : {pipes.in, pipes.out, pipes.err, pipes.exec}) {
        if (::pipe2(p, O_CLOEXEC) != 0) {
            const int e = errno;
            pipes.closeAll();
            throw ManagerError(ErrorCode::ProcessStartFailed,
                               std::format("pipe2 failed: {}", ::strerror(e)), id);
        }
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        pipes.closeAll();
        throw ManagerError(ErrorCode::ProcessStartFailed, std::format("fork failed: {}", ::strerror(e)), id);
    }

    if (pid == 0) {
        ::setsid();
        ::dup2(pipes.in[0], STDIN_FILENO);
        ::dup2(pipes.out[1], STDOUT_FILENO);
        ::dup2(pipes.err[1], STDERR_FILENO);
        ::sigaction(SIGPIPE, &dfl, nullptr);
        if (cwd != nullptr && ::chdir(cwd) != 0) {
            int e = errno;
            ssize_t ignored = ::write(pipes.exec[1], &e, sizeof(e));
            (void)ignored;
            ::_exit(127);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        int e = errno;
        ssize_t ignored = ::write(pipes.exec[1], &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(pipes.in[0]);
    closeFd(pipes.out[1]);
    closeFd(pipes.err[1]);
    closeFd(pipes.exec[1]);

    int childErrno = 0;
    ssize_t r;
    do {
        r = ::read(pipes.exec[0], &childErrno, sizeof(childErrno));
    } while (r < 0 && errno == EINTR);
    closeFd(pipes.exec[0]);

    if (r > 0) {
        int status = 0;
        pid_t w;
        do {
            w = ::waitpid(pid, &status, 0);
        } while (w < 0 && errno == EINTR);
        pipes.closeAll();
        LOG_ERROR("HostProcessAdapter: failed to launch '{}' for {}: {}", spec.command, id, ::strerror(childErrno));
        throw ManagerError(ErrorCode::ProcessStartFailed,
                           std::format("Failed to start '{}': {}", spec.command, ::strerror(childErrno)), id);
    }

    auto proc = std::make_shared<HostProcess>(id, pid, pipes.in[1], pipes.out[0], pipes.err[0], shutdownGrace);
    pipes.in[1] = -1;
    pipes.out[0] = -1;
    pipes.err[0] = -1;
    proc->start();
    return proc;
}

} // namespace adapters
} // namespace mcpm

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessSupervisor.cpp
// Purpose: fork/exec with piped stdio, exit polling and graceful-then-forced termination
//==========================================================================================================

#include "mcphub/ProcessSupervisor.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "logging/Logger.h"
#include "mcphub/errors/Errors.h"

extern char** environ;

namespace mcphub {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Only async-signal-safe calls are allowed between fork and exec.
[[noreturn]] void childFail(int statusFd, int err) {
    ssize_t w;
    do {
        w = ::write(statusFd, &err, sizeof(err));
    } while (w < 0 && errno == EINTR);
    ::_exit(127);
}

void moveToStdFd(int fd, int target, int statusFd) {
    if (fd == target) {
        int flags = ::fcntl(fd, F_GETFD);
        if (flags < 0 || ::fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) < 0) {
            childFail(statusFd, errno);
        }
        return;
    }
    if (::dup2(fd, target) < 0) {
        childFail(statusFd, errno);
    }
}

std::vector<std::string> mergedEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [k, v] : overrides) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}

ExitStatus decodeWaitStatus(int status) {
    ExitStatus s;
    if (WIFEXITED(status)) {
        s.exited = true;
        s.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        s.signal = WTERMSIG(status);
    }
    return s;
}

std::once_flag sigpipeOnce;

} // namespace

std::string ExitStatus::describe() const {
    if (exited) {
        return fmt::format("exited with code {}", code);
    }
    if (signal != 0) {
        return fmt::format("killed by signal {} ({})", signal, ::strsignal(signal));
    }
    return "still running";
}

class ProcessSupervisor::Impl {
public:
    std::string label;
    mutable std::mutex mutex;
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    std::optional<ExitStatus> exitStatus;

    explicit Impl(std::string l) : label(std::move(l)) {}

    ~Impl() {
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
    }

    // Caller holds the lock.
    std::optional<ExitStatus> reapLocked(bool block) {
        if (exitStatus.has_value() || pid <= 0) {
            return exitStatus;
        }
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &status, block ? 0 : WNOHANG);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            exitStatus = decodeWaitStatus(status);
            LOG_INFO("[{}] process {} {}", label, static_cast<int>(pid), exitStatus->describe());
        } else if (r < 0) {
            // ECHILD: reaped elsewhere; treat as gone
            LOG_WARN("[{}] waitpid failed (errno={} msg={})", label, errno, ::strerror(errno));
            exitStatus = ExitStatus{};
        }
        return exitStatus;
    }
};

ProcessSupervisor::ProcessSupervisor(std::string label) : pImpl(std::make_unique<Impl>(std::move(label))) {}

ProcessSupervisor::~ProcessSupervisor() {
    if (pImpl->pid > 0) {
        Terminate(std::chrono::milliseconds(500));
    }
}

void ProcessSupervisor::Spawn(const ProcessSpec& spec) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->pid > 0) {
        throw std::logic_error("ProcessSupervisor: process already spawned");
    }
    const std::string& label = pImpl->label;
    auto spawnError = [&](const std::string& what, int err) {
        return errors::McpException(JSONRPCErrorCodes::SpawnFailed,
                                    fmt::format("Failed to spawn '{}' for [{}]: {}: {}", spec.command, label, what, ::strerror(err)));
    };
    if (spec.command.empty()) {
        throw errors::McpException(JSONRPCErrorCodes::SpawnFailed,
                                   fmt::format("Failed to spawn [{}]: empty command", label));
    }

    // The parent must survive writes to a child that has already exited
    std::call_once(sigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });

    int inPipe[2]{-1, -1};
    int outPipe[2]{-1, -1};
    int errPipe[2]{-1, -1};
    int statusPipe[2]{-1, -1};
    int* allPipes[] = {inPipe, outPipe, errPipe, statusPipe};
    auto closeAll = [&]() {
        for (int* p : allPipes) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };
    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeAll();
        throw spawnError("pipe2", err);
    }

    // Everything the child needs is built before fork
    std::vector<std::string> argStorage;
    argStorage.reserve(spec.args.size() + 1);
    argStorage.push_back(spec.command);
    argStorage.insert(argStorage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argStorage) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    std::vector<std::string> envStorage = mergedEnvironment(spec.env);
    std::vector<char*> envp;
    for (auto& e : envStorage) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);
    const char* cwd = spec.workingDirectory.has_value() ? spec.workingDirectory->c_str() : nullptr;

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeAll();
        throw spawnError("fork", err);
    }
    if (pid == 0) {
        // Child
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        moveToStdFd(inPipe[0], STDIN_FILENO, statusPipe[1]);
        moveToStdFd(outPipe[1], STDOUT_FILENO, statusPipe[1]);
        moveToStdFd(errPipe[1], STDERR_FILENO, statusPipe[1]);
        if (cwd != nullptr && ::chdir(cwd) != 0) {
            childFail(statusPipe[1], errno);
        }
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        childFail(statusPipe[1], errno);
    }

    // Parent
    (void)::setpgid(pid, pid);
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n > 0) {
        // exec (or chdir/dup2) failed in the child; reap it and report
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        LOG_ERROR("[{}] spawn of '{}' failed: {}", label, spec.command, ::strerror(childErr));
        throw spawnError("exec", childErr);
    }

    setNonBlocking(inPipe[1]);
    setNonBlocking(outPipe[0]);
    setNonBlocking(errPipe[0]);
    pImpl->pid = pid;
    pImpl->stdinFd = inPipe[1];
    pImpl->stdoutFd = outPipe[0];
    pImpl->stderrFd = errPipe[0];
    pImpl->exitStatus.reset();
    LOG_INFO("[{}] spawned pid {}: {} ({} arg(s))", label, static_cast<int>(pid), spec.command, spec.args.size());
}

pid_t ProcessSupervisor::Pid() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pid;
}

int ProcessSupervisor::StdinFd() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stdinFd;
}

int ProcessSupervisor::StdoutFd() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stdoutFd;
}

int ProcessSupervisor::StderrFd() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stderrFd;
}

void ProcessSupervisor::CloseStdin() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    closeFd(pImpl->stdinFd);
}

std::optional<ExitStatus> ProcessSupervisor::PollExit() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->reapLocked(false);
}

bool ProcessSupervisor::IsRunning() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pid > 0 && !pImpl->reapLocked(false).has_value();
}

ExitStatus ProcessSupervisor::Terminate(std::chrono::milliseconds grace) {
    FUNC_SCOPE();
    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        closeFd(pImpl->stdinFd);
        if (pImpl->pid <= 0) {
            return pImpl->exitStatus.value_or(ExitStatus{});
        }
        if (pImpl->reapLocked(false).has_value()) {
            return pImpl->exitStatus.value();
        }
        pid = pImpl->pid;
        // The unreaped child keeps its pid, so the group id cannot have been recycled
        if (::kill(-pid, SIGTERM) != 0) {
            (void)::kill(pid, SIGTERM);
        }
    }
    LOG_DEBUG("[{}] sent SIGTERM to process group {}", pImpl->label, static_cast<int>(pid));

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (PollExit().has_value()) {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            return pImpl->exitStatus.value();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->reapLocked(false).has_value()) {
        LOG_WARN("[{}] process {} ignored SIGTERM for {} ms; sending SIGKILL", pImpl->label, static_cast<int>(pid),
                 static_cast<long long>(grace.count()));
        if (::kill(-pid, SIGKILL) != 0) {
            (void)::kill(pid, SIGKILL);
        }
        pImpl->reapLocked(true);
    }
    return pImpl->exitStatus.value_or(ExitStatus{});
}

} // namespace mcphub

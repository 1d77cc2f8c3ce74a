//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessSupervisor.h
// Purpose: Spawns one tool server process with piped stdio and controls its termination (POSIX)
//==========================================================================================================
#pragma once

#include <sys/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {

//==========================================================================================================
// ProcessSpec
// Purpose: What to run. env entries are layered over the parent environment and win on conflict.
//==========================================================================================================
struct ProcessSpec {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> workingDirectory;
};

//==========================================================================================================
// ExitStatus
// Purpose: How the child ended. code is valid when exited is true, signal when it is non-zero.
//==========================================================================================================
struct ExitStatus {
    bool exited{false};
    int code{-1};
    int signal{0};

    std::string describe() const;
};

//==========================================================================================================
// ProcessSupervisor
// Purpose: Owns one child process and the parent ends of its stdin/stdout/stderr pipes.
// Notes:
//   - The child runs in its own process group so termination reaches helper processes (npx, uvx).
//   - Parent pipe ends are close-on-exec and non-blocking.
//   - Exec failures are detected synchronously and reported by Spawn().
//   - stdout/stderr descriptors stay open until destruction so a reader thread never sees them
//     recycled underneath it.
//==========================================================================================================
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(std::string label = "");
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    //======================================================================================================
    // Spawn
    // Purpose: fork/exec the command with piped stdio.
    // Throws:
    //   errors::McpException with category SpawnFailure when pipes cannot be created, fork fails,
    //   the working directory is unusable or exec fails; std::logic_error when already spawned.
    //======================================================================================================
    void Spawn(const ProcessSpec& spec);

    pid_t Pid() const;
    int StdinFd() const;
    int StdoutFd() const;
    int StderrFd() const;

    // Closes the parent's write end of the child's stdin (the child then sees EOF).
    void CloseStdin();

    //======================================================================================================
    // PollExit
    // Purpose: Non-blocking reap. Returns the exit status once the child has ended.
    //======================================================================================================
    std::optional<ExitStatus> PollExit();

    bool IsRunning();

    //======================================================================================================
    // Terminate
    // Purpose: Closes stdin, sends SIGTERM to the process group, waits up to grace, then SIGKILL and reap.
    // Returns:
    //   The final exit status. Safe to call repeatedly and from several threads.
    //======================================================================================================
    ExitStatus Terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphub

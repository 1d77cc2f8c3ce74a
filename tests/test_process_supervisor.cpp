//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_supervisor.cpp
// Purpose: Tests for child process spawn, environment merge, exit detection and termination escalation
//==========================================================================================================

#include <gtest/gtest.h>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

#include "mcphub/ProcessSupervisor.h"
#include "mcphub/errors/Errors.h"

using namespace mcphub;
using namespace std::chrono_literals;

namespace {

// Reads a non-blocking fd until EOF or timeout.
std::string readAll(int fd, std::chrono::milliseconds timeout = 3000ms) {
    std::string out;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{fd, POLLIN, 0};
        int r = ::poll(&pfd, 1, 50);
        if (r <= 0) {
            continue;
        }
        char buf[512];
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        }
    }
    return out;
}

std::optional<ExitStatus> waitExit(ProcessSupervisor& sup, std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto st = sup.PollExit()) {
            return st;
        }
        std::this_thread::sleep_for(10ms);
    }
    return std::nullopt;
}

ProcessSpec shell(const std::string& script) {
    ProcessSpec spec;
    spec.command = "/bin/sh";
    spec.args = {"-c", script};
    return spec;
}

} // namespace

TEST(ProcessSupervisor, MissingExecutableIsSpawnFailure) {
    ProcessSupervisor sup("missing");
    ProcessSpec spec;
    spec.command = "/nonexistent/definitely-not-here";
    try {
        sup.Spawn(spec);
        FAIL() << "expected spawn failure";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::SpawnFailure);
        EXPECT_NE(std::string(e.what()).find("definitely-not-here"), std::string::npos);
    }
    EXPECT_LE(sup.Pid(), 0);
    EXPECT_FALSE(sup.IsRunning());
}

TEST(ProcessSupervisor, EmptyCommandAndBadWorkingDirectoryFail) {
    ProcessSupervisor a("empty");
    EXPECT_THROW(a.Spawn(ProcessSpec{}), errors::McpException);

    ProcessSupervisor b("cwd");
    ProcessSpec spec = shell("true");
    spec.workingDirectory = "/nonexistent/dir/for/mcphub";
    EXPECT_THROW(b.Spawn(spec), errors::McpException);
}

TEST(ProcessSupervisor, SpawnTwiceIsLogicError) {
    ProcessSupervisor sup("twice");
    sup.Spawn(shell("sleep 5"));
    EXPECT_THROW(sup.Spawn(shell("true")), std::logic_error);
    sup.Terminate(1000ms);
}

TEST(ProcessSupervisor, EnvironmentOverridesAreLayeredOverParent) {
    ::setenv("MCPHUB_TEST_INHERITED", "parent", 1);
    ::setenv("MCPHUB_TEST_OVERRIDDEN", "parent", 1);
    ProcessSupervisor sup("env");
    ProcessSpec spec = shell("printf '%s|%s|%s' \"$MCPHUB_TEST_INHERITED\" \"$MCPHUB_TEST_OVERRIDDEN\" \"$MCPHUB_TEST_NEW\"");
    spec.env["MCPHUB_TEST_OVERRIDDEN"] = "child";
    spec.env["MCPHUB_TEST_NEW"] = "fresh";
    sup.Spawn(spec);
    EXPECT_EQ(readAll(sup.StdoutFd()), "parent|child|fresh");
    auto st = waitExit(sup);
    ASSERT_TRUE(st.has_value());
    EXPECT_TRUE(st->exited);
    EXPECT_EQ(st->code, 0);
}

TEST(ProcessSupervisor, WorkingDirectoryIsApplied) {
    ProcessSupervisor sup("cwd");
    ProcessSpec spec = shell("pwd");
    spec.workingDirectory = "/";
    sup.Spawn(spec);
    EXPECT_EQ(readAll(sup.StdoutFd()), "/\n");
}

TEST(ProcessSupervisor, StderrIsSeparateChannel) {
    ProcessSupervisor sup("stderr");
    sup.Spawn(shell("echo out; echo oops 1>&2"));
    EXPECT_EQ(readAll(sup.StdoutFd()), "out\n");
    EXPECT_EQ(readAll(sup.StderrFd()), "oops\n");
}

TEST(ProcessSupervisor, ExitCodeIsReported) {
    ProcessSupervisor sup("exit");
    sup.Spawn(shell("exit 7"));
    auto st = waitExit(sup);
    ASSERT_TRUE(st.has_value());
    EXPECT_TRUE(st->exited);
    EXPECT_EQ(st->code, 7);
    EXPECT_EQ(st->describe(), "exited with code 7");
    EXPECT_FALSE(sup.IsRunning());
}

TEST(ProcessSupervisor, CloseStdinDeliversEof) {
    ProcessSupervisor sup("cat");
    ProcessSpec spec;
    spec.command = "cat";
    sup.Spawn(spec);
    EXPECT_TRUE(sup.IsRunning());
    sup.CloseStdin();
    EXPECT_EQ(sup.StdinFd(), -1);
    auto st = waitExit(sup);
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->code, 0);
}

TEST(ProcessSupervisor, TerminateUsesSigtermFirst) {
    ProcessSupervisor sup("sleep");
    sup.Spawn(shell("exec sleep 30"));
    ASSERT_TRUE(sup.IsRunning());
    const auto start = std::chrono::steady_clock::now();
    ExitStatus st = sup.Terminate(2000ms);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);
    EXPECT_FALSE(st.exited);
    EXPECT_EQ(st.signal, SIGTERM);
    EXPECT_FALSE(sup.IsRunning());
}

TEST(ProcessSupervisor, TerminateEscalatesToSigkill) {
    ProcessSupervisor sup("stubborn");
    sup.Spawn(shell("trap '' TERM; while true; do sleep 1; done"));
    std::this_thread::sleep_for(100ms);
    ExitStatus st = sup.Terminate(200ms);
    EXPECT_FALSE(st.exited);
    EXPECT_EQ(st.signal, SIGKILL);
    // Repeated calls return the cached status.
    EXPECT_EQ(sup.Terminate(200ms).signal, SIGKILL);
}

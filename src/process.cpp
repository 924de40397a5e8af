//
// Copyright (c) 2024-present, The upserve authors
//
// This file is part of upserve.
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//
#include <upserve/process.h>

#include <potassco/error.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>
#include <utility>

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Upserve {
namespace {
using Clock = std::chrono::steady_clock;

struct Pipe {
    Pipe() {
        POTASSCO_CHECK(::pipe2(fd, O_CLOEXEC) == 0, static_cast<std::errc>(errno), "could not create pipe");
    }
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    Pipe(const Pipe&)            = delete;
    Pipe& operator=(const Pipe&) = delete;
    void  closeRead() { closeFd(fd[0]); }
    void  closeWrite() { closeFd(fd[1]); }
    int   release() { return std::exchange(fd[0], -1); }
    static void closeFd(int& f) {
        if (f >= 0) {
            ::close(f);
            f = -1;
        }
    }
    int fd[2] = {-1, -1};
};

// Only async-signal-safe functions are allowed in the child.
[[noreturn]] void childFail(int errFd) {
    int err = errno;
    while (::write(errFd, &err, sizeof(err)) < 0 && errno == EINTR) {}
    ::_exit(127);
}

bool needsQuotes(const std::string& arg) {
    return arg.empty() || arg.find_first_of(" \t\n\"'\\") != std::string::npos;
}
} // namespace

std::string ProcessResult::describe() const {
    switch (status) {
        case status_exited       : return "exited with code " + std::to_string(code);
        case status_signaled     : return "killed by signal " + std::to_string(code);
        case status_launch_failed: return std::string("could not be started: ") + std::strerror(code);
        case status_lost         : return std::string("could not be waited for: ") + std::strerror(code);
        default                  : return "timed out";
    }
}
/////////////////////////////////////////////////////////////////////////////////////////
// Process
/////////////////////////////////////////////////////////////////////////////////////////
Process::Process() : pid_(-1), out_(-1) {}
Process::~Process() { terminate(); }

int Process::start(const std::vector<std::string>& argv, const ProcessOptions& opts) {
    POTASSCO_CHECK_PRE(not running(), "process already started");
    POTASSCO_CHECK_PRE(not argv.empty(), "empty command");
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) { args.push_back(const_cast<char*>(a.c_str())); }
    args.push_back(nullptr);

    Pipe err;
    Pipe out;
    if (not opts.captureOutput) {
        out.closeRead();
        out.closeWrite();
    }
    // Children of a process that ignores SIGCHLD are reaped by the system and can't be waited for.
    struct sigaction sa{};
    if (::sigaction(SIGCHLD, nullptr, &sa) == 0 && (sa.sa_handler == SIG_IGN || (sa.sa_flags & SA_NOCLDWAIT) != 0)) {
        ::signal(SIGCHLD, SIG_DFL);
    }
    pid_t pid = ::fork();
    if (pid < 0) {
        return errno;
    }
    if (pid == 0) {
        if (not opts.cwd.empty() && ::chdir(opts.cwd.c_str()) != 0) {
            childFail(err.fd[1]);
        }
        if (out.fd[1] >= 0 && ::dup2(out.fd[1], STDOUT_FILENO) < 0) {
            childFail(err.fd[1]);
        }
        ::execvp(args[0], args.data());
        childFail(err.fd[1]);
    }
    err.closeWrite();
    out.closeWrite();
    pid_ = pid;
    out_ = out.release();
    // The error pipe is closed on successful exec, so EOF means the child is running.
    int     code = 0;
    ssize_t n;
    while ((n = ::read(err.fd[0], &code, sizeof(code))) < 0 && errno == EINTR) {}
    if (n == static_cast<ssize_t>(sizeof(code))) {
        int status;
        int err;
        reap(status, err, true);
        closeOutput();
        return code != 0 ? code : ECHILD;
    }
    return 0;
}

bool Process::reap(int& status, int& err, bool block) {
    for (;;) {
        pid_t r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
        err     = r < 0 ? errno : 0;
        if (r == pid_ || (r < 0 && err != EINTR)) {
            pid_ = -1;
            return true;
        }
        if (r == 0) {
            return false;
        }
    }
}

void Process::closeOutput() { Pipe::closeFd(out_); }

ProcessResult Process::finish(double timeout) {
    POTASSCO_CHECK_PRE(running(), "process not started");
    using Seconds = std::chrono::duration<double>;
    ProcessResult res;
    auto          hasLimit    = timeout > 0.0;
    auto          deadline    = Clock::now() + std::chrono::duration_cast<Clock::duration>(Seconds(timeout));
    auto          expired     = [&]() { return hasLimit && Clock::now() >= deadline; };
    auto          remainingMs = [&]() {
        if (not hasLimit) {
            return -1;
        }
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        return static_cast<int>(std::max<decltype(ms)>(ms, 0) + 1);
    };
    char buffer[4096];
    while (out_ >= 0 && not expired()) {
        pollfd p{out_, POLLIN, 0};
        int    r = ::poll(&p, 1, remainingMs());
        if (r < 0 && errno != EINTR) {
            break;
        }
        if (r <= 0) {
            continue;
        }
        ssize_t n = ::read(out_, buffer, sizeof(buffer));
        if (n > 0) {
            res.output.append(buffer, static_cast<std::size_t>(n));
        }
        else if (n == 0 || errno != EINTR) {
            closeOutput();
        }
    }
    int status = 0;
    int err    = 0;
    for (;;) {
        if (reap(status, err, not hasLimit)) {
            break;
        }
        if (expired()) {
            terminate();
            res.status = ProcessResult::status_timeout;
            res.code   = 0;
            return res;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    closeOutput();
    if (err != 0) {
        res.status = ProcessResult::status_lost;
        res.code   = err;
    }
    else if (WIFSIGNALED(status)) {
        res.status = ProcessResult::status_signaled;
        res.code   = WTERMSIG(status);
    }
    else {
        res.status = ProcessResult::status_exited;
        res.code   = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
    }
    return res;
}

void Process::terminate() {
    if (running()) {
        ::kill(pid_, SIGKILL);
        int status;
        int err;
        reap(status, err, true);
    }
    closeOutput();
}
/////////////////////////////////////////////////////////////////////////////////////////
// free functions
/////////////////////////////////////////////////////////////////////////////////////////
ProcessResult runCommand(const std::vector<std::string>& argv, const ProcessOptions& opts) {
    Process proc;
    if (int err = proc.start(argv, opts); err != 0) {
        ProcessResult res;
        res.status = ProcessResult::status_launch_failed;
        res.code   = err;
        return res;
    }
    return proc.finish(opts.timeout);
}

std::vector<std::string> splitCommand(std::string_view cmd) {
    std::vector<std::string> args;
    std::string              arg;
    bool                     inArg = false;
    char                     quote = 0;
    for (std::size_t i = 0; i != cmd.size(); ++i) {
        char c = cmd[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
            else if (c == '\\' && quote == '"' && i + 1 != cmd.size()) {
                arg += cmd[++i];
            }
            else {
                arg += c;
            }
        }
        else if (c == ' ' || c == '\t' || c == '\n') {
            if (inArg) {
                args.push_back(std::move(arg));
                arg.clear();
                inArg = false;
            }
        }
        else {
            inArg = true;
            if (c == '"' || c == '\'') {
                quote = c;
            }
            else if (c == '\\' && i + 1 != cmd.size()) {
                arg += cmd[++i];
            }
            else {
                arg += c;
            }
        }
    }
    POTASSCO_CHECK(quote == 0, std::errc::invalid_argument, "unterminated quote in command '%.*s'",
                   static_cast<int>(cmd.size()), cmd.data());
    if (inArg) {
        args.push_back(std::move(arg));
    }
    return args;
}

std::string joinCommand(const std::vector<std::string>& argv) {
    std::string res;
    for (const auto& a : argv) {
        if (not res.empty()) {
            res += ' ';
        }
        if (not needsQuotes(a)) {
            res += a;
            continue;
        }
        res += '\'';
        for (char c : a) {
            if (c == '\'') {
                res += "'\\''";
            }
            else {
                res += c;
            }
        }
        res += '\'';
    }
    return res;
}

} // namespace Upserve

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
#pragma once

#include <upserve/config.h>

#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

/*!
 * \file
 * \brief Process transport used to run external solvers and endpoints.
 */
namespace Upserve {

//! Options for running a child process.
struct ProcessOptions {
    std::string cwd;                 //!< Working directory of the child or empty to inherit.
    double      timeout{0.0};        //!< Time limit in seconds or 0 for no limit.
    bool        captureOutput{true}; //!< Whether to capture the child's stdout.
};

//! Result of running a child process.
/*!
 * A process that could not be started is never confused with a process that
 * exited with a non-zero status.
 */
struct ProcessResult {
    enum Status {
        status_exited        = 0, //!< Process terminated normally; code is its exit status.
        status_signaled      = 1, //!< Process was terminated by signal code.
        status_launch_failed = 2, //!< Process could not be started; code is the errno value.
        status_timeout       = 3, //!< Process was killed because the time limit expired.
        status_lost          = 4, //!< Process could not be waited for; code is the errno value.
    };
    [[nodiscard]] bool        success() const { return status == status_exited && code == 0; }
    [[nodiscard]] std::string describe() const;

    Status      status{status_launch_failed};
    int         code{0};
    std::string output; //!< Captured stdout.
};

//! A child process that is killed and reaped when its owner goes away.
class Process {
public:
    Process();
    ~Process();
    Process(const Process&)            = delete;
    Process& operator=(const Process&) = delete;

    //! Starts argv[0] with the given arguments.
    /*!
     * \return 0 if the process was started or the errno value of the failed launch.
     * \pre not running()
     * \note If SIGCHLD is ignored, its disposition is reset to SIG_DFL so that the child can be waited for.
     */
    [[nodiscard]] int start(const std::vector<std::string>& argv, const ProcessOptions& opts);
    //! Collects output and waits for termination, killing the process if timeout (in seconds) expires.
    ProcessResult finish(double timeout);
    //! Kills and reaps the process if it is running.
    void terminate();

    [[nodiscard]] bool  running() const { return pid_ > 0; }
    [[nodiscard]] pid_t pid() const { return pid_; }

private:
    void closeOutput();
    // Returns false if the process is still running; err is the errno of a failed wait or 0.
    bool reap(int& status, int& err, bool block);

    pid_t pid_;
    int   out_;
};

//! Runs argv and waits for its termination.
ProcessResult runCommand(const std::vector<std::string>& argv, const ProcessOptions& opts = {});

//! Splits cmd into arguments at unquoted whitespace.
/*!
 * Single and double quotes group words; a backslash escapes the next character.
 * \throw std::invalid_argument on an unterminated quote.
 */
std::vector<std::string> splitCommand(std::string_view cmd);
//! Joins arguments into a single command line quoting arguments that need it.
std::string joinCommand(const std::vector<std::string>& argv);

} // namespace Upserve

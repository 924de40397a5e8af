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

#include <upserve/events.h>
#include <upserve/process.h>

#include <string>
#include <vector>

/*!
 * \file
 * \brief Runs a solver endpoint over a corpus of problems.
 */
namespace Upserve {
/*!
 * \defgroup harness Harness
 * \brief End-to-end validation of solver endpoints.
 * @{
 */

//! Configuration of a validation run.
struct HarnessOptions {
    using StringSeq = std::vector<std::string>;

    //! Returns the reference corpus.
    static const StringSeq& defaultInstances();

    //! Returns the file of the given instance, i.e. problemsDir/name.extension.
    [[nodiscard]] std::string problemFile(const std::string& name) const;

    std::string executable;                                          //!< Endpoint to validate or empty to build one.
    std::string buildCommand{"cmake --build build --target upserve"}; //!< Command used if executable is empty.
    std::string buildOutput{"build/upserve"};                       //!< Executable produced by buildCommand.
    std::string address{"0.0.0.0:2222"};                            //!< Value passed via --address.
    std::string problemsDir{"./planning/ext/up/bins/problems"};
    std::string extension{"bin"};
    StringSeq   instances{defaultInstances()}; //!< Instances to run in order.
    double      timeout{0.0};                  //!< Time limit per instance in seconds or 0 for no limit.
};

//! Event emitted while a validation run progresses.
struct HarnessEvent : Event {
    enum Op { op_build = 'B', op_instance = 'I', op_command = 'C', op_output = 'O', op_failure = 'F' };
    HarnessEvent(Op o, const std::string& what, Verbosity v = verbosity_quiet)
        : Event(this, subsystem_harness, v)
        , text(what.c_str()) {
        op = static_cast<uint32_t>(o);
    }
    const char* text;
};

//! Summary of a validation run.
struct HarnessReport {
    [[nodiscard]] bool ok() const { return not buildFailed && failed.empty(); }
    //! Returns 0 if all instances were solved and 1 otherwise.
    [[nodiscard]] int exitCode() const { return ok() ? 0 : 1; }

    uint32_t      attempted{0};       //!< Number of instances started.
    uint32_t      solved{0};          //!< Number of instances solved successfully.
    bool          buildFailed{false}; //!< Whether the build step failed.
    std::string   failed;             //!< Name of the first failing instance.
    std::string   command;            //!< Command line of the failing step.
    ProcessResult result;             //!< Result of the failing step including the endpoint's output.
    std::string   message;
};

//! Runs an endpoint once per instance and stops at the first failure.
/*!
 * Instances are processed strictly sequentially. Each run invokes
 * `<exe> --address <address> --file-path <problem file>` and is considered
 * successful if the endpoint exits with code 0. The output of an endpoint is
 * captured and only reported for the failing instance.
 */
class ValidationHarness {
public:
    //! \throw std::invalid_argument if neither an executable nor a build command is given.
    explicit ValidationHarness(HarnessOptions opts, EventHandler* handler = nullptr);

    HarnessReport run();

    //! Returns the command line used to run the given instance with exe.
    [[nodiscard]] std::vector<std::string> commandFor(const std::string& exe, const std::string& instance) const;
    [[nodiscard]] const HarnessOptions&    options() const { return opts_; }

private:
    bool build(HarnessReport& rep);
    void report(HarnessEvent::Op op, const std::string& text) const;

    HarnessOptions opts_;
    EventHandler*  handler_;
};
//@}
} // namespace Upserve

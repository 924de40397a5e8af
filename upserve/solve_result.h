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

#include <iosfwd>
#include <string>
#include <vector>

/*!
 * \file
 * \brief Defines the outcome of a solve attempt and its textual envelope.
 */
namespace Upserve {

//! Result of a single solve attempt.
/*!
 * The four outcomes are always distinguishable. In particular, an empty plan
 * is a plan and not the same as an unsolvable problem.
 */
struct SolveOutcome {
    //! Possible outcomes.
    enum Status : uint8_t {
        status_plan        = 0, //!< The solver produced a plan.
        status_unsolvable  = 1, //!< The solver ran and proved that no plan exists.
        status_unsupported = 2, //!< The problem requires features the solver does not support.
        status_failure     = 3, //!< The attempt failed.
    };
    //! Origin of a failure.
    enum Error : uint8_t {
        error_none      = 0, //!< Not a failure.
        error_solve     = 1, //!< The solver ran but failed or crashed.
        error_transport = 2, //!< The solver could not be reached or started.
        error_timeout   = 3, //!< A configured time limit expired.
    };
    using Plan = std::vector<std::string>;

    static SolveOutcome found(Plan steps);
    static SolveOutcome noPlan();
    static SolveOutcome notSupported(std::string reason);
    static SolveOutcome failed(Error e, std::string what);

    [[nodiscard]] bool hasPlan() const { return status == status_plan; }
    [[nodiscard]] bool unsolvable() const { return status == status_unsolvable; }
    [[nodiscard]] bool unsupported() const { return status == status_unsupported; }
    [[nodiscard]] bool failure() const { return status == status_failure; }

    Status      status{status_failure};
    Error       errorKind{error_solve};
    Plan        plan;    //!< Steps of the plan if hasPlan().
    std::string message; //!< Reason for unsupported or description of a failure.
};

[[nodiscard]] const char* toString(SolveOutcome::Status s);
[[nodiscard]] const char* toString(SolveOutcome::Error e);

/////////////////////////////////////////////////////////////////////////////////////////
// endpoint exit codes
/////////////////////////////////////////////////////////////////////////////////////////
enum ExitCode {
    exit_plan        = 0,  /*!< A plan was found.                                           */
    exit_interrupt   = 1,  /*!< Run was interrupted.                                        */
    exit_unsolvable  = 20, /*!< Problem has no plan.                                        */
    exit_unsupported = 30, /*!< Problem requires unsupported features.                      */
    exit_memory      = 33, /*!< Run was interrupted by out of memory exception.             */
    exit_error       = 65, /*!< Run was interrupted by internal error.                      */
    exit_no_run      = 128 /*!< Search not started because of syntax or command line error. */
};
//! Maps an outcome to the exit code of a solver endpoint.
[[nodiscard]] int exitCode(const SolveOutcome& outcome);
//! Maps the exit code of a process that produced no envelope to an outcome.
/*!
 * \param code   Exit code of the process.
 * \param output Captured standard output used as plan if code is exit_plan.
 */
[[nodiscard]] SolveOutcome fromExitCode(int code, const std::string& output);

/////////////////////////////////////////////////////////////////////////////////////////
// response envelope
/////////////////////////////////////////////////////////////////////////////////////////
/*!
 * \code
 * upserve 1
 * status plan|unsolvable|unsupported|failure
 * [error solve|transport|timeout]
 * [reason <text>]
 * [step <plan step>]*
 * end
 * \endcode
 */
void writeOutcome(std::ostream& os, const SolveOutcome& outcome);
//! Reads an outcome envelope from in.
/*!
 * Lines preceding the envelope header are skipped.
 * \return false if in does not contain an envelope.
 * \throw std::runtime_error with errc bad_message if the envelope is malformed.
 */
bool readOutcome(std::istream& in, SolveOutcome& out);

} // namespace Upserve

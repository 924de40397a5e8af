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

#include <upserve/process.h>
#include <upserve/solver.h>

/*!
 * \file
 * \brief Solver that drives an external planner process.
 */
namespace Upserve {

//! Runs an external planner once per problem.
/*!
 * Recognized options:
 *  - cmd:     command template (required). Each occurrence of {instance} is
 *             replaced by the locator of the problem. If the template does not
 *             mention {instance}, the locator is appended as last argument.
 *  - timeout: time limit per solve in seconds (0 for no limit).
 *  - cwd:     working directory of the planner process.
 *
 * If the planner writes a response envelope to stdout, the envelope determines
 * the outcome. Otherwise, the outcome is derived from the exit code. An invalid
 * envelope is reported as a warning and its lines are not taken as plan steps.
 */
class ProcessSolver : public Solver {
public:
    static constexpr const char* name_s = "exec";

    //! \throw std::invalid_argument if opts are not valid for this solver.
    explicit ProcessSolver(const SolverOptions& opts);
    ~ProcessSolver() override;

    [[nodiscard]] const char*        name() const override { return name_s; }
    [[nodiscard]] const ProblemKind& capabilities() const override { return supportedKind(); }
    [[nodiscard]] uint32_t           roles() const override { return role_oneshot_planner; }

    //! Returns the command line used to solve the given problem.
    [[nodiscard]] std::vector<std::string> commandFor(const Problem& problem) const;
    [[nodiscard]] const ProcessOptions&    processOptions() const { return opts_; }

    static const ProblemKind& supportedKind();
    static SolverInfo         info();

protected:
    SolveOutcome doSolve(const Problem& problem) override;

private:
    std::vector<std::string> cmd_;
    ProcessOptions           opts_;
};

} // namespace Upserve

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
#include <upserve/solve_result.h>

#include <cstdio>

/*!
 * \file
 * \brief Plain text output of the command-line applications.
 */
namespace Upserve {
class SolverRegistry;
namespace Cli {

//! Prints progress events in a human readable form.
class TextOutput : public EventHandler {
public:
    //! Creates an output printing events with verbosity up to verb to out.
    explicit TextOutput(uint32_t verb, FILE* out = stdout);
    ~TextOutput() override;

    void onEvent(const Event& ev) override;

    //! Prints the name, roles, and capabilities of each registered solver.
    void printSolvers(const SolverRegistry& reg) const;
    //! Prints a one line summary of the given outcome.
    void printSummary(const char* instance, const SolveOutcome& outcome) const;

    [[nodiscard]] FILE* stream() const { return out_; }

private:
    void printLine(const char* prefix, const char* text) const;

    FILE* out_;
};

} // namespace Cli
} // namespace Upserve

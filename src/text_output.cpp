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
#include <upserve/cli/text_output.h>

#include <upserve/harness.h>
#include <upserve/solver.h>

#include <algorithm>

namespace Upserve::Cli {

TextOutput::TextOutput(uint32_t verb, FILE* out) : out_(out) {
    auto v = static_cast<Event::Verbosity>(std::min(verb, static_cast<uint32_t>(Event::verbosity_max)));
    setVerbosity(Event::subsystem_solve, v);
    setVerbosity(Event::subsystem_harness, v);
}
TextOutput::~TextOutput() = default;

void TextOutput::printLine(const char* prefix, const char* text) const {
    fprintf(out_, "%s%s\n", prefix, text);
    fflush(out_);
}

void TextOutput::onEvent(const Event& ev) {
    if (const auto* log = event_cast<LogEvent>(ev)) {
        printLine(log->isWarning() ? "*** Warn : " : "", log->msg);
    }
    else if (const auto* solve = event_cast<SolveEvent>(ev)) {
        if (not solve->outcome) {
            fprintf(out_, "Solving '%s' with %s...\n", solve->problem->name.c_str(), solve->solver);
            fflush(out_);
        }
        else {
            printSummary(solve->problem->name.c_str(), *solve->outcome);
        }
    }
    else if (const auto* hev = event_cast<HarnessEvent>(ev)) {
        switch (hev->op) {
            case HarnessEvent::op_build   : printLine("Building: ", hev->text); break;
            case HarnessEvent::op_instance: printLine("Solving instance: ", hev->text); break;
            case HarnessEvent::op_command : printLine("Command: ", hev->text); break;
            case HarnessEvent::op_output  :
                fputs(hev->text, out_);
                fflush(out_);
                break;
            default                       : printLine("", hev->text); break;
        }
    }
}

void TextOutput::printSummary(const char* instance, const SolveOutcome& outcome) const {
    fprintf(out_, "%s: %s", instance, toString(outcome.status));
    if (outcome.hasPlan()) {
        fprintf(out_, " (%u steps)", static_cast<unsigned>(outcome.plan.size()));
    }
    else if (outcome.failure()) {
        fprintf(out_, " (%s)", toString(outcome.errorKind));
    }
    if (not outcome.message.empty()) {
        fprintf(out_, ": %s", outcome.message.c_str());
    }
    fprintf(out_, "\n");
    fflush(out_);
}

void TextOutput::printSolvers(const SolverRegistry& reg) const {
    for (const auto& info : reg.solvers()) {
        fprintf(out_, "%-8s %s\n", info.name.c_str(), info.description.c_str());
        fprintf(out_, "%-8s roles   : %s%s%s\n", "", (info.roles & role_oneshot_planner) ? "oneshot-planner " : "",
                (info.roles & role_plan_validator) ? "plan-validator " : "",
                (info.roles & role_grounder) ? "grounder" : "");
        fprintf(out_, "%-8s features: %s\n", "",
                info.staticKind ? info.kind.toString().c_str() : "<reported by endpoint>");
    }
    fflush(out_);
}

} // namespace Upserve::Cli

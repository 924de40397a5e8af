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
#include <upserve/process_solver.h>

#include <potassco/error.h>

#include <sstream>
#include <stdexcept>

namespace Upserve {
namespace {
constexpr std::string_view instance_s = "{instance}";

std::string substitute(std::string arg, const std::string& value) {
    for (auto pos = arg.find(instance_s); pos != std::string::npos; pos = arg.find(instance_s, pos + value.size())) {
        arg.replace(pos, instance_s.size(), value);
    }
    return arg;
}
} // namespace

ProcessSolver::ProcessSolver(const SolverOptions& opts) {
    opts.checkKeys(name_s, {"cmd", "timeout", "cwd"});
    cmd_ = splitCommand(opts.get("cmd"));
    POTASSCO_CHECK(not cmd_.empty(), std::errc::invalid_argument, "%s: option 'cmd' is required", name_s);
    opts_.timeout       = opts.number("timeout", 0.0);
    opts_.cwd           = opts.get("cwd");
    opts_.captureOutput = true;
}
ProcessSolver::~ProcessSolver() { destroy(); }

std::vector<std::string> ProcessSolver::commandFor(const Problem& problem) const {
    std::vector<std::string> argv;
    bool                     hasInstance = false;
    argv.reserve(cmd_.size() + 1);
    for (const auto& arg : cmd_) {
        hasInstance = hasInstance || arg.find(instance_s) != std::string::npos;
        argv.push_back(substitute(arg, problem.locator));
    }
    if (not hasInstance) {
        argv.push_back(problem.locator);
    }
    return argv;
}

SolveOutcome ProcessSolver::doSolve(const Problem& problem) {
    auto argv = commandFor(problem);
    auto res  = runCommand(argv, opts_);
    switch (res.status) {
        case ProcessResult::status_launch_failed:
            return SolveOutcome::failed(SolveOutcome::error_transport, "'" + argv[0] + "' " + res.describe());
        case ProcessResult::status_timeout: {
            std::ostringstream msg;
            msg << "'" << problem.name << "' " << res.describe() << " after " << opts_.timeout << "s";
            return SolveOutcome::failed(SolveOutcome::error_timeout, msg.str());
        }
        case ProcessResult::status_signaled:
        case ProcessResult::status_lost:
            return SolveOutcome::failed(SolveOutcome::error_solve, "'" + argv[0] + "' " + res.describe());
        default: break;
    }
    std::istringstream out(res.output);
    try {
        if (SolveOutcome envelope; readOutcome(out, envelope)) {
            return envelope;
        }
    }
    catch (const std::runtime_error& e) {
        auto msg = "'" + argv[0] + "' wrote an invalid response envelope (" + e.what() + "), using exit code";
        warn(msg.c_str());
        return fromExitCode(res.code, {});
    }
    return fromExitCode(res.code, res.output);
}

const ProblemKind& ProcessSolver::supportedKind() {
    static const ProblemKind kind = [] {
        ProblemKind k;
        k.setProblemClass("ACTION_BASED").setProblemClass("HIERARCHICAL");
        k.setTyping("FLAT_TYPING").setTyping("HIERARCHICAL_TYPING");
        k.setConditionsKind("NEGATIVE_CONDITIONS")
            .setConditionsKind("DISJUNCTIVE_CONDITIONS")
            .setConditionsKind("EQUALITY")
            .setConditionsKind("EXISTENTIAL_CONDITIONS")
            .setConditionsKind("UNIVERSAL_CONDITIONS");
        k.setEffectsKind("CONDITIONAL_EFFECTS");
        k.setTime("CONTINUOUS_TIME")
            .setTime("DISCRETE_TIME")
            .setTime("INTERMEDIATE_CONDITIONS_AND_EFFECTS")
            .setTime("TIMED_EFFECT")
            .setTime("TIMED_GOALS");
        k.setNumbers("DISCRETE_NUMBERS");
        return k.freeze();
    }();
    return kind;
}

SolverInfo ProcessSolver::info() {
    SolverInfo info;
    info.name        = name_s;
    info.roles       = role_oneshot_planner;
    info.kind        = supportedKind();
    info.description = "Runs an external planner (options: cmd, timeout, cwd)";
    info.create      = [](const SolverOptions& opts) { return std::make_unique<ProcessSolver>(opts); };
    return info;
}

} // namespace Upserve

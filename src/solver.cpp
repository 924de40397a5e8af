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
#include <upserve/solver.h>

#include <potassco/error.h>
#include <potassco/program_opts/string_convert.h>

#include <algorithm>
#include <stdexcept>

namespace Upserve {
/////////////////////////////////////////////////////////////////////////////////////////
// SolverOptions
/////////////////////////////////////////////////////////////////////////////////////////
SolverOptions& SolverOptions::add(std::string key, std::string value) {
    opts_.emplace_back(std::move(key), std::move(value));
    return *this;
}
SolverOptions& SolverOptions::parse(std::string_view opt) {
    auto sep = opt.find('=');
    POTASSCO_CHECK(sep != std::string_view::npos && sep != 0, std::errc::invalid_argument,
                   "invalid solver option '%.*s': 'key=value' expected", static_cast<int>(opt.size()), opt.data());
    return add(std::string(opt.substr(0, sep)), std::string(opt.substr(sep + 1)));
}
const std::string* SolverOptions::find(std::string_view key) const {
    // last one wins
    auto it = std::find_if(opts_.rbegin(), opts_.rend(), [key](const Entry& e) { return e.first == key; });
    return it != opts_.rend() ? &it->second : nullptr;
}
std::string SolverOptions::get(std::string_view key, std::string_view def) const {
    const auto* v = find(key);
    return v ? *v : std::string(def);
}
double SolverOptions::number(std::string_view key, double def) const {
    const auto* v = find(key);
    if (not v) {
        return def;
    }
    double d = 0.0;
    POTASSCO_CHECK(Potassco::stringTo(*v, d) == std::errc{} && d >= 0.0, std::errc::invalid_argument,
                   "option '%.*s': non-negative number expected but got '%s'", static_cast<int>(key.size()),
                   key.data(), v->c_str());
    return d;
}
void SolverOptions::checkKeys(const char* solver, std::initializer_list<std::string_view> keys) const {
    for (const auto& [key, value] : opts_) {
        POTASSCO_CHECK(std::find(keys.begin(), keys.end(), key) != keys.end(), std::errc::invalid_argument,
                       "%s: unrecognized option '%s'", solver, key.c_str());
    }
}
/////////////////////////////////////////////////////////////////////////////////////////
// Solver
/////////////////////////////////////////////////////////////////////////////////////////
Solver::Solver() : handler_(nullptr), state_(state_ready) {}
Solver::~Solver() = default;
void Solver::doDestroy() {}

SolveOutcome Solver::solve(const Problem& problem) {
    POTASSCO_CHECK_PRE(state_ == state_ready, "solver '%s': solve called after destroy", name());
    POTASSCO_CHECK_PRE(isOneshotPlanner(), "solver '%s' is not a oneshot planner", name());
    report(SolveEvent(name(), problem, nullptr));
    SolveOutcome res;
    if (const auto& kind = problemKind(problem); not supports(kind)) {
        res = SolveOutcome::notSupported("unsupported features: " + kind.difference(capabilities()).toString());
    }
    else {
        try {
            res = doSolve(problem);
        }
        catch (const std::runtime_error& e) {
            res = SolveOutcome::failed(SolveOutcome::error_solve, e.what());
        }
    }
    report(SolveEvent(name(), problem, &res));
    return res;
}

void Solver::destroy() {
    if (std::exchange(state_, state_destroyed) == state_ready) {
        doDestroy();
    }
}

void Solver::warn(const char* msg) const {
    report(LogEvent(Event::subsystem_solve, Event::verbosity_low, LogEvent::warning, msg));
}
/////////////////////////////////////////////////////////////////////////////////////////
// SolverRegistry
/////////////////////////////////////////////////////////////////////////////////////////
SolverRegistry::SolverRegistry()  = default;
SolverRegistry::~SolverRegistry() = default;

SolverRegistry& SolverRegistry::add(SolverInfo info) {
    POTASSCO_CHECK(not info.name.empty(), std::errc::invalid_argument, "solver name must not be empty");
    POTASSCO_CHECK(find(info.name) == nullptr, std::errc::invalid_argument, "duplicate solver name '%s'",
                   info.name.c_str());
    POTASSCO_CHECK_PRE(static_cast<bool>(info.create), "solver '%s': factory expected", info.name.c_str());
    info.kind.freeze();
    solvers_.push_back(std::move(info));
    return *this;
}

const SolverInfo* SolverRegistry::find(std::string_view name) const {
    auto it = std::find_if(solvers_.begin(), solvers_.end(), [name](const SolverInfo& i) { return i.name == name; });
    return it != solvers_.end() ? &*it : nullptr;
}

std::unique_ptr<Solver> SolverRegistry::create(std::string_view name, const SolverOptions& opts) const {
    const auto* info = find(name);
    POTASSCO_CHECK(info != nullptr, std::errc::invalid_argument, "unknown solver '%.*s'",
                   static_cast<int>(name.size()), name.data());
    auto solver = info->create(opts);
    POTASSCO_ASSERT(solver && info->name == solver->name() && info->roles == solver->roles(),
                    "solver does not match its registration");
    return solver;
}

const SolverInfo* SolverRegistry::select(const ProblemKind& problem, SolverRole role) const {
    for (const auto& info : solvers_) {
        if ((info.roles & role) != 0 && info.staticKind && info.kind.supports(problem)) {
            return &info;
        }
    }
    return nullptr;
}

} // namespace Upserve

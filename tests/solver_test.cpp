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
#include "test_util.h"

#include <upserve/process_solver.h>
#include <upserve/protocol.h>
#include <upserve/solver.h>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace Upserve::Test {
namespace {
ProblemKind plannerKind() {
    ProblemKind k;
    k.setTyping("FLAT_TYPING")
        .setTyping("HIERARCHICAL_TYPING")
        .setConditionsKind("EQUALITY")
        .setConditionsKind("UNIVERSAL_CONDITIONS");
    return k;
}
Problem makeProblem(const char* name, ProblemKind kind) {
    Problem p;
    p.name    = name;
    p.locator = std::string(name) + ".bin";
    p.kind    = kind.freeze();
    return p;
}
struct EventRecorder : EventHandler {
    EventRecorder() : EventHandler(Event::verbosity_max) {}
    void onEvent(const Event& ev) override {
        if (const auto* s = event_cast<SolveEvent>(ev)) {
            ops.push_back(static_cast<char>(s->op));
        }
    }
    std::vector<char> ops;
};
} // namespace

TEST_CASE("Event handler verbosity", "[solver]") {
    EventHandler h(Event::verbosity_high);
    REQUIRE(h.verbosity(Event::subsystem_solve) == Event::verbosity_high);
    REQUIRE(h.verbosity(Event::subsystem_harness) == Event::verbosity_high);
    h.setVerbosity(Event::subsystem_harness, Event::verbosity_quiet);
    REQUIRE(h.verbosity(Event::subsystem_solve) == Event::verbosity_high);
    REQUIRE(h.verbosity(Event::subsystem_harness) == Event::verbosity_quiet);
    EventRecorder rec;
    rec.setVerbosity(Event::subsystem_solve, Event::verbosity_quiet);
    Problem p;
    rec.dispatch(SolveEvent("test", p, nullptr));
    REQUIRE(rec.ops.empty());
}

TEST_CASE("Solver options", "[solver]") {
    SolverOptions opts;
    opts.parse("cmd=planner --plan {instance}").parse("timeout=2.5").add("cwd", "/tmp");
    REQUIRE(opts.size() == 3);
    REQUIRE(opts.get("cmd") == "planner --plan {instance}");
    REQUIRE(opts.number("timeout", 0.0) == 2.5);
    REQUIRE(opts.number("missing", 1.0) == 1.0);
    REQUIRE(opts.get("missing", "x") == "x");
    REQUIRE_FALSE(opts.has("missing"));
    SECTION("last value wins") {
        opts.parse("timeout=3");
        REQUIRE(opts.number("timeout", 0.0) == 3.0);
    }
    SECTION("invalid options") {
        REQUIRE_THROWS_AS(opts.parse("timeout"), std::invalid_argument);
        REQUIRE_THROWS_AS(opts.parse("=1"), std::invalid_argument);
        opts.parse("timeout=-1");
        REQUIRE_THROWS_AS(opts.number("timeout", 0.0), std::invalid_argument);
        REQUIRE_NOTHROW(opts.checkKeys("exec", {"cmd", "timeout", "cwd"}));
        REQUIRE_THROWS_AS(opts.checkKeys("exec", {"cmd", "timeout"}), std::invalid_argument);
    }
}

TEST_CASE("Solver lifecycle", "[solver]") {
    TestSolver solver(plannerKind());
    REQUIRE(solver.state() == Solver::state_ready);
    REQUIRE(solver.isOneshotPlanner());
    REQUIRE_FALSE(solver.isPlanValidator());
    REQUIRE_FALSE(solver.isGrounder());

    SECTION("supported problem is solved") {
        EventRecorder rec;
        solver.setEventHandler(&rec);
        ProblemKind k;
        k.setTyping("FLAT_TYPING").setConditionsKind("EQUALITY");
        auto res = solver.solve(makeProblem("basic", k));
        REQUIRE(res.hasPlan());
        REQUIRE(res.plan.size() == 1);
        REQUIRE(solver.solves == 1);
        REQUIRE(rec.ops == std::vector<char>{'S', 'F'});
    }
    SECTION("empty plan is not unsolvable") {
        solver.next = SolveOutcome::found({});
        auto res    = solver.solve(makeProblem("basic", ProblemKind()));
        REQUIRE(res.hasPlan());
        REQUIRE_FALSE(res.unsolvable());
    }
    SECTION("unsupported problem is rejected without solving") {
        ProblemKind k;
        k.setTyping("FLAT_TYPING").setTime("CONTINUOUS_TIME");
        auto res = solver.solve(makeProblem("matchcellar", k));
        REQUIRE(res.unsupported());
        REQUIRE(res.message.find("TIME:CONTINUOUS_TIME") != std::string::npos);
        REQUIRE(solver.solves == 0);
    }
    SECTION("runtime errors become failures") {
        solver.raise = true;
        auto res     = solver.solve(makeProblem("basic", ProblemKind()));
        REQUIRE(res.failure());
        REQUIRE(res.errorKind == SolveOutcome::error_solve);
        REQUIRE(res.message == "solver crashed");
    }
    SECTION("destroy is idempotent") {
        solver.destroy();
        REQUIRE(solver.destroyed());
        solver.destroy();
        REQUIRE(solver.destroys == 1);
    }
    SECTION("solve after destroy is a contract violation") {
        solver.destroy();
        REQUIRE_THROWS_AS(solver.solve(makeProblem("basic", ProblemKind())), std::logic_error);
        REQUIRE(solver.solves == 0);
    }
    SECTION("role mismatch is a contract violation") {
        TestSolver validator(plannerKind(), role_plan_validator);
        REQUIRE_THROWS_AS(validator.solve(makeProblem("basic", ProblemKind())), std::logic_error);
    }
}

TEST_CASE("Solver registry", "[solver]") {
    SolverRegistry reg;
    auto           entry = [](const char* name, ProblemKind kind, uint32_t roles = role_oneshot_planner) {
        SolverInfo info;
        info.name   = name;
        info.roles  = roles;
        info.kind   = kind;
        info.create = [kind, roles](const SolverOptions& opts) {
            opts.checkKeys("test", {});
            return std::make_unique<TestSolver>(kind, roles);
        };
        return info;
    };
    SECTION("names are unique and non-empty") {
        reg.add(entry("test", plannerKind()));
        REQUIRE_THROWS_AS(reg.add(entry("test", ProblemKind())), std::invalid_argument);
        REQUIRE_THROWS_AS(reg.add(entry("", ProblemKind())), std::invalid_argument);
        REQUIRE(reg.size() == 1);
        REQUIRE(reg.find("test")->kind.frozen());
    }
    SECTION("create") {
        reg.add(entry("test", plannerKind()));
        auto s = reg.create("test");
        REQUIRE(s->name() == std::string("test"));
        REQUIRE(s->capabilities() == plannerKind());
        REQUIRE_THROWS_AS(reg.create("aries"), std::invalid_argument);
        REQUIRE_THROWS_AS(reg.create("test", {{"foo", "bar"}}), std::invalid_argument);
    }
    SECTION("select in registration order") {
        ProblemKind small;
        small.setTyping("FLAT_TYPING");
        reg.add(entry("validator", small, role_plan_validator));
        reg.add(entry("planner", plannerKind()));
        ProblemKind p;
        p.setTyping("FLAT_TYPING");
        REQUIRE(reg.select(p) != nullptr);
        REQUIRE(reg.select(p)->name == "planner");
        REQUIRE(reg.select(p, role_plan_validator)->kind == small);
        p.setEffectsKind("CONDITIONAL_EFFECTS");
        REQUIRE(reg.select(p) == nullptr);
    }
    SECTION("built-in solvers") {
        const auto& def = defaultRegistry();
        REQUIRE(def.find(ProcessSolver::name_s) != nullptr);
        REQUIRE(def.find(RemoteSolver::name_s) != nullptr);
        REQUIRE_FALSE(def.find(RemoteSolver::name_s)->staticKind);
        ProblemKind p;
        p.setProblemClass("HIERARCHICAL").setTyping("HIERARCHICAL_TYPING");
        REQUIRE(def.select(p)->name == ProcessSolver::name_s);
        REQUIRE_THROWS_AS(def.create(ProcessSolver::name_s), std::invalid_argument);
        REQUIRE_THROWS_AS(def.create(ProcessSolver::name_s, {{"cmd", "true"}, {"retries", "2"}}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(def.create(RemoteSolver::name_s, {{"address", "no-port"}}), std::invalid_argument);
    }
}

} // namespace Upserve::Test

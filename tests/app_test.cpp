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

#include <upserve/harness.h>
#include <upserve/process.h>
#include <upserve/solve_result.h>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace Upserve::Test {
namespace {
using StringVec = std::vector<std::string>;

constexpr const char* endpoint_exe = UPSERVE_ENDPOINT_EXE;
constexpr const char* validate_exe = UPSERVE_VALIDATE_EXE;

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::string& value) : name_(name) { ::setenv(name, value.c_str(), 1); }
    ~ScopedEnv() { ::unsetenv(name_); }
    ScopedEnv(const ScopedEnv&)            = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
};

// Planner that records its calls and behaves according to the instance it is given.
std::string fakePlanner(const TempDir& dir) {
    return dir.write("planner.sh",
                     "#!/bin/sh\n"
                     "echo \"$1\" >> '" + dir.file("planner.log") + "'\n"
                     "case \"$1\" in\n"
                     "  *unsolvable*) exit 20 ;;\n"
                     "  *crash*) exit 3 ;;\n"
                     "esac\n"
                     "echo '(move a b)'\n"
                     "echo '(move b c)'\n"
                     "exit 0\n",
                     true);
}

ProcessResult runEndpoint(StringVec args) {
    args.insert(args.begin(), endpoint_exe);
    return runCommand(args);
}

SolveOutcome outcomeOf(const ProcessResult& res) {
    std::istringstream in(res.output);
    SolveOutcome       out;
    REQUIRE(readOutcome(in, out));
    return out;
}
} // namespace

TEST_CASE("Endpoint application one-shot", "[app]") {
    TempDir dir;
    auto    cmd   = "cmd=" + fakePlanner(dir);
    auto    basic = dir.write("basic.bin", problemText("basic", "kind TYPING FLAT_TYPING\n"));
    auto    addr  = std::string("0.0.0.0:2222");

    SECTION("plan") {
        auto res = runEndpoint({"--address", addr, "--file-path", basic, "-o", cmd});
        REQUIRE(res.status == ProcessResult::status_exited);
        REQUIRE(res.code == exit_plan);
        auto out = outcomeOf(res);
        REQUIRE(out.hasPlan());
        REQUIRE(out.plan == SolveOutcome::Plan{"(move a b)", "(move b c)"});
    }
    SECTION("problem file as positional argument") {
        auto res = runEndpoint({"--address", addr, basic, "-o", cmd});
        REQUIRE(res.code == exit_plan);
    }
    SECTION("unsolvable") {
        auto file = dir.write("unsolvable.bin", problemText("unsolvable", "kind TYPING FLAT_TYPING\n"));
        auto res  = runEndpoint({"--address", addr, "--file-path", file, "-o", cmd});
        REQUIRE(res.code == exit_unsolvable);
        REQUIRE(outcomeOf(res).unsolvable());
    }
    SECTION("unsupported problem is not passed to the planner") {
        auto file = dir.write("durative.bin", problemText("durative", "kind TIME DURATION_INEQUALITIES\n"));
        auto res  = runEndpoint({"--address", addr, "--file-path", file, "-o", cmd});
        REQUIRE(res.code == exit_unsupported);
        REQUIRE(outcomeOf(res).unsupported());
        REQUIRE_FALSE(std::filesystem::exists(dir.file("planner.log")));
    }
    SECTION("failing planner") {
        auto file = dir.write("crash.bin", problemText("crash", "kind TYPING FLAT_TYPING\n"));
        auto res  = runEndpoint({"--address", addr, "--file-path", file, "-o", cmd});
        REQUIRE(res.code == exit_error);
        auto out = outcomeOf(res);
        REQUIRE(out.failure());
        REQUIRE(out.errorKind == SolveOutcome::error_solve);
    }
    SECTION("unknown solver option fails before any solve") {
        auto res = runEndpoint({"--address", addr, "--file-path", basic, "-o", cmd, "-o", "tiemout=1"});
        REQUIRE(res.code == exit_no_run);
        REQUIRE(res.output.empty());
        REQUIRE_FALSE(std::filesystem::exists(dir.file("planner.log")));
    }
    SECTION("bad address fails before any solve") {
        auto res = runEndpoint({"--address", "localhost", "--file-path", basic, "-o", cmd});
        REQUIRE(res.code == exit_no_run);
        REQUIRE_FALSE(std::filesystem::exists(dir.file("planner.log")));
    }
    SECTION("missing solver configuration") {
        auto res = runEndpoint({"--address", addr, "--file-path", basic});
        REQUIRE(res.code == exit_no_run);
    }
    SECTION("version credits the project authors") {
        auto res = runEndpoint({"--version"});
        REQUIRE(res.output.find("The upserve authors") != std::string::npos);
        REQUIRE(res.output.find("Kaufmann") == std::string::npos);
    }
    SECTION("solver configuration from the environment") {
        ScopedEnv opts("UPSERVE_SOLVER_OPTIONS", cmd + " timeout=10");
        auto      res = runEndpoint({"--address", addr, "--file-path", basic});
        REQUIRE(res.code == exit_plan);
        REQUIRE(outcomeOf(res).hasPlan());
    }
    SECTION("command line options override the environment") {
        ScopedEnv opts("UPSERVE_SOLVER_OPTIONS", "cmd=/this/program/does/not/exist");
        auto      res = runEndpoint({"--address", addr, "--file-path", basic, "-o", cmd});
        REQUIRE(res.code == exit_plan);
    }
    SECTION("unknown solver from the environment") {
        ScopedEnv solver("UPSERVE_SOLVER", "no-such-solver");
        auto      res = runEndpoint({"--address", addr, "--file-path", basic, "-o", cmd});
        REQUIRE(res.code == exit_no_run);
    }
}

TEST_CASE("Harness against endpoint application", "[app][harness]") {
    TempDir dir;
    auto    planner = fakePlanner(dir);
    dir.write("basic.bin", problemText("basic", "kind TYPING FLAT_TYPING\n"));
    dir.write("matchcellar.bin", problemText("matchcellar", "kind TIME CONTINUOUS_TIME\n"));
    dir.write("crash.bin", problemText("crash", "kind TYPING FLAT_TYPING\n"));
    HarnessOptions opts;
    opts.executable  = endpoint_exe;
    opts.problemsDir = dir.path().string();
    opts.instances   = {"basic", "matchcellar"};

    SECTION("conforming endpoint") {
        ScopedEnv env("UPSERVE_SOLVER_OPTIONS", "cmd=" + planner);
        auto      rep = ValidationHarness(opts).run();
        REQUIRE(rep.ok());
        REQUIRE(rep.exitCode() == 0);
        REQUIRE(rep.solved == 2);
    }
    SECTION("failing instance") {
        ScopedEnv env("UPSERVE_SOLVER_OPTIONS", "cmd=" + planner);
        opts.instances = {"basic", "crash", "matchcellar"};
        auto rep       = ValidationHarness(opts).run();
        REQUIRE(rep.exitCode() == 1);
        REQUIRE(rep.failed == "crash");
        REQUIRE(rep.result.code == exit_error);
        REQUIRE(rep.result.output.find("status failure") != std::string::npos);
    }
    SECTION("unconfigured endpoint") {
        auto rep = ValidationHarness(opts).run();
        REQUIRE(rep.exitCode() == 1);
        REQUIRE(rep.failed == "basic");
        REQUIRE(rep.result.code == exit_no_run);
    }
}

TEST_CASE("Validation application", "[app][harness]") {
    TempDir dir;
    ScopedEnv env("UPSERVE_SOLVER_OPTIONS", "cmd=" + fakePlanner(dir));
    dir.write("basic.bin", problemText("basic", "kind TYPING FLAT_TYPING\n"));
    dir.write("crash.bin", problemText("crash", "kind TYPING FLAT_TYPING\n"));
    StringVec args = {validate_exe, "--executable", endpoint_exe, "--problems-dir", dir.path().string()};

    SECTION("all instances solved") {
        args.push_back("basic");
        auto res = runCommand(args);
        REQUIRE(res.status == ProcessResult::status_exited);
        REQUIRE(res.code == 0);
        REQUIRE(res.output.find("Solving instance: " + dir.file("basic.bin")) != std::string::npos);
        REQUIRE(res.output.find("All 1 instance(s) solved") != std::string::npos);
    }
    SECTION("failing instance") {
        args.insert(args.end(), {"basic", "crash"});
        auto res = runCommand(args);
        REQUIRE(res.code == 1);
    }
    SECTION("invalid address") {
        args.insert(args.end(), {"--address", "localhost", "basic"});
        auto res = runCommand(args);
        REQUIRE(res.code == 1);
    }
}

} // namespace Upserve::Test

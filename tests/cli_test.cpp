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
#include <upserve/problem.h>
#include <upserve/solver.h>

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <string>

namespace Upserve::Test {
namespace {
std::string contents(FILE* f) {
    std::string res;
    std::rewind(f);
    for (int c; (c = std::fgetc(f)) != EOF;) { res += static_cast<char>(c); }
    return res;
}
} // namespace

TEST_CASE("Text output", "[cli]") {
    FILE* f = std::tmpfile();
    REQUIRE(f != nullptr);
    Cli::TextOutput out(1, f);

    SECTION("harness events") {
        out.dispatch(HarnessEvent(HarnessEvent::op_instance, "problems/basic.bin"));
        out.dispatch(HarnessEvent(HarnessEvent::op_command, "upserve --file-path problems/basic.bin"));
        out.dispatch(HarnessEvent(HarnessEvent::op_output, "upserve 1\nstatus failure\nend\n"));
        REQUIRE(contents(f) == "Solving instance: problems/basic.bin\n"
                               "Command: upserve --file-path problems/basic.bin\n"
                               "upserve 1\nstatus failure\nend\n");
    }
    SECTION("solve events") {
        Problem p;
        p.name   = "basic";
        auto res = SolveOutcome::found({"(a)", "(b)"});
        out.dispatch(SolveEvent("exec", p, nullptr));
        out.dispatch(SolveEvent("exec", p, &res));
        REQUIRE(contents(f) == "Solving 'basic' with exec...\nbasic: plan (2 steps)\n");
    }
    SECTION("verbosity") {
        Cli::TextOutput quiet(0, f);
        Problem         p;
        p.name = "basic";
        quiet.dispatch(SolveEvent("exec", p, nullptr));
        quiet.dispatch(LogEvent(Event::subsystem_solve, Event::verbosity_high, LogEvent::message, "hidden"));
        REQUIRE(contents(f).empty());
    }
    SECTION("solver listing") {
        out.printSolvers(defaultRegistry());
        auto text = contents(f);
        REQUIRE(text.find("exec") != std::string::npos);
        REQUIRE(text.find("remote") != std::string::npos);
        REQUIRE(text.find("<reported by endpoint>") != std::string::npos);
    }
    std::fclose(f);
}

} // namespace Upserve::Test

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

#include <upserve/protocol.h>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <stdexcept>
#include <thread>

namespace Upserve::Test {
namespace {
ProblemKind endpointKind() {
    ProblemKind k;
    k.setTyping("FLAT_TYPING").setTyping("HIERARCHICAL_TYPING").setConditionsKind("EQUALITY");
    k.setCategory(Category::quality_metrics);
    return k;
}
} // namespace

TEST_CASE("Address", "[protocol]") {
    auto a = parseAddress("0.0.0.0:2222");
    REQUIRE(a.host == "0.0.0.0");
    REQUIRE(a.port == 2222);
    REQUIRE(a.toString() == "0.0.0.0:2222");
    auto b = parseAddress("[::1]:80");
    REQUIRE(b.host == "::1");
    REQUIRE(b.port == 80);
    REQUIRE(b.toString() == "[::1]:80");
    REQUIRE(parseAddress("localhost:0").port == 0);
    REQUIRE_THROWS_AS(parseAddress("localhost"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseAddress(":2222"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseAddress("host:port"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseAddress("host:70000"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseAddress("::1:80"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseAddress("[::1]80"), std::invalid_argument);
}

TEST_CASE("Kind envelope", "[protocol]") {
    std::stringstream str;
    auto              kind = endpointKind();
    writeKind(str, "test", kind);
    std::string name;
    ProblemKind in;
    REQUIRE(readKind(str, name, in));
    REQUIRE(name == "test");
    REQUIRE(in == kind);
    REQUIRE(in.hasCategory(Category::quality_metrics));
    REQUIRE(in.frozen());

    std::stringstream bad("upserve 1\nname x\nfeature TYPING:DUCK_TYPING\nend\n");
    REQUIRE_THROWS(readKind(bad, name, in));
    std::stringstream noName("upserve 1\nend\n");
    REQUIRE_THROWS_AS(readKind(noName, name, in), std::runtime_error);
}

TEST_CASE("Endpoint one-shot", "[protocol]") {
    TempDir    dir;
    TestSolver solver(endpointKind());
    Endpoint   endpoint(solver, parseAddress("0.0.0.0:2222"));
    REQUIRE_FALSE(endpoint.bound());

    SECTION("supported problem") {
        auto file = dir.write("basic.bin", problemText("basic", "kind TYPING FLAT_TYPING\n"));
        auto res  = endpoint.handle(file);
        REQUIRE(res.hasPlan());
        REQUIRE(solver.solves == 1);
    }
    SECTION("unsupported problem") {
        auto file = dir.write("matchcellar.bin", problemText("matchcellar", "kind TIME CONTINUOUS_TIME\n"));
        auto res  = endpoint.handle(file);
        REQUIRE(res.unsupported());
        REQUIRE(solver.solves == 0);
    }
    SECTION("unknown feature is unsupported") {
        auto file = dir.write("x.bin", problemText("x", "kind TYPING DUCK_TYPING\n"));
        REQUIRE(endpoint.handle(file).unsupported());
    }
    SECTION("malformed problem") {
        auto file = dir.write("x.bin", "not a problem\n");
        auto res  = endpoint.handle(file);
        REQUIRE(res.failure());
        REQUIRE(res.errorKind == SolveOutcome::error_solve);
        REQUIRE(res.message.find("is not a problem envelope") != std::string::npos);
        REQUIRE(solver.solves == 0);
        auto bad = dir.write("y.bin", "upp 1\nname y\nbogus\nbegin\n");
        res      = endpoint.handle(bad);
        REQUIRE(res.errorKind == SolveOutcome::error_solve);
        REQUIRE(res.message.find("line 3") != std::string::npos);
    }
    SECTION("unreadable locator") {
        auto res = endpoint.handle(dir.file("missing.bin"));
        REQUIRE(res.failure());
        REQUIRE(res.errorKind == SolveOutcome::error_transport);
    }
    REQUIRE_FALSE(endpoint.bound());
}

TEST_CASE("Endpoint network", "[protocol][network]") {
    TempDir    dir;
    TestSolver solver(endpointKind());
    Endpoint   endpoint(solver, parseAddress("127.0.0.1:0"));
    endpoint.bind();
    REQUIRE(endpoint.bound());
    REQUIRE(endpoint.port() != 0);
    auto address = "127.0.0.1:" + std::to_string(endpoint.port());
    auto basic   = dir.write("basic.bin", problemText("basic", "kind TYPING HIERARCHICAL_TYPING\n"));
    auto timed   = dir.write("matchcellar.bin", problemText("matchcellar", "kind TIME CONTINUOUS_TIME\n"));

    SECTION("remote solver") {
        uint32_t    served = 0;
        std::thread server([&]() { served = endpoint.serve(1); });
        {
            RemoteSolver remote({{"address", address}});
            REQUIRE(remote.remoteName() == "test");
            REQUIRE(remote.capabilities() == endpointKind());
            auto res = remote.solve(loadProblem(basic));
            REQUIRE(res.hasPlan());
            REQUIRE(res.plan == SolveOutcome::Plan{"(noop)"});
            // rejected locally without a round trip
            REQUIRE(remote.solve(loadProblem(timed)).unsupported());
            auto broken = loadProblem(basic);
            broken.locator += "\nquit";
            auto failed = remote.solve(broken);
            REQUIRE(failed.failure());
            REQUIRE(failed.errorKind == SolveOutcome::error_transport);
            REQUIRE(remote.solve(loadProblem(basic)).hasPlan());
            remote.destroy();
            REQUIRE(remote.destroyed());
            remote.destroy();
        }
        server.join();
        REQUIRE(served == 1);
        REQUIRE(solver.solves == 2);
    }
    SECTION("client requests are answered in order") {
        std::thread server([&]() { endpoint.serve(); });
        {
            ProtocolClient client(parseAddress(address));
            std::string    name;
            REQUIRE(client.kind(&name) == endpointKind());
            REQUIRE(name == "test");
            SolveRequest req{client.address(), basic, ProblemKind()};
            REQUIRE(client.solve(req).hasPlan());
            req.locator = dir.file("missing.bin");
            auto res    = client.solve(req);
            REQUIRE(res.failure());
            REQUIRE(res.errorKind == SolveOutcome::error_transport);
            client.quit();
            REQUIRE_FALSE(client.connected());
        }
        server.join();
    }
    endpoint.close();
    REQUIRE_FALSE(endpoint.bound());
    SECTION("unreachable endpoint") {
        REQUIRE_THROWS_AS(RemoteSolver({{"address", address}}), std::runtime_error);
    }
}

} // namespace Upserve::Test

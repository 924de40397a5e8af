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

#include <upserve/solver.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace Upserve::Test {

// Directory that is removed together with its content on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto               base = std::filesystem::temp_directory_path();
        do {
            path_ = base / ("upserve-test-" + std::to_string(rd()));
        } while (not std::filesystem::create_directory(path_));
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::string                  file(const std::string& name) const { return (path_ / name).string(); }

    std::string write(const std::string& name, const std::string& content, bool executable = false) const {
        auto p = file(name);
        std::ofstream(p) << content;
        if (executable) {
            std::filesystem::permissions(p, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
        }
        return p;
    }

private:
    std::filesystem::path path_;
};

inline std::string problemText(const std::string& name, const std::string& kind) {
    return "upp 1\nname " + name + "\n" + kind + "begin\n(define (problem " + name + "))\n";
}

// Solver with configurable capabilities that records calls.
class TestSolver : public Solver {
public:
    explicit TestSolver(ProblemKind kind, uint32_t roles = role_oneshot_planner)
        : kind_(kind.freeze())
        , roles_(roles) {}
    ~TestSolver() override { destroy(); }

    [[nodiscard]] const char*        name() const override { return "test"; }
    [[nodiscard]] const ProblemKind& capabilities() const override { return kind_; }
    [[nodiscard]] uint32_t           roles() const override { return roles_; }

    SolveOutcome next{SolveOutcome::found({"(noop)"})};
    bool         raise{false};
    int          solves{0};
    int          destroys{0};

protected:
    SolveOutcome doSolve(const Problem&) override {
        ++solves;
        if (raise) {
            throw std::runtime_error("solver crashed");
        }
        return next;
    }
    void doDestroy() override { ++destroys; }

private:
    ProblemKind kind_;
    uint32_t    roles_;
};

} // namespace Upserve::Test

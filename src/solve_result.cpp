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
#include <upserve/solve_result.h>

#include <potassco/error.h>

#include <istream>
#include <ostream>
#include <sstream>

namespace Upserve {
namespace {
constexpr std::string_view header_s = "upserve 1";

const char* const status_names[] = {"plan", "unsolvable", "unsupported", "failure"};
const char* const error_names[]  = {"none", "solve", "transport", "timeout"};

template <typename E, std::size_t N>
bool lookup(const char* const (&names)[N], std::string_view in, E& out) {
    for (std::size_t i = 0; i != N; ++i) {
        if (in == names[i]) {
            out = static_cast<E>(i);
            return true;
        }
    }
    return false;
}
// Envelope lines are newline terminated, so embedded line breaks are flattened.
std::string oneLine(std::string s) {
    for (auto& c : s) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return s;
}
void stripCr(std::string& line) {
    if (not line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}
} // namespace

SolveOutcome SolveOutcome::found(Plan steps) {
    SolveOutcome res;
    res.status    = status_plan;
    res.errorKind = error_none;
    res.plan      = std::move(steps);
    return res;
}
SolveOutcome SolveOutcome::noPlan() {
    SolveOutcome res;
    res.status    = status_unsolvable;
    res.errorKind = error_none;
    return res;
}
SolveOutcome SolveOutcome::notSupported(std::string reason) {
    SolveOutcome res;
    res.status    = status_unsupported;
    res.errorKind = error_none;
    res.message   = std::move(reason);
    return res;
}
SolveOutcome SolveOutcome::failed(Error e, std::string what) {
    POTASSCO_CHECK_PRE(e != error_none, "failure requires an error kind");
    SolveOutcome res;
    res.status    = status_failure;
    res.errorKind = e;
    res.message   = std::move(what);
    return res;
}

const char* toString(SolveOutcome::Status s) { return status_names[s & 3u]; }
const char* toString(SolveOutcome::Error e) { return error_names[e & 3u]; }

int exitCode(const SolveOutcome& outcome) {
    switch (outcome.status) {
        case SolveOutcome::status_plan       : return exit_plan;
        case SolveOutcome::status_unsolvable : return exit_unsolvable;
        case SolveOutcome::status_unsupported: return exit_unsupported;
        default                              : return outcome.errorKind == SolveOutcome::error_transport ? exit_no_run
                                                                                                          : exit_error;
    }
}

SolveOutcome fromExitCode(int code, const std::string& output) {
    switch (code) {
        case exit_plan: {
            SolveOutcome::Plan plan;
            std::istringstream in(output);
            for (std::string line; std::getline(in, line);) {
                stripCr(line);
                if (not line.empty() && line[0] != '%' && line[0] != ';') {
                    plan.push_back(std::move(line));
                }
            }
            return SolveOutcome::found(std::move(plan));
        }
        case exit_unsolvable : return SolveOutcome::noPlan();
        case exit_unsupported: return SolveOutcome::notSupported("problem rejected by solver");
        default:
            return SolveOutcome::failed(SolveOutcome::error_solve, "solver exited with code " + std::to_string(code));
    }
}

void writeOutcome(std::ostream& os, const SolveOutcome& outcome) {
    os << header_s << '\n';
    os << "status " << toString(outcome.status) << '\n';
    if (outcome.failure()) {
        os << "error " << toString(outcome.errorKind) << '\n';
    }
    if (not outcome.message.empty()) {
        os << "reason " << oneLine(outcome.message) << '\n';
    }
    for (const auto& step : outcome.plan) { os << "step " << oneLine(step) << '\n'; }
    os << "end" << std::endl;
}

bool readOutcome(std::istream& in, SolveOutcome& out) {
    std::string line;
    bool        header = false;
    while (not header && std::getline(in, line)) {
        stripCr(line);
        header = line == header_s;
    }
    if (not header) {
        return false;
    }
    SolveOutcome res;
    bool         status = false;
    res.errorKind       = SolveOutcome::error_none;
    for (;;) {
        line.clear();
        POTASSCO_CHECK(static_cast<bool>(std::getline(in, line)), std::errc::bad_message,
                       "incomplete response envelope");
        stripCr(line);
        if (line == "end") {
            break;
        }
        auto sep   = line.find(' ');
        auto key   = std::string_view(line).substr(0, sep);
        auto value = sep != std::string::npos ? std::string_view(line).substr(sep + 1) : std::string_view();
        if (key == "status") {
            POTASSCO_CHECK(lookup(status_names, value, res.status), std::errc::bad_message, "invalid status '%s'",
                           line.c_str());
            status = true;
        }
        else if (key == "error") {
            POTASSCO_CHECK(lookup(error_names, value, res.errorKind), std::errc::bad_message, "invalid error '%s'",
                           line.c_str());
        }
        else if (key == "reason") {
            res.message = value;
        }
        else if (key == "step") {
            res.plan.emplace_back(value);
        }
        else {
            POTASSCO_CHECK(false, std::errc::bad_message, "unexpected line in response envelope: '%s'", line.c_str());
        }
    }
    POTASSCO_CHECK(status, std::errc::bad_message, "response envelope without status");
    if (res.status != SolveOutcome::status_failure) {
        res.errorKind = SolveOutcome::error_none;
    }
    else {
        POTASSCO_CHECK(res.errorKind != SolveOutcome::error_none, std::errc::bad_message,
                       "failure envelope without error kind");
    }
    out = std::move(res);
    return true;
}

} // namespace Upserve

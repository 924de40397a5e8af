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
#include <upserve/harness.h>

#include <potassco/error.h>

#include <filesystem>

namespace Upserve {

const HarnessOptions::StringSeq& HarnessOptions::defaultInstances() {
    static const StringSeq instances = {
        "basic",
        "basic_without_negative_preconditions",
        "basic_nested_conjunctions",
        "hierarchical_blocks_world",
        "hierarchical_blocks_world_object_as_root",
        "hierarchical_blocks_world_with_object",
        "matchcellar",
    };
    return instances;
}

std::string HarnessOptions::problemFile(const std::string& name) const {
    auto file = std::filesystem::path(problemsDir) / name;
    if (not extension.empty()) {
        file += "." + extension;
    }
    return file.string();
}

ValidationHarness::ValidationHarness(HarnessOptions opts, EventHandler* handler)
    : opts_(std::move(opts))
    , handler_(handler) {
    POTASSCO_CHECK(not opts_.executable.empty() || not opts_.buildCommand.empty(), std::errc::invalid_argument,
                   "harness: executable or build command required");
    POTASSCO_CHECK(not opts_.executable.empty() || not opts_.buildOutput.empty(), std::errc::invalid_argument,
                   "harness: build output required");
}

void ValidationHarness::report(HarnessEvent::Op op, const std::string& text) const {
    if (handler_) {
        handler_->dispatch(HarnessEvent(op, text));
    }
}

std::vector<std::string> ValidationHarness::commandFor(const std::string& exe, const std::string& instance) const {
    return {exe, "--address", opts_.address, "--file-path", opts_.problemFile(instance)};
}

bool ValidationHarness::build(HarnessReport& rep) {
    auto argv = splitCommand(opts_.buildCommand);
    POTASSCO_CHECK(not argv.empty(), std::errc::invalid_argument, "harness: empty build command");
    report(HarnessEvent::op_build, joinCommand(argv));
    ProcessOptions po;
    po.captureOutput = false;
    auto res         = runCommand(argv, po);
    if (res.success()) {
        return true;
    }
    rep.buildFailed = true;
    rep.command     = joinCommand(argv);
    rep.result      = res;
    rep.message     = "Build failed: " + res.describe();
    report(HarnessEvent::op_failure, rep.message);
    return false;
}

HarnessReport ValidationHarness::run() {
    HarnessReport rep;
    std::string   exe = opts_.executable;
    if (exe.empty()) {
        if (not build(rep)) {
            return rep;
        }
        exe = opts_.buildOutput;
    }
    ProcessOptions po;
    po.timeout = opts_.timeout;
    for (const auto& instance : opts_.instances) {
        auto argv = commandFor(exe, instance);
        auto cmd  = joinCommand(argv);
        report(HarnessEvent::op_instance, argv.back());
        report(HarnessEvent::op_command, cmd);
        ++rep.attempted;
        auto res = runCommand(argv, po);
        if (not res.success()) {
            rep.failed  = instance;
            rep.command = cmd;
            rep.result  = res;
            rep.message = "Solver did not return expected result on '" + instance + "': " + res.describe();
            if (not res.output.empty()) {
                report(HarnessEvent::op_output, res.output);
            }
            report(HarnessEvent::op_failure, rep.message);
            break;
        }
        ++rep.solved;
    }
    return rep;
}

} // namespace Upserve

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

#include <upserve/cli/text_output.h>
#include <upserve/harness.h>
#include <upserve/protocol.h>
#include <upserve/solver.h>

#include <potassco/application.h>
#include <potassco/program_opts/typed_value.h>

#include <memory>
#include <string>
#include <vector>

/*!
 * \file
 * \brief Command-line applications hosting and validating solver endpoints.
 */
namespace Upserve::Cli {

//! Options of the endpoint application.
struct UpserveAppOptions {
    using StringSeq = std::vector<std::string>;
    void        initOptions(Potassco::ProgramOptions::OptionContext& root);
    std::string address;          // address of the endpoint
    std::string filePath;         // problem to solve in one-shot mode
    std::string solver;           // registry name of the hosted solver (empty: $UPSERVE_SOLVER or exec)
    StringSeq   solverOpts;       // key=value options of the hosted solver
    uint32_t    serve{0};         // max number of connections in serve mode (0=until quit)
    bool        listSolvers{false};
};
/////////////////////////////////////////////////////////////////////////////////////////
// endpoint application
/////////////////////////////////////////////////////////////////////////////////////////
//! Hosts a registered solver at an address.
/*!
 * Given a problem file, the application solves it once, writes the response
 * envelope to stdout and exits with the exit code of the outcome. Otherwise, it
 * serves requests on the address.
 *
 * The hosted solver can also be configured via the environment:
 *  - UPSERVE_SOLVER: solver to host if --solver is not given.
 *  - UPSERVE_SOLVER_OPTIONS: whitespace separated key=value options that are
 *    applied before the ones given via --option.
 */
class UpserveApp
    : public Potassco::Application
    , public EventHandler {
public:
    UpserveApp();
    ~UpserveApp() override;
    [[nodiscard]] const char* getName() const override { return "upserve"; }
    [[nodiscard]] const char* getVersion() const override { return UPSERVE_VERSION; }
    [[nodiscard]] const char* getUsage() const override {
        return "[options] [file]\n"
               "Solve the planning problem given in <file> or serve solve requests on --address";
    }

protected:
    using Potassco::Application::run;
    [[nodiscard]] const int* getSignals() const override;
    [[nodiscard]] HelpOpt     getHelpOption() const override { return {"Print {1=basic|2=more} help and exit", 2}; }
    [[nodiscard]] const char* getPositional(const std::string& value) const override;

    void initOptions(Potassco::ProgramOptions::OptionContext& root) override;
    void validateOptions(const Potassco::ProgramOptions::OptionContext& root,
                         const Potassco::ProgramOptions::ParsedOptions& parsed,
                         const Potassco::ProgramOptions::ParsedValues&  values) override;
    void setup() override;
    void run() override;
    void shutdown() override;
    bool onSignal(int) override;
    void flush() override;
    void onHelp(const std::string& help, Potassco::ProgramOptions::DescriptionLevel level) override;
    void onVersion(const std::string& version) override;
    bool onUnhandledException(const char*) override;
    void onEvent(const Event& ev) override;

private:
    using SolverPtr   = std::unique_ptr<Solver>;
    using EndpointPtr = std::unique_ptr<Endpoint>;
    using OutPtr      = std::unique_ptr<TextOutput>;
    UpserveAppOptions opts_;
    SolverOptions     solverOpts_;
    Address           address_;
    OutPtr            out_;
    SolverPtr         solver_;
    EndpointPtr       endpoint_;
};
/////////////////////////////////////////////////////////////////////////////////////////
// validation application
/////////////////////////////////////////////////////////////////////////////////////////
//! Runs an endpoint executable over a corpus of problems.
/*!
 * Exits with 0 if every instance was solved and with 1 otherwise.
 */
class ValidateApp
    : public Potassco::Application
    , public EventHandler {
public:
    ValidateApp();
    ~ValidateApp() override;
    [[nodiscard]] const char* getName() const override { return "upserve-validate"; }
    [[nodiscard]] const char* getVersion() const override { return UPSERVE_VERSION; }
    [[nodiscard]] const char* getUsage() const override {
        return "[options] [instance...]\n"
               "Run an endpoint on each <instance> (default: reference corpus) and stop at the first failure";
    }

protected:
    using Potassco::Application::run;
    [[nodiscard]] HelpOpt     getHelpOption() const override { return {"Print help and exit", 1}; }
    [[nodiscard]] const char* getPositional(const std::string& value) const override;

    void initOptions(Potassco::ProgramOptions::OptionContext& root) override;
    void validateOptions(const Potassco::ProgramOptions::OptionContext& root,
                         const Potassco::ProgramOptions::ParsedOptions& parsed,
                         const Potassco::ProgramOptions::ParsedValues&  values) override;
    void setup() override;
    void run() override;
    void flush() override;
    void onVersion(const std::string& version) override;
    bool onUnhandledException(const char*) override;
    void onEvent(const Event& ev) override;

private:
    HarnessOptions              opts_;
    std::vector<std::string>    instances_;
    std::unique_ptr<TextOutput> out_;
};

} // namespace Upserve::Cli

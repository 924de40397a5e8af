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
#include <upserve/cli/upserve_app.h>

#include <upserve/process_solver.h>

#include <potassco/error.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <new>

#include <unistd.h>

namespace Upserve::Cli {
/////////////////////////////////////////////////////////////////////////////////////////
// Some helpers
/////////////////////////////////////////////////////////////////////////////////////////
#define WRITE_STDERR(TYPE, MSG, ...)                                                                                   \
    do {                                                                                                               \
        char buffer[256];                                                                                              \
        auto len = formatMessage(buffer, Potassco::Application::TYPE, (MSG) POTASSCO_OPTARGS(__VA_ARGS__));            \
        fwrite(buffer, sizeof(char), len, stderr);                                                                     \
        fflush(stderr);                                                                                                \
    } while (0)

constexpr const char* solver_env_s      = "UPSERVE_SOLVER";
constexpr const char* solver_opts_env_s = "UPSERVE_SOLVER_OPTIONS";

static void writeSigMessage(std::string_view message) { // async signal safe
    for (auto fd = fileno(stderr); not message.empty();) {
        if (auto x = write(fd, message.data(), message.size()); x >= 0) {
            message.remove_prefix(static_cast<std::size_t>(x));
        }
        else if (errno != EINTR) {
            break;
        }
    }
}
static void printVersion(const std::string& version) {
    printf("%s\n", version.c_str());
    printf("libupserve version %s (libpotassco version %s)\n", UPSERVE_VERSION, LIB_POTASSCO_VERSION);
    printf("%s\n", UPSERVE_LEGAL);
}
static void setHandlerVerbosity(EventHandler& h, uint32_t verb) {
    auto v = static_cast<Event::Verbosity>(std::min(verb, static_cast<uint32_t>(Event::verbosity_max)));
    h.setVerbosity(Event::subsystem_solve, v);
    h.setVerbosity(Event::subsystem_harness, v);
}
/////////////////////////////////////////////////////////////////////////////////////////
// UpserveAppOptions
/////////////////////////////////////////////////////////////////////////////////////////
void UpserveAppOptions::initOptions(Potassco::ProgramOptions::OptionContext& root) {
    using namespace Potassco::ProgramOptions;
    OptionGroup basic("Endpoint Options");
    basic.addOptions()                                                                              //
        ("address", storeTo(address)->arg("<host:port>"), "Serve solve requests on %A")            //
        ("file-path,f", storeTo(filePath)->arg("<file>"),                                          //
         "Solve the problem in %A once and exit\n"                                                 //
         "      Exit code: {0=plan|20=unsolvable|30=unsupported|65=error|128=not started}")        //
        ("solver", storeTo(solver)->arg("<name>"), "Host the solver registered as %A [exec]")      //
        ("option,o", storeTo(solverOpts)->arg("<key=value>")->composing(),                          //
         "Pass option %A to the hosted solver")                                                    //
        ("serve,@1", storeTo(serve)->arg("<n>"), "Stop after serving %A connections (0=until quit)") //
        ("list-solvers", flag(listSolvers), "Print registered solvers and exit");                  //
    root.add(basic);
}
/////////////////////////////////////////////////////////////////////////////////////////
// UpserveApp
/////////////////////////////////////////////////////////////////////////////////////////
UpserveApp::UpserveApp()  = default;
UpserveApp::~UpserveApp() = default;

const int* UpserveApp::getSignals() const {
    static const int signals[] = {SIGINT, SIGTERM, SIGHUP, SIGXCPU, 0};
    return signals;
}
const char* UpserveApp::getPositional(const std::string&) const { return "file-path"; }

void UpserveApp::initOptions(Potassco::ProgramOptions::OptionContext& root) {
    opts_.initOptions(root);
    root.find("verbose")->get()->value()->defaultsTo("1");
}

void UpserveApp::validateOptions(const Potassco::ProgramOptions::OptionContext&,
                                 const Potassco::ProgramOptions::ParsedOptions&,
                                 const Potassco::ProgramOptions::ParsedValues&) {
    if (opts_.listSolvers) {
        return;
    }
    setExitCode(exit_no_run);
    POTASSCO_CHECK(not opts_.address.empty(), std::errc::invalid_argument, "'address': option is required!");
    address_ = parseAddress(opts_.address);
    if (opts_.solver.empty()) {
        const char* env = std::getenv(solver_env_s);
        opts_.solver    = env && *env ? env : ProcessSolver::name_s;
    }
    POTASSCO_CHECK(defaultRegistry().find(opts_.solver) != nullptr, std::errc::invalid_argument,
                   "'solver': unknown solver '%s'!", opts_.solver.c_str());
    if (const char* env = std::getenv(solver_opts_env_s); env && *env) {
        for (const auto& opt : splitCommand(env)) { solverOpts_.parse(opt); }
    }
    for (const auto& opt : opts_.solverOpts) { solverOpts_.parse(opt); }
    setExitCode(0);
}

void UpserveApp::setup() {
    out_ = std::make_unique<TextOutput>(getVerbose(), opts_.filePath.empty() ? stdout : stderr);
    setHandlerVerbosity(*this, getVerbose());
    if (opts_.listSolvers) {
        return;
    }
    // invalid solver options and unreachable endpoints are reported before any solve
    setExitCode(exit_no_run);
    solver_ = defaultRegistry().create(opts_.solver, solverOpts_);
    solver_->setEventHandler(this);
    endpoint_ = std::make_unique<Endpoint>(*solver_, address_);
    setExitCode(0);
}

void UpserveApp::run() {
    if (opts_.listSolvers) {
        out_->printSolvers(defaultRegistry());
        return;
    }
    if (not opts_.filePath.empty()) {
        auto res = endpoint_->handle(opts_.filePath);
        writeOutcome(std::cout, res);
        if (res.failure()) {
            WRITE_STDERR(message_warning, "%s\n", res.message.c_str());
        }
        setExitCode(exitCode(res));
        return;
    }
    endpoint_->bind();
    WRITE_STDERR(message_info, "Serving %s on %s:%u\n", solver_->name(), address_.host.c_str(),
                 static_cast<unsigned>(endpoint_->port()));
    auto served = endpoint_->serve(opts_.serve);
    WRITE_STDERR(message_info, "Served %u connection(s)\n", served);
}

void UpserveApp::shutdown() {
    endpoint_.reset();
    if (solver_) {
        solver_->destroy();
    }
}

bool UpserveApp::onSignal(int) {
    char message[80];
    auto len = formatMessage(message, message_info, "INTERRUPTED by signal!\n");
    writeSigMessage({message, len});
    setExitCode(exit_interrupt);
    shutdown();
    exit(getExitCode());
    return false;
}

void UpserveApp::onEvent(const Event& ev) {
    if (const auto* log = event_cast<LogEvent>(ev); log && log->isWarning()) {
        WRITE_STDERR(message_warning, "%s\n", log->msg);
    }
    else if (out_) {
        out_->dispatch(ev);
    }
}

void UpserveApp::flush() {
    fflush(stdout);
    fflush(stderr);
}

void UpserveApp::onHelp(const std::string& help, Potassco::ProgramOptions::DescriptionLevel level) {
    printf("%s\n", help.c_str());
    if (level == Potassco::ProgramOptions::desc_level_default) {
        printf("\nType '%s --help=2' for all options.\n", getName());
    }
    printf("Type '%s --list-solvers' for the registered solvers.\n", getName());
    printf("Environment: %s=<name> and %s='<key=value>...' configure the hosted solver.\n", solver_env_s,
           solver_opts_env_s);
}

void UpserveApp::onVersion(const std::string& version) { printVersion(version); }

bool UpserveApp::onUnhandledException(const char* msg) {
    if (std::strstr(msg, std::bad_alloc().what())) {
        setExitCode(exit_memory);
    }
    else if (getExitCode() != exit_no_run) {
        setExitCode(exit_error);
    }
    fprintf(stderr, "%s\n", msg);
    return false;
}
/////////////////////////////////////////////////////////////////////////////////////////
// ValidateApp
/////////////////////////////////////////////////////////////////////////////////////////
ValidateApp::ValidateApp()  = default;
ValidateApp::~ValidateApp() = default;

const char* ValidateApp::getPositional(const std::string&) const { return "instance"; }

void ValidateApp::initOptions(Potassco::ProgramOptions::OptionContext& root) {
    using namespace Potassco::ProgramOptions;
    OptionGroup basic("Validation Options");
    basic.addOptions()                                                                                    //
        ("executable,e", storeTo(opts_.executable)->arg("<file>"), "Validate endpoint %A (default: build)") //
        ("build-cmd", storeTo(opts_.buildCommand)->arg("<cmd>"), "Build the endpoint with %A")             //
        ("build-output", storeTo(opts_.buildOutput)->arg("<file>"), "Endpoint produced by --build-cmd")    //
        ("address", storeTo(opts_.address)->arg("<host:port>"), "Pass %A to the endpoint")                 //
        ("problems-dir", storeTo(opts_.problemsDir)->arg("<dir>"), "Read problems from %A")                //
        ("ext", storeTo(opts_.extension)->arg("<ext>"), "Problem files have extension %A")                 //
        ("timeout", storeTo(opts_.timeout)->arg("<sec>"), "Kill an endpoint after %A seconds (0=no limit)") //
        ("instance,@1", storeTo(instances_)->composing(), "Instance to run");                             //
    root.add(basic);
}

void ValidateApp::validateOptions(const Potassco::ProgramOptions::OptionContext&,
                                  const Potassco::ProgramOptions::ParsedOptions&,
                                  const Potassco::ProgramOptions::ParsedValues&) {
    setExitCode(1);
    parseAddress(opts_.address);
    if (not instances_.empty()) {
        opts_.instances = instances_;
    }
    setExitCode(0);
}

void ValidateApp::setup() {
    out_ = std::make_unique<TextOutput>(getVerbose());
    setHandlerVerbosity(*this, getVerbose());
}

void ValidateApp::run() {
    ValidationHarness harness(opts_, this);
    auto              rep = harness.run();
    if (rep.ok()) {
        printf("All %u instance(s) solved\n", rep.solved);
    }
    setExitCode(rep.exitCode());
}

void ValidateApp::onEvent(const Event& ev) {
    if (const auto* hev = event_cast<HarnessEvent>(ev); hev && hev->op == HarnessEvent::op_failure) {
        WRITE_STDERR(message_warning, "%s\n", hev->text);
    }
    else if (out_) {
        out_->dispatch(ev);
    }
}

void ValidateApp::flush() {
    fflush(stdout);
    fflush(stderr);
}

void ValidateApp::onVersion(const std::string& version) { printVersion(version); }

bool ValidateApp::onUnhandledException(const char* msg) {
    setExitCode(1);
    fprintf(stderr, "%s\n", msg);
    return false;
}

} // namespace Upserve::Cli

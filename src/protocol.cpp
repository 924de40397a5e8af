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
#include <upserve/protocol.h>

#include <potassco/error.h>
#include <potassco/program_opts/string_convert.h>

#include <boost/asio.hpp>

#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace Upserve {
namespace asio = boost::asio;
using tcp      = asio::ip::tcp;

namespace {
constexpr std::string_view header_s = "upserve 1";

void stripCr(std::string& line) {
    if (not line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}
std::pair<std::string_view, std::string_view> splitRequest(std::string_view line) {
    auto sep = line.find(' ');
    if (sep == std::string_view::npos) {
        return {line, {}};
    }
    return {line.substr(0, sep), line.substr(sep + 1)};
}
std::errc toErrc(const boost::system::error_code& ec, std::errc def) {
    return ec.category() == boost::system::system_category() ? static_cast<std::errc>(ec.value()) : def;
}
} // namespace
/////////////////////////////////////////////////////////////////////////////////////////
// Address
/////////////////////////////////////////////////////////////////////////////////////////
std::string Address::toString() const {
    auto portStr = std::to_string(port);
    return host.find(':') != std::string::npos ? "[" + host + "]:" + portStr : host + ":" + portStr;
}

Address parseAddress(std::string_view str) {
    std::string_view host;
    std::string_view port;
    bool             valid = false;
    if (not str.empty() && str.front() == '[') {
        auto close = str.find(']');
        if (close != std::string_view::npos && close + 1 < str.size() && str[close + 1] == ':') {
            host  = str.substr(1, close - 1);
            port  = str.substr(close + 2);
            valid = true;
        }
    }
    else if (auto sep = str.rfind(':'); sep != std::string_view::npos) {
        host  = str.substr(0, sep);
        port  = str.substr(sep + 1);
        valid = host.find(':') == std::string_view::npos;
    }
    valid = valid && not host.empty() && host.find_first_of(" \t[]") == std::string_view::npos;
    unsigned num = 0;
    POTASSCO_CHECK(valid && Potassco::stringTo(port, num) == std::errc{} && num <= 65535u, std::errc::invalid_argument,
                   "invalid address '%.*s': 'host:port' expected", static_cast<int>(str.size()), str.data());
    return {std::string(host), static_cast<uint16_t>(num)};
}
/////////////////////////////////////////////////////////////////////////////////////////
// kind envelope
/////////////////////////////////////////////////////////////////////////////////////////
void writeKind(std::ostream& os, const char* solverName, const ProblemKind& kind) {
    os << header_s << '\n';
    os << "name " << solverName << '\n';
    kind.forEach([&os](Category c, const char* tag) {
        if (tag) {
            os << "feature " << ProblemKind::categoryName(c) << ':' << tag << '\n';
        }
        else {
            os << "category " << ProblemKind::categoryName(c) << '\n';
        }
    });
    os << "end" << std::endl;
}

bool readKind(std::istream& in, std::string& solverName, ProblemKind& kind) {
    std::string line;
    bool        header = false;
    while (not header && std::getline(in, line)) {
        stripCr(line);
        header = line == header_s;
    }
    if (not header) {
        return false;
    }
    ProblemKind res;
    std::string name;
    for (;;) {
        line.clear();
        POTASSCO_CHECK(static_cast<bool>(std::getline(in, line)), std::errc::bad_message, "incomplete kind envelope");
        stripCr(line);
        if (line == "end") {
            break;
        }
        auto [key, value] = splitRequest(line);
        if (key == "name") {
            name = value;
        }
        else if (key == "feature") {
            res.set(value);
        }
        else if (key == "category") {
            Category c;
            POTASSCO_CHECK(ProblemKind::findCategory(value, c), std::errc::bad_message, "unknown category in '%s'",
                           line.c_str());
            res.setCategory(c);
        }
        else {
            POTASSCO_CHECK(false, std::errc::bad_message, "unexpected line in kind envelope: '%s'", line.c_str());
        }
    }
    POTASSCO_CHECK(not name.empty(), std::errc::bad_message, "kind envelope without name");
    solverName = std::move(name);
    kind       = res.freeze();
    return true;
}
/////////////////////////////////////////////////////////////////////////////////////////
// Endpoint
/////////////////////////////////////////////////////////////////////////////////////////
struct Endpoint::Impl {
    asio::io_context               io;
    std::unique_ptr<tcp::acceptor> acceptor;
};

Endpoint::Endpoint(Solver& solver, Address address)
    : solver_(&solver)
    , address_(std::move(address))
    , impl_(std::make_unique<Impl>()) {}
Endpoint::~Endpoint() { close(); }

SolveOutcome Endpoint::handle(const std::string& locator) {
    std::ifstream file(locator);
    if (not file.is_open()) {
        return SolveOutcome::failed(SolveOutcome::error_transport, "Can not read from '" + locator + "'!");
    }
    if (not isProblemEnvelope(file)) {
        return SolveOutcome::failed(SolveOutcome::error_solve, "'" + locator + "' is not a problem envelope");
    }
    Problem problem;
    try {
        problem = readProblem(file, locator);
    }
    catch (const std::invalid_argument& e) {
        return SolveOutcome::notSupported(e.what());
    }
    catch (const std::runtime_error& e) {
        return SolveOutcome::failed(SolveOutcome::error_solve, e.what());
    }
    return solver_->solve(problem);
}

void Endpoint::bind() {
    if (bound()) {
        return;
    }
    boost::system::error_code ec;
    tcp::resolver             resolver(impl_->io);
    auto results = resolver.resolve(address_.host, std::to_string(address_.port), tcp::resolver::passive, ec);
    POTASSCO_CHECK(not ec && not results.empty(), std::errc::address_not_available, "could not resolve '%s': %s",
                   address_.toString().c_str(), ec.message().c_str());
    auto acceptor = std::make_unique<tcp::acceptor>(impl_->io);
    auto ep       = results.begin()->endpoint();
    acceptor->open(ep.protocol(), ec);
    if (not ec) {
        acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (not ec) {
        acceptor->bind(ep, ec);
    }
    if (not ec) {
        acceptor->listen(asio::socket_base::max_listen_connections, ec);
    }
    POTASSCO_CHECK(not ec, toErrc(ec, std::errc::address_in_use), "could not bind '%s': %s",
                   address_.toString().c_str(), ec.message().c_str());
    impl_->acceptor = std::move(acceptor);
}

uint32_t Endpoint::serve(uint32_t maxConnections) {
    bind();
    uint32_t served = 0;
    for (bool more = true; more && (maxConnections == 0 || served != maxConnections);) {
        tcp::iostream             stream;
        boost::system::error_code ec;
        impl_->acceptor->accept(stream.socket(), ec);
        POTASSCO_CHECK(not ec, toErrc(ec, std::errc::connection_aborted), "accept failed on '%s': %s",
                       address_.toString().c_str(), ec.message().c_str());
        ++served;
        more = process(stream);
    }
    return served;
}

bool Endpoint::process(std::iostream& stream) {
    for (std::string line; std::getline(stream, line);) {
        stripCr(line);
        auto [req, arg] = splitRequest(line);
        if (req.empty()) {
            continue;
        }
        if (req == "kind") {
            writeKind(stream, solver_->name(), solver_->capabilities());
        }
        else if (req == "solve") {
            writeOutcome(stream, handle(std::string(arg)));
        }
        else if (req == "quit") {
            stream << "bye" << std::endl;
            return false;
        }
        else {
            writeOutcome(stream, SolveOutcome::failed(SolveOutcome::error_transport,
                                                      "unknown request '" + std::string(req) + "'"));
        }
        if (not stream) {
            break;
        }
    }
    return true;
}

void Endpoint::close() {
    if (impl_->acceptor) {
        boost::system::error_code ec;
        impl_->acceptor->close(ec);
        impl_->acceptor.reset();
    }
}

bool     Endpoint::bound() const { return impl_->acceptor && impl_->acceptor->is_open(); }
uint16_t Endpoint::port() const {
    if (not bound()) {
        return address_.port;
    }
    boost::system::error_code ec;
    auto                      ep = impl_->acceptor->local_endpoint(ec);
    return ec ? address_.port : ep.port();
}
/////////////////////////////////////////////////////////////////////////////////////////
// ProtocolClient
/////////////////////////////////////////////////////////////////////////////////////////
struct ProtocolClient::Impl {
    tcp::iostream stream;
};

ProtocolClient::ProtocolClient(Address address) : address_(std::move(address)), impl_(std::make_unique<Impl>()) {
    impl_->stream.connect(address_.host, std::to_string(address_.port));
    POTASSCO_CHECK(static_cast<bool>(impl_->stream), std::errc::connection_refused, "could not connect to '%s': %s",
                   address_.toString().c_str(), impl_->stream.error().message().c_str());
}
ProtocolClient::~ProtocolClient() { close(); }

bool ProtocolClient::connected() const { return impl_->stream.socket().is_open(); }

std::iostream& ProtocolClient::stream() {
    POTASSCO_CHECK(connected(), std::errc::not_connected, "not connected to '%s'", address_.toString().c_str());
    return impl_->stream;
}

ProblemKind ProtocolClient::kind(std::string* solverName) {
    auto& s = stream();
    s << "kind" << std::endl;
    std::string name;
    ProblemKind res;
    POTASSCO_CHECK(readKind(s, name, res), std::errc::connection_aborted, "'%s': no answer to kind request",
                   address_.toString().c_str());
    if (solverName) {
        *solverName = std::move(name);
    }
    return res;
}

SolveOutcome ProtocolClient::solve(const SolveRequest& req) {
    POTASSCO_CHECK(req.locator.find('\n') == std::string::npos, std::errc::invalid_argument,
                   "invalid locator '%s'", req.locator.c_str());
    auto& s = stream();
    s << "solve " << req.locator << std::endl;
    SolveOutcome res;
    POTASSCO_CHECK(readOutcome(s, res), std::errc::connection_aborted, "'%s': connection closed while solving '%s'",
                   address_.toString().c_str(), req.locator.c_str());
    return res;
}

void ProtocolClient::quit() {
    auto& s = stream();
    s << "quit" << std::endl;
    std::string line;
    std::getline(s, line);
    stripCr(line);
    close();
    POTASSCO_CHECK(line == "bye", std::errc::connection_aborted, "'%s': quit not acknowledged",
                   address_.toString().c_str());
}

void ProtocolClient::close() {
    if (connected()) {
        impl_->stream.close();
    }
}
/////////////////////////////////////////////////////////////////////////////////////////
// RemoteSolver
/////////////////////////////////////////////////////////////////////////////////////////
RemoteSolver::RemoteSolver(const SolverOptions& opts) {
    opts.checkKeys(name_s, {"address"});
    POTASSCO_CHECK(opts.has("address"), std::errc::invalid_argument, "%s: option 'address' is required", name_s);
    address_ = parseAddress(opts.get("address"));
    client_  = std::make_unique<ProtocolClient>(address_);
    kind_    = client_->kind(&remote_);
}
RemoteSolver::~RemoteSolver() { destroy(); }

SolveOutcome RemoteSolver::doSolve(const Problem& problem) {
    SolveRequest req{address_, problem.locator, problem.kind};
    try {
        return client_->solve(req);
    }
    catch (const std::invalid_argument& e) {
        // request was not sent, the connection remains usable
        return SolveOutcome::failed(SolveOutcome::error_transport, e.what());
    }
    catch (const std::runtime_error& e) {
        client_->close();
        return SolveOutcome::failed(SolveOutcome::error_transport,
                                    address_.toString() + " '" + req.locator + "': " + e.what());
    }
}

void RemoteSolver::doDestroy() { client_.reset(); }

SolverInfo RemoteSolver::info() {
    SolverInfo info;
    info.name        = name_s;
    info.roles       = role_oneshot_planner;
    info.staticKind  = false;
    info.description = "Forwards problems to an endpoint (options: address)";
    info.create      = [](const SolverOptions& opts) { return std::make_unique<RemoteSolver>(opts); };
    return info;
}

} // namespace Upserve

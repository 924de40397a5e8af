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

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

/*!
 * \file
 * \brief Line based protocol between solver clients and solver endpoints.
 *
 * A connection carries a sequence of requests, each a single line:
 * \code
 * kind              -> upserve 1 / name <solver> / feature <CAT:TAG>... / category <CAT>... / end
 * solve <locator>   -> response envelope (see writeOutcome())
 * quit              -> bye
 * \endcode
 * Requests on one connection are answered in order.
 */
namespace Upserve {
/*!
 * \defgroup protocol Protocol
 * \brief Exchanging problems and outcomes with solver endpoints.
 * @{
 */

//! Network address of an endpoint.
struct Address {
    std::string host; //!< Host name, IPv4 or IPv6 address (without brackets).
    uint16_t    port{0};

    //! Returns the address in the form host:port or [host]:port.
    [[nodiscard]] std::string toString() const;
};

//! Parses an address of the form host:port or [IPv6]:port.
/*!
 * \throw std::invalid_argument if str is not a valid address.
 */
Address parseAddress(std::string_view str);

//! A single solve request; built fresh for each call.
struct SolveRequest {
    Address     address; //!< Address of the endpoint.
    std::string locator; //!< Locator of the serialized problem.
    ProblemKind kind;    //!< Features required by the problem.
};

//! Writes the answer to a kind request.
void writeKind(std::ostream& os, const char* solverName, const ProblemKind& kind);
//! Reads the answer to a kind request.
/*!
 * \return false if in does not contain a kind envelope.
 * \throw std::runtime_error with errc bad_message if the envelope is malformed.
 */
bool readKind(std::istream& in, std::string& solverName, ProblemKind& kind);

//! Hosts a single solver at an address.
/*!
 * The endpoint does not own the solver. Connections are accepted and processed
 * one at a time; requests of a connection are processed in order.
 */
class Endpoint {
public:
    Endpoint(Solver& solver, Address address);
    ~Endpoint();
    Endpoint(const Endpoint&)            = delete;
    Endpoint& operator=(const Endpoint&) = delete;

    //! Loads the problem at locator and solves it with the hosted solver.
    /*!
     * A locator that can't be read yields a transport failure, a problem
     * referencing features outside the vocabulary yields an unsupported outcome,
     * and a malformed problem yields a solve failure.
     */
    SolveOutcome handle(const std::string& locator);

    //! Binds the address.
    /*!
     * A port of 0 binds an ephemeral port that is available via port().
     * \throw std::runtime_error if the address can't be bound.
     */
    void bind();
    //! Accepts and processes connections until maxConnections were served or a quit request was received.
    /*!
     * Binds the address if not already done.
     * \param maxConnections Maximal number of connections or 0 for no limit.
     * \return The number of connections served.
     */
    uint32_t serve(uint32_t maxConnections = 0);
    //! Releases the address.
    void close();

    [[nodiscard]] bool           bound() const;
    [[nodiscard]] uint16_t       port() const;
    [[nodiscard]] const Address& address() const { return address_; }
    [[nodiscard]] Solver&        solver() const { return *solver_; }

private:
    struct Impl;
    bool                  process(std::iostream& stream);
    Solver*               solver_;
    Address               address_;
    std::unique_ptr<Impl> impl_;
};

//! Client side of one connection to an endpoint.
/*!
 * Connection and communication failures are reported as std::runtime_error
 * with errc connection_refused or connection_aborted.
 */
class ProtocolClient {
public:
    //! Connects to the endpoint at the given address.
    explicit ProtocolClient(Address address);
    ~ProtocolClient();
    ProtocolClient(const ProtocolClient&)            = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    //! Requests the capabilities of the remote solver.
    ProblemKind kind(std::string* solverName = nullptr);
    //! Sends req to the endpoint and waits for its outcome.
    SolveOutcome solve(const SolveRequest& req);
    //! Asks the endpoint to stop serving and closes the connection.
    void quit();
    void close();

    [[nodiscard]] bool           connected() const;
    [[nodiscard]] const Address& address() const { return address_; }

private:
    struct Impl;
    std::iostream& stream();
    Address               address_;
    std::unique_ptr<Impl> impl_;
};

//! Solver that forwards problems to an endpoint.
/*!
 * Recognized options:
 *  - address: address of the endpoint (required).
 *
 * The solver opens one exclusive connection on construction and advertises the
 * capabilities reported by the endpoint. The connection is closed on destroy().
 */
class RemoteSolver : public Solver {
public:
    static constexpr const char* name_s = "remote";

    //! \throw std::invalid_argument if opts are invalid.
    //! \throw std::runtime_error if the endpoint can't be reached.
    explicit RemoteSolver(const SolverOptions& opts);
    ~RemoteSolver() override;

    [[nodiscard]] const char*        name() const override { return name_s; }
    [[nodiscard]] const ProblemKind& capabilities() const override { return kind_; }
    [[nodiscard]] uint32_t           roles() const override { return role_oneshot_planner; }

    //! Name of the solver hosted by the endpoint.
    [[nodiscard]] const std::string& remoteName() const { return remote_; }
    [[nodiscard]] const Address&     address() const { return address_; }

    static SolverInfo info();

protected:
    SolveOutcome doSolve(const Problem& problem) override;
    void         doDestroy() override;

private:
    Address                         address_;
    std::unique_ptr<ProtocolClient> client_;
    std::string                     remote_;
    ProblemKind                     kind_;
};
//@}
} // namespace Upserve

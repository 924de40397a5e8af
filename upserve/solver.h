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

#include <upserve/events.h>
#include <upserve/problem.h>
#include <upserve/solve_result.h>

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/*!
 * \file
 * \brief Defines the plugin interface of planning solvers and the solver registry.
 */
namespace Upserve {
/*!
 * \defgroup solver Solver
 * \brief Pluggable planning solvers.
 * @{
 */

//! Roles a solver can fulfill.
enum SolverRole : uint32_t {
    role_oneshot_planner = 1u,
    role_plan_validator  = 2u,
    role_grounder        = 4u,
};

//! Ordered list of key=value configuration options of a solver.
class SolverOptions {
public:
    using Entry = std::pair<std::string, std::string>;
    using Vec   = std::vector<Entry>;
    SolverOptions() = default;
    SolverOptions(std::initializer_list<Entry> opts) : opts_(opts) {}

    SolverOptions& add(std::string key, std::string value);
    //! Adds an option given in the form "key=value".
    /*!
     * \throw std::invalid_argument if opt is not of the expected form.
     */
    SolverOptions& parse(std::string_view opt);

    [[nodiscard]] const std::string* find(std::string_view key) const;
    [[nodiscard]] bool               has(std::string_view key) const { return find(key) != nullptr; }
    [[nodiscard]] std::string        get(std::string_view key, std::string_view def = {}) const;
    //! Returns the value of key as a non-negative number or def if key is not set.
    [[nodiscard]] double number(std::string_view key, double def) const;

    //! Checks that each option is one of the given keys.
    /*!
     * \throw std::invalid_argument on the first unrecognized key.
     */
    void checkKeys(const char* solver, std::initializer_list<std::string_view> keys) const;

    [[nodiscard]] bool        empty() const { return opts_.empty(); }
    [[nodiscard]] std::size_t size() const { return opts_.size(); }
    [[nodiscard]] auto        begin() const { return opts_.begin(); }
    [[nodiscard]] auto        end() const { return opts_.end(); }

private:
    Vec opts_;
};

//! Event emitted by a solver before and after a solve attempt.
struct SolveEvent : Event {
    enum Op { op_start = 'S', op_finish = 'F' };
    SolveEvent(const char* solverName, const Problem& p, const SolveOutcome* res)
        : Event(this, subsystem_solve, verbosity_low)
        , solver(solverName)
        , problem(&p)
        , outcome(res) {
        op = static_cast<uint32_t>(res ? op_finish : op_start);
    }
    const char*         solver;
    const Problem*      problem;
    const SolveOutcome* outcome; //!< Outcome of the attempt or nullptr on start.
};

//! Base class of all planning solvers.
/*!
 * A solver is ready after successful construction. Its lifecycle ends with
 * destroy(), which releases any process, connection, or handle held by the
 * solver. Construction failures are reported as exceptions, so no solver in an
 * invalid state is ever observable.
 *
 * \note Derived classes shall call destroy() in their destructor.
 */
class Solver {
public:
    enum State { state_ready = 1, state_destroyed = 2 };
    virtual ~Solver();
    Solver(const Solver&)            = delete;
    Solver& operator=(const Solver&) = delete;

    //! Unique and stable name of the solver.
    [[nodiscard]] virtual const char* name() const = 0;
    //! Features supported by this solver.
    [[nodiscard]] virtual const ProblemKind& capabilities() const = 0;
    //! Set of SolverRole values.
    [[nodiscard]] virtual uint32_t roles() const = 0;

    [[nodiscard]] bool isOneshotPlanner() const { return (roles() & role_oneshot_planner) != 0; }
    [[nodiscard]] bool isPlanValidator() const { return (roles() & role_plan_validator) != 0; }
    [[nodiscard]] bool isGrounder() const { return (roles() & role_grounder) != 0; }
    [[nodiscard]] bool supports(const ProblemKind& problem) const { return capabilities().supports(problem); }

    //! Solves the given problem.
    /*!
     * Problems whose kind is not supported are rejected with an unsupported
     * outcome. Runtime errors raised while solving are reported as failures.
     *
     * \pre state() == state_ready && isOneshotPlanner()
     * \throw std::logic_error if the precondition does not hold.
     */
    SolveOutcome solve(const Problem& problem);

    //! Releases all resources held by this solver.
    /*!
     * Calling destroy() more than once is a noop.
     */
    void destroy();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool  destroyed() const { return state_ == state_destroyed; }

    void                        setEventHandler(EventHandler* h) { handler_ = h; }
    [[nodiscard]] EventHandler* eventHandler() const { return handler_; }

protected:
    Solver();
    virtual SolveOutcome doSolve(const Problem& problem) = 0;
    virtual void         doDestroy();
    void                 report(const Event& ev) const {
        if (handler_) {
            handler_->dispatch(ev);
        }
    }
    void warn(const char* msg) const;

private:
    EventHandler* handler_;
    State         state_;
};

//! Registration record of a solver.
struct SolverInfo {
    using Factory = std::function<std::unique_ptr<Solver>(const SolverOptions&)>;

    std::string name;              //!< Registry key.
    uint32_t    roles{0};          //!< Set of SolverRole values.
    ProblemKind kind;              //!< Advertised features.
    bool        staticKind{true};  //!< Whether kind is known without creating a solver.
    std::string description;       //!< One line description used in listings.
    Factory     create;
};

//! Set of solvers addressable by name.
class SolverRegistry {
public:
    using InfoVec = std::vector<SolverInfo>;
    SolverRegistry();
    ~SolverRegistry();

    //! Registers a new solver.
    /*!
     * \throw std::invalid_argument if the name is empty or already registered.
     */
    SolverRegistry& add(SolverInfo info);

    [[nodiscard]] const SolverInfo* find(std::string_view name) const;
    //! Creates the solver registered under the given name.
    /*!
     * \throw std::invalid_argument if no such solver exists or if opts contain unrecognized keys.
     */
    [[nodiscard]] std::unique_ptr<Solver> create(std::string_view name, const SolverOptions& opts = {}) const;
    //! Returns the first solver (in registration order) having role and supporting problem.
    /*!
     * Solvers whose capabilities are only known after creation are not considered.
     */
    [[nodiscard]] const SolverInfo* select(const ProblemKind& problem, SolverRole role = role_oneshot_planner) const;

    [[nodiscard]] const InfoVec& solvers() const { return solvers_; }
    [[nodiscard]] std::size_t    size() const { return solvers_.size(); }

private:
    InfoVec solvers_;
};

//! Returns a registry containing the built-in solvers.
const SolverRegistry& defaultRegistry();
//! Adds the built-in solvers to the given registry.
SolverRegistry& addBuiltinSolvers(SolverRegistry& reg);
//@}
} // namespace Upserve

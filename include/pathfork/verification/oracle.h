#pragma once

#include <cstddef>
#include <pathfork/state/heap.h>
#include <pathfork/terms/term.h>
#include <string_view>
#include <z3++.h>

/**
 * @file oracle.h
 * @brief Scoped theorem-proving session used to decide and record path facts.
 */

namespace pathfork::verification
{

using pathfork::terms::Term;
using pathfork::terms::TermSet;

/**
 * @brief Theorem-proving session with a scoped fact set (the path condition).
 *
 * Facts assumed inside a scope are dropped when the scope is popped. Scopes nest in stack order.
 */
class Oracle
{
  public:
    virtual ~Oracle() = default;

    /** @brief Context that terms handed to this oracle are built in. */
    [[nodiscard]] virtual z3::context& context() = 0;

    /**
     * @brief True only if @p formula is proven unsatisfiable together with the current facts.
     *
     * Never changes the fact set. A query that runs out of its @p timeout_ms budget, or that
     * the prover cannot decide, answers false.
     */
    [[nodiscard]] virtual bool query_infeasible(const pathfork::state::State& state,
                                                const Term& formula, unsigned timeout_ms) = 0;

    virtual void assume(const Term& formula) = 0;
    virtual void assume(const TermSet& formulas);

    [[nodiscard]] virtual TermSet current_facts() const = 0;

    virtual void push_scope() = 0;
    virtual void pop_scope() = 0;
    [[nodiscard]] virtual std::size_t scope_depth() const = 0;

    /** @brief Record a comment in the prover log; has no effect on the facts. */
    virtual void log(std::string_view comment) = 0;
};

/** @brief Opens an oracle scope for its lifetime. */
class ScopeGuard
{
  public:
    explicit ScopeGuard(Oracle& oracle) : oracle_(oracle) { oracle_.push_scope(); }
    ~ScopeGuard() { oracle_.pop_scope(); }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

  private:
    Oracle& oracle_;
};

/** @brief Run @p block inside a fresh scope that is closed on every exit path. */
template <typename F> decltype(auto) with_scope(Oracle& oracle, F&& block)
{
    ScopeGuard guard(oracle);
    return block();
}

} // namespace pathfork::verification

#pragma once

#include <cstdint>
#include <functional>
#include <pathfork/config/config.h>
#include <pathfork/engine/bookkeeper.h>
#include <pathfork/engine/counter.h>
#include <pathfork/state/compressor.h>
#include <pathfork/state/context.h>
#include <pathfork/state/heap.h>
#include <pathfork/verification/oracle.h>
#include <pathfork/verification/result.h>
#include <string_view>
#include <vector>

/**
 * @file brancher.h
 * @brief Two-way branching on a symbolic guard.
 */

namespace pathfork::engine
{

using pathfork::state::Context;
using pathfork::state::State;
using pathfork::terms::Term;
using pathfork::verification::VerificationResult;

/** @brief Rest of the path, run with the context extended by the branch guard. */
using Continuation = std::function<VerificationResult(const Context&)>;

/**
 * @brief Explores the feasible outcomes of a guard, each under its own oracle scope.
 *
 * A side is skipped only when the oracle proves its guard infeasible; if the then-side is
 * skipped the else-side is always explored. The outcomes of both sides are combined. Scopes
 * are closed and a compressed heap is restored on every exit path, including exceptions
 * thrown by a continuation.
 *
 * The branch counter labelling log comments belongs to the brancher and is reset by
 * start() and reset(). Branching before start() is a structural error.
 */
class Brancher
{
  public:
    Brancher(pathfork::verification::Oracle& oracle, pathfork::state::HeapCompressor& compressor,
             Bookkeeper& bookkeeper, pathfork::config::BrancherConfig config);

    VerificationResult branch(State& state, const Term& guard, const Context& context,
                              const Continuation& on_true, const Continuation& on_false);

    /** @brief Branch on the conjunction of @p guards against the conjunction of their negations. */
    VerificationResult branch(State& state, const std::vector<Term>& guards, const Context& context,
                              const Continuation& on_true, const Continuation& on_false);

    void start();
    void reset();
    void stop();

    [[nodiscard]] bool started() const { return started_; }
    [[nodiscard]] pathfork::verification::Oracle& oracle() { return oracle_; }

  private:
    pathfork::verification::Oracle& oracle_;
    pathfork::state::HeapCompressor& compressor_;
    Bookkeeper& bookkeeper_;
    pathfork::config::BrancherConfig config_;
    Counter branch_counter_;
    bool started_ = false;

    VerificationResult explore(State& state, const Term& guard, const Context& context,
                               const Continuation& k, std::string_view label, std::uint64_t id);
    VerificationResult skip(const Term& guard, std::string_view label, std::uint64_t id);
};

} // namespace pathfork::engine

#pragma once

#include <functional>
#include <optional>
#include <pathfork/engine/bookkeeper.h>
#include <pathfork/engine/brancher.h>
#include <pathfork/engine/fact_classifier.h>

/**
 * @file joiner.h
 * @brief Branch on a guard and join both sides back into one term and one context.
 */

namespace pathfork::engine
{

/** @brief Reports the value a branch produced and the context it ended in. Call at most once. */
using JoinCompletion = std::function<VerificationResult(const Term&, const Context&)>;

/** @brief One side of a join: evaluates under the given context and reports via the completion. */
using JoinBranch = std::function<VerificationResult(const Context&, const JoinCompletion&)>;

/** @brief Receives the value of each reachable side and the merged context. */
using JoinContinuation = std::function<VerificationResult(
    const std::optional<Term>&, const std::optional<Term>&, const Context&)>;

/**
 * @brief Lets a branching sub-expression be evaluated once per side and then recombined.
 *
 * Facts a side adds to the path condition (other than its guard) are split by the fact
 * classifier: top-level facts are assumed as they are, nested facts are folded into a single
 * `ite(guard, /\ then-facts, /\ else-facts)`. The merged context always carries the branch
 * conditions the join started with.
 *
 * A side that branches again without going through a join of its own fires its completion
 * more than once; that throws StructuralError.
 */
class Joiner
{
  public:
    Joiner(Brancher& brancher, const FactClassifier& classifier, Bookkeeper& bookkeeper);

    VerificationResult branch_and_join(State& state, const Term& guard, const Context& context,
                                       const JoinBranch& on_true, const JoinBranch& on_false,
                                       const JoinContinuation& join);

  private:
    Brancher& brancher_;
    const FactClassifier& classifier_;
    Bookkeeper& bookkeeper_;
};

} // namespace pathfork::engine

#include <pathfork/diag/render.h>
#include <pathfork/diag/structural_error.h>
#include <pathfork/engine/joiner.h>
#include <pathfork/log/trace.h>
#include <string>
#include <string_view>
#include <variant>

namespace pathfork::engine
{
namespace
{

using pathfork::terms::TermSet;
using pathfork::verification::Oracle;

/** What one side of a join handed to its completion. */
struct SideCapture
{
    bool fired = false;
    TermSet facts;
    std::optional<Term> term;
    std::optional<Context> context;
};

Continuation capture_side(Oracle& oracle, const TermSet& facts_before, const JoinBranch& side,
                          SideCapture& capture, std::string_view label)
{
    return [&oracle, &facts_before, &side, &capture, label](const Context& branch_context)
    {
        // The brancher prepends the guard it assumed for this side.
        const Term assumed = branch_context.branch_conditions().front();

        const JoinCompletion complete =
            [&oracle, &facts_before, &capture, label, assumed](const Term& value,
                                                              const Context& end_context)
        {
            if (capture.fired)
            {
                throw pathfork::diag::StructuralError("unexpected branching in " +
                                                      std::string(label) +
                                                      "-side of a join: completion fired twice");
            }
            capture.fired = true;

            TermSet excluded = facts_before;
            excluded.insert(assumed);
            capture.facts = pathfork::terms::set_difference(oracle.current_facts(), excluded);
            capture.term = value;
            capture.context = end_context;
            return VerificationResult{pathfork::verification::Success{}};
        };

        return side(branch_context, complete);
    };
}

Context reset_conditions(const Context& c, const Context& pre)
{
    return c.with_branch_conditions(pre.branch_conditions());
}

Context merge_sides(const Context& pre, const std::optional<Context>& then_context,
                    const std::optional<Context>& else_context)
{
    if (then_context.has_value() && else_context.has_value())
    {
        auto merged =
            reset_conditions(*then_context, pre).merge(reset_conditions(*else_context, pre));
        if (auto* d = std::get_if<pathfork::diag::Diagnostic>(&merged))
        {
            throw pathfork::diag::StructuralError("join could not merge branch contexts: " +
                                                  pathfork::diag::render(*d));
        }
        return std::get<Context>(std::move(merged));
    }
    if (then_context.has_value())
    {
        return reset_conditions(*then_context, pre);
    }
    if (else_context.has_value())
    {
        return reset_conditions(*else_context, pre);
    }
    return pre;
}

} // namespace

Joiner::Joiner(Brancher& brancher, const FactClassifier& classifier, Bookkeeper& bookkeeper)
    : brancher_(brancher), classifier_(classifier), bookkeeper_(bookkeeper)
{
}

VerificationResult Joiner::branch_and_join(State& state, const Term& guard,
                                           const Context& context, const JoinBranch& on_true,
                                           const JoinBranch& on_false,
                                           const JoinContinuation& join)
{
    auto& oracle = brancher_.oracle();
    const TermSet facts_before = oracle.current_facts();

    SideCapture then_side;
    SideCapture else_side;

    const VerificationResult explored =
        brancher_.branch(state, guard, context,
                         capture_side(oracle, facts_before, on_true, then_side, "then"),
                         capture_side(oracle, facts_before, on_false, else_side, "else"));

    return pathfork::verification::combine(
        explored,
        [&]() -> VerificationResult
        {
            auto& ctx = oracle.context();
            const auto then_facts = classifier_.partition(then_side.facts);
            const auto else_facts = classifier_.partition(else_side.facts);

            const Term aux = pathfork::terms::ite(guard,
                                                  pathfork::terms::conjoin(ctx, then_facts.nested),
                                                  pathfork::terms::conjoin(ctx, else_facts.nested));

            oracle.assume(then_facts.top_level);
            oracle.assume(else_facts.top_level);
            oracle.assume(aux);

            const Context joined = merge_sides(context, then_side.context, else_side.context);
            bookkeeper_.joins += 1;
            pathfork::log::trace("join", "joined on " + pathfork::terms::to_string(guard) +
                                             " with " + pathfork::terms::to_string(aux));

            return join(then_side.term, else_side.term,
                        joined.with_branch_conditions(context.branch_conditions()));
        });
}

} // namespace pathfork::engine

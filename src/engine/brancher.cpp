#include <pathfork/diag/structural_error.h>
#include <pathfork/engine/brancher.h>
#include <pathfork/log/trace.h>
#include <string>
#include <utility>

namespace pathfork::engine
{
namespace
{

std::string branch_comment(std::string_view label, std::uint64_t id, const Term& guard)
{
    return "[" + std::string(label) + "-branch " + std::to_string(id) + "] " +
           pathfork::terms::to_string(guard);
}

} // namespace

Brancher::Brancher(pathfork::verification::Oracle& oracle,
                   pathfork::state::HeapCompressor& compressor, Bookkeeper& bookkeeper,
                   pathfork::config::BrancherConfig config)
    : oracle_(oracle), compressor_(compressor), bookkeeper_(bookkeeper), config_(std::move(config))
{
}

VerificationResult Brancher::branch(State& state, const Term& guard, const Context& context,
                                    const Continuation& on_true, const Continuation& on_false)
{
    return branch(state, std::vector<Term>{guard}, context, on_true, on_false);
}

VerificationResult Brancher::branch(State& state, const std::vector<Term>& guards,
                                    const Context& context, const Continuation& on_true,
                                    const Continuation& on_false)
{
    if (!started_)
    {
        throw pathfork::diag::StructuralError("brancher used before start()");
    }

    auto& ctx = oracle_.context();
    const Term guards_true = pathfork::terms::conjoin(ctx, guards);
    const Term guards_false = pathfork::terms::conjoin(ctx, pathfork::terms::negate_each(guards));

    const bool explore_true =
        !oracle_.query_infeasible(state, guards_true, config_.check_timeout_ms);
    const bool explore_false =
        !explore_true || !oracle_.query_infeasible(state, guards_false, config_.check_timeout_ms);

    if (explore_true && explore_false)
    {
        bookkeeper_.branches += 1;
    }

    const auto id = branch_counter_.next();

    const VerificationResult then_result =
        explore_true ? explore(state, guards_true, context, on_true, "then", id)
                     : skip(guards_true, "then", id);
    const VerificationResult else_result =
        explore_false ? explore(state, guards_false, context, on_false, "else", id)
                      : skip(guards_false, "else", id);

    return pathfork::verification::combine(then_result, else_result);
}

VerificationResult Brancher::explore(State& state, const Term& guard, const Context& context,
                                     const Continuation& k, std::string_view label,
                                     std::uint64_t id)
{
    const Context extended = context.with_branch_condition(guard);

    pathfork::verification::ScopeGuard scope(oracle_);
    oracle_.log(branch_comment(label, id, guard));
    oracle_.assume(guard);

    // Declared after the scope so the heap is restored before the scope is popped.
    pathfork::state::HeapSnapshot snapshot(state.heap);
    if (extended.retrying())
    {
        snapshot.capture();
        compressor_.compress(state, state.heap, extended);
    }

    return k(extended);
}

VerificationResult Brancher::skip(const Term& guard, std::string_view label, std::uint64_t id)
{
    bookkeeper_.pruned_branches += 1;
    oracle_.log(branch_comment("dead " + std::string(label), id, guard));
    return pathfork::verification::Unreachable{};
}

void Brancher::start()
{
    started_ = true;
    branch_counter_.reset();
}

void Brancher::reset()
{
    branch_counter_.reset();
}

void Brancher::stop()
{
    started_ = false;
}

} // namespace pathfork::engine

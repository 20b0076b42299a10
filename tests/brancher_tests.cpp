#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <pathfork/diag/structural_error.h>
#include <pathfork/engine/brancher.h>
#include <pathfork/verification/z3_oracle.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

namespace
{

using namespace pathfork::engine;
using pathfork::state::Chunk;
using pathfork::state::Heap;
using pathfork::state::HeapCompressor;
using pathfork::terms::same;
using pathfork::verification::is_failure;
using pathfork::verification::is_success;
using pathfork::verification::is_unreachable;
using pathfork::verification::Success;
using pathfork::verification::Unreachable;

// Empties the heap so a missing restore is visible.
struct RecordingCompressor final : HeapCompressor
{
    int calls = 0;
    void compress(State&, Heap& heap, const Context&) override
    {
        ++calls;
        heap.replace({});
    }
};

// Answers every feasibility query as if its budget ran out.
class UndecidedOracle final : public pathfork::verification::Oracle
{
  public:
    z3::context& context() override { return inner.context(); }
    bool query_infeasible(const State&, const pathfork::terms::Term&, unsigned) override
    {
        ++queries;
        return pathfork::verification::proves_infeasible(
            pathfork::verification::CheckResult::Unknown);
    }
    void assume(const pathfork::terms::Term& formula) override { inner.assume(formula); }
    pathfork::terms::TermSet current_facts() const override { return inner.current_facts(); }
    void push_scope() override { inner.push_scope(); }
    void pop_scope() override { inner.pop_scope(); }
    std::size_t scope_depth() const override { return inner.scope_depth(); }
    void log(std::string_view comment) override { inner.log(comment); }

    pathfork::verification::Z3Oracle inner;
    int queries = 0;
};

struct Fixture
{
    pathfork::verification::Z3Oracle oracle;
    RecordingCompressor compressor;
    Bookkeeper bookkeeper;
    Brancher brancher{oracle, compressor, bookkeeper,
                      pathfork::config::BrancherConfig{.check_timeout_ms = 1000}};
    State state;

    Fixture() { brancher.start(); }
};

Continuation returning(VerificationResult r, int& calls)
{
    return [r, &calls](const Context&)
    {
        ++calls;
        return r;
    };
}

bool has_comment(const pathfork::verification::Z3Oracle& oracle, const std::string& prefix)
{
    for (const auto& c : oracle.comments())
    {
        if (c.rfind(prefix, 0) == 0)
        {
            return true;
        }
    }
    return false;
}

} // namespace

int main()
{
    // Both sides feasible: one bifurcation, both explored in order.
    {
        Fixture f;
        const auto b = f.oracle.context().bool_const("b");
        std::vector<std::string> order;
        const auto r = f.brancher.branch(
            f.state, b, Context{},
            [&](const Context& c)
            {
                order.push_back("then");
                if (!same(c.branch_conditions().front(), b))
                {
                    fail("then-side should see its guard first");
                }
                return VerificationResult{Success{}};
            },
            [&](const Context& c)
            {
                order.push_back("else");
                if (!same(c.branch_conditions().front(), !b))
                {
                    fail("else-side should see the negated guard first");
                }
                return VerificationResult{Success{}};
            });

        if (!is_success(r) || order != std::vector<std::string>{"then", "else"})
        {
            fail("expected both sides explored then-first");
        }
        if (f.bookkeeper.branches != 1 || f.bookkeeper.pruned_branches != 0)
        {
            fail("a genuine bifurcation should count once");
        }
    }

    // Else-side infeasible: no bifurcation, result is the then-side's.
    {
        Fixture f;
        const auto x = f.oracle.context().int_const("x");
        f.oracle.assume(x > 0);
        int then_calls = 0;
        int else_calls = 0;
        const auto r = f.brancher.branch(f.state, x > 0, Context{},
                                         returning(pathfork::verification::failure("then"),
                                                   then_calls),
                                         returning(Success{}, else_calls));
        if (then_calls != 1 || else_calls != 0)
        {
            fail("only the then-side should run");
        }
        if (!is_failure(r) || f.bookkeeper.branches != 0 || f.bookkeeper.pruned_branches != 1)
        {
            fail("pruned else-side should not count as a bifurcation");
        }
        if (!has_comment(f.oracle, "[dead else-branch 1]"))
        {
            fail("expected dead else-branch comment");
        }
    }

    // Then-side infeasible: else-side explored without a second query.
    {
        Fixture f;
        const auto x = f.oracle.context().int_const("x");
        f.oracle.assume(x > 0);
        int then_calls = 0;
        int else_calls = 0;
        const auto queries_before = f.oracle.query_count();
        const auto r = f.brancher.branch(f.state, x < 0, Context{},
                                         returning(Success{}, then_calls),
                                         returning(Success{}, else_calls));
        if (then_calls != 0 || else_calls != 1 || !is_success(r))
        {
            fail("else-side must run when the then-side is infeasible");
        }
        if (f.oracle.query_count() - queries_before != 1)
        {
            fail("else-side exploration should short-circuit its query");
        }
        if (!has_comment(f.oracle, "[dead then-branch 1]") ||
            !has_comment(f.oracle, "[else-branch 1]"))
        {
            fail("expected dead then-branch and else-branch comments");
        }
    }

    // Undecided queries never prune: both sides run even when one is in fact infeasible.
    {
        UndecidedOracle oracle;
        RecordingCompressor compressor;
        Bookkeeper bookkeeper;
        Brancher brancher(oracle, compressor, bookkeeper, pathfork::config::BrancherConfig{});
        brancher.start();
        State state;

        const auto x = oracle.context().int_const("x");
        oracle.assume(x > 0);
        int then_calls = 0;
        int else_calls = 0;
        const auto r = brancher.branch(state, x > 0, Context{}, returning(Success{}, then_calls),
                                       returning(Success{}, else_calls));
        if (then_calls != 1 || else_calls != 1 || !is_success(r))
        {
            fail("undecided queries should explore both sides");
        }
        if (bookkeeper.branches != 1 || bookkeeper.pruned_branches != 0 || oracle.queries != 2)
        {
            fail("undecided queries should count as a bifurcation without pruning");
        }
    }

    // A guard Z3 cannot settle within a tiny budget is explored on both sides.
    {
        pathfork::verification::Z3Oracle oracle;
        RecordingCompressor compressor;
        Bookkeeper bookkeeper;
        Brancher brancher(oracle, compressor, bookkeeper,
                          pathfork::config::BrancherConfig{.check_timeout_ms = 1});
        brancher.start();
        State state;

        auto& ctx = oracle.context();
        const auto x = ctx.int_const("x");
        const auto y = ctx.int_const("y");
        const auto z = ctx.int_const("z");
        oracle.assume(x > 0 && y > 0 && z > 0);
        const auto guard = (x * x * x + y * y * y != z * z * z) || x > 1000000;

        int then_calls = 0;
        int else_calls = 0;
        const auto r = brancher.branch(state, guard, Context{}, returning(Success{}, then_calls),
                                       returning(Success{}, else_calls));
        if (then_calls != 1 || else_calls != 1 || !is_success(r) ||
            bookkeeper.pruned_branches != 0)
        {
            fail("a timed-out query should keep its side explorable");
        }
    }

    // Guard [true]: only the then-side runs, combined with Unreachable.
    {
        Fixture f;
        auto& ctx = f.oracle.context();
        const auto prior = ctx.bool_const("prior");
        const Context start = Context{}.with_branch_condition(prior);
        int else_calls = 0;
        const auto r = f.brancher.branch(
            f.state, std::vector<pathfork::terms::Term>{ctx.bool_val(true)}, start,
            [&](const Context& c)
            {
                if (c.branch_conditions().size() != 2 ||
                    !same(c.branch_conditions()[0], ctx.bool_val(true)) ||
                    !same(c.branch_conditions()[1], prior))
                {
                    fail("then-side should see [true] ++ prior");
                }
                return VerificationResult{Unreachable{}};
            },
            returning(Success{}, else_calls));
        if (else_calls != 0 || f.bookkeeper.branches != 0 || !is_unreachable(r))
        {
            fail("guard true should only explore the then-side");
        }
    }

    // Facts from the then-side do not reach the else-side or the caller.
    {
        Fixture f;
        auto& ctx = f.oracle.context();
        const auto g = ctx.bool_const("g");
        const auto k = ctx.bool_const("k");
        const pathfork::state::State probe;
        const auto r = f.brancher.branch(
            f.state, g, Context{},
            [&](const Context&)
            {
                f.oracle.assume(k);
                if (f.oracle.scope_depth() != 1)
                {
                    fail("then-side should run in one scope");
                }
                return VerificationResult{Success{}};
            },
            [&](const Context& c)
            {
                if (f.oracle.current_facts().count(k) != 0 ||
                    f.oracle.query_infeasible(probe, !k, 1000))
                {
                    fail("then-side fact leaked into the else-side");
                }
                for (const auto& bc : c.branch_conditions())
                {
                    if (same(bc, k) || same(bc, g))
                    {
                        fail("else-side context carries a then-side term");
                    }
                }
                return VerificationResult{Success{}};
            });
        if (!is_success(r) || f.oracle.scope_depth() != 0 || !f.oracle.current_facts().empty())
        {
            fail("facts should not survive the branch");
        }
    }

    // Nested branches keep scopes in stack order.
    {
        Fixture f;
        auto& ctx = f.oracle.context();
        const auto a = ctx.bool_const("a");
        const auto b = ctx.bool_const("b");
        std::vector<std::size_t> depths;
        const Continuation inner = [&](const Context& c)
        {
            depths.push_back(f.oracle.scope_depth());
            if (c.branch_conditions().size() != 2)
            {
                fail("nested context should carry both guards");
            }
            return VerificationResult{Success{}};
        };
        const Continuation outer = [&](const Context& c)
        { return f.brancher.branch(f.state, b, c, inner, inner); };
        const auto r = f.brancher.branch(f.state, a, Context{}, outer, outer);
        if (!is_success(r) || depths != std::vector<std::size_t>{2, 2, 2, 2} ||
            f.bookkeeper.branches != 3)
        {
            fail("nested branching mismatch");
        }
    }

    // Not retrying: no compression, heap untouched.
    {
        Fixture f;
        auto& ctx = f.oracle.context();
        f.state.heap.add(Chunk{.id = "val", .args = {ctx.int_const("r")},
                               .snapshot = ctx.int_const("v"), .permission = ctx.real_val(1)});
        const Heap before = f.state.heap;
        const auto r = f.brancher.branch(
            f.state, ctx.bool_const("g"), Context{},
            [&](const Context&)
            {
                if (f.state.heap != before)
                {
                    fail("heap should be untouched when not retrying");
                }
                return VerificationResult{Success{}};
            },
            [&](const Context&) { return VerificationResult{Success{}}; });
        if (!is_success(r) || f.compressor.calls != 0 || f.state.heap != before)
        {
            fail("compression should not run when not retrying");
        }
    }

    // Retrying: compressed inside each side, restored afterwards even on failure.
    {
        Fixture f;
        auto& ctx = f.oracle.context();
        f.state.heap.add(Chunk{.id = "val", .args = {ctx.int_const("r")},
                               .snapshot = ctx.int_const("v"), .permission = ctx.real_val(1)});
        const Heap before = f.state.heap;
        const auto r = f.brancher.branch(
            f.state, ctx.bool_const("g"), Context{}.with_retrying(true),
            [&](const Context&)
            {
                if (f.state.heap.size() != 0)
                {
                    fail("then-side should see the compressed heap");
                }
                return pathfork::verification::failure("assertion might not hold");
            },
            [&](const Context&)
            {
                if (f.state.heap.size() != 0)
                {
                    fail("else-side should see a freshly compressed heap");
                }
                return VerificationResult{Success{}};
            });
        if (!is_failure(r) || f.compressor.calls != 2 || f.state.heap != before)
        {
            fail("heap should be restored after compression");
        }
    }

    // A throwing continuation still closes its scope and restores the heap.
    {
        Fixture f;
        auto& ctx = f.oracle.context();
        f.state.heap.add(Chunk{.id = "val", .args = {ctx.int_const("r")},
                               .snapshot = ctx.int_const("v"), .permission = ctx.real_val(1)});
        const Heap before = f.state.heap;
        bool caught = false;
        try
        {
            (void)f.brancher.branch(
                f.state, ctx.bool_const("g"), Context{}.with_retrying(true),
                [&](const Context&) -> VerificationResult
                { throw std::runtime_error("continuation aborted"); },
                [&](const Context&) { return VerificationResult{Success{}}; });
        }
        catch (const std::runtime_error&)
        {
            caught = true;
        }
        if (!caught || f.oracle.scope_depth() != 0 || f.state.heap != before ||
            !f.oracle.current_facts().empty())
        {
            fail("exception should unwind scope and heap");
        }
    }

    // Conjunctive guards: the else-side assumes the conjunction of negations.
    {
        Fixture f;
        auto& ctx = f.oracle.context();
        const auto a = ctx.bool_const("a");
        const auto b = ctx.bool_const("b");
        const std::vector<pathfork::terms::Term> guards{a, b};
        (void)f.brancher.branch(
            f.state, guards, Context{},
            [&](const Context& c)
            {
                if (!same(c.branch_conditions().front(), pathfork::terms::conjoin(ctx, guards)))
                {
                    fail("then guard should be the conjunction");
                }
                return VerificationResult{Success{}};
            },
            [&](const Context& c)
            {
                if (!same(c.branch_conditions().front(), !a && !b))
                {
                    fail("else guard should conjoin the negations");
                }
                return VerificationResult{Success{}};
            });
    }

    // Branch ids restart on reset; branching before start is a structural error.
    {
        Fixture f;
        auto& ctx = f.oracle.context();
        int calls = 0;
        (void)f.brancher.branch(f.state, ctx.bool_const("p"), Context{},
                                returning(Success{}, calls), returning(Success{}, calls));
        (void)f.brancher.branch(f.state, ctx.bool_const("q"), Context{},
                                returning(Success{}, calls), returning(Success{}, calls));
        if (!has_comment(f.oracle, "[then-branch 2] q"))
        {
            fail("second branch should be numbered 2");
        }

        f.brancher.reset();
        (void)f.brancher.branch(f.state, ctx.bool_const("r"), Context{},
                                returning(Success{}, calls), returning(Success{}, calls));
        if (!has_comment(f.oracle, "[then-branch 1] r"))
        {
            fail("reset should restart branch numbering");
        }

        f.brancher.stop();
        bool thrown = false;
        try
        {
            (void)f.brancher.branch(f.state, ctx.bool_const("s"), Context{},
                                    returning(Success{}, calls), returning(Success{}, calls));
        }
        catch (const pathfork::diag::StructuralError&)
        {
            thrown = true;
        }
        if (!thrown)
        {
            fail("branching on a stopped brancher should throw");
        }
    }

    std::cout << "OK\n";
    return 0;
}

#include <pathfork/log/trace.h>
#include <pathfork/verification/z3_oracle.h>

namespace pathfork::verification
{
namespace
{

// Solver frame for a single query; popped even if asserting or checking throws.
class QueryFrame
{
  public:
    explicit QueryFrame(z3::solver& solver) : solver_(solver) { solver_.push(); }
    ~QueryFrame() { solver_.pop(); }

    QueryFrame(const QueryFrame&) = delete;
    QueryFrame& operator=(const QueryFrame&) = delete;

  private:
    z3::solver& solver_;
};

} // namespace

bool proves_infeasible(CheckResult result)
{
    return result == CheckResult::Unsat;
}

Z3Oracle::Z3Oracle() : solver_(ctx_) {}

z3::context& Z3Oracle::context()
{
    return ctx_;
}

CheckResult Z3Oracle::check(const Term& formula, unsigned timeout_ms)
{
    ++query_count_;

    z3::params p(ctx_);
    p.set("timeout", timeout_ms);
    solver_.set(p);

    z3::check_result res = z3::unknown;
    {
        QueryFrame frame(solver_);
        solver_.add(formula);
        res = solver_.check();
    }

    switch (res)
    {
    case z3::sat:
        return CheckResult::Sat;
    case z3::unsat:
        return CheckResult::Unsat;
    default:
        return CheckResult::Unknown;
    }
}

bool Z3Oracle::query_infeasible(const pathfork::state::State&, const Term& formula,
                                unsigned timeout_ms)
{
    const auto res = check(formula, timeout_ms);
    if (res == CheckResult::Unknown)
    {
        pathfork::log::trace("oracle", "unknown (treated as feasible): " +
                                           pathfork::terms::to_string(formula));
    }
    return proves_infeasible(res);
}

void Z3Oracle::assume(const Term& formula)
{
    solver_.add(formula);
    facts_.push_back(formula);
}

TermSet Z3Oracle::current_facts() const
{
    return TermSet(facts_.begin(), facts_.end());
}

void Z3Oracle::push_scope()
{
    solver_.push();
    marks_.push_back(facts_.size());
}

void Z3Oracle::pop_scope()
{
    if (marks_.empty())
    {
        return;
    }
    const auto mark = marks_.back();
    marks_.pop_back();
    facts_.erase(facts_.begin() + static_cast<std::ptrdiff_t>(mark), facts_.end());
    solver_.pop();
}

std::size_t Z3Oracle::scope_depth() const
{
    return marks_.size();
}

void Z3Oracle::log(std::string_view comment)
{
    comments_.emplace_back(comment);
    pathfork::log::trace("prover", comment);
}

} // namespace pathfork::verification

#pragma once

#include <cstddef>
#include <pathfork/verification/oracle.h>
#include <string>
#include <vector>
#include <z3++.h>

/**
 * @file z3_oracle.h
 * @brief Oracle backed by a Z3 solver.
 */

namespace pathfork::verification
{

/** @brief Check result from the solver. */
enum class CheckResult
{
    Sat,
    Unsat,
    Unknown,
};

/** @brief Only a definite unsat proves infeasibility; unknown (including timeouts) does not. */
[[nodiscard]] bool proves_infeasible(CheckResult result);

/**
 * @brief Oracle over a single z3::solver.
 *
 * Assumed facts are asserted into the solver and mirrored in a list with one mark per open
 * scope, so current_facts() can be answered without asking the solver.
 */
class Z3Oracle final : public Oracle
{
  public:
    Z3Oracle();

    [[nodiscard]] z3::context& context() override;

    using Oracle::assume;

    [[nodiscard]] bool query_infeasible(const pathfork::state::State& state, const Term& formula,
                                        unsigned timeout_ms) override;
    void assume(const Term& formula) override;
    [[nodiscard]] TermSet current_facts() const override;

    void push_scope() override;
    void pop_scope() override;
    [[nodiscard]] std::size_t scope_depth() const override;

    void log(std::string_view comment) override;

    /** @brief Satisfiability of @p formula together with the current facts. */
    [[nodiscard]] CheckResult check(const Term& formula, unsigned timeout_ms);

    [[nodiscard]] const std::vector<std::string>& comments() const { return comments_; }
    [[nodiscard]] std::size_t query_count() const { return query_count_; }

  private:
    z3::context ctx_;
    z3::solver solver_;
    std::vector<Term> facts_;
    std::vector<std::size_t> marks_;
    std::vector<std::string> comments_;
    std::size_t query_count_ = 0;
};

} // namespace pathfork::verification

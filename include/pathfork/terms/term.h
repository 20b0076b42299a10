#pragma once

#include <set>
#include <string>
#include <vector>
#include <z3++.h>

/**
 * @file term.h
 * @brief Symbolic terms and the combinators branching needs.
 *
 * Terms are Z3 expressions. Z3 hash-conses its ASTs, so a term is immutable, shares
 * structure with every equal term and compares structurally.
 */

namespace pathfork::terms
{

using Term = z3::expr;

/** @brief Strict order on terms by AST id; equal ids mean structurally equal terms. */
struct TermLess
{
    bool operator()(const Term& a, const Term& b) const;
};

using TermSet = std::set<Term, TermLess>;

/** @brief Structural equality of two terms. */
[[nodiscard]] bool same(const Term& a, const Term& b);

/** @brief Pointwise structural equality of two term lists. */
[[nodiscard]] bool same(const std::vector<Term>& a, const std::vector<Term>& b);

/** @brief Conjunction: `true` for no terms, the term itself for one, `and` otherwise. */
[[nodiscard]] Term conjoin(z3::context& ctx, const std::vector<Term>& terms);
[[nodiscard]] Term conjoin(z3::context& ctx, const TermSet& terms);

[[nodiscard]] Term negate(const Term& term);

/** @brief Negate every term, keeping the order. */
[[nodiscard]] std::vector<Term> negate_each(const std::vector<Term>& terms);

[[nodiscard]] Term ite(const Term& guard, const Term& then_term, const Term& else_term);

/** @brief Elements of @p a that are not in @p b. */
[[nodiscard]] TermSet set_difference(const TermSet& a, const TermSet& b);

[[nodiscard]] std::string to_string(const Term& term);

} // namespace pathfork::terms

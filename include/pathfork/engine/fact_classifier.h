#pragma once

#include <pathfork/terms/term.h>

/**
 * @file fact_classifier.h
 * @brief Splits the facts a branch added into those valid after a join and those that are not.
 */

namespace pathfork::engine
{

using pathfork::terms::TermSet;

struct FactPartition
{
    /** Facts that hold whichever branch was taken; assumed unconditionally after a join. */
    TermSet top_level;
    /** Facts that hold only on the branch that produced them. */
    TermSet nested;
};

class FactClassifier
{
  public:
    virtual ~FactClassifier() = default;
    [[nodiscard]] virtual FactPartition partition(const TermSet& facts) const = 0;
};

/**
 * @brief Universally quantified facts are top-level, everything else is nested.
 *
 * Quantified facts are the definitional axioms emitted for fresh function symbols; they
 * mention no branch-local constants and stay valid outside the branch.
 */
class QuantifierFactClassifier final : public FactClassifier
{
  public:
    [[nodiscard]] FactPartition partition(const TermSet& facts) const override;
};

} // namespace pathfork::engine

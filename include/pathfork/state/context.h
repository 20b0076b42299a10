#pragma once

#include <pathfork/diag/diagnostic.h>
#include <pathfork/terms/term.h>
#include <string>
#include <variant>
#include <vector>

/**
 * @file context.h
 * @brief Per-path execution context.
 */

namespace pathfork::state
{

using pathfork::terms::Term;
using pathfork::terms::TermSet;

class Context;

/** @brief Result of merging two contexts: the merged context or a diagnostic. */
using MergeResult = std::variant<Context, pathfork::diag::Diagnostic>;

/**
 * @brief Metadata carried along one execution path.
 *
 * Contexts are values: every `with_*` operation returns an updated copy and leaves the
 * receiver untouched. Branch conditions are stored newest first.
 */
class Context
{
  public:
    Context() = default;

    [[nodiscard]] const std::vector<Term>& branch_conditions() const { return branch_conditions_; }
    [[nodiscard]] bool retrying() const { return retrying_; }
    [[nodiscard]] const std::vector<std::string>& visited() const { return visited_; }
    [[nodiscard]] const TermSet& constrainable() const { return constrainable_; }

    /** @brief Copy with @p guard prepended to the branch conditions. */
    [[nodiscard]] Context with_branch_condition(const Term& guard) const;
    [[nodiscard]] Context with_branch_conditions(std::vector<Term> conditions) const;
    [[nodiscard]] Context with_retrying(bool retrying) const;
    [[nodiscard]] Context with_visited(std::string member) const;
    [[nodiscard]] Context with_constrainable(const Term& permission) const;

    /**
     * @brief Merge with a context from a sibling path.
     *
     * Fails unless both contexts agree on branch conditions, visited members and the retry
     * flag. Constrainable permissions are united.
     */
    [[nodiscard]] MergeResult merge(const Context& other) const;

  private:
    std::vector<Term> branch_conditions_;
    bool retrying_ = false;
    std::vector<std::string> visited_;
    TermSet constrainable_;
};

} // namespace pathfork::state

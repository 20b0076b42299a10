#pragma once

#include <stdexcept>
#include <string>

namespace pathfork::diag
{

/**
 * @brief Internal-consistency violation that aborts the current verification attempt.
 *
 * Distinct from a verification failure: it signals a broken contract between the
 * branching machinery and its callers (for example a join completion fired twice).
 */
class StructuralError : public std::logic_error
{
  public:
    explicit StructuralError(const std::string& message) : std::logic_error(message) {}
};

} // namespace pathfork::diag

#pragma once

#include <string>
#include <vector>

/**
 * @file diagnostic.h
 * @brief Types for diagnostics (failures, warnings and notes) produced while exploring branches.
 */

namespace pathfork::diag
{

/** @brief Severity level for a diagnostic. */
enum class Severity
{
    Error,
    Warning,
    Note,
};

/** @brief Additional related message attached to a diagnostic. */
struct Related
{
    std::string message;
};

/**
 * @brief A diagnostic message with related notes.
 *
 * Diagnostics carry the reason of a failed verification as well as errors from partial
 * operations such as context merging and configuration parsing.
 */
struct Diagnostic
{
    Severity severity = Severity::Error;
    std::string message;
    std::vector<Related> notes;
};

/** @brief Build an error diagnostic with the given message. */
[[nodiscard]] Diagnostic error(std::string message);

} // namespace pathfork::diag

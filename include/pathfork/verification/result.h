#pragma once

#include <pathfork/diag/diagnostic.h>
#include <string>
#include <type_traits>
#include <variant>

/**
 * @file result.h
 * @brief Outcome of exploring a path and the algebra that combines outcomes.
 */

namespace pathfork::verification
{

/** @brief Every obligation on the path held. */
struct Success
{
};

/** @brief An obligation on the path did not hold. */
struct Failure
{
    pathfork::diag::Diagnostic reason;
};

/** @brief The path cannot happen; nothing was checked. */
struct Unreachable
{
};

using VerificationResult = std::variant<Success, Failure, Unreachable>;

[[nodiscard]] bool is_success(const VerificationResult& r);
[[nodiscard]] bool is_failure(const VerificationResult& r);
[[nodiscard]] bool is_unreachable(const VerificationResult& r);

/** @brief Build a failure with an error diagnostic carrying @p message. */
[[nodiscard]] VerificationResult failure(std::string message);

/**
 * @brief Combine two outcomes.
 *
 * A failure absorbs everything, the left one winning when both fail. Unreachable yields the
 * other side unchanged. Success with success is success.
 */
[[nodiscard]] VerificationResult combine(const VerificationResult& lhs,
                                         const VerificationResult& rhs);

/** @brief Combine with a lazily computed right side; @p rhs is not run when @p lhs failed. */
template <typename F, typename = std::enable_if_t<std::is_invocable_r_v<VerificationResult, F>>>
[[nodiscard]] VerificationResult combine(const VerificationResult& lhs, F&& rhs)
{
    if (is_failure(lhs))
    {
        return lhs;
    }
    return combine(lhs, static_cast<VerificationResult>(rhs()));
}

/** @brief One-line rendering: `success`, `unreachable` or `failure: <message>`. */
[[nodiscard]] std::string to_string(const VerificationResult& r);

} // namespace pathfork::verification

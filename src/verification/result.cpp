#include <pathfork/verification/result.h>

namespace pathfork::verification
{

bool is_success(const VerificationResult& r)
{
    return std::holds_alternative<Success>(r);
}

bool is_failure(const VerificationResult& r)
{
    return std::holds_alternative<Failure>(r);
}

bool is_unreachable(const VerificationResult& r)
{
    return std::holds_alternative<Unreachable>(r);
}

VerificationResult failure(std::string message)
{
    return Failure{.reason = pathfork::diag::error(std::move(message))};
}

VerificationResult combine(const VerificationResult& lhs, const VerificationResult& rhs)
{
    if (is_failure(lhs))
    {
        return lhs;
    }
    if (is_failure(rhs))
    {
        return rhs;
    }
    if (is_unreachable(lhs))
    {
        return rhs;
    }
    return lhs;
}

std::string to_string(const VerificationResult& r)
{
    return std::visit(
        [](const auto& node) -> std::string
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, Success>)
            {
                return "success";
            }
            else if constexpr (std::is_same_v<Node, Failure>)
            {
                return "failure: " + node.reason.message;
            }
            else
            {
                return "unreachable";
            }
        },
        r);
}

} // namespace pathfork::verification

#include <pathfork/diag/diagnostic.h>

namespace pathfork::diag
{

Diagnostic error(std::string message)
{
    Diagnostic d;
    d.severity = Severity::Error;
    d.message = std::move(message);
    return d;
}

} // namespace pathfork::diag

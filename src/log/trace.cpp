#include <cstdlib>
#include <iostream>
#include <optional>
#include <pathfork/log/trace.h>

namespace pathfork::log
{
namespace
{

std::optional<bool>& trace_override()
{
    static std::optional<bool> value;
    return value;
}

} // namespace

bool trace_enabled()
{
    if (trace_override().has_value())
    {
        return *trace_override();
    }
    return std::getenv("PATHFORK_TRACE") != nullptr;
}

void set_trace_enabled(bool enabled)
{
    trace_override() = enabled;
}

void trace(std::string_view channel, std::string_view message)
{
    if (!trace_enabled())
    {
        return;
    }
    std::cerr << "[" << channel << "] " << message << "\n";
}

} // namespace pathfork::log

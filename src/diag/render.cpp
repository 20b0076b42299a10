#include <pathfork/diag/render.h>
#include <sstream>
#include <string_view>

namespace pathfork::diag
{
namespace
{

constexpr std::string_view severity_string(Severity s)
{
    switch (s)
    {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Note:
        return "note";
    }
    return "error";
}

} // namespace

std::string render(const Diagnostic& diagnostic)
{
    std::ostringstream out;
    out << severity_string(diagnostic.severity) << ": " << diagnostic.message << "\n";
    for (const auto& note : diagnostic.notes)
    {
        out << "note: " << note.message << "\n";
    }
    return out.str();
}

} // namespace pathfork::diag

#pragma once

#include <pathfork/diag/diagnostic.h>
#include <string>

namespace pathfork::diag
{

[[nodiscard]] std::string render(const Diagnostic& diagnostic);

} // namespace pathfork::diag

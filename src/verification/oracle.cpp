#include <pathfork/verification/oracle.h>

namespace pathfork::verification
{

void Oracle::assume(const TermSet& formulas)
{
    for (const auto& f : formulas)
    {
        assume(f);
    }
}

} // namespace pathfork::verification

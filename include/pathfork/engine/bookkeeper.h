#pragma once

#include <cstdint>

namespace pathfork::engine
{

/** @brief Statistics written by branching for external reporting. */
struct Bookkeeper
{
    /** Branch points where both outcomes were feasible. */
    std::uint64_t branches = 0;
    /** Branch sides skipped because their guard was infeasible. */
    std::uint64_t pruned_branches = 0;
    /** Completed branch-and-join operations. */
    std::uint64_t joins = 0;

    void reset() { *this = Bookkeeper{}; }
};

} // namespace pathfork::engine

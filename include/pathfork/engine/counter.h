#pragma once

#include <cstdint>

namespace pathfork::engine
{

/** @brief Source of increasing ids for labelling branches in logs; starts at 1. */
class Counter
{
  public:
    std::uint64_t next() { return ++value_; }
    void reset() { value_ = 0; }

  private:
    std::uint64_t value_ = 0;
};

} // namespace pathfork::engine

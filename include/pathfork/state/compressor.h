#pragma once

#include <pathfork/state/context.h>
#include <pathfork/state/heap.h>

namespace pathfork::verification
{
class Oracle;
}

namespace pathfork::state
{

/** @brief In-place simplifier for a heap's chunks. May lose per-chunk precision. */
class HeapCompressor
{
  public:
    virtual ~HeapCompressor() = default;
    virtual void compress(State& state, Heap& heap, const Context& context) = 0;
};

/**
 * @brief Merges chunks for the same resource into one.
 *
 * Permissions of merged chunks are summed. The first chunk's snapshot is kept and the
 * oracle is told the dropped snapshots equal it. Chunks keep their first-occurrence order.
 */
class MergingHeapCompressor final : public HeapCompressor
{
  public:
    explicit MergingHeapCompressor(pathfork::verification::Oracle& oracle) : oracle_(oracle) {}

    void compress(State& state, Heap& heap, const Context& context) override;

  private:
    pathfork::verification::Oracle& oracle_;
};

} // namespace pathfork::state

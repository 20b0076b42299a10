#include <cstddef>
#include <pathfork/log/trace.h>
#include <pathfork/state/compressor.h>
#include <pathfork/verification/oracle.h>
#include <string>
#include <vector>

namespace pathfork::state
{

void MergingHeapCompressor::compress(State&, Heap& heap, const Context&)
{
    std::vector<Chunk> merged;
    const auto chunks = heap.values();

    for (const auto& chunk : chunks)
    {
        Chunk* target = nullptr;
        for (auto& m : merged)
        {
            if (same_resource(m, chunk))
            {
                target = &m;
                break;
            }
        }

        if (target == nullptr)
        {
            merged.push_back(chunk);
            continue;
        }

        target->permission = target->permission + chunk.permission;
        if (!pathfork::terms::same(target->snapshot, chunk.snapshot))
        {
            oracle_.assume(target->snapshot == chunk.snapshot);
        }
    }

    if (merged.size() != chunks.size())
    {
        pathfork::log::trace("heap", "compressed " + std::to_string(chunks.size()) + " chunks to " +
                                         std::to_string(merged.size()));
    }
    heap.replace(std::move(merged));
}

} // namespace pathfork::state

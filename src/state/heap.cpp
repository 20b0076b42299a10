#include <pathfork/state/heap.h>
#include <utility>

namespace pathfork::state
{

bool operator==(const Chunk& a, const Chunk& b)
{
    return same_resource(a, b) && pathfork::terms::same(a.snapshot, b.snapshot) &&
           pathfork::terms::same(a.permission, b.permission);
}

bool operator!=(const Chunk& a, const Chunk& b)
{
    return !(a == b);
}

bool same_resource(const Chunk& a, const Chunk& b)
{
    return a.id == b.id && pathfork::terms::same(a.args, b.args);
}

Heap::Heap(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

std::vector<Chunk> Heap::values() const
{
    return chunks_;
}

void Heap::replace(std::vector<Chunk> chunks)
{
    chunks_ = std::move(chunks);
}

void Heap::add(Chunk chunk)
{
    chunks_.push_back(std::move(chunk));
}

std::size_t Heap::size() const
{
    return chunks_.size();
}

bool operator==(const Heap& a, const Heap& b)
{
    return a.chunks_ == b.chunks_;
}

bool operator!=(const Heap& a, const Heap& b)
{
    return !(a == b);
}

HeapSnapshot::~HeapSnapshot()
{
    if (original_.has_value())
    {
        heap_.replace(std::move(*original_));
    }
}

void HeapSnapshot::capture()
{
    original_ = heap_.values();
}

} // namespace pathfork::state

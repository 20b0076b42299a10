#pragma once

#include <cstddef>
#include <optional>
#include <pathfork/terms/term.h>
#include <string>
#include <vector>

/**
 * @file heap.h
 * @brief Permission chunks, the symbolic heap holding them and the state threaded through branches.
 */

namespace pathfork::state
{

using pathfork::terms::Term;

/** @brief Symbolic permission to a resource `id(args)` with its value snapshot. */
struct Chunk
{
    std::string id;
    std::vector<Term> args;
    Term snapshot;
    Term permission;
};

/** @brief Structural equality over every field. */
[[nodiscard]] bool operator==(const Chunk& a, const Chunk& b);
[[nodiscard]] bool operator!=(const Chunk& a, const Chunk& b);

/** @brief True if both chunks denote the same resource (same id and structurally equal args). */
[[nodiscard]] bool same_resource(const Chunk& a, const Chunk& b);

/** @brief Ordered, mutable collection of chunks. */
class Heap
{
  public:
    Heap() = default;
    explicit Heap(std::vector<Chunk> chunks);

    /** @brief Copy of the current chunks, usable with replace() to restore exactly. */
    [[nodiscard]] std::vector<Chunk> values() const;
    void replace(std::vector<Chunk> chunks);
    void add(Chunk chunk);
    [[nodiscard]] std::size_t size() const;

    friend bool operator==(const Heap& a, const Heap& b);

  private:
    std::vector<Chunk> chunks_;
};

[[nodiscard]] bool operator!=(const Heap& a, const Heap& b);

/** @brief Symbolic state visible to branching. */
struct State
{
    Heap heap;
};

/**
 * @brief Scoped heap snapshot.
 *
 * After capture() the heap is restored to the captured chunks when the snapshot goes out of
 * scope, whether the enclosing block returns or throws.
 */
class HeapSnapshot
{
  public:
    explicit HeapSnapshot(Heap& heap) : heap_(heap) {}
    ~HeapSnapshot();

    HeapSnapshot(const HeapSnapshot&) = delete;
    HeapSnapshot& operator=(const HeapSnapshot&) = delete;

    void capture();
    [[nodiscard]] bool captured() const { return original_.has_value(); }

  private:
    Heap& heap_;
    std::optional<std::vector<Chunk>> original_;
};

} // namespace pathfork::state

/**
 * @file spatial_grid.hpp
 * @brief Sparse uniform hash grid of particle indices
 *
 * Cells are addressed by integer (cellX, cellY) packed into one 64-bit key.
 * A bucket exists only while it holds at least one index. The grid stores
 * indices only and never owns particles.
 */

#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "liquid/math/vector_math.hpp"

namespace Systems {
namespace Fluid {

struct Cell {
    int x = 0;
    int y = 0;

    bool operator==(const Cell& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

class SpatialGrid {
public:
    using Bucket = std::vector<int>;

    explicit SpatialGrid(double cellSize);

    double getCellSize() const { return cellSize; }

    /** @brief Cell containing a world position, floor division on both axes */
    Cell cellOf(const Position& p) const;

    void insert(int index, int cx, int cy);

    /** @brief Removes index from its bucket; drops the bucket once empty. Absent index is a no-op. */
    void remove(int index, int cx, int cy);

    /** @brief Re-homes index from one cell to another; no-op if both are equal */
    void move(int index, const Cell& from, const Cell& to);

    /** @brief Bucket at (cx, cy), or nullptr when that cell is empty */
    const Bucket* bucket(int cx, int cy) const;

    /**
     * @brief Visits the 3x3 block of buckets around (cx, cy).
     *
     * Order is x-offset -1..1 outer, y-offset -1..1 inner. Empty cells are
     * skipped. The visitor returns false to stop early.
     */
    template<typename Visitor>
    void neighborhood(int cx, int cy, Visitor&& visit) const {
        for (int nx = -1; nx <= 1; ++nx) {
            for (int ny = -1; ny <= 1; ++ny) {
                const Bucket* b = bucket(cx + nx, cy + ny);
                if (b && !visit(*b)) {
                    return;
                }
            }
        }
    }

    std::size_t bucketCount() const { return buckets.size(); }

    /** @brief Total number of indices over all buckets */
    std::size_t size() const;

    void clear() { buckets.clear(); }

    static std::int64_t packKey(int cx, int cy);

private:
    double cellSize;
    std::unordered_map<std::int64_t, Bucket> buckets;
};

} // namespace Fluid
} // namespace Systems

#include "liquid/systems/fluid/spatial_grid.hpp"

#include <algorithm>
#include <cmath>

namespace Systems {
namespace Fluid {

SpatialGrid::SpatialGrid(double cellSize)
    : cellSize(cellSize)
{
}

std::int64_t SpatialGrid::packKey(int cx, int cy) {
    // High 32 bits x, low 32 bits y; both as raw 32-bit patterns
    std::uint64_t const hi = static_cast<std::uint32_t>(cx);
    std::uint64_t const lo = static_cast<std::uint32_t>(cy);
    return static_cast<std::int64_t>((hi << 32) | lo);
}

Cell SpatialGrid::cellOf(const Position& p) const {
    return Cell{
        static_cast<int>(std::floor(p.x / cellSize)),
        static_cast<int>(std::floor(p.y / cellSize))
    };
}

void SpatialGrid::insert(int index, int cx, int cy) {
    buckets[packKey(cx, cy)].push_back(index);
}

void SpatialGrid::remove(int index, int cx, int cy) {
    auto it = buckets.find(packKey(cx, cy));
    if (it == buckets.end()) {
        return;
    }

    Bucket& b = it->second;
    auto pos = std::find(b.begin(), b.end(), index);
    if (pos == b.end()) {
        return;
    }

    // Bucket order is not significant; swap-and-pop
    *pos = b.back();
    b.pop_back();

    if (b.empty()) {
        buckets.erase(it);
    }
}

void SpatialGrid::move(int index, const Cell& from, const Cell& to) {
    if (from == to) {
        return;
    }
    remove(index, from.x, from.y);
    insert(index, to.x, to.y);
}

const SpatialGrid::Bucket* SpatialGrid::bucket(int cx, int cy) const {
    auto it = buckets.find(packKey(cx, cy));
    return it == buckets.end() ? nullptr : &it->second;
}

std::size_t SpatialGrid::size() const {
    std::size_t total = 0;
    for (const auto& [key, b] : buckets) {
        (void)key;
        total += b.size();
    }
    return total;
}

} // namespace Fluid
} // namespace Systems

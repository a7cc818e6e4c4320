#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "liquid/systems/fluid/spatial_grid.hpp"

using namespace Systems::Fluid;

TEST(SpatialGridTest, CellOfUsesFloorDivision) {
    SpatialGrid grid(0.5);

    Cell c = grid.cellOf(Position(0.74, 1.0));
    EXPECT_EQ(c.x, 1);
    EXPECT_EQ(c.y, 2);

    // Negative coordinates round toward -infinity, not toward zero
    c = grid.cellOf(Position(-0.1, -0.5));
    EXPECT_EQ(c.x, -1);
    EXPECT_EQ(c.y, -1);

    c = grid.cellOf(Position(-0.6, 0.0));
    EXPECT_EQ(c.x, -2);
    EXPECT_EQ(c.y, 0);
}

TEST(SpatialGridTest, PackedKeysDistinguishSignedCells) {
    EXPECT_NE(SpatialGrid::packKey(1, -1), SpatialGrid::packKey(-1, 1));
    EXPECT_NE(SpatialGrid::packKey(0, -1), SpatialGrid::packKey(-1, 0));
    EXPECT_NE(SpatialGrid::packKey(0, 1), SpatialGrid::packKey(1, 0));
    EXPECT_EQ(SpatialGrid::packKey(-7, 3), SpatialGrid::packKey(-7, 3));
}

TEST(SpatialGridTest, BucketsAreCreatedAndDroppedWithTheirContents) {
    SpatialGrid grid(1.0);
    EXPECT_EQ(grid.bucketCount(), 0u);
    EXPECT_EQ(grid.bucket(0, 0), nullptr);

    grid.insert(3, 0, 0);
    grid.insert(4, 0, 0);
    grid.insert(5, -2, 7);
    EXPECT_EQ(grid.bucketCount(), 2u);
    EXPECT_EQ(grid.size(), 3u);
    ASSERT_NE(grid.bucket(0, 0), nullptr);
    EXPECT_EQ(grid.bucket(0, 0)->size(), 2u);

    grid.remove(3, 0, 0);
    EXPECT_EQ(grid.bucketCount(), 2u);
    grid.remove(4, 0, 0);
    EXPECT_EQ(grid.bucketCount(), 1u);
    EXPECT_EQ(grid.bucket(0, 0), nullptr);
}

TEST(SpatialGridTest, RemovingAbsentIndexIsNoOp) {
    SpatialGrid grid(1.0);
    grid.insert(1, 2, 2);

    grid.remove(9, 2, 2);   // wrong index
    grid.remove(1, 3, 3);   // wrong cell
    EXPECT_EQ(grid.size(), 1u);
    EXPECT_EQ(grid.bucketCount(), 1u);
}

TEST(SpatialGridTest, MoveRehomesIndex) {
    SpatialGrid grid(1.0);
    grid.insert(7, 0, 0);

    grid.move(7, Cell{0, 0}, Cell{0, 0});
    ASSERT_NE(grid.bucket(0, 0), nullptr);

    grid.move(7, Cell{0, 0}, Cell{1, -1});
    EXPECT_EQ(grid.bucket(0, 0), nullptr);
    ASSERT_NE(grid.bucket(1, -1), nullptr);
    EXPECT_EQ(grid.bucket(1, -1)->front(), 7);
    EXPECT_EQ(grid.size(), 1u);
}

TEST(SpatialGridTest, NeighborhoodVisitsThreeByThreeBlock) {
    SpatialGrid grid(1.0);
    // One index in every cell of a 5x5 block centered on the origin
    int idx = 0;
    for (int x = -2; x <= 2; ++x) {
        for (int y = -2; y <= 2; ++y) {
            grid.insert(idx++, x, y);
        }
    }

    std::vector<int> seen;
    grid.neighborhood(0, 0, [&](const SpatialGrid::Bucket& b) {
        seen.insert(seen.end(), b.begin(), b.end());
        return true;
    });
    ASSERT_EQ(seen.size(), 9u);

    // x-offset outer, y-offset inner: first visited is (-1,-1), then (-1,0)
    // Index of (x, y) is (x+2)*5 + (y+2)
    EXPECT_EQ(seen[0], 1 * 5 + 1);
    EXPECT_EQ(seen[1], 1 * 5 + 2);
    EXPECT_EQ(seen[8], 3 * 5 + 3);
}

TEST(SpatialGridTest, NeighborhoodStopsWhenVisitorReturnsFalse) {
    SpatialGrid grid(1.0);
    grid.insert(0, -1, -1);
    grid.insert(1, 0, 0);
    grid.insert(2, 1, 1);

    int visits = 0;
    grid.neighborhood(0, 0, [&](const SpatialGrid::Bucket&) {
        ++visits;
        return false;
    });
    EXPECT_EQ(visits, 1);
}

TEST(SpatialGridTest, ClearDropsEverything) {
    SpatialGrid grid(1.0);
    grid.insert(0, 0, 0);
    grid.insert(1, 5, 5);
    grid.clear();
    EXPECT_EQ(grid.bucketCount(), 0u);
    EXPECT_EQ(grid.size(), 0u);
}

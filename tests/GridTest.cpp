#include <gtest/gtest.h>

#include "core/Grid.hpp"
#include "core/MazeError.hpp"
#include "MazeTestUtil.hpp"

TEST(Grid, BuildIsFullyWalledAndUnvisited)
{
    const Grid g = GridBuilder::Build(4, 3);

    EXPECT_EQ(g.Width(), 4);
    EXPECT_EQ(g.Height(), 3);
    EXPECT_EQ(g.CellCount(), 12u);
    EXPECT_EQ(g.CountPassages(), 0u);
    EXPECT_FALSE(g.AnyVisited());

    for (int32_t r = 0; r < 3; ++r)
        for (int32_t c = 0; c < 4; ++c)
            EXPECT_EQ(WallString(g, r, c), "1111") << "cell " << r << "," << c;

    EXPECT_EQ(ReachableFromOrigin(g), 1u);
}

TEST(Grid, SingleCellIsValid)
{
    const Grid g = GridBuilder::Build(1, 1);
    EXPECT_EQ(g.CellCount(), 1u);
    EXPECT_TRUE(g.IsPerimeter({0, 0}, Direction::North));
    EXPECT_TRUE(g.IsPerimeter({0, 0}, Direction::East));
    EXPECT_TRUE(g.IsPerimeter({0, 0}, Direction::South));
    EXPECT_TRUE(g.IsPerimeter({0, 0}, Direction::West));
}

TEST(Grid, RejectsNonPositiveDimensions)
{
    EXPECT_THROW(GridBuilder::Build(0, 5), InvalidDimension);
    EXPECT_THROW(GridBuilder::Build(5, 0), InvalidDimension);
    EXPECT_THROW(GridBuilder::Build(-1, 3), InvalidDimension);

    try {
        GridBuilder::Build(3, -2);
        FAIL() << "expected InvalidDimension";
    } catch (const MazeError& e) {
        EXPECT_EQ(e.code(), MazeErrc::InvalidDimension);
    }
}

TEST(Grid, AtIsBoundsChecked)
{
    const Grid g = GridBuilder::Build(2, 2);
    EXPECT_NO_THROW(g.At(1, 1));
    EXPECT_THROW(g.At(2, 0), std::out_of_range);
    EXPECT_THROW(g.At(0, -1), std::out_of_range);
    EXPECT_THROW(Grid().At(0, 0), std::out_of_range);
}

TEST(Grid, OpenPassageUpdatesBothCells)
{
    Grid g = GridBuilder::Build(3, 2);

    g.OpenPassage({0, 1}, Direction::East);
    EXPECT_FALSE(g.HasWall({0, 1}, Direction::East));
    EXPECT_FALSE(g.HasWall({0, 2}, Direction::West));

    g.OpenPassage({1, 0}, Direction::North);
    EXPECT_FALSE(g.HasWall({1, 0}, Direction::North));
    EXPECT_FALSE(g.HasWall({0, 0}, Direction::South));

    EXPECT_EQ(g.CountPassages(), 2u);
    EXPECT_TRUE(WallsConsistent(g));
}

TEST(Grid, OpenPassageRejectsBorderEdges)
{
    Grid g = GridBuilder::Build(2, 2);
    EXPECT_THROW(g.OpenPassage({0, 0}, Direction::North), std::out_of_range);
    EXPECT_THROW(g.OpenPassage({1, 1}, Direction::East), std::out_of_range);
    EXPECT_EQ(g.CountPassages(), 0u);
}

TEST(Grid, OpenBoundaryWallOnlyOnPerimeter)
{
    Grid g = GridBuilder::Build(3, 3);

    EXPECT_THROW(g.OpenBoundaryWall({1, 1}, Direction::North), std::out_of_range);
    EXPECT_THROW(g.OpenBoundaryWall({0, 0}, Direction::East), std::out_of_range);

    g.OpenBoundaryWall({2, 1}, Direction::South);
    EXPECT_FALSE(g.HasWall({2, 1}, Direction::South));
    EXPECT_EQ(g.CountPassages(), 0u);
}

TEST(Grid, NeighborStopsAtEdges)
{
    const Grid g = GridBuilder::Build(2, 3);
    CellCoord n{-1, -1};

    EXPECT_FALSE(g.Neighbor({0, 0}, Direction::North, n));
    EXPECT_FALSE(g.Neighbor({0, 1}, Direction::East, n));
    ASSERT_TRUE(g.Neighbor({0, 0}, Direction::South, n));
    EXPECT_EQ(n, (CellCoord{1, 0}));
    ASSERT_TRUE(g.Neighbor({2, 1}, Direction::West, n));
    EXPECT_EQ(n, (CellCoord{2, 0}));
}

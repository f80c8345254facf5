#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "sweep/game/cell.h"
#include "sweep/game/grid.h"

namespace sweep {

namespace {

std::vector<Cell> Adjacent(const Bounds& bounds, const Cell& cell) {
  std::vector<Cell> cells;
  bounds.ForEachAdjacent(cell, [&cells](const Cell& adjacent) {
    cells.push_back(adjacent);
    return false;
  });
  return cells;
}

TEST(BoundsTest, IsValid) {
  const Bounds bounds(3, 4);
  EXPECT_TRUE(bounds.IsValid({0, 0}));
  EXPECT_TRUE(bounds.IsValid({2, 3}));
  EXPECT_FALSE(bounds.IsValid({3, 0}));
  EXPECT_FALSE(bounds.IsValid({0, 4}));
  EXPECT_EQ(12u, bounds.GetSize());
}

TEST(BoundsTest, InteriorCellHasEightNeighbors) {
  const std::vector<Cell> expected{{0, 0}, {0, 1}, {0, 2}, {1, 0},
                                   {1, 2}, {2, 0}, {2, 1}, {2, 2}};
  EXPECT_EQ(expected, Adjacent(Bounds(3, 3), {1, 1}));
}

TEST(BoundsTest, CornerNeighborsAreClipped) {
  const std::vector<Cell> expected{{0, 1}, {1, 0}, {1, 1}};
  EXPECT_EQ(expected, Adjacent(Bounds(3, 3), {0, 0}));

  const std::vector<Cell> far_corner{{1, 1}, {1, 2}, {2, 1}};
  EXPECT_EQ(far_corner, Adjacent(Bounds(3, 3), {2, 2}));
}

TEST(BoundsTest, SingleRow) {
  const std::vector<Cell> expected{{0, 1}, {0, 3}};
  EXPECT_EQ(expected, Adjacent(Bounds(1, 5), {0, 2}));
}

TEST(BoundsTest, ForEachAdjacentCountsTrueResults) {
  const Bounds bounds(3, 3);
  const std::size_t count = bounds.ForEachAdjacent(
      {1, 1}, [](const Cell& cell) { return cell.row == 0; });
  EXPECT_EQ(3u, count);
}

TEST(BoundsTest, ForEachCellIsRowMajor) {
  std::vector<Cell> cells;
  Bounds(2, 2).ForEachCell([&cells](const Cell& cell) { cells.push_back(cell); });
  const std::vector<Cell> expected{{0, 0}, {0, 1}, {1, 0}, {1, 1}};
  EXPECT_EQ(expected, cells);
}

TEST(GridTest, ValuesStartZeroed) {
  Grid<int> grid(2, 3);
  grid({1, 2}) = 7;
  EXPECT_EQ(0, grid({0, 0}));
  EXPECT_EQ(7, grid({1, 2}));
  EXPECT_EQ(0, grid({1, 1}));
}

TEST(CellTest, HashAndEquality) {
  CellSet cells{{0, 1}, {1, 0}, {0, 1}};
  EXPECT_EQ(2u, cells.size());
  EXPECT_EQ(1u, cells.count({1, 0}));
  EXPECT_TRUE((Cell{2, 3} == Cell{2, 3}));
  EXPECT_TRUE((Cell{2, 3} != Cell{3, 2}));
  EXPECT_TRUE((Cell{0, 9} < Cell{1, 0}));
}

TEST(CellTest, PrintsSortedSet) {
  std::ostringstream out;
  out << CellSet{{1, 0}, {0, 2}, {0, 1}};
  EXPECT_EQ("{(0, 1), (0, 2), (1, 0)}", out.str());
}

}  // namespace

}  // namespace sweep

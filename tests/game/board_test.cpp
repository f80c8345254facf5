#include <gtest/gtest.h>

#include <memory>

#include "sweep/game/board.h"

namespace sweep {

namespace {

TEST(BoardTest, RejectsBadDimensions) {
  EXPECT_EQ(nullptr, NewBoard(0, 3, {}));
  EXPECT_EQ(nullptr, NewBoard(3, 0, {}));
  EXPECT_EQ(nullptr, NewBoard(3, 3, {{3, 0}}));
}

TEST(BoardTest, CountsDistinctMines) {
  auto board = NewBoard(3, 3, {{0, 0}, {2, 2}, {0, 0}});
  ASSERT_NE(nullptr, board);
  EXPECT_EQ(3u, board->GetRows());
  EXPECT_EQ(3u, board->GetCols());
  EXPECT_EQ(2u, board->GetMines());
  EXPECT_TRUE(board->IsMine({0, 0}));
  EXPECT_FALSE(board->IsMine({1, 1}));
  EXPECT_FALSE(board->IsMine({5, 5}));
}

TEST(BoardTest, NeighborMineCount) {
  auto board = NewBoard(3, 3, {{0, 0}, {2, 2}});
  ASSERT_NE(nullptr, board);
  EXPECT_EQ(2u, board->NeighborMineCount({1, 1}));
  EXPECT_EQ(1u, board->NeighborMineCount({0, 1}));
  EXPECT_EQ(0u, board->NeighborMineCount({0, 2}));
  // A mine does not count itself.
  EXPECT_EQ(0u, board->NeighborMineCount({0, 0}));
  EXPECT_EQ(0u, board->NeighborMineCount({3, 0}));
}

TEST(BoardTest, WonWhenFlagsMatchMines) {
  auto board = NewBoard(2, 2, {{0, 0}, {1, 1}});
  ASSERT_NE(nullptr, board);
  EXPECT_FALSE(board->Won());

  EXPECT_TRUE(board->Flag({0, 0}));
  EXPECT_FALSE(board->Won());

  EXPECT_TRUE(board->Flag({1, 1}));
  EXPECT_TRUE(board->Won());

  // Flagging twice changes nothing.
  EXPECT_TRUE(board->Flag({1, 1}));
  EXPECT_TRUE(board->Won());

  EXPECT_FALSE(board->Flag({2, 0}));
  EXPECT_TRUE(board->Won());
}

TEST(BoardTest, WrongFlagLoses) {
  auto board = NewBoard(2, 2, {{0, 0}});
  ASSERT_NE(nullptr, board);
  EXPECT_TRUE(board->Flag({0, 0}));
  EXPECT_TRUE(board->Flag({0, 1}));
  EXPECT_FALSE(board->Won());
}

TEST(BoardTest, NoMinesIsWonFromTheStart) {
  auto board = NewBoard(1, 1, {});
  ASSERT_NE(nullptr, board);
  EXPECT_TRUE(board->Won());
}

}  // namespace

}  // namespace sweep

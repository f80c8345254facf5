#ifndef SWEEP_GAME_BOARD_H_
#define SWEEP_GAME_BOARD_H_

#include <cstddef>
#include <memory>
#include <vector>

#include "sweep/game/cell.h"

namespace sweep {

// Holds the ground truth of a game: where the mines are.
//
// The board answers the questions a game loop asks on behalf of a player. The
// agent never sees the board; it only receives the clues the game loop reads
// from it.
class Board {
 public:
  virtual ~Board() = default;

  // Returns the number of rows on the board.
  virtual std::size_t GetRows() const = 0;

  // Returns the number of columns on the board.
  virtual std::size_t GetCols() const = 0;

  // Returns the number of mines on the board.
  virtual std::size_t GetMines() const = 0;

  // Returns true if the cell contains a mine.
  //
  // Returns false for cells outside the board.
  virtual bool IsMine(const Cell& cell) const = 0;

  // Returns the number of mines in the cells adjacent to the given cell. The
  // cell itself is not counted. Returns 0 for cells outside the board.
  virtual std::size_t NeighborMineCount(const Cell& cell) const = 0;

  // Records the cell as a found mine.
  //
  // Returns false (and does nothing) if the cell is outside the board.
  virtual bool Flag(const Cell& cell) = 0;

  // Returns true if the set of flagged cells is exactly the set of mines.
  virtual bool Won() const = 0;
};

// Creates a new board with mines at the given cells.
//   rows - The number of rows.
//   cols - The number of columns.
//   mines - The mine locations. Duplicates are ignored.
//
// Returns nullptr if a dimension is zero or a mine lies outside the board.
std::unique_ptr<Board> NewBoard(std::size_t rows, std::size_t cols,
                                const std::vector<Cell>& mines);

}  // namespace sweep

#endif  // SWEEP_GAME_BOARD_H_

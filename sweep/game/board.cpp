#include "sweep/game/board.h"

#include "sweep/compat/make_unique.h"
#include "sweep/game/grid.h"

namespace sweep {

namespace {

// A single square of the board.
class Square {
 public:
  // Returns true if the square contains a mine.
  bool IsMine() const { return is_mine_; }

  // Places a mine in this square.
  //
  // Returns false if the square already held a mine.
  bool SetMine() {
    if (is_mine_) {
      return false;
    }
    is_mine_ = true;
    return true;
  }

  // Returns true if the square has been flagged.
  bool IsFlagged() const { return is_flagged_; }

  // Flags the square.
  //
  // Returns false if the square was already flagged.
  bool SetFlagged() {
    if (is_flagged_) {
      return false;
    }
    is_flagged_ = true;
    return true;
  }

 private:
  bool is_mine_ = false;
  bool is_flagged_ = false;
};

// The board implementation.
class BoardImpl : public Board {
 public:
  BoardImpl(std::size_t rows, std::size_t cols, const std::vector<Cell>& mines)
      : mines_(0), flagged_mines_(0), flagged_safes_(0), grid_(rows, cols) {
    for (const Cell& cell : mines) {
      if (grid_(cell).SetMine()) {
        ++mines_;
      }
    }
  }

  ~BoardImpl() final = default;

  std::size_t GetRows() const final { return grid_.GetRows(); }

  std::size_t GetCols() const final { return grid_.GetCols(); }

  std::size_t GetMines() const final { return mines_; }

  bool IsMine(const Cell& cell) const final {
    return grid_.IsValid(cell) && grid_(cell).IsMine();
  }

  std::size_t NeighborMineCount(const Cell& cell) const final {
    if (!grid_.IsValid(cell)) {
      return 0;
    }
    return grid_.ForEachAdjacent(
        cell, [this](const Cell& adjacent) { return grid_(adjacent).IsMine(); });
  }

  bool Flag(const Cell& cell) final {
    if (!grid_.IsValid(cell)) {
      return false;
    }
    Square& square = grid_(cell);
    if (square.SetFlagged()) {
      if (square.IsMine()) {
        ++flagged_mines_;
      } else {
        ++flagged_safes_;
      }
    }
    return true;
  }

  bool Won() const final {
    return flagged_mines_ == mines_ && flagged_safes_ == 0;
  }

 private:
  std::size_t mines_;

  // Flagged squares, split by whether they hold a mine.
  std::size_t flagged_mines_;
  std::size_t flagged_safes_;

  Grid<Square> grid_;
};

}  // namespace

std::unique_ptr<Board> NewBoard(std::size_t rows, std::size_t cols,
                                const std::vector<Cell>& mines) {
  if (rows == 0 || cols == 0) {
    return nullptr;
  }
  const Bounds bounds(rows, cols);
  for (const Cell& cell : mines) {
    if (!bounds.IsValid(cell)) {
      return nullptr;
    }
  }
  return MakeUnique<BoardImpl>(rows, cols, mines);
}

}  // namespace sweep

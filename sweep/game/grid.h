#ifndef SWEEP_GAME_GRID_H_
#define SWEEP_GAME_GRID_H_

#include <cstddef>
#include <memory>

#include "sweep/game/cell.h"

namespace sweep {

// The extent of a rectangular board.
class Bounds {
 public:
  Bounds(std::size_t rows, std::size_t cols) : rows_(rows), cols_(cols) {}

  // Returns the number of rows.
  std::size_t GetRows() const { return rows_; }

  // Returns the number of columns.
  std::size_t GetCols() const { return cols_; }

  // Returns the number of cells.
  std::size_t GetSize() const { return rows_ * cols_; }

  // Returns true if the cell lies within the bounds.
  bool IsValid(const Cell& cell) const {
    return cell.row < rows_ && cell.col < cols_;
  }

  // Calls the provided function object for each cell in row-major order.
  //
  // The function should be callable as:
  //   fn(cell);
  template <class Fn>
  void ForEachCell(Fn fn) const {
    for (std::size_t row = 0; row < rows_; ++row) {
      for (std::size_t col = 0; col < cols_; ++col) {
        fn(Cell{row, col});
      }
    }
  }

  // Calls the provided function object for each of the valid adjacent cells,
  // in row-major order. The cell itself is not visited.
  //
  // The function should be callable as:
  //   bool v = fn(cell);
  //
  // Returns the number of function calls that returned true.
  template <class Fn>
  std::size_t ForEachAdjacent(const Cell& cell, Fn fn) const {
    // Note: This relies on the fact that unsigned underflow is well defined.
    std::size_t count = 0;
    for (std::size_t row = cell.row - 1; row != cell.row + 2; ++row) {
      for (std::size_t col = cell.col - 1; col != cell.col + 2; ++col) {
        const Cell adjacent{row, col};
        if (adjacent != cell && IsValid(adjacent) && fn(adjacent)) {
          ++count;
        }
      }
    }
    return count;
  }

 private:
  std::size_t rows_;
  std::size_t cols_;
};

// Represents a two dimensional grid of T, addressed by Cell.
template <typename T>
class Grid : public Bounds {
 public:
  Grid(std::size_t rows, std::size_t cols)
      : Bounds(rows, cols), values_(new T[rows * cols]()) {}

  ~Grid() = default;

  // Movable.
  Grid(Grid&&) = default;
  Grid& operator=(Grid&&) = default;

  // Returns the value at the specified cell.
  const T& operator()(const Cell& cell) const {
    return values_[cell.row * GetCols() + cell.col];
  }

  // Returns the value at the specified cell.
  T& operator()(const Cell& cell) {
    return values_[cell.row * GetCols() + cell.col];
  }

 private:
  std::unique_ptr<T[]> values_;
};

}  // namespace sweep

#endif  // SWEEP_GAME_GRID_H_

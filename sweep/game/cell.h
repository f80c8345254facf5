#ifndef SWEEP_GAME_CELL_H_
#define SWEEP_GAME_CELL_H_

#include <cstddef>
#include <functional>
#include <ostream>
#include <unordered_set>
#include <vector>

namespace sweep {

// The row/col location of a cell on a board.
struct Cell {
  std::size_t row;
  std::size_t col;
};

inline bool operator==(const Cell& a, const Cell& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Cell& a, const Cell& b) {
  return a.row != b.row || a.col != b.col;
}

// Row-major ordering.
inline bool operator<(const Cell& a, const Cell& b) {
  return a.row < b.row || (a.row == b.row && a.col < b.col);
}

// Prints the cell as "(row, col)".
std::ostream& operator<<(std::ostream& out, const Cell& cell);

}  // namespace sweep

namespace std {

// Hash function for Cell.
template <>
struct hash<sweep::Cell> {
  // This is 2^64 / phi. Any irrational number would do. The goal is just
  // "random" bits.
  static constexpr std::size_t magic = 0x9e3779b97f4a7a97;

  std::size_t operator()(const sweep::Cell& cell) const {
    const std::hash<std::size_t> h;
    std::size_t seed = h(cell.row);
    seed ^= h(cell.col) + magic + (seed << 6) + (seed >> 2);
    return seed;
  }
};

}  // namespace std

namespace sweep {

// An unordered collection of unique cells.
using CellSet = std::unordered_set<Cell>;

// Returns the cells of the set in row-major order.
//
// Iteration order of a CellSet is unspecified; anything that must be
// reproducible (printing, random selection) goes through this.
std::vector<Cell> SortedCells(const CellSet& cells);

// Prints the set as "{(r, c), ...}" in row-major order.
std::ostream& operator<<(std::ostream& out, const CellSet& cells);

}  // namespace sweep

#endif  // SWEEP_GAME_CELL_H_

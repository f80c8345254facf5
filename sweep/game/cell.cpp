#include "sweep/game/cell.h"

#include <algorithm>

namespace sweep {

std::ostream& operator<<(std::ostream& out, const Cell& cell) {
  return out << '(' << cell.row << ", " << cell.col << ')';
}

std::vector<Cell> SortedCells(const CellSet& cells) {
  std::vector<Cell> sorted(cells.begin(), cells.end());
  std::sort(sorted.begin(), sorted.end());
  return sorted;
}

std::ostream& operator<<(std::ostream& out, const CellSet& cells) {
  out << '{';
  bool first = true;
  for (const Cell& cell : SortedCells(cells)) {
    if (!first) {
      out << ", ";
    }
    first = false;
    out << cell;
  }
  return out << '}';
}

}  // namespace sweep

#include "sweep/agent/sentence.h"

#include <sstream>
#include <utility>

namespace sweep {

Sentence::Sentence(CellSet cells, std::size_t count)
    : cells_(std::move(cells)), count_(count) {
  if (count_ > cells_.size()) {
    std::ostringstream what;
    what << "sentence claims more mines than cells: " << *this;
    throw InconsistentKnowledge(what.str());
  }
}

bool Sentence::KnownMines(CellSet* mines) const {
  if (cells_.size() != count_) {
    return false;
  }
  *mines = cells_;
  return true;
}

bool Sentence::KnownSafes(CellSet* safes) const {
  if (count_ != 0) {
    return false;
  }
  *safes = cells_;
  return true;
}

bool Sentence::MarkMine(const Cell& cell) {
  auto it = cells_.find(cell);
  if (it == cells_.end()) {
    return false;
  }
  // Every cell here is already known to be safe.
  if (count_ == 0) {
    std::ostringstream what;
    what << "mine " << cell << " in a sentence with no mines: " << *this;
    throw InconsistentKnowledge(what.str());
  }
  cells_.erase(it);
  --count_;
  return true;
}

bool Sentence::MarkSafe(const Cell& cell) {
  auto it = cells_.find(cell);
  if (it == cells_.end()) {
    return false;
  }
  // Every cell here is already known to be a mine.
  if (count_ == cells_.size()) {
    std::ostringstream what;
    what << "safe cell " << cell << " in a sentence of mines: " << *this;
    throw InconsistentKnowledge(what.str());
  }
  cells_.erase(it);
  return true;
}

bool Sentence::IsSubsetOf(const Sentence& other) const {
  if (cells_.size() > other.cells_.size()) {
    return false;
  }
  for (const Cell& cell : cells_) {
    if (other.cells_.count(cell) == 0) {
      return false;
    }
  }
  return true;
}

Sentence Sentence::Difference(const Sentence& subset) const {
  if (subset.count_ > count_) {
    std::ostringstream what;
    what << "subset " << subset << " has more mines than " << *this;
    throw InconsistentKnowledge(what.str());
  }
  CellSet cells;
  for (const Cell& cell : cells_) {
    if (subset.cells_.count(cell) == 0) {
      cells.insert(cell);
    }
  }
  return Sentence(std::move(cells), count_ - subset.count_);
}

std::ostream& operator<<(std::ostream& out, const Sentence& sentence) {
  return out << sentence.GetCells() << " = " << sentence.GetCount();
}

}  // namespace sweep

#ifndef SWEEP_AGENT_SENTENCE_H_
#define SWEEP_AGENT_SENTENCE_H_

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>

#include "sweep/game/cell.h"

namespace sweep {

// Thrown when the agent's knowledge contradicts itself: a sentence claims
// more mines than it has cells, a cell is proven both safe and a mine, and
// so on. This always indicates faulty inference (or faulty clues), never an
// ordinary "nothing is known yet" outcome. An agent that threw this must be
// discarded.
class InconsistentKnowledge : public std::logic_error {
 public:
  explicit InconsistentKnowledge(const std::string& what)
      : std::logic_error(what) {}
};

// A logical statement about a game: exactly GetCount() of GetCells() are
// mines.
//
// A sentence always satisfies 0 <= count <= |cells|. Any construction or
// mutation that would break this throws InconsistentKnowledge.
class Sentence {
 public:
  Sentence(CellSet cells, std::size_t count);

  // Copyable.
  Sentence(const Sentence&) = default;
  Sentence& operator=(const Sentence&) = default;

  // Movable.
  Sentence(Sentence&&) = default;
  Sentence& operator=(Sentence&&) = default;

  // Returns the cells the sentence is about.
  const CellSet& GetCells() const { return cells_; }

  // Returns the number of mines among the cells.
  std::size_t GetCount() const { return count_; }

  // A vacuous sentence has no cells (and so no mines). It is trivially true
  // and can tell us nothing.
  bool IsVacuous() const { return cells_.empty(); }

  // If every cell is known to be a mine, copies the cells into mines and
  // returns true. Otherwise returns false and leaves mines untouched.
  bool KnownMines(CellSet* mines) const;

  // If every cell is known to be safe, copies the cells into safes and
  // returns true. Otherwise returns false and leaves safes untouched.
  bool KnownSafes(CellSet* safes) const;

  // Updates the sentence given that the cell is a mine: the cell is removed
  // and the count decremented.
  //
  // Returns false (and does nothing) if the cell is not part of the sentence.
  bool MarkMine(const Cell& cell);

  // Updates the sentence given that the cell is safe: the cell is removed and
  // the count is unchanged.
  //
  // Returns false (and does nothing) if the cell is not part of the sentence.
  bool MarkSafe(const Cell& cell);

  // Returns true if every cell of this sentence is also a cell of other.
  bool IsSubsetOf(const Sentence& other) const;

  // Returns the sentence covering the cells of this sentence that are not in
  // subset, with the mines of subset taken away.
  //
  // The cells of subset must be a subset of the cells of this sentence.
  Sentence Difference(const Sentence& subset) const;

 private:
  CellSet cells_;
  std::size_t count_;
};

inline bool operator==(const Sentence& a, const Sentence& b) {
  return a.GetCount() == b.GetCount() && a.GetCells() == b.GetCells();
}

inline bool operator!=(const Sentence& a, const Sentence& b) {
  return !(a == b);
}

// Prints the sentence as "{(r, c), ...} = count".
std::ostream& operator<<(std::ostream& out, const Sentence& sentence);

}  // namespace sweep

#endif  // SWEEP_AGENT_SENTENCE_H_

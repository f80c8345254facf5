#ifndef SWEEP_AGENT_AGENT_H_
#define SWEEP_AGENT_AGENT_H_

#include <cstddef>
#include <memory>

#include "sweep/agent/knowledge_base.h"
#include "sweep/agent/options.h"
#include "sweep/game/cell.h"

namespace sweep {

// A player that reasons about the board from the clues it is given.
//
// The game loop reveals a cell, tells the agent how many mines surround it
// through AddKnowledge, and asks the agent for its next move. The agent keeps
// every clue as a sentence and deduces from them which cells are safe and
// which are mines.
class Agent {
 public:
  virtual ~Agent() = default;

  // Records that the cell was revealed and that count of its neighbors are
  // mines, then draws every conclusion that follows.
  //
  // Returns false (and does nothing) if the cell is outside the board.
  //
  // Throws InconsistentKnowledge if the clue contradicts what the agent
  // already knows.
  virtual bool AddKnowledge(const Cell& cell, std::size_t count) = 0;

  // Chooses a cell known to be safe that has not been revealed yet.
  //
  // Returns false if there is no such cell. Does not change what the agent
  // knows.
  virtual bool MakeSafeMove(Cell* move) = 0;

  // Chooses a cell at random among those that have not been revealed and are
  // not known to be mines. The chosen cell may be a mine.
  //
  // Returns false if there is no such cell.
  virtual bool MakeRandomMove(Cell* move) = 0;

  // Returns the number of rows.
  virtual std::size_t GetRows() const = 0;

  // Returns the number of columns.
  virtual std::size_t GetCols() const = 0;

  // Returns the cells that have been revealed.
  virtual const CellSet& GetMovesMade() const = 0;

  // Returns the cells known to be safe.
  virtual const CellSet& GetSafes() const = 0;

  // Returns the cells known to be mines.
  virtual const CellSet& GetMines() const = 0;

  // Returns the sentences the agent holds to be true.
  virtual const KnowledgeBase& GetKnowledge() const = 0;
};

// Creates a new agent.
//   rows - The number of rows.
//   cols - The number of columns.
//   seed - Seed for the PRNG used to choose among candidate moves.
//   options - Agent settings.
//
// Returns nullptr if a dimension is zero.
std::unique_ptr<Agent> NewAgent(std::size_t rows, std::size_t cols,
                                unsigned seed,
                                const AgentOptions& options = AgentOptions());

}  // namespace sweep

#endif  // SWEEP_AGENT_AGENT_H_

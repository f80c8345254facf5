#include "sweep/agent/agent.h"

#include <random>
#include <utility>
#include <vector>

#include "sweep/agent/inference.h"
#include "sweep/agent/sentence.h"
#include "sweep/compat/make_unique.h"
#include "sweep/game/grid.h"

namespace sweep {

namespace {

class AgentImpl : public Agent {
 public:
  AgentImpl(std::size_t rows, std::size_t cols, unsigned seed,
            const AgentOptions& options)
      : bounds_(rows, cols),
        options_(options),
        rng_(seed),
        engine_(options.trace) {}

  ~AgentImpl() final = default;

  bool AddKnowledge(const Cell& cell, std::size_t count) final {
    if (!bounds_.IsValid(cell)) {
      return false;
    }

    moves_made_.insert(cell);
    engine_.MarkSafe(cell);

    const CellSet& safes = engine_.GetSafes();
    const CellSet& mines = engine_.GetMines();

    CellSet neighbors;
    std::size_t known_mines = 0;
    bounds_.ForEachAdjacent(cell, [&](const Cell& adjacent) {
      if (mines.count(adjacent) != 0) {
        ++known_mines;
      } else if (moves_made_.count(adjacent) == 0 &&
                 safes.count(adjacent) == 0) {
        neighbors.insert(adjacent);
      }
      return false;
    });

    if (options_.subtract_known_mines) {
      if (known_mines > count) {
        throw InconsistentKnowledge("clue is below the known adjacent mines");
      }
      count -= known_mines;
    }

    engine_.AddSentence(Sentence(std::move(neighbors), count));
    engine_.Infer();
    return true;
  }

  bool MakeSafeMove(Cell* move) final {
    const CellSet& safes = engine_.GetSafes();
    std::vector<Cell> candidates;
    bounds_.ForEachCell([&](const Cell& cell) {
      if (safes.count(cell) != 0 && moves_made_.count(cell) == 0) {
        candidates.push_back(cell);
      }
    });
    return Choose(candidates, move);
  }

  bool MakeRandomMove(Cell* move) final {
    const CellSet& mines = engine_.GetMines();
    std::vector<Cell> candidates;
    bounds_.ForEachCell([&](const Cell& cell) {
      if (mines.count(cell) == 0 && moves_made_.count(cell) == 0) {
        candidates.push_back(cell);
      }
    });
    return Choose(candidates, move);
  }

  std::size_t GetRows() const final { return bounds_.GetRows(); }

  std::size_t GetCols() const final { return bounds_.GetCols(); }

  const CellSet& GetMovesMade() const final { return moves_made_; }

  const CellSet& GetSafes() const final { return engine_.GetSafes(); }

  const CellSet& GetMines() const final { return engine_.GetMines(); }

  const KnowledgeBase& GetKnowledge() const final {
    return engine_.GetKnowledge();
  }

 private:
  // Picks one of the candidates uniformly at random.
  //
  // Returns false if there are no candidates.
  bool Choose(const std::vector<Cell>& candidates, Cell* move) {
    if (candidates.empty()) {
      return false;
    }
    std::uniform_int_distribution<std::size_t> d(0, candidates.size() - 1);
    *move = candidates[d(rng_)];
    return true;
  }

  const Bounds bounds_;
  const AgentOptions options_;
  std::default_random_engine rng_;
  CellSet moves_made_;
  InferenceEngine engine_;
};

}  // namespace

std::unique_ptr<Agent> NewAgent(std::size_t rows, std::size_t cols,
                                unsigned seed, const AgentOptions& options) {
  if (rows == 0 || cols == 0) {
    return nullptr;
  }
  return MakeUnique<AgentImpl>(rows, cols, seed, options);
}

}  // namespace sweep

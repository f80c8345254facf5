#ifndef SWEEP_AGENT_INFERENCE_H_
#define SWEEP_AGENT_INFERENCE_H_

#include <cstddef>
#include <ostream>

#include "sweep/agent/knowledge_base.h"
#include "sweep/agent/sentence.h"
#include "sweep/game/cell.h"

namespace sweep {

// What a call to InferenceEngine::Infer did.
struct InferenceStats {
  // Number of extraction + resolution passes run, including the final pass
  // that changed nothing.
  std::size_t passes = 0;

  // Number of cells newly proven safe or mines.
  std::size_t marked = 0;

  // Number of sentences derived by subset resolution and kept.
  std::size_t derived = 0;

  // Number of superset sentences removed after resolution.
  std::size_t removed = 0;
};

// Holds the sentences known to be true along with the cells proven safe and
// proven to be mines, and draws every conclusion that follows from them.
//
// Two rules are applied until neither changes anything:
//  - Extraction: a sentence whose count is zero proves all of its cells safe;
//    a sentence whose count equals its size proves all of its cells mines.
//    Proven cells are removed from every sentence.
//  - Subset resolution: if the cells of B are a subset of the cells of A,
//    then the mines of A not in B are exactly A.count - B.count of the cells
//    A \ B. That sentence is added and A, now redundant, is removed.
//
// Each step either proves a new cell or replaces a sentence with strictly
// smaller ones, so inference always terminates.
class InferenceEngine {
 public:
  // trace - If not null, each inference step is written to it. Not owned.
  explicit InferenceEngine(std::ostream* trace = nullptr);

  // Not copyable.
  InferenceEngine(const InferenceEngine&) = delete;
  InferenceEngine& operator=(const InferenceEngine&) = delete;

  // Proves the cell is a mine, and removes it from every sentence.
  //
  // Does nothing if the cell is already a known mine. Throws
  // InconsistentKnowledge if the cell is known to be safe.
  void MarkMine(const Cell& cell);

  // Proves the cell is safe, and removes it from every sentence.
  //
  // Does nothing if the cell is already known to be safe. Throws
  // InconsistentKnowledge if the cell is a known mine.
  void MarkSafe(const Cell& cell);

  // Adds a sentence to the knowledge base without drawing conclusions from
  // it.
  //
  // Returns false if the sentence was dropped as vacuous or duplicate.
  bool AddSentence(Sentence sentence);

  // Applies extraction and subset resolution until a pass changes nothing.
  InferenceStats Infer();

  // Returns the cells proven safe.
  const CellSet& GetSafes() const { return safes_; }

  // Returns the cells proven to be mines.
  const CellSet& GetMines() const { return mines_; }

  // Returns the current sentences.
  const KnowledgeBase& GetKnowledge() const { return knowledge_; }

 private:
  // Marks every cell proven by a single sentence.
  //
  // Returns the number of newly marked cells.
  std::size_t Extract();

  // Resolves every subset pair of the current sentences.
  //
  // Returns the number of superset sentences removed. Adds the number of new
  // sentences to *derived.
  std::size_t Resolve(std::size_t* derived);

  std::ostream* trace_;
  CellSet safes_;
  CellSet mines_;
  KnowledgeBase knowledge_;
};

}  // namespace sweep

#endif  // SWEEP_AGENT_INFERENCE_H_

#include "sweep/agent/inference.h"

#include <sstream>
#include <utility>
#include <vector>

namespace sweep {

InferenceEngine::InferenceEngine(std::ostream* trace) : trace_(trace) {}

void InferenceEngine::MarkMine(const Cell& cell) {
  if (safes_.count(cell) != 0) {
    std::ostringstream what;
    what << "cell " << cell << " is known to be safe";
    throw InconsistentKnowledge(what.str());
  }
  if (!mines_.insert(cell).second) {
    return;
  }
  if (trace_ != nullptr) {
    *trace_ << "mine " << cell << '\n';
  }
  knowledge_.MarkMine(cell);
}

void InferenceEngine::MarkSafe(const Cell& cell) {
  if (mines_.count(cell) != 0) {
    std::ostringstream what;
    what << "cell " << cell << " is known to be a mine";
    throw InconsistentKnowledge(what.str());
  }
  if (!safes_.insert(cell).second) {
    return;
  }
  if (trace_ != nullptr) {
    *trace_ << "safe " << cell << '\n';
  }
  knowledge_.MarkSafe(cell);
}

bool InferenceEngine::AddSentence(Sentence sentence) {
  if (trace_ != nullptr) {
    *trace_ << "add " << sentence << '\n';
  }
  return knowledge_.Add(std::move(sentence));
}

InferenceStats InferenceEngine::Infer() {
  InferenceStats stats;
  for (;;) {
    ++stats.passes;
    const std::size_t marked = Extract();
    const std::size_t removed = Resolve(&stats.derived);
    stats.marked += marked;
    stats.removed += removed;

    if (trace_ != nullptr) {
      *trace_ << "pass " << stats.passes << ": " << marked << " marked, "
              << removed << " removed, " << knowledge_.size()
              << " sentences\n";
    }

    if (marked == 0 && removed == 0) {
      break;
    }
  }
  return stats;
}

std::size_t InferenceEngine::Extract() {
  // Marking a cell edits the sentences, so conclusions are drawn from a
  // snapshot. Conclusions of a sentence stay true as it shrinks.
  const KnowledgeBase snapshot = knowledge_;

  std::size_t marked = 0;
  CellSet cells;
  for (const Sentence& sentence : snapshot) {
    if (sentence.KnownMines(&cells)) {
      for (const Cell& cell : SortedCells(cells)) {
        if (mines_.count(cell) == 0) {
          MarkMine(cell);
          ++marked;
        }
      }
    }
    if (sentence.KnownSafes(&cells)) {
      for (const Cell& cell : SortedCells(cells)) {
        if (safes_.count(cell) == 0) {
          MarkSafe(cell);
          ++marked;
        }
      }
    }
  }
  return marked;
}

std::size_t InferenceEngine::Resolve(std::size_t* derived) {
  const KnowledgeBase snapshot = knowledge_;

  std::vector<const Sentence*> supersets;
  for (const Sentence& a : snapshot) {
    bool is_superset = false;
    for (const Sentence& b : snapshot) {
      if (b == a || !b.IsSubsetOf(a)) {
        continue;
      }
      is_superset = true;
      Sentence difference = a.Difference(b);
      if (trace_ != nullptr) {
        *trace_ << "derive " << a << " minus " << b << " gives " << difference
                << '\n';
      }
      if (knowledge_.Add(std::move(difference))) {
        ++*derived;
      }
    }
    if (is_superset) {
      supersets.push_back(&a);
    }
  }

  std::size_t removed = 0;
  for (const Sentence* sentence : supersets) {
    if (knowledge_.Remove(*sentence)) {
      if (trace_ != nullptr) {
        *trace_ << "remove " << *sentence << '\n';
      }
      ++removed;
    }
  }
  return removed;
}

}  // namespace sweep

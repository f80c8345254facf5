#include "sweep/agent/knowledge_base.h"

#include <algorithm>
#include <utility>

namespace sweep {

bool KnowledgeBase::Add(Sentence sentence) {
  if (sentence.IsVacuous() || Contains(sentence)) {
    return false;
  }
  sentences_.push_back(std::move(sentence));
  return true;
}

bool KnowledgeBase::Remove(const Sentence& sentence) {
  auto it = std::find(sentences_.begin(), sentences_.end(), sentence);
  if (it == sentences_.end()) {
    return false;
  }
  sentences_.erase(it);
  return true;
}

bool KnowledgeBase::Contains(const Sentence& sentence) const {
  return std::find(sentences_.begin(), sentences_.end(), sentence) !=
         sentences_.end();
}

std::size_t KnowledgeBase::MarkMine(const Cell& cell) {
  std::size_t changed = 0;
  for (Sentence& sentence : sentences_) {
    if (sentence.MarkMine(cell)) {
      ++changed;
    }
  }
  if (changed != 0) {
    Canonicalize();
  }
  return changed;
}

std::size_t KnowledgeBase::MarkSafe(const Cell& cell) {
  std::size_t changed = 0;
  for (Sentence& sentence : sentences_) {
    if (sentence.MarkSafe(cell)) {
      ++changed;
    }
  }
  if (changed != 0) {
    Canonicalize();
  }
  return changed;
}

void KnowledgeBase::Canonicalize() {
  std::vector<Sentence> kept;
  kept.reserve(sentences_.size());
  for (Sentence& sentence : sentences_) {
    if (sentence.IsVacuous() ||
        std::find(kept.begin(), kept.end(), sentence) != kept.end()) {
      continue;
    }
    kept.push_back(std::move(sentence));
  }
  sentences_ = std::move(kept);
}

}  // namespace sweep

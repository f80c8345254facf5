#ifndef SWEEP_AGENT_KNOWLEDGE_BASE_H_
#define SWEEP_AGENT_KNOWLEDGE_BASE_H_

#include <cstddef>
#include <vector>

#include "sweep/agent/sentence.h"
#include "sweep/game/cell.h"

namespace sweep {

// The ordered collection of sentences an agent holds to be true.
//
// The collection is kept canonical: it never holds a vacuous sentence, and
// never holds two equal sentences. Sentences keep the order in which they
// were added.
class KnowledgeBase {
 public:
  using const_iterator = std::vector<Sentence>::const_iterator;

  KnowledgeBase() = default;

  // Copyable.
  KnowledgeBase(const KnowledgeBase&) = default;
  KnowledgeBase& operator=(const KnowledgeBase&) = default;

  // Movable.
  KnowledgeBase(KnowledgeBase&&) = default;
  KnowledgeBase& operator=(KnowledgeBase&&) = default;

  // Appends the sentence.
  //
  // Returns false (and does nothing) if the sentence is vacuous or an equal
  // sentence is already present.
  bool Add(Sentence sentence);

  // Removes the first sentence equal to the given one.
  //
  // Returns false if there is no such sentence.
  bool Remove(const Sentence& sentence);

  // Returns true if an equal sentence is present.
  bool Contains(const Sentence& sentence) const;

  // Marks the cell as a mine in every sentence.
  //
  // Returns the number of sentences that changed. Sentences left vacuous or
  // equal to an earlier sentence are dropped.
  std::size_t MarkMine(const Cell& cell);

  // Marks the cell as safe in every sentence.
  //
  // Returns the number of sentences that changed. Sentences left vacuous or
  // equal to an earlier sentence are dropped.
  std::size_t MarkSafe(const Cell& cell);

  std::size_t size() const { return sentences_.size(); }
  bool empty() const { return sentences_.empty(); }
  const_iterator begin() const { return sentences_.begin(); }
  const_iterator end() const { return sentences_.end(); }
  const Sentence& operator[](std::size_t i) const { return sentences_[i]; }

 private:
  // Drops vacuous sentences and all but the first of any equal sentences.
  void Canonicalize();

  std::vector<Sentence> sentences_;
};

}  // namespace sweep

#endif  // SWEEP_AGENT_KNOWLEDGE_BASE_H_

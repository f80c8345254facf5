#ifndef SWEEP_AGENT_OPTIONS_H_
#define SWEEP_AGENT_OPTIONS_H_

#include <ostream>

namespace sweep {

// Settings for an Agent.
struct AgentOptions {
  // When a clue is added, neighbors already known to be mines are left out of
  // the new sentence. If this is false the clue's count is used as is, which
  // overstates the mines among the remaining neighbors whenever such a
  // neighbor exists. If true, the count is reduced by the number of neighbors
  // left out this way.
  bool subtract_known_mines = false;

  // If set, inference steps are written to this stream, one per line. Not
  // owned; must outlive the agent.
  std::ostream* trace = nullptr;
};

}  // namespace sweep

#endif  // SWEEP_AGENT_OPTIONS_H_

#pragma once
#include <vector>
#include <cstddef>
#include "Agent.h"

/**
 * owns the agent snapshot of the current step
 * readers only ever see a complete committed snapshot; the next one is built
 * in a separate buffer and swapped in by commit()
 */
class AgentStore
{
public:
    AgentStore() = default;
    explicit AgentStore(std::vector<Agent> agents);

    // throws std::out_of_range
    const Agent &at(size_t index) const;

    const std::vector<Agent> &snapshot() const { return current_; }
    size_t size() const { return current_.size(); }
    bool empty() const { return current_.empty(); }
    long long committedSteps() const { return committedSteps_; }

    // copy of the snapshot to build the next step in (the back buffer)
    std::vector<Agent> &beginStep();

    // swaps in the buffer handed out by beginStep(), or any buffer of the same size
    // throws std::invalid_argument on a size mismatch
    void commit(std::vector<Agent> &next);

    // replaces everything, used on reset
    void reset(std::vector<Agent> agents);

private:
    std::vector<Agent> current_;
    std::vector<Agent> back_;
    long long committedSteps_ = 0;
};

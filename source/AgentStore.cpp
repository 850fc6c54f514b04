#include "AgentStore.h"
#include <stdexcept>
#include <string>

AgentStore::AgentStore(std::vector<Agent> agents)
    : current_(std::move(agents))
{
}

const Agent &AgentStore::at(size_t index) const
{
    if (index >= current_.size())
    {
        throw std::out_of_range("agent index " + std::to_string(index) + " out of range (" +
                                std::to_string(current_.size()) + " agents)");
    }
    return current_[index];
}

std::vector<Agent> &AgentStore::beginStep()
{
    back_ = current_;
    return back_;
}

void AgentStore::commit(std::vector<Agent> &next)
{
    if (next.size() != current_.size())
    {
        throw std::invalid_argument("commit of " + std::to_string(next.size()) + " agents into a store of " +
                                    std::to_string(current_.size()));
    }
    current_.swap(next);
    ++committedSteps_;
}

void AgentStore::reset(std::vector<Agent> agents)
{
    current_ = std::move(agents);
    back_.clear();
    committedSteps_ = 0;
}

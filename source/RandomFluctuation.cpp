#include "RandomFluctuation.h"
#include "VectorMath.h"
#include <cmath>

RandomFluctuation::RandomFluctuation(std::uint32_t seed)
    : seed_(seed), angle_(0.0f, 2.0f * vecmath::PI)
{
}

std::mt19937 RandomFluctuation::makeEngine(int agentId) const
{
    std::seed_seq seq{seed_, static_cast<std::uint32_t>(agentId)};
    return std::mt19937(seq);
}

void RandomFluctuation::prepare(const std::vector<int> &agentIds)
{
    if (streams_.size() != agentIds.size())
        streams_.resize(agentIds.size());

    for (size_t i = 0; i < agentIds.size(); ++i)
    {
        if (streams_[i].agentId != agentIds[i])
        {
            streams_[i].agentId = agentIds[i];
            streams_[i].engine = makeEngine(agentIds[i]);
        }
    }
}

sf::Vector2f RandomFluctuation::unitVector(size_t slot)
{
    // local distribution, worker threads never share one
    std::uniform_real_distribution<float> dist(angle_.param());
    float theta = dist(streams_[slot].engine);
    return sf::Vector2f(std::cos(theta), std::sin(theta));
}

void RandomFluctuation::reset(std::uint32_t seed)
{
    seed_ = seed;
    for (auto &stream : streams_)
    {
        stream.engine = makeEngine(stream.agentId);
    }
}

#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstdint>
#include <random>
#include <vector>

/**
 * seeded source of uniformly distributed unit vectors
 * one mt19937 stream per agent, seeded from (run seed, agent id), so the draws of an agent
 * do not depend on how agents are split across worker threads
 * a stream may only be advanced by the thread that owns the agent this step
 */
class RandomFluctuation
{
public:
    explicit RandomFluctuation(std::uint32_t seed = 42);

    // makes sure every agent id has a stream; call serially before a parallel step
    void prepare(const std::vector<int> &agentIds);

    // next direction for stream `slot` (the agent's index in the snapshot passed to prepare)
    sf::Vector2f unitVector(size_t slot);

    // restarts every stream from the given seed
    void reset(std::uint32_t seed);

    std::uint32_t getSeed() const { return seed_; }
    size_t getStreamCount() const { return streams_.size(); }

private:
    struct Stream
    {
        int agentId = -1;
        std::mt19937 engine;
    };

    std::uint32_t seed_;
    std::vector<Stream> streams_;
    std::uniform_real_distribution<float> angle_;

    std::mt19937 makeEngine(int agentId) const;
};

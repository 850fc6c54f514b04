#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstdint>
#include <vector>
#include "SignMemory.h"

class SimulationSettings;

// one pedestrian
// owned by AgentStore; position/velocity only change through the integrator,
// memory only through the region classifier
struct Agent
{
public:
    static constexpr float DEFAULT_MASS = 1.0f;
    static constexpr float DEFAULT_DAMPING = 0.5f;

    // hot data, read by every kernel every step
    sf::Vector2f position;
    sf::Vector2f velocity;
    float mass = DEFAULT_MASS;
    float damping = DEFAULT_DAMPING; // viscosity nu

    // heading used for thrust and field of view while (nearly) standing still
    sf::Vector2f desiredHeading = sf::Vector2f(1.0f, 0.0f);

    int id = -1;
    int exitId = -1;        // -1 = any exit
    bool panicked = false;  // a panic source was in range during the last committed step

    // cold data
    SignMemory memory;

    Agent() = default;
    Agent(int agentId, const sf::Vector2f &pos, const sf::Vector2f &vel = sf::Vector2f(0.0f, 0.0f),
          float m = DEFAULT_MASS, float nu = DEFAULT_DAMPING);

    float speed() const { return velocity.length(); }

    // unit vector the agent is facing: velocity direction, or desired heading when slower than minSpeed
    sf::Vector2f heading(float minSpeed) const;

    void setDesiredHeading(const sf::Vector2f &direction);
};

// agent factory for demo spawn modes
class AgentFactory
{
public:
    enum class SpawnMode
    {
        Random,
        Grid,
        Cluster
    };

    // axis aligned spawn rectangle in meters
    struct SpawnArea
    {
        sf::Vector2f min;
        sf::Vector2f max;
    };

    static std::vector<Agent> createAgents(int count, SpawnMode mode, const SpawnArea &area,
                                           const SimulationSettings &settings, std::uint32_t seed,
                                           const sf::Vector2f &heading = sf::Vector2f(1.0f, 0.0f),
                                           int firstId = 0);

private:
    static std::vector<sf::Vector2f> getSpawnPositions(int count, SpawnMode mode, const SpawnArea &area,
                                                       std::uint32_t seed);
};

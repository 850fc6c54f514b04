#include "Agent.h"
#include "SimulationSettings.h"
#include "VectorMath.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>

Agent::Agent(int agentId, const sf::Vector2f &pos, const sf::Vector2f &vel, float m, float nu)
    : position(pos), velocity(vel), mass(m), damping(nu), id(agentId)
{
    // start facing the way we move if we move at all
    desiredHeading = vecmath::normalizedOr(vel, sf::Vector2f(1.0f, 0.0f));
}

sf::Vector2f Agent::heading(float minSpeed) const
{
    return vecmath::normalizedOr(velocity, desiredHeading, minSpeed);
}

void Agent::setDesiredHeading(const sf::Vector2f &direction)
{
    desiredHeading = vecmath::normalizedOr(direction, desiredHeading);
}

std::vector<Agent> AgentFactory::createAgents(int count, SpawnMode mode, const SpawnArea &area,
                                              const SimulationSettings &settings, std::uint32_t seed,
                                              const sf::Vector2f &heading, int firstId)
{
    std::vector<Agent> agents;
    if (count <= 0)
        return agents;
    agents.reserve(count);

    std::vector<sf::Vector2f> positions = getSpawnPositions(count, mode, area, seed);

    for (int i = 0; i < count; ++i)
    {
        Agent agent(firstId + i, positions[i]);
        agent.setDesiredHeading(heading);
        agent.memory.configure(static_cast<std::size_t>(settings.memoryCapacity), settings.memoryExpirySteps);
        agents.push_back(std::move(agent));
    }

    std::cout << "Created " << agents.size() << " agents ("
              << (mode == SpawnMode::Random ? "random" : mode == SpawnMode::Grid ? "grid" : "cluster")
              << " spawning)" << std::endl;

    return agents;
}

std::vector<sf::Vector2f> AgentFactory::getSpawnPositions(int count, SpawnMode mode, const SpawnArea &area,
                                                          std::uint32_t seed)
{
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> xDist(area.min.x, area.max.x);
    std::uniform_real_distribution<float> yDist(area.min.y, area.max.y);

    std::vector<sf::Vector2f> positions;
    positions.reserve(count);

    const sf::Vector2f size = area.max - area.min;

    switch (mode)
    {
    case SpawnMode::Random:
        for (int i = 0; i < count; ++i)
        {
            positions.emplace_back(xDist(gen), yDist(gen));
        }
        break;

    case SpawnMode::Grid:
    {
        // as square as the area allows, filled row by row
        float aspect = size.y > 0.0f ? size.x / size.y : 1.0f;
        int columns = std::max(1, static_cast<int>(std::ceil(std::sqrt(count * aspect))));
        int rows = (count + columns - 1) / columns;
        float spacingX = size.x / columns;
        float spacingY = size.y / std::max(1, rows);
        for (int i = 0; i < count; ++i)
        {
            int col = i % columns;
            int row = i / columns;
            positions.emplace_back(area.min.x + (col + 0.5f) * spacingX,
                                   area.min.y + (row + 0.5f) * spacingY);
        }
        break;
    }

    case SpawnMode::Cluster:
    {
        // 1-3 groups, tight gaussian spread around each center
        std::uniform_int_distribution<int> clusterCountDist(1, 3);
        int clusters = std::min(count, clusterCountDist(gen));
        std::vector<sf::Vector2f> centers;
        for (int c = 0; c < clusters; ++c)
        {
            centers.emplace_back(xDist(gen), yDist(gen));
        }
        float spread = 0.15f * std::min(size.x, size.y);
        std::normal_distribution<float> offset(0.0f, std::max(spread, 1.0e-3f));
        for (int i = 0; i < count; ++i)
        {
            const sf::Vector2f &center = centers[i % clusters];
            positions.emplace_back(std::clamp(center.x + offset(gen), area.min.x, area.max.x),
                                   std::clamp(center.y + offset(gen), area.min.y, area.max.y));
        }
        break;
    }
    }

    return positions;
}

#include "SpatialQuery.h"
#include "SimulationSettings.h"
#include "VectorMath.h"
#include <algorithm>
#include <iostream>

SpatialQuery::SpatialQuery(const SimulationSettings &settings, const WallGeometry &walls)
    : walls_(walls),
      grid_(settings.interactionRadius),
      interactionRadius_(settings.interactionRadius),
      minPairDistance_(settings.minPairDistance),
      speedEpsilon_(settings.speedEpsilon)
{
    std::cout << "SpatialQuery initialized (interaction radius " << interactionRadius_ << " m)" << std::endl;
}

void SpatialQuery::rebuild(const std::vector<Agent> &snapshot)
{
    grid_.reserve(snapshot.size());
    grid_.rebuild(snapshot);
}

bool SpatialQuery::interacts(const Agent &a, const Agent &b) const
{
    if (!vecmath::isFinite(a.position) || !vecmath::isFinite(b.position))
        return false;

    // b - a and a - b differ only in sign so both members of a pair get the same answer
    sf::Vector2f delta = b.position - a.position;
    return delta.x * delta.x + delta.y * delta.y < interactionRadius_ * interactionRadius_;
}

NeighborInfo SpatialQuery::pairGeometry(const Agent &self, const Agent &other, size_t otherIndex) const
{
    NeighborInfo info;
    info.index = otherIndex;

    sf::Vector2f delta = other.position - self.position;
    float r = delta.length();

    if (r > 0.0f)
    {
        info.direction = delta / r;
    }
    else
    {
        // exact overlap: split the pair along x, ordered by id so the two directions are opposite
        info.direction = (self.id < other.id) ? sf::Vector2f(1.0f, 0.0f) : sf::Vector2f(-1.0f, 0.0f);
    }
    info.distance = std::max(r, minPairDistance_);

    // a standing agent has no facing, every neighbor counts as straight ahead
    if (self.speed() > speedEpsilon_)
        info.angle = vecmath::angleBetween(self.velocity, info.direction);

    return info;
}

void SpatialQuery::query(const std::vector<Agent> &snapshot, size_t index, AgentGeometry &out,
                         std::vector<size_t> &scratch) const
{
    const Agent &self = snapshot[index];

    out.neighbors.clear();
    grid_.getNeighbors(self.position.x, self.position.y, interactionRadius_, scratch);
    for (size_t j : scratch)
    {
        if (j == index || !interacts(self, snapshot[j]))
            continue;
        out.neighbors.push_back(pairGeometry(self, snapshot[j], j));
    }

    out.wall = walls_.nearestWall(self.position);
    out.wallApproachSpeed = out.wall.found ? -vecmath::dot(self.velocity, out.wall.normal) : 0.0f;
}

AgentGeometry SpatialQuery::query(const std::vector<Agent> &snapshot, size_t index) const
{
    AgentGeometry geometry;
    std::vector<size_t> scratch;
    query(snapshot, index, geometry, scratch);
    return geometry;
}

std::vector<size_t> SpatialQuery::bruteForceNeighbors(const std::vector<Agent> &snapshot, size_t index) const
{
    std::vector<size_t> result;
    for (size_t j = 0; j < snapshot.size(); ++j)
    {
        if (j != index && interacts(snapshot[index], snapshot[j]))
            result.push_back(j);
    }
    return result;
}

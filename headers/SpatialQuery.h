#pragma once
#include <SFML/System/Vector2.hpp>
#include <vector>
#include "Agent.h"
#include "SpatialGrid.h"
#include "WallGeometry.h"

class SimulationSettings;

// one neighbor j as seen from agent i
struct NeighborInfo
{
    size_t index = 0;       // into the snapshot
    sf::Vector2f direction; // unit vector from i to j
    float distance = 0.0f;  // r_ij, never below the min pair distance
    float angle = 0.0f;     // theta_ij between v_i and the vector to j, in [0, pi]
};

// everything the force kernels need to know about an agent's surroundings
struct AgentGeometry
{
    std::vector<NeighborInfo> neighbors;
    WallProximity wall;
    float wallApproachSpeed = 0.0f; // v_wi = -v . e_w, positive when moving into the wall
};

/**
 * neighbor enumeration and pairwise geometry on a frozen snapshot
 * rebuild() is called once per step (serial), query() may then run concurrently for any agents
 * the neighbor relation is symmetric: j is in i's list exactly when i is in j's
 */
class SpatialQuery
{
public:
    SpatialQuery(const SimulationSettings &settings, const WallGeometry &walls);

    void rebuild(const std::vector<Agent> &snapshot);

    // scratch holds grid candidates so worker threads can reuse their allocation
    void query(const std::vector<Agent> &snapshot, size_t index, AgentGeometry &out,
               std::vector<size_t> &scratch) const;

    AgentGeometry query(const std::vector<Agent> &snapshot, size_t index) const;

    // the O(n^2) reference enumeration, used to check the grid
    std::vector<size_t> bruteForceNeighbors(const std::vector<Agent> &snapshot, size_t index) const;

    NeighborInfo pairGeometry(const Agent &self, const Agent &other, size_t otherIndex) const;

    float getInteractionRadius() const { return interactionRadius_; }
    const SpatialGrid &getGrid() const { return grid_; }

private:
    const WallGeometry &walls_;
    SpatialGrid grid_;
    float interactionRadius_;
    float minPairDistance_;
    float speedEpsilon_;

    bool interacts(const Agent &a, const Agent &b) const;
};

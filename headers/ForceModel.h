#pragma once
#include <SFML/System/Vector2.hpp>
#include <vector>
#include "Agent.h"
#include "RegionClassifier.h"
#include "Scenario.h"
#include "SimulationSettings.h"
#include "SpatialQuery.h"

// every term of an agent's total force for one step
struct ForceBreakdown
{
    sf::Vector2f driving;
    sf::Vector2f avoidance;
    sf::Vector2f cohesion;
    sf::Vector2f wall;
    sf::Vector2f goal;
    sf::Vector2f herding;
    sf::Vector2f random;
    Region region = Region::Default;
    bool panicked = false; // a panic source was within its cutoff

    sf::Vector2f total() const
    {
        return driving + avoidance + cohesion + wall + goal + herding + random;
    }
};

/**
 * the Hirai-Tarui force kernels
 * pure functions of the frozen snapshot geometry and the parameter set; the only outside input
 * is the random unit vector handed in by the caller
 */
class ForceModel
{
public:
    ForceModel(const SimulationSettings::ForceParameters &params, float speedEpsilon);

    // distance weight of the avoidance term
    float c1(float r) const;
    // angle weight of the avoidance term
    float c2(float theta) const;
    // distance weight of the cohesion term
    float h1(float r) const;
    // angle weight of the cohesion term, two levels
    float h2(float theta) const;

    sf::Vector2f driving(const Agent &agent) const;
    sf::Vector2f avoidance(const std::vector<NeighborInfo> &neighbors) const;
    sf::Vector2f cohesion(const std::vector<NeighborInfo> &neighbors) const;
    sf::Vector2f wall(const WallProximity &wall, float approachSpeed) const;

    // nearest source whose cutoff contains the position; inRange reports whether there was one
    sf::Vector2f herding(const sf::Vector2f &position, const std::vector<PanicSource> &sources,
                         bool *inRange = nullptr) const;

    // scales the unit vector by the near-wall branch of the fluctuation
    sf::Vector2f randomFluctuation(const WallProximity &wall, float approachSpeed,
                                   const sf::Vector2f &unitRandom) const;

    ForceBreakdown compute(const Agent &agent, const AgentGeometry &geometry, const GoalDecision &goal,
                           const std::vector<PanicSource> &panicSources, const sf::Vector2f &unitRandom) const;

    const SimulationSettings::ForceParameters &getParameters() const { return params_; }

private:
    SimulationSettings::ForceParameters params_;
    float speedEpsilon_;

    // linear ramp from `from` at x0 to `to` at x1
    static float lerpRange(float x, float x0, float x1, float from, float to);
};

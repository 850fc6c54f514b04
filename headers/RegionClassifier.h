#pragma once
#include <SFML/System/Vector2.hpp>
#include <vector>
#include "Agent.h"
#include "Scenario.h"
#include "SimulationSettings.h"
#include "WallGeometry.h"

// goal force domains, in priority order
enum class Region
{
    Exit,
    VisibleSign,
    Memory,
    Default
};

const char *regionName(Region region);

// the single goal force an agent follows this step
// region is the tag, targetId/target say what it is attracted to (unused for Default)
struct GoalDecision
{
    Region region = Region::Default;
    int targetId = -1;
    sf::Vector2f target;
    sf::Vector2f force; // zero for Default

    bool isActive() const { return region != Region::Default; }
};

/**
 * decides which goal force drives an agent: exit, then a visible sign, then memory, then nothing
 * first match wins so at most one goal force exists per agent per step
 */
class RegionClassifier
{
public:
    RegionClassifier(const SimulationSettings &settings, const WallGeometry &walls,
                     const std::vector<Sign> &signs, const std::vector<Exit> &exits);

    // reads the frozen agent, writes sightings only into that agent's next state
    GoalDecision classify(const Agent &current, long long step, Agent &next) const;

    // nearest exit whose radius contains the position (restricted to exitId when >= 0)
    const Exit *exitInRange(const sf::Vector2f &position, int exitId) const;

    bool isSignVisible(const Agent &agent, const Sign &sign) const;

    // every sign the agent can see, nearest first
    std::vector<const Sign *> visibleSigns(const Agent &agent) const;

private:
    const SimulationSettings::ForceParameters &params_;
    float speedEpsilon_;
    const WallGeometry &walls_;
    const std::vector<Sign> &signs_;
    const std::vector<Exit> &exits_;

    GoalDecision attractTo(Region region, int targetId, const sf::Vector2f &target, const sf::Vector2f &from,
                           float strength) const;
};

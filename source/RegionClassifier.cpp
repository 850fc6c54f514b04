#include "RegionClassifier.h"
#include "VectorMath.h"
#include <algorithm>
#include <limits>

const char *regionName(Region region)
{
    switch (region)
    {
    case Region::Exit:
        return "exit";
    case Region::VisibleSign:
        return "sign";
    case Region::Memory:
        return "memory";
    case Region::Default:
        return "default";
    }
    return "unknown";
}

RegionClassifier::RegionClassifier(const SimulationSettings &settings, const WallGeometry &walls,
                                   const std::vector<Sign> &signs, const std::vector<Exit> &exits)
    : params_(settings.params),
      speedEpsilon_(settings.speedEpsilon),
      walls_(walls),
      signs_(signs),
      exits_(exits)
{
}

GoalDecision RegionClassifier::attractTo(Region region, int targetId, const sf::Vector2f &target,
                                         const sf::Vector2f &from, float strength) const
{
    GoalDecision decision;
    decision.region = region;
    decision.targetId = targetId;
    decision.target = target;
    decision.force = strength * vecmath::normalizedOrZero(target - from);
    return decision;
}

const Exit *RegionClassifier::exitInRange(const sf::Vector2f &position, int exitId) const
{
    const Exit *best = nullptr;
    float bestDist = std::numeric_limits<float>::infinity();

    for (const auto &exit : exits_)
    {
        if (exitId >= 0 && exit.id != exitId)
            continue;

        float dist = (exit.position - position).length();
        if (dist <= exit.radius && dist < bestDist)
        {
            best = &exit;
            bestDist = dist;
        }
    }
    return best;
}

bool RegionClassifier::isSignVisible(const Agent &agent, const Sign &sign) const
{
    const sf::Vector2f toSign = sign.position - agent.position;
    if (toSign.length() > params_.visionRadius)
        return false;

    // the sign has to be inside the agent's field of view...
    if (vecmath::angleBetween(agent.heading(speedEpsilon_), toSign) > params_.fovAngle * 0.5f)
        return false;

    // ...and the agent inside the sign's cone
    if (vecmath::angleBetween(sign.direction, -toSign) > params_.signFov * 0.5f)
        return false;

    return walls_.lineOfSight(agent.position, sign.position);
}

std::vector<const Sign *> RegionClassifier::visibleSigns(const Agent &agent) const
{
    std::vector<const Sign *> visible;
    for (const auto &sign : signs_)
    {
        if (isSignVisible(agent, sign))
            visible.push_back(&sign);
    }

    const sf::Vector2f from = agent.position;
    std::stable_sort(visible.begin(), visible.end(), [&from](const Sign *a, const Sign *b)
                     { return (a->position - from).length() < (b->position - from).length(); });
    return visible;
}

GoalDecision RegionClassifier::classify(const Agent &current, long long step, Agent &next) const
{
    if (!vecmath::isFinite(current.position))
        return GoalDecision{};

    if (const Exit *exit = exitInRange(current.position, current.exitId))
    {
        return attractTo(Region::Exit, exit->id, exit->position, current.position, exit->strength);
    }

    auto visible = visibleSigns(current);
    if (!visible.empty())
    {
        for (const Sign *sign : visible)
        {
            next.memory.record(sign->id, sign->position, step);
        }
        const Sign *nearest = visible.front();
        return attractTo(Region::VisibleSign, nearest->id, nearest->position, current.position, params_.etaSign);
    }

    auto remembered = current.memory.latest(step, current.position);
    next.memory.purgeExpired(step);
    if (remembered)
    {
        return attractTo(Region::Memory, remembered->signId, remembered->position, current.position,
                         params_.etaMem);
    }

    return GoalDecision{};
}

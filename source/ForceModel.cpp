#include "ForceModel.h"
#include "VectorMath.h"
#include <cmath>
#include <limits>

ForceModel::ForceModel(const SimulationSettings::ForceParameters &params, float speedEpsilon)
    : params_(params), speedEpsilon_(speedEpsilon)
{
}

float ForceModel::lerpRange(float x, float x0, float x1, float from, float to)
{
    if (x1 <= x0)
        return to;
    return from + (to - from) * (x - x0) / (x1 - x0);
}

float ForceModel::c1(float r) const
{
    const auto &p = params_;
    if (r < p.beta)
        return lerpRange(r, 0.0f, p.beta, p.cn0, 0.0f);
    if (r < p.nuDist)
        return lerpRange(r, p.beta, p.nuDist, 0.0f, p.cr0);
    if (r < p.gamma)
        return p.cr0;
    if (r < p.epsilon)
        return lerpRange(r, p.gamma, p.epsilon, p.cr0, 0.0f);
    return 0.0f;
}

float ForceModel::c2(float theta) const
{
    const auto &p = params_;
    theta = std::abs(theta);
    if (theta < p.phi1)
        return p.cphi1;
    if (theta < p.phi2)
        return lerpRange(theta, p.phi1, p.phi2, p.cphi1, p.cphi2);
    if (theta < p.phi3)
        return p.cphi2;
    if (theta < p.phi4)
        return lerpRange(theta, p.phi3, p.phi4, p.cphi2, 0.0f);
    return 0.0f;
}

float ForceModel::h1(float r) const
{
    const auto &p = params_;
    if (r < p.lam)
        return p.hr0;
    if (r < p.sigma)
        return lerpRange(r, p.lam, p.sigma, p.hr0, 0.0f);
    return 0.0f;
}

float ForceModel::h2(float theta) const
{
    return std::abs(theta) <= params_.cohesionAlignAngle ? params_.hphi1 : params_.hphi2;
}

sf::Vector2f ForceModel::driving(const Agent &agent) const
{
    return params_.a * agent.heading(speedEpsilon_);
}

sf::Vector2f ForceModel::avoidance(const std::vector<NeighborInfo> &neighbors) const
{
    sf::Vector2f force;
    for (const auto &n : neighbors)
    {
        force -= c1(n.distance) * c2(n.angle) * n.direction;
    }
    return force;
}

sf::Vector2f ForceModel::cohesion(const std::vector<NeighborInfo> &neighbors) const
{
    sf::Vector2f sum;
    int contributors = 0;
    for (const auto &n : neighbors)
    {
        float weight = h1(n.distance) * h2(n.angle);
        if (weight == 0.0f)
            continue;
        sum += weight * n.direction;
        ++contributors;
    }

    if (contributors == 0)
        return sf::Vector2f(0.0f, 0.0f);
    return -sum / static_cast<float>(contributors);
}

sf::Vector2f ForceModel::wall(const WallProximity &wall, float approachSpeed) const
{
    if (!wall.found || wall.distance > params_.d)
        return sf::Vector2f(0.0f, 0.0f);

    if (approachSpeed > 0.0f)
    {
        float magnitude = params_.w0 * approachSpeed * (params_.d - wall.distance) / params_.d + params_.w1;
        return magnitude * wall.normal;
    }
    return params_.w1 * wall.normal;
}

sf::Vector2f ForceModel::herding(const sf::Vector2f &position, const std::vector<PanicSource> &sources,
                                 bool *inRange) const
{
    const PanicSource *nearest = nullptr;
    float nearestDist = std::numeric_limits<float>::infinity();

    for (const auto &source : sources)
    {
        float dist = (position - source.position).length();
        if (dist <= source.cutoff && dist < nearestDist)
        {
            nearest = &source;
            nearestDist = dist;
        }
    }

    if (inRange)
        *inRange = nearest != nullptr;
    if (!nearest)
        return sf::Vector2f(0.0f, 0.0f);

    // standing on the source itself gives no direction to flee in
    return nearest->strength * vecmath::normalizedOrZero(position - nearest->position);
}

sf::Vector2f ForceModel::randomFluctuation(const WallProximity &wall, float approachSpeed,
                                           const sf::Vector2f &unitRandom) const
{
    if (!wall.found || wall.distance > params_.d)
        return params_.q1 * unitRandom;
    if (approachSpeed > 0.0f)
        return -params_.q2 * unitRandom;
    return -params_.q1 * unitRandom;
}

ForceBreakdown ForceModel::compute(const Agent &agent, const AgentGeometry &geometry, const GoalDecision &goal,
                                   const std::vector<PanicSource> &panicSources,
                                   const sf::Vector2f &unitRandom) const
{
    ForceBreakdown f;
    f.driving = driving(agent);
    f.avoidance = avoidance(geometry.neighbors);
    f.cohesion = cohesion(geometry.neighbors);
    f.wall = wall(geometry.wall, geometry.wallApproachSpeed);
    f.goal = goal.force;
    f.herding = herding(agent.position, panicSources, &f.panicked);
    f.random = randomFluctuation(geometry.wall, geometry.wallApproachSpeed, unitRandom);
    f.region = goal.region;
    return f;
}

#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstddef>
#include "Agent.h"

// numbers a caller can use to spot an unstable run, the integrator itself never acts on them
struct IntegrationDiagnostics
{
    float maxDampingFactor = 0.0f; // max nu*dt/m, explicit Euler wants this well below 1
    float maxSpeed = 0.0f;
    size_t nonFiniteAgents = 0;

    void merge(const IntegrationDiagnostics &other);
};

// explicit Euler:
//   v' = v + dt (F/m - (nu/m) v)
//   x' = x + dt v'
class Integrator
{
public:
    explicit Integrator(float dt) : dt_(dt) {}

    // writes the advanced position/velocity of `current` into `next`
    void integrate(const Agent &current, const sf::Vector2f &force, Agent &next,
                   IntegrationDiagnostics &diagnostics) const;

    float getTimeStep() const { return dt_; }
    float dampingFactor(const Agent &agent) const { return agent.damping * dt_ / agent.mass; }

private:
    float dt_;
};

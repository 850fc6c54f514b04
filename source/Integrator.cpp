#include "Integrator.h"
#include "VectorMath.h"
#include <algorithm>

void IntegrationDiagnostics::merge(const IntegrationDiagnostics &other)
{
    maxDampingFactor = std::max(maxDampingFactor, other.maxDampingFactor);
    maxSpeed = std::max(maxSpeed, other.maxSpeed);
    nonFiniteAgents += other.nonFiniteAgents;
}

void Integrator::integrate(const Agent &current, const sf::Vector2f &force, Agent &next,
                           IntegrationDiagnostics &diagnostics) const
{
    const float invMass = 1.0f / current.mass;

    next.velocity = current.velocity + dt_ * (force * invMass - current.damping * invMass * current.velocity);
    next.position = current.position + dt_ * next.velocity;

    // divergence is reported, not clamped
    diagnostics.maxDampingFactor = std::max(diagnostics.maxDampingFactor, dampingFactor(current));
    if (vecmath::isFinite(next.velocity) && vecmath::isFinite(next.position))
    {
        diagnostics.maxSpeed = std::max(diagnostics.maxSpeed, next.velocity.length());
    }
    else
    {
        ++diagnostics.nonFiniteAgents;
    }
}

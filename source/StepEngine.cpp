#include "StepEngine.h"
#include "VectorMath.h"
#include <mutex>
#include <stdexcept>
#include <string>

StepEngine::StepEngine(const SimulationSettings &settings, const WallGeometry &walls,
                       const std::vector<Sign> &signs, const std::vector<Exit> &exits,
                       ParallelProcessor &processor)
    : spatialQuery_(settings, walls),
      classifier_(settings, walls, signs, exits),
      forceModel_(settings.params, settings.speedEpsilon),
      integrator_(settings.dt),
      processor_(processor)
{
}

StepResult StepEngine::advance(const std::vector<Agent> &state, long long step, RandomFluctuation &rng)
{
    StepResult result;
    result.agents = state;
    advanceInto(state, step, rng, result.agents, result);
    return result;
}

void StepEngine::advanceInto(const std::vector<Agent> &state, long long step, RandomFluctuation &rng,
                             std::vector<Agent> &next, StepResult &result)
{
    if (next.size() != state.size())
    {
        throw std::invalid_argument("next state holds " + std::to_string(next.size()) + " agents, expected " +
                                    std::to_string(state.size()));
    }

    const size_t count = state.size();
    result.forces.assign(count, ForceBreakdown{});
    result.goals.assign(count, GoalDecision{});
    result.stats = StepStatistics{};

    // serial setup, everything after this only reads shared structures
    spatialQuery_.rebuild(state);
    agentIds_.resize(count);
    for (size_t i = 0; i < count; ++i)
    {
        agentIds_[i] = state[i].id;
    }
    rng.prepare(agentIds_);

    std::mutex diagnosticsMutex;

    processor_.parallelForChunks(count, [&](size_t begin, size_t end)
                                 {
        AgentGeometry geometry;
        std::vector<size_t> scratch;
        IntegrationDiagnostics local;

        for (size_t i = begin; i < end; ++i)
        {
            const Agent &current = state[i];
            Agent &out = next[i];

            spatialQuery_.query(state, i, geometry, scratch);
            GoalDecision goal = classifier_.classify(current, step, out);
            sf::Vector2f unitRandom = rng.unitVector(i);

            ForceBreakdown forces = forceModel_.compute(current, geometry, goal, panicSources_, unitRandom);
            integrator_.integrate(current, forces.total(), out, local);
            out.panicked = forces.panicked;

            result.forces[i] = forces;
            result.goals[i] = goal;
        }

        std::lock_guard<std::mutex> lock(diagnosticsMutex);
        result.stats.integration.merge(local); });

    collectStatistics(next, result);
}

void StepEngine::collectStatistics(const std::vector<Agent> &next, StepResult &result) const
{
    StepStatistics &stats = result.stats;

    double speedSum = 0.0;
    size_t finiteAgents = 0;
    for (size_t i = 0; i < next.size(); ++i)
    {
        stats.regionCounts[static_cast<size_t>(result.goals[i].region)]++;
        if (next[i].panicked)
            stats.panickedAgents++;

        if (vecmath::isFinite(next[i].velocity))
        {
            speedSum += next[i].velocity.length();
            finiteAgents++;
        }
    }
    stats.meanSpeed = finiteAgents > 0 ? static_cast<float>(speedSum / finiteAgents) : 0.0f;
}

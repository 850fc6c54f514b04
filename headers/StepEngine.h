#pragma once
#include <array>
#include <vector>
#include "Agent.h"
#include "ForceModel.h"
#include "Integrator.h"
#include "ParallelProcessor.h"
#include "RandomFluctuation.h"
#include "RegionClassifier.h"
#include "Scenario.h"
#include "SimulationSettings.h"
#include "SpatialQuery.h"
#include "WallGeometry.h"

struct StepStatistics
{
    IntegrationDiagnostics integration;
    std::array<size_t, 4> regionCounts{}; // indexed by Region
    size_t panickedAgents = 0;
    float meanSpeed = 0.0f; // over finite agents of the new state

    size_t count(Region region) const { return regionCounts[static_cast<size_t>(region)]; }
};

struct StepResult
{
    std::vector<Agent> agents; // the advanced state (only filled by advance())
    std::vector<ForceBreakdown> forces;
    std::vector<GoalDecision> goals;
    StepStatistics stats;
};

/**
 * one synchronous timestep
 * grid rebuild (serial) -> per agent query, classify, forces, integrate (parallel) -> statistics (serial)
 * every per agent computation reads only the frozen input state and writes only its own slot of the output
 */
class StepEngine
{
public:
    StepEngine(const SimulationSettings &settings, const WallGeometry &walls, const std::vector<Sign> &signs,
               const std::vector<Exit> &exits, ParallelProcessor &processor);

    // advance(state) -> new state; the only other effect is on the rng streams
    StepResult advance(const std::vector<Agent> &state, long long step, RandomFluctuation &rng);

    // same, writing into `next`, which must start as a copy of `state`
    // throws std::invalid_argument when the sizes differ
    void advanceInto(const std::vector<Agent> &state, long long step, RandomFluctuation &rng,
                     std::vector<Agent> &next, StepResult &result);

    // panic sources may move between steps, never during one
    void setPanicSources(std::vector<PanicSource> sources) { panicSources_ = std::move(sources); }
    const std::vector<PanicSource> &getPanicSources() const { return panicSources_; }

    const ForceModel &getForceModel() const { return forceModel_; }
    const RegionClassifier &getClassifier() const { return classifier_; }
    const SpatialQuery &getSpatialQuery() const { return spatialQuery_; }
    const Integrator &getIntegrator() const { return integrator_; }

private:
    SpatialQuery spatialQuery_;
    RegionClassifier classifier_;
    ForceModel forceModel_;
    Integrator integrator_;
    ParallelProcessor &processor_;
    std::vector<PanicSource> panicSources_;
    std::vector<int> agentIds_;

    void collectStatistics(const std::vector<Agent> &next, StepResult &result) const;
};

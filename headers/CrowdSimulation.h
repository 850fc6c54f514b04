#pragma once
#include <SFML/System/Clock.hpp>
#include "SimulationSettings.h"
#include "Scenario.h"
#include "Agent.h"
#include "AgentStore.h"
#include "WallGeometry.h"
#include "ParallelProcessor.h"
#include "RandomFluctuation.h"
#include "StepEngine.h"
#include <atomic>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

// handed to observers after every committed step
struct StepReport
{
    long long step = 0;      // number of committed steps so far
    float time = 0.0f;       // simulated seconds
    float updateTime = 0.0f; // wall clock milliseconds spent in the step
    const std::vector<Agent> *agents = nullptr;
    const StepResult *result = nullptr;
};

/**
 * runs a scenario under the force model, one synchronous step at a time
 * construction validates settings and scenario and throws std::invalid_argument on any issue
 */
class CrowdSimulation
{
public:
    using StepObserver = std::function<void(const StepReport &)>;

    CrowdSimulation(const SimulationSettings &settings, Scenario scenario);
    ~CrowdSimulation() = default;

    // core simulation methods
    void step();
    // runs until `steps` more steps are committed or a stop is requested, returns steps done
    long long run(long long steps);
    // honoured between steps, never inside one; safe to call from another thread or an observer
    void requestStop() { stopRequested_ = true; }
    bool isStopRequested() const { return stopRequested_; }
    // back to the initial scenario with the random streams reseeded
    void reset();

    void addObserver(StepObserver observer) { observers_.push_back(std::move(observer)); }

    // moves / replaces the panic sources for the following steps
    void setPanicSources(std::vector<PanicSource> sources);
    const std::vector<PanicSource> &getPanicSources() const { return engine_->getPanicSources(); }

    // snapshot of the last committed step
    const std::vector<Agent> &getAgents() const { return store_.snapshot(); }
    const AgentStore &getStore() const { return store_; }
    const StepResult &getLastResult() const { return lastResult_; }

    const SimulationSettings &getSettings() const { return settings_; }
    const Scenario &getScenario() const { return scenario_; }
    const WallGeometry &getWalls() const { return *walls_; }

    long long getStepCount() const { return store_.committedSteps(); }
    float getSimulatedTime() const { return static_cast<float>(store_.committedSteps()) * settings_.dt; }
    int getAgentCount() const { return static_cast<int>(store_.size()); }
    // agents that have been inside an exit domain at least once
    size_t getEvacuatedCount() const;

    // performance tracking
    float getLastUpdateTime() const { return lastUpdateTime_; }
    const ParallelProcessor &getProcessor() const { return *parallelProcessor_; }

    // throws std::invalid_argument listing every issue of both
    static void validateConfiguration(const SimulationSettings &settings, const Scenario &scenario);

private:
    SimulationSettings settings_;
    Scenario scenario_;

    std::unique_ptr<SegmentWallGeometry> walls_;
    std::unique_ptr<ParallelProcessor> parallelProcessor_;
    std::unique_ptr<StepEngine> engine_;
    RandomFluctuation rng_;
    AgentStore store_;
    StepResult lastResult_;

    std::vector<StepObserver> observers_;
    std::atomic<bool> stopRequested_{false};

    std::unordered_map<int, size_t> indexById_;
    std::vector<bool> reachedExit_;
    size_t reportedNonFinite_ = 0;

    // performance tracking
    float lastUpdateTime_ = 0.0f;
    sf::Clock updateTimer_;

    std::vector<Agent> makeInitialAgents() const;
    void checkStability() const;
    void logProgress() const;
    void traceAgent() const;
};

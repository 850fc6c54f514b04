#include "CrowdSimulation.h"
#include "VectorMath.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace
{
    std::string formatVector(const sf::Vector2f &v)
    {
        std::ostringstream out;
        out << std::fixed << std::setprecision(3) << "(" << v.x << ", " << v.y << ")";
        return out.str();
    }
}

void CrowdSimulation::validateConfiguration(const SimulationSettings &settings, const Scenario &scenario)
{
    std::vector<std::string> issues = settings.validate();
    std::vector<std::string> scenarioIssues = scenario.validate();
    issues.insert(issues.end(), scenarioIssues.begin(), scenarioIssues.end());

    if (issues.empty())
        return;

    for (const auto &issue : issues)
    {
        std::cerr << "Error: " << issue << std::endl;
    }
    throw std::invalid_argument("invalid configuration: " + std::to_string(issues.size()) + " issue(s), first: " +
                                issues.front());
}

CrowdSimulation::CrowdSimulation(const SimulationSettings &settings, Scenario scenario)
    : settings_(settings), scenario_(std::move(scenario)), rng_(settings.seed)
{
    validateConfiguration(settings_, scenario_);

    walls_ = std::make_unique<SegmentWallGeometry>(scenario_.walls);
    parallelProcessor_ = std::make_unique<ParallelProcessor>(static_cast<size_t>(settings_.workerThreads),
                                                             settings_.schedulingPolicy);
    engine_ = std::make_unique<StepEngine>(settings_, *walls_, scenario_.signs, scenario_.exits, *parallelProcessor_);
    engine_->setPanicSources(scenario_.panicSources);

    store_.reset(makeInitialAgents());
    for (size_t i = 0; i < store_.size(); ++i)
    {
        indexById_[store_.at(i).id] = i;
    }
    reachedExit_.assign(store_.size(), false);

    checkStability();

    std::cout << "CrowdSimulation initialized:" << std::endl;
    std::cout << "  Agents: " << store_.size() << std::endl;
    std::cout << "  Walls: " << walls_->getWallCount() << std::endl;
    std::cout << "  Signs: " << scenario_.signs.size() << std::endl;
    std::cout << "  Exits: " << scenario_.exits.size() << std::endl;
    std::cout << "  Panic sources: " << scenario_.panicSources.size() << std::endl;
    std::cout << "  dt: " << settings_.dt << " s, seed: " << settings_.seed << std::endl;
}

std::vector<Agent> CrowdSimulation::makeInitialAgents() const
{
    std::vector<Agent> agents = scenario_.agents;
    for (auto &agent : agents)
    {
        agent.memory.configure(static_cast<std::size_t>(settings_.memoryCapacity), settings_.memoryExpirySteps);
        agent.panicked = false;
    }

    // prior knowledge counts as a sighting at step 0
    for (const auto &[agentId, signId] : scenario_.knownSigns)
    {
        const Sign *sign = scenario_.findSign(signId);
        auto it = std::find_if(agents.begin(), agents.end(), [agentId](const Agent &a)
                               { return a.id == agentId; });
        if (sign && it != agents.end())
        {
            it->memory.record(sign->id, sign->position, 0);
        }
    }
    return agents;
}

void CrowdSimulation::checkStability() const
{
    float worst = 0.0f;
    for (const auto &agent : store_.snapshot())
    {
        worst = std::max(worst, engine_->getIntegrator().dampingFactor(agent));
    }
    if (worst >= 1.0f)
    {
        std::cerr << "Warning: nu*dt/m reaches " << worst << ", explicit Euler will not be stable, reduce dt"
                  << std::endl;
    }
}

void CrowdSimulation::step()
{
    updateTimer_.restart();

    const long long stepIndex = store_.committedSteps();
    std::vector<Agent> &next = store_.beginStep();
    engine_->advanceInto(store_.snapshot(), stepIndex, rng_, next, lastResult_);
    store_.commit(next);

    lastUpdateTime_ = updateTimer_.getElapsedTime().asSeconds() * 1000.0f;

    for (size_t i = 0; i < lastResult_.goals.size(); ++i)
    {
        if (lastResult_.goals[i].region == Region::Exit)
            reachedExit_[i] = true;
    }

    const size_t nonFinite = lastResult_.stats.integration.nonFiniteAgents;
    if (nonFinite > reportedNonFinite_)
    {
        std::cerr << "Warning: step " << store_.committedSteps() << ": " << nonFinite
                  << " agents have non-finite position or velocity" << std::endl;
        reportedNonFinite_ = nonFinite;
    }

    if (settings_.traceAgentId >= 0)
        traceAgent();
    if (settings_.logEvery > 0 && store_.committedSteps() % settings_.logEvery == 0)
        logProgress();

    StepReport report;
    report.step = store_.committedSteps();
    report.time = getSimulatedTime();
    report.updateTime = lastUpdateTime_;
    report.agents = &store_.snapshot();
    report.result = &lastResult_;
    for (const auto &observer : observers_)
    {
        observer(report);
    }
}

long long CrowdSimulation::run(long long steps)
{
    long long done = 0;
    while (done < steps && !stopRequested_)
    {
        step();
        ++done;
    }

    if (stopRequested_)
    {
        std::cout << "Run stopped after " << done << " steps (step " << store_.committedSteps() << ")" << std::endl;
        stopRequested_ = false;
    }
    return done;
}

void CrowdSimulation::reset()
{
    store_.reset(makeInitialAgents());
    rng_.reset(settings_.seed);
    engine_->setPanicSources(scenario_.panicSources);
    lastResult_ = StepResult{};
    reachedExit_.assign(store_.size(), false);
    reportedNonFinite_ = 0;
    stopRequested_ = false;

    std::cout << "Simulation reset with " << store_.size() << " agents" << std::endl;
}

void CrowdSimulation::setPanicSources(std::vector<PanicSource> sources)
{
    engine_->setPanicSources(std::move(sources));
}

size_t CrowdSimulation::getEvacuatedCount() const
{
    return static_cast<size_t>(std::count(reachedExit_.begin(), reachedExit_.end(), true));
}

void CrowdSimulation::logProgress() const
{
    const StepStatistics &stats = lastResult_.stats;
    std::cout << std::fixed << std::setprecision(2)
              << "Step " << store_.committedSteps()
              << " | t=" << getSimulatedTime() << "s"
              << " | mean speed " << stats.meanSpeed << " m/s"
              << " | exit " << stats.count(Region::Exit)
              << " sign " << stats.count(Region::VisibleSign)
              << " memory " << stats.count(Region::Memory)
              << " default " << stats.count(Region::Default)
              << " | panicked " << stats.panickedAgents
              << " | " << lastUpdateTime_ << " ms" << std::endl;
    std::cout << std::defaultfloat;
}

void CrowdSimulation::traceAgent() const
{
    auto it = indexById_.find(settings_.traceAgentId);
    if (it == indexById_.end() || it->second >= lastResult_.forces.size())
        return;

    const ForceBreakdown &f = lastResult_.forces[it->second];
    const Agent &agent = store_.at(it->second);

    std::cout << "[trace] step " << store_.committedSteps() << " agent " << agent.id
              << " region=" << regionName(f.region)
              << " x=" << formatVector(agent.position)
              << " v=" << formatVector(agent.velocity) << std::endl;
    std::cout << "        driving=" << formatVector(f.driving)
              << " avoidance=" << formatVector(f.avoidance)
              << " cohesion=" << formatVector(f.cohesion)
              << " wall=" << formatVector(f.wall) << std::endl;
    std::cout << "        goal=" << formatVector(f.goal)
              << " herding=" << formatVector(f.herding)
              << " random=" << formatVector(f.random)
              << " total=" << formatVector(f.total()) << std::endl;
}

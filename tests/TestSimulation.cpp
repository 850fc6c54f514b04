#include <atomic>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "AgentStore.h"
#include "CrowdSimulation.h"
#include "ParallelProcessor.h"
#include "RandomFluctuation.h"
#include "Scenario.h"
#include "SimulationSettings.h"
#include "StepEngine.h"
#include "WallGeometry.h"
#include "TestSupport.h"

namespace
{

const float TOL = 1.0e-5f;

SimulationSettings quietSettings(int workerThreads = 1)
{
    SimulationSettings settings;
    settings.workerThreads = workerThreads;
    settings.logEvery = 0;
    return settings;
}

template <typename Fn>
bool throwsInvalidArgument(Fn &&fn)
{
    try
    {
        fn();
    }
    catch (const std::invalid_argument &)
    {
        return true;
    }
    return false;
}

static void runTwoAgentSymmetry()
{
    // only avoidance is left: no thrust, no cohesion, no noise, no walls
    SimulationSettings settings = quietSettings();
    settings.params.a = 0.0f;
    settings.params.hr0 = 0.0f;
    settings.params.q1 = 0.0f;
    settings.params.q2 = 0.0f;
    settings.params.beta = 1.0f;

    std::vector<Agent> agents;
    agents.emplace_back(0, sf::Vector2f(0.0f, 0.0f));
    agents.emplace_back(1, sf::Vector2f(0.5f, 0.0f));

    SegmentWallGeometry walls(std::vector<WallSegment>{});
    std::vector<Sign> signs;
    std::vector<Exit> exits;
    ParallelProcessor processor(1);
    StepEngine engine(settings, walls, signs, exits, processor);
    RandomFluctuation rng(settings.seed);

    StepResult result = engine.advance(agents, 0, rng);
    const ForceBreakdown &f0 = result.forces[0];
    const ForceBreakdown &f1 = result.forces[1];

    // c1(0.5) = -0.25 on the cn0 -> 0 ramp, c2(0) = 1
    REQUIRE_NEAR(f0.avoidance.length(), 0.25f, TOL, "avoidance magnitude");
    REQUIRE_NEAR(f0.avoidance.y, 0.0f, TOL, "avoidance along the line between the agents");
    REQUIRE_VEC_NEAR(f0.avoidance, -f1.avoidance, 0.0f, "equal and opposite avoidance");
    REQUIRE_VEC_NEAR(f0.total(), -f1.total(), 0.0f, "equal and opposite total force");
    REQUIRE(isZero(f0.cohesion) && isZero(f0.driving) && isZero(f0.random), "other terms switched off");

    REQUIRE_VEC_NEAR(agents[0].position, sf::Vector2f(0.0f, 0.0f), 0.0f, "input state is not modified");
    REQUIRE_NEAR(result.agents[0].velocity.x, -result.agents[1].velocity.x, 0.0f, "velocities mirror each other");

    std::cout << "[PASS] two agent avoidance is symmetric\n";
}

std::vector<Agent> runDemo(int workerThreads, int steps,
                           ParallelProcessor::SchedulingPolicy policy = ParallelProcessor::SchedulingPolicy::Static)
{
    SimulationSettings settings = quietSettings(workerThreads);
    settings.schedulingPolicy = policy;
    CrowdSimulation simulation(settings, Scenario::makeEvacuationDemo(settings, 80, 99));
    simulation.run(steps);
    return simulation.getAgents();
}

static void runThreadCountDoesNotChangeResults()
{
    std::vector<Agent> serial = runDemo(1, 150);
    for (int threads : {3, 8})
    {
        std::vector<Agent> parallel = runDemo(threads, 150);
        REQUIRE(parallel.size() == serial.size(), "same agent count");
        for (size_t i = 0; i < serial.size(); ++i)
        {
            REQUIRE(parallel[i].position == serial[i].position, "bit identical positions");
            REQUIRE(parallel[i].velocity == serial[i].velocity, "bit identical velocities");
            REQUIRE(parallel[i].memory.size() == serial[i].memory.size(), "same memories");
        }
    }

    std::cout << "[PASS] results do not depend on the worker count\n";
}

static void runSchedulingPolicies()
{
    using Policy = ParallelProcessor::SchedulingPolicy;
    const size_t count = 103;

    size_t staticChunks = 0;
    for (Policy policy : {Policy::Static, Policy::Dynamic, Policy::Guided})
    {
        ParallelProcessor processor(4, policy);
        REQUIRE(processor.getSchedulingPolicy() == policy, "policy kept");

        std::vector<std::atomic<int>> hits(count);
        std::atomic<size_t> chunks{0};
        processor.parallelForChunks(count, [&](size_t begin, size_t end)
                                    {
            chunks++;
            for (size_t i = begin; i < end; ++i)
                hits[i]++; });

        for (size_t i = 0; i < count; ++i)
            REQUIRE(hits[i] == 1, "every index handled exactly once");
        if (policy == Policy::Static)
            staticChunks = chunks;
        else
            REQUIRE(chunks > staticChunks, "dynamic and guided split finer than static");
    }

    std::vector<Agent> reference = runDemo(4, 100);
    for (Policy policy : {Policy::Dynamic, Policy::Guided})
    {
        std::vector<Agent> other = runDemo(4, 100, policy);
        for (size_t i = 0; i < reference.size(); ++i)
        {
            REQUIRE(other[i].position == reference[i].position, "bit identical positions");
            REQUIRE(other[i].velocity == reference[i].velocity, "bit identical velocities");
        }
    }

    std::cout << "[PASS] scheduling policies cover the range and agree\n";
}

static void runRegionsAndCutoffsHold()
{
    SimulationSettings settings = quietSettings(4);
    CrowdSimulation simulation(settings, Scenario::makeEvacuationDemo(settings, 60, 5));
    const auto &p = settings.params;

    size_t activeGoals = 0;
    for (int s = 0; s < 300; ++s)
    {
        std::vector<Agent> previous = simulation.getAgents();
        simulation.step();
        const StepResult &result = simulation.getLastResult();

        size_t total = 0;
        for (size_t count : result.stats.regionCounts)
            total += count;
        REQUIRE(total == previous.size(), "every agent is in exactly one region");

        for (size_t i = 0; i < previous.size(); ++i)
        {
            const ForceBreakdown &f = result.forces[i];
            REQUIRE(f.region == result.goals[i].region, "force breakdown carries the region");
            if (f.region == Region::Default)
                REQUIRE(isZero(f.goal), "default region has no goal force");
            else
                activeGoals++;

            WallProximity wall = simulation.getWalls().nearestWall(previous[i].position);
            if (wall.distance > p.d)
                REQUIRE(isZero(f.wall), "no wall force beyond d");

            const PanicSource &source = simulation.getPanicSources().front();
            bool inRange = (previous[i].position - source.position).length() <= source.cutoff;
            REQUIRE(f.panicked == inRange, "herding only within the cutoff");
            if (!inRange)
                REQUIRE(isZero(f.herding), "no herding beyond the cutoff");
        }
    }
    REQUIRE(activeGoals > 0, "the demo reaches signs or the exit");

    std::cout << "[PASS] region exclusivity and force cutoffs over a demo run\n";
}

static void runStopAndResume()
{
    SimulationSettings settings = quietSettings();
    CrowdSimulation simulation(settings, Scenario::makeEvacuationDemo(settings, 20, 1));

    long long observed = 0;
    simulation.addObserver([&](const StepReport &report)
                           {
        observed = report.step;
        REQUIRE(report.agents && report.agents->size() == 20, "observer sees the committed snapshot");
        if (report.step == 10)
            simulation.requestStop(); });

    long long done = simulation.run(100);
    REQUIRE(done == 10, "stop honoured after the current step");
    REQUIRE(simulation.getStepCount() == 10, "ten steps committed");
    REQUIRE(observed == 10, "observer saw every step");
    REQUIRE(!simulation.isStopRequested(), "a consumed stop request is cleared");

    done = simulation.run(5);
    REQUIRE(done == 5 && simulation.getStepCount() == 15, "run resumes after a stop");
    REQUIRE_NEAR(simulation.getSimulatedTime(), 15 * settings.dt, TOL, "simulated time");

    std::cout << "[PASS] stop request and resume\n";
}

static void runResetReplays()
{
    SimulationSettings settings = quietSettings(2);
    CrowdSimulation simulation(settings, Scenario::makeEvacuationDemo(settings, 40, 3));
    std::vector<Agent> initial = simulation.getAgents();

    simulation.run(60);
    std::vector<Agent> first = simulation.getAgents();

    simulation.reset();
    REQUIRE(simulation.getStepCount() == 0, "reset clears the step count");
    for (size_t i = 0; i < initial.size(); ++i)
        REQUIRE(simulation.getAgents()[i].position == initial[i].position, "reset restores the initial state");

    simulation.run(60);
    for (size_t i = 0; i < first.size(); ++i)
        REQUIRE(simulation.getAgents()[i].position == first[i].position, "same seed replays the same run");

    std::cout << "[PASS] reset replays the run\n";
}

static void runPriorKnowledgeAndPanic()
{
    SimulationSettings settings = quietSettings();
    Scenario scenario;
    scenario.agents.emplace_back(0, sf::Vector2f(0.0f, 0.0f));
    scenario.signs.push_back(Sign{4, sf::Vector2f(0.0f, -10.0f), sf::Vector2f(0.0f, 1.0f)});
    scenario.knownSigns.emplace_back(0, 4);

    CrowdSimulation simulation(settings, scenario);
    simulation.step();
    const GoalDecision &goal = simulation.getLastResult().goals[0];
    REQUIRE(goal.region == Region::Memory, "prior knowledge puts the agent in the memory domain");
    REQUIRE(goal.targetId == 4, "remembered sign");
    REQUIRE_VEC_NEAR(goal.force, sf::Vector2f(0.0f, -settings.params.etaMem), TOL, "memory force");

    PanicSource source;
    source.position = simulation.getAgents()[0].position + sf::Vector2f(-1.0f, 0.0f);
    source.strength = 2.0f;
    source.cutoff = 3.0f;
    simulation.setPanicSources({source});
    simulation.step();
    REQUIRE(simulation.getAgents()[0].panicked, "agent within the cutoff panics");
    REQUIRE_NEAR(simulation.getLastResult().forces[0].herding.x, 2.0f, 1.0e-3f, "pushed away from the source");

    simulation.setPanicSources({});
    simulation.step();
    REQUIRE(!simulation.getAgents()[0].panicked, "panic clears once no source is in range");

    std::cout << "[PASS] prior knowledge and moving panic sources\n";
}

static void runEvacuationCount()
{
    SimulationSettings settings = quietSettings();
    Scenario scenario;
    scenario.agents.emplace_back(0, sf::Vector2f(1.0f, 0.0f));
    scenario.agents.emplace_back(1, sf::Vector2f(50.0f, 0.0f));
    Exit exit;
    exit.id = 0;
    exit.position = sf::Vector2f(0.0f, 0.0f);
    scenario.exits.push_back(exit);

    CrowdSimulation simulation(settings, scenario);
    simulation.step();
    REQUIRE(simulation.getEvacuatedCount() == 1, "only the agent inside the exit radius counts");
    REQUIRE(simulation.getLastResult().stats.count(Region::Exit) == 1, "region statistics");

    std::cout << "[PASS] evacuation count\n";
}

static void runInvalidConfigurationThrows()
{
    SimulationSettings good = quietSettings();

    SimulationSettings badDt = good;
    badDt.dt = 0.0f;
    REQUIRE(throwsInvalidArgument([&]
                                  { CrowdSimulation s(badDt, Scenario()); }),
            "dt = 0 is rejected");

    SimulationSettings badBreakpoints = good;
    badBreakpoints.params.gamma = 0.5f;
    REQUIRE(throwsInvalidArgument([&]
                                  { CrowdSimulation s(badBreakpoints, Scenario()); }),
            "unordered breakpoints are rejected");

    Scenario zeroWall;
    zeroWall.walls.push_back(WallSegment{sf::Vector2f(1.0f, 1.0f), sf::Vector2f(1.0f, 1.0f)});
    REQUIRE(throwsInvalidArgument([&]
                                  { CrowdSimulation s(good, zeroWall); }),
            "zero length wall is rejected");

    Scenario unknownExit;
    unknownExit.agents.emplace_back(0, sf::Vector2f(0.0f, 0.0f));
    unknownExit.agents.back().exitId = 9;
    REQUIRE(throwsInvalidArgument([&]
                                  { CrowdSimulation s(good, unknownExit); }),
            "unknown exit is rejected");

    Scenario empty;
    CrowdSimulation nothing(good, empty);
    nothing.run(3);
    REQUIRE(nothing.getStepCount() == 3 && nothing.getAgentCount() == 0, "an empty crowd still steps");

    std::cout << "[PASS] invalid configuration is rejected before the run\n";
}

static void runAgentStore()
{
    std::vector<Agent> agents;
    agents.emplace_back(0, sf::Vector2f(0.0f, 0.0f));
    agents.emplace_back(1, sf::Vector2f(1.0f, 0.0f));
    AgentStore store(agents);

    bool threw = false;
    try
    {
        store.at(2);
    }
    catch (const std::out_of_range &)
    {
        threw = true;
    }
    REQUIRE(threw, "at() checks the index");

    std::vector<Agent> &next = store.beginStep();
    next[0].position = sf::Vector2f(5.0f, 5.0f);
    REQUIRE(store.at(0).position == sf::Vector2f(0.0f, 0.0f), "next buffer is invisible before commit");
    store.commit(next);
    REQUIRE(store.at(0).position == sf::Vector2f(5.0f, 5.0f), "commit publishes the next state");
    REQUIRE(store.committedSteps() == 1, "commit counts steps");

    std::vector<Agent> wrong(1);
    REQUIRE(throwsInvalidArgument([&]
                                  { store.commit(wrong); }),
            "size mismatch is rejected");
    REQUIRE(store.committedSteps() == 1 && store.size() == 2, "failed commit changes nothing");

    std::cout << "[PASS] agent store double buffering\n";
}

} // namespace

int main()
{
    runTwoAgentSymmetry();
    runThreadCountDoesNotChangeResults();
    runSchedulingPolicies();
    runRegionsAndCutoffsHold();
    runStopAndResume();
    runResetReplays();
    runPriorKnowledgeAndPanic();
    runEvacuationCount();
    runInvalidConfigurationThrows();
    runAgentStore();

    std::cout << "All simulation tests passed\n";
    return 0;
}

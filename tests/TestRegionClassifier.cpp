#include <iostream>
#include <vector>

#include "RegionClassifier.h"
#include "SignMemory.h"
#include "SimulationSettings.h"
#include "WallGeometry.h"
#include "TestSupport.h"

namespace
{

const float TOL = 1.0e-5f;

// one corridor along +x: sign 0 at x=3 facing back towards the start, exit 0 at x=10
struct Fixture
{
    SimulationSettings settings;
    std::vector<Sign> signs;
    std::vector<Exit> exits;
    SegmentWallGeometry walls;
    RegionClassifier classifier;

    explicit Fixture(std::vector<WallSegment> wallList = std::vector<WallSegment>(), long long memoryExpiry = 0)
        : settings(makeSettings(memoryExpiry)),
          signs(makeSigns()),
          exits(makeExits()),
          walls(std::move(wallList)),
          classifier(settings, walls, signs, exits)
    {
    }

    static SimulationSettings makeSettings(long long memoryExpiry)
    {
        SimulationSettings s;
        s.memoryExpirySteps = static_cast<int>(memoryExpiry);
        return s;
    }

    static std::vector<Sign> makeSigns()
    {
        return {Sign{0, sf::Vector2f(3.0f, 0.0f), sf::Vector2f(-1.0f, 0.0f)},
                Sign{1, sf::Vector2f(9.5f, 0.0f), sf::Vector2f(-1.0f, 0.0f)}};
    }

    static std::vector<Exit> makeExits()
    {
        Exit exit;
        exit.id = 0;
        exit.position = sf::Vector2f(10.0f, 0.0f);
        exit.radius = 2.0f;
        exit.strength = 0.5f;
        return {exit};
    }

    Agent agent(const sf::Vector2f &position, const sf::Vector2f &velocity) const
    {
        Agent a(7, position, velocity);
        a.memory.configure(static_cast<std::size_t>(settings.memoryCapacity), settings.memoryExpirySteps);
        return a;
    }
};

static void requireSingleGoal(const GoalDecision &goal)
{
    // the decision is a tagged value: default carries no force, every other tag carries exactly one
    if (goal.region == Region::Default)
        REQUIRE(isZero(goal.force), "default region must have no goal force");
    else
        REQUIRE(goal.targetId >= 0, "active region must name its target");
}

static void runExitHasPriority()
{
    Fixture f;
    Agent current = f.agent(sf::Vector2f(9.0f, 0.0f), sf::Vector2f(1.0f, 0.0f));
    Agent next = current;

    // sign 1 is visible from here too, the exit still wins
    REQUIRE(f.classifier.isSignVisible(current, f.signs[1]), "sign next to the exit is visible");

    GoalDecision goal = f.classifier.classify(current, 3, next);
    REQUIRE(goal.region == Region::Exit, "agent inside the exit radius is in the exit domain");
    REQUIRE(goal.targetId == 0, "exit id");
    REQUIRE_VEC_NEAR(goal.force, sf::Vector2f(0.5f, 0.0f), TOL, "exit force = strength * unit vector to exit");
    REQUIRE(next.memory.empty(), "exit domain does not record signs");
    requireSingleGoal(goal);

    // an agent assigned to another exit ignores this one
    Agent assigned = current;
    assigned.exitId = 5;
    Agent assignedNext = assigned;
    GoalDecision other = f.classifier.classify(assigned, 3, assignedNext);
    REQUIRE(other.region == Region::VisibleSign, "assigned exit elsewhere falls through to the sign");

    std::cout << "[PASS] exit domain priority\n";
}

static void runVisibleSign()
{
    Fixture f;
    Agent current = f.agent(sf::Vector2f(1.8f, 0.0f), sf::Vector2f(1.0f, 0.0f));
    Agent next = current;

    GoalDecision goal = f.classifier.classify(current, 12, next);
    REQUIRE(goal.region == Region::VisibleSign, "sign ahead within vision radius is visible");
    REQUIRE(goal.targetId == 0, "nearest visible sign");
    REQUIRE_VEC_NEAR(goal.force, sf::Vector2f(1.0f, 0.0f), TOL, "sign force = etaSign * unit vector to sign");
    requireSingleGoal(goal);

    REQUIRE(next.memory.contains(0), "visible sign is written into memory");
    REQUIRE(next.memory.entries().at(0).recordedStep == 12, "memory records the current step");
    REQUIRE(current.memory.empty(), "the frozen snapshot is never written");

    std::cout << "[PASS] visible sign domain writes memory\n";
}

static void runSignVisibilityRules()
{
    Fixture f;

    // behind the agent: outside its field of view
    Agent facingAway = f.agent(sf::Vector2f(1.8f, 0.0f), sf::Vector2f(-1.0f, 0.0f));
    REQUIRE(!f.classifier.isSignVisible(facingAway, f.signs[0]), "sign behind the agent is not visible");

    // standing still: the desired heading decides
    Agent standing = f.agent(sf::Vector2f(1.8f, 0.0f), sf::Vector2f(0.0f, 0.0f));
    standing.setDesiredHeading(sf::Vector2f(1.0f, 0.0f));
    REQUIRE(f.classifier.isSignVisible(standing, f.signs[0]), "stationary agent looks along its desired heading");

    // too far
    Agent far = f.agent(sf::Vector2f(1.0f, 0.0f), sf::Vector2f(1.0f, 0.0f));
    REQUIRE(!f.classifier.isSignVisible(far, f.signs[0]), "sign beyond vision radius is not visible");

    // behind the sign: outside the sign's own cone
    Agent behindSign = f.agent(sf::Vector2f(4.0f, 0.0f), sf::Vector2f(-1.0f, 0.0f));
    REQUIRE(!f.classifier.isSignVisible(behindSign, f.signs[0]), "agent behind the sign does not see it");

    // a wall between agent and sign
    Fixture blocked(std::vector<WallSegment>{WallSegment{sf::Vector2f(2.5f, -1.0f), sf::Vector2f(2.5f, 1.0f)}});
    Agent occluded = blocked.agent(sf::Vector2f(1.8f, 0.0f), sf::Vector2f(1.0f, 0.0f));
    REQUIRE(!blocked.classifier.isSignVisible(occluded, blocked.signs[0]), "occluded sign is not visible");
    Agent occludedNext = occluded;
    GoalDecision goal = blocked.classifier.classify(occluded, 0, occludedNext);
    REQUIRE(goal.region == Region::Default, "no exit, no visible sign, no memory: default");
    REQUIRE(isZero(goal.force), "default has no goal force");
    REQUIRE(occludedNext.memory.empty(), "nothing recorded");

    std::cout << "[PASS] sign visibility (radius, fov, sign cone, line of sight)\n";
}

static void runMemoryDomain()
{
    Fixture f;
    Agent current = f.agent(sf::Vector2f(3.0f, -5.0f), sf::Vector2f(0.0f, 0.0f));
    current.memory.record(0, sf::Vector2f(3.0f, 0.0f), 0);
    Agent next = current;

    GoalDecision goal = f.classifier.classify(current, 40, next);
    REQUIRE(goal.region == Region::Memory, "remembered sign without sight: memory domain");
    REQUIRE(goal.targetId == 0, "remembered sign id");
    REQUIRE_VEC_NEAR(goal.force, sf::Vector2f(0.0f, 1.0f), TOL, "memory force = etaMem * unit vector to memory");
    requireSingleGoal(goal);

    std::cout << "[PASS] memory domain\n";
}

static void runMemoryExpiry()
{
    Fixture f(std::vector<WallSegment>(), 5);
    Agent current = f.agent(sf::Vector2f(3.0f, -5.0f), sf::Vector2f(0.0f, 0.0f));
    current.memory.record(0, sf::Vector2f(3.0f, 0.0f), 0);

    Agent next = current;
    REQUIRE(f.classifier.classify(current, 5, next).region == Region::Memory, "entry alive at its expiry step");
    REQUIRE(next.memory.contains(0), "live entry kept");

    next = current;
    GoalDecision expired = f.classifier.classify(current, 6, next);
    REQUIRE(expired.region == Region::Default, "expired entry no longer attracts");
    REQUIRE(!next.memory.contains(0), "expired entry is purged from the next state");

    std::cout << "[PASS] memory expiry\n";
}

static void runSignMemoryPolicy()
{
    SignMemory memory(2, 0);
    memory.record(1, sf::Vector2f(1.0f, 0.0f), 0);
    memory.record(2, sf::Vector2f(2.0f, 0.0f), 1);
    memory.record(3, sf::Vector2f(3.0f, 0.0f), 2);
    REQUIRE(memory.size() == 2, "memory never exceeds its capacity");
    REQUIRE(!memory.contains(1), "oldest entry is evicted");
    REQUIRE(memory.contains(2) && memory.contains(3), "newer entries survive");

    // refreshing an entry makes it the newest
    memory.record(2, sf::Vector2f(2.5f, 0.0f), 3);
    memory.record(4, sf::Vector2f(4.0f, 0.0f), 4);
    REQUIRE(memory.contains(2) && !memory.contains(3), "refreshed entry survives eviction");
    REQUIRE_NEAR(memory.entries().at(2).position.x, 2.5f, TOL, "refresh updates the position");

    auto latest = memory.latest(4, sf::Vector2f(0.0f, 0.0f));
    REQUIRE(latest && latest->signId == 4, "latest returns the most recent sighting");

    // same step: the nearer one wins
    SignMemory tie(4, 0);
    tie.record(1, sf::Vector2f(5.0f, 0.0f), 2);
    tie.record(2, sf::Vector2f(1.0f, 0.0f), 2);
    REQUIRE(tie.latest(2, sf::Vector2f(0.0f, 0.0f))->signId == 2, "ties go to the nearest entry");

    // expiry
    SignMemory expiring(4, 3);
    expiring.record(1, sf::Vector2f(1.0f, 0.0f), 0);
    REQUIRE(expiring.latest(3, sf::Vector2f(0.0f, 0.0f)).has_value(), "alive up to the expiry window");
    REQUIRE(!expiring.latest(4, sf::Vector2f(0.0f, 0.0f)).has_value(), "expired entries are ignored");
    expiring.record(2, sf::Vector2f(2.0f, 0.0f), 4);
    REQUIRE(!expiring.contains(1) && expiring.size() == 1, "writes purge expired entries");

    std::cout << "[PASS] sign memory eviction and expiry\n";
}

} // namespace

int main()
{
    runExitHasPriority();
    runVisibleSign();
    runSignVisibilityRules();
    runMemoryDomain();
    runMemoryExpiry();
    runSignMemoryPolicy();

    std::cout << "All region classifier tests passed\n";
    return 0;
}

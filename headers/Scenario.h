#pragma once
#include <SFML/System/Vector2.hpp>
#include <string>
#include <utility>
#include <vector>
#include "Agent.h"

class SimulationSettings;

// straight wall piece, walls are immutable for the whole run
struct WallSegment
{
    sf::Vector2f a;
    sf::Vector2f b;

    float length() const { return (b - a).length(); }
};

// a sign attracts agents that see it, and agents remember where it was
struct Sign
{
    int id = -1;
    sf::Vector2f position;
    sf::Vector2f direction = sf::Vector2f(1.0f, 0.0f); // axis of the sign's own cone of influence
};

struct Exit
{
    int id = -1;
    sf::Vector2f position;
    float radius = 4.0f;   // effective radius of the exit domain
    float strength = 0.5f; // attraction magnitude inside the domain
};

// positive strength pushes agents away, negative pulls them in
struct PanicSource
{
    sf::Vector2f position;
    float strength = 1.0f;
    float cutoff = 20.0f;
};

// everything a run starts from except the parameters
class Scenario
{
public:
    std::vector<Agent> agents;
    std::vector<WallSegment> walls;
    std::vector<Sign> signs;
    std::vector<Exit> exits;
    std::vector<PanicSource> panicSources;

    // prior knowledge: (agent id, sign id) pairs memorised before step 0
    std::vector<std::pair<int, int>> knownSigns;

    // closed outline -> one wall per edge
    void addPolygon(const std::vector<sf::Vector2f> &outline);

    bool loadFromFile(const std::string &filename, const SimulationSettings &settings);

    // configuration errors, empty when the scenario can be simulated
    std::vector<std::string> validate() const;

    const Sign *findSign(int id) const;
    const Exit *findExit(int id) const;

    // room with an obstacle, a door to a corridor, two signs, an exit and a panic source
    static Scenario makeEvacuationDemo(const SimulationSettings &settings, int agentCount, std::uint32_t seed);

private:
    bool parseLine(const std::string &key, const std::string &value, const SimulationSettings &settings);
};

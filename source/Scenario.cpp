#include "Scenario.h"
#include "SimulationSettings.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <initializer_list>
#include <set>
#include <sstream>
#include <stdexcept>

namespace
{
    std::string trim(const std::string &s)
    {
        size_t first = s.find_first_not_of(" \t\r");
        if (first == std::string::npos)
            return "";
        size_t last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    // "1.0, 2, 3.5" -> {"1.0", "2", "3.5"}; empty fields are an error
    std::vector<std::string> splitFields(const std::string &text, char separator)
    {
        std::vector<std::string> fields;
        std::stringstream ss(text);
        std::string item;
        while (std::getline(ss, item, separator))
        {
            item = trim(item);
            if (item.empty())
                throw std::invalid_argument("empty field");
            fields.push_back(item);
        }
        return fields;
    }

    float parseNumber(const std::string &item)
    {
        size_t used = 0;
        float value = std::stof(item, &used);
        if (used != item.size())
            throw std::invalid_argument("trailing characters in '" + item + "'");
        return value;
    }

    // ids are integers, never read through a float
    int parseId(const std::string &item)
    {
        size_t used = 0;
        int value = std::stoi(item, &used);
        if (used != item.size())
            throw std::invalid_argument("id '" + item + "' is not an integer");
        return value;
    }

    std::vector<float> parseNumbers(const std::string &text, char separator)
    {
        std::vector<float> numbers;
        for (const auto &item : splitFields(text, separator))
        {
            numbers.push_back(parseNumber(item));
        }
        return numbers;
    }

    void requireCount(size_t count, std::initializer_list<size_t> allowed, const char *what)
    {
        if (std::find(allowed.begin(), allowed.end(), count) == allowed.end())
        {
            throw std::invalid_argument(std::string("wrong number of fields for ") + what);
        }
    }

    bool finite(const sf::Vector2f &v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y);
    }
}

void Scenario::addPolygon(const std::vector<sf::Vector2f> &outline)
{
    if (outline.size() < 2)
        return;

    for (size_t i = 0; i < outline.size(); ++i)
    {
        const sf::Vector2f &a = outline[i];
        const sf::Vector2f &b = outline[(i + 1) % outline.size()];
        // an explicitly closed outline repeats its first point, skip that empty edge
        if (i + 1 == outline.size() && a == b)
            break;
        walls.push_back({a, b});
    }
}

bool Scenario::loadFromFile(const std::string &filename, const SimulationSettings &settings)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open scenario file: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    bool ok = true;
    while (std::getline(file, line))
    {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
        {
            std::cerr << "Error: " << filename << ":" << lineNumber << ": expected key=value" << std::endl;
            ok = false;
            continue;
        }

        std::string key = trim(line.substr(0, equalPos));
        std::string value = trim(line.substr(equalPos + 1));

        try
        {
            if (!parseLine(key, value, settings))
            {
                std::cerr << "Warning: " << filename << ":" << lineNumber << ": unknown entry '" << key << "'" << std::endl;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error: " << filename << ":" << lineNumber << ": " << e.what() << std::endl;
            ok = false;
        }
    }

    std::cout << "Scenario loaded from " << filename << ": " << agents.size() << " agents, "
              << walls.size() << " walls, " << signs.size() << " signs, " << exits.size() << " exits, "
              << panicSources.size() << " panic sources" << std::endl;
    return ok;
}

bool Scenario::parseLine(const std::string &key, const std::string &value, const SimulationSettings &settings)
{
    const auto &p = settings.params;

    if (key == "wall")
    {
        auto v = parseNumbers(value, ',');
        requireCount(v.size(), {4}, "wall");
        walls.push_back({sf::Vector2f(v[0], v[1]), sf::Vector2f(v[2], v[3])});
    }
    else if (key == "polygon")
    {
        std::vector<sf::Vector2f> outline;
        std::stringstream ss(value);
        std::string point;
        while (std::getline(ss, point, ';'))
        {
            auto v = parseNumbers(point, ',');
            requireCount(v.size(), {2}, "polygon point");
            outline.emplace_back(v[0], v[1]);
        }
        if (outline.size() < 3)
            throw std::invalid_argument("polygon needs at least 3 points");
        addPolygon(outline);
    }
    else if (key == "sign")
    {
        auto f = splitFields(value, ',');
        requireCount(f.size(), {5}, "sign");
        signs.push_back({parseId(f[0]), sf::Vector2f(parseNumber(f[1]), parseNumber(f[2])),
                         sf::Vector2f(parseNumber(f[3]), parseNumber(f[4]))});
    }
    else if (key == "exit")
    {
        auto f = splitFields(value, ',');
        requireCount(f.size(), {3, 4, 5}, "exit");
        Exit exit;
        exit.id = parseId(f[0]);
        exit.position = sf::Vector2f(parseNumber(f[1]), parseNumber(f[2]));
        exit.radius = f.size() > 3 ? parseNumber(f[3]) : p.exitRadius;
        exit.strength = f.size() > 4 ? parseNumber(f[4]) : p.exitStrength;
        exits.push_back(exit);
    }
    else if (key == "panic")
    {
        auto v = parseNumbers(value, ',');
        requireCount(v.size(), {2, 3, 4}, "panic");
        PanicSource source;
        source.position = sf::Vector2f(v[0], v[1]);
        source.strength = v.size() > 2 ? v[2] : p.strength;
        source.cutoff = v.size() > 3 ? v[3] : p.cutoff;
        panicSources.push_back(source);
    }
    else if (key == "agent")
    {
        auto f = splitFields(value, ',');
        requireCount(f.size(), {3, 5, 6, 7, 9, 10}, "agent");
        const int id = parseId(f[0]);
        // the optional trailing exit id is an integer too
        std::vector<float> v;
        for (size_t i = 1; i < std::min<size_t>(f.size(), 9); ++i)
        {
            v.push_back(parseNumber(f[i]));
        }
        sf::Vector2f velocity = v.size() >= 4 ? sf::Vector2f(v[2], v[3]) : sf::Vector2f(0.0f, 0.0f);
        float mass = v.size() >= 5 ? v[4] : Agent::DEFAULT_MASS;
        float damping = v.size() >= 6 ? v[5] : Agent::DEFAULT_DAMPING;

        Agent agent(id, sf::Vector2f(v[0], v[1]), velocity, mass, damping);
        if (v.size() >= 8)
            agent.setDesiredHeading(sf::Vector2f(v[6], v[7]));
        if (f.size() >= 10)
            agent.exitId = parseId(f[9]);
        agent.memory.configure(static_cast<std::size_t>(std::max(1, settings.memoryCapacity)),
                               std::max(0, settings.memoryExpirySteps));
        agents.push_back(std::move(agent));
    }
    else if (key == "knows")
    {
        auto f = splitFields(value, ',');
        requireCount(f.size(), {2}, "knows");
        knownSigns.emplace_back(parseId(f[0]), parseId(f[1]));
    }
    else
    {
        return false;
    }
    return true;
}

const Sign *Scenario::findSign(int id) const
{
    for (const auto &sign : signs)
    {
        if (sign.id == id)
            return &sign;
    }
    return nullptr;
}

const Exit *Scenario::findExit(int id) const
{
    for (const auto &exit : exits)
    {
        if (exit.id == id)
            return &exit;
    }
    return nullptr;
}

std::vector<std::string> Scenario::validate() const
{
    std::vector<std::string> issues;

    for (size_t i = 0; i < walls.size(); ++i)
    {
        if (!finite(walls[i].a) || !finite(walls[i].b))
            issues.push_back("wall " + std::to_string(i) + " has non-finite coordinates");
        else if (walls[i].length() <= 1.0e-6f)
            issues.push_back("wall " + std::to_string(i) + " has zero length");
    }

    std::set<int> signIds;
    for (const auto &sign : signs)
    {
        if (!signIds.insert(sign.id).second)
            issues.push_back("duplicate sign id " + std::to_string(sign.id));
        if (!finite(sign.position))
            issues.push_back("sign " + std::to_string(sign.id) + " has a non-finite position");
        if (!(sign.direction.length() > 0.0f))
            issues.push_back("sign " + std::to_string(sign.id) + " has no facing direction");
    }

    std::set<int> exitIds;
    for (const auto &exit : exits)
    {
        if (!exitIds.insert(exit.id).second)
            issues.push_back("duplicate exit id " + std::to_string(exit.id));
        if (!finite(exit.position))
            issues.push_back("exit " + std::to_string(exit.id) + " has a non-finite position");
        if (!(exit.radius > 0.0f))
            issues.push_back("exit " + std::to_string(exit.id) + " radius must be positive");
    }

    for (size_t i = 0; i < panicSources.size(); ++i)
    {
        if (!finite(panicSources[i].position))
            issues.push_back("panic source " + std::to_string(i) + " has a non-finite position");
        if (panicSources[i].cutoff < 0.0f)
            issues.push_back("panic source " + std::to_string(i) + " cutoff must not be negative");
    }

    std::set<int> agentIds;
    for (const auto &agent : agents)
    {
        const std::string label = "agent " + std::to_string(agent.id);
        if (!agentIds.insert(agent.id).second)
            issues.push_back("duplicate agent id " + std::to_string(agent.id));
        if (!finite(agent.position) || !finite(agent.velocity))
            issues.push_back(label + " has a non-finite state");
        if (!(agent.mass > 0.0f))
            issues.push_back(label + " mass must be positive");
        if (agent.damping < 0.0f)
            issues.push_back(label + " damping must not be negative");
        if (agent.exitId >= 0 && exitIds.count(agent.exitId) == 0)
            issues.push_back(label + " references unknown exit " + std::to_string(agent.exitId));
    }

    for (const auto &[agentId, signId] : knownSigns)
    {
        if (agentIds.count(agentId) == 0)
            issues.push_back("prior knowledge references unknown agent " + std::to_string(agentId));
        if (signIds.count(signId) == 0)
            issues.push_back("agent " + std::to_string(agentId) + " knows unknown sign " + std::to_string(signId));
    }

    return issues;
}

Scenario Scenario::makeEvacuationDemo(const SimulationSettings &settings, int agentCount, std::uint32_t seed)
{
    Scenario scenario;

    // 20 x 12 room with a 2 m door on the east wall leading into a corridor
    scenario.walls.push_back({{0.0f, 0.0f}, {20.0f, 0.0f}});
    scenario.walls.push_back({{20.0f, 0.0f}, {20.0f, 5.0f}});
    scenario.walls.push_back({{20.0f, 7.0f}, {20.0f, 12.0f}});
    scenario.walls.push_back({{20.0f, 12.0f}, {0.0f, 12.0f}});
    scenario.walls.push_back({{0.0f, 12.0f}, {0.0f, 0.0f}});
    scenario.walls.push_back({{20.0f, 5.0f}, {30.0f, 5.0f}});
    scenario.walls.push_back({{20.0f, 7.0f}, {30.0f, 7.0f}});

    // pillar in the middle of the room
    scenario.addPolygon({{10.0f, 5.0f}, {11.0f, 5.0f}, {11.0f, 7.0f}, {10.0f, 7.0f}});

    // signs facing into the room
    scenario.signs.push_back({0, {19.5f, 6.0f}, {-1.0f, 0.0f}});
    scenario.signs.push_back({1, {12.0f, 11.5f}, {0.0f, -1.0f}});

    Exit exit;
    exit.id = 0;
    exit.position = {29.0f, 6.0f};
    exit.radius = settings.params.exitRadius;
    exit.strength = settings.params.exitStrength;
    scenario.exits.push_back(exit);

    PanicSource panic;
    panic.position = {2.0f, 2.0f};
    panic.strength = settings.params.strength;
    panic.cutoff = std::min(settings.params.cutoff, 6.0f);
    scenario.panicSources.push_back(panic);

    AgentFactory::SpawnArea area{{1.0f, 1.0f}, {9.0f, 11.0f}};
    scenario.agents = AgentFactory::createAgents(agentCount, AgentFactory::SpawnMode::Random, area,
                                                 settings, seed, sf::Vector2f(1.0f, 0.0f));

    return scenario;
}

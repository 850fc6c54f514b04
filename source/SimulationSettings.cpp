#include "SimulationSettings.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace
{
    // every model parameter is written and parsed under its member name
    struct ForceKey
    {
        const char *name;
        float SimulationSettings::ForceParameters::*member;
    };

    using FP = SimulationSettings::ForceParameters;

    const ForceKey FORCE_KEYS[] = {
        {"a", &FP::a},
        {"d", &FP::d},
        {"w0", &FP::w0},
        {"w1", &FP::w1},
        {"cn0", &FP::cn0},
        {"cr0", &FP::cr0},
        {"beta", &FP::beta},
        {"nuDist", &FP::nuDist},
        {"gamma", &FP::gamma},
        {"epsilon", &FP::epsilon},
        {"cphi1", &FP::cphi1},
        {"cphi2", &FP::cphi2},
        {"phi1", &FP::phi1},
        {"phi2", &FP::phi2},
        {"phi3", &FP::phi3},
        {"phi4", &FP::phi4},
        {"hr0", &FP::hr0},
        {"lam", &FP::lam},
        {"sigma", &FP::sigma},
        {"hphi1", &FP::hphi1},
        {"hphi2", &FP::hphi2},
        {"cohesionAlignAngle", &FP::cohesionAlignAngle},
        {"etaSign", &FP::etaSign},
        {"etaMem", &FP::etaMem},
        {"visionRadius", &FP::visionRadius},
        {"fovAngle", &FP::fovAngle},
        {"signFov", &FP::signFov},
        {"exitStrength", &FP::exitStrength},
        {"exitRadius", &FP::exitRadius},
        {"strength", &FP::strength},
        {"cutoff", &FP::cutoff},
        {"q1", &FP::q1},
        {"q2", &FP::q2},
    };

    std::string trim(const std::string &s)
    {
        size_t first = s.find_first_not_of(" \t\r");
        if (first == std::string::npos)
            return "";
        size_t last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    // the whole value must be the number, "20O0" or "0.05s" are errors
    void requireConsumed(const std::string &value, size_t used)
    {
        if (used != value.size())
            throw std::invalid_argument("trailing characters");
    }

    float parseFloat(const std::string &value)
    {
        size_t used = 0;
        float result = std::stof(value, &used);
        requireConsumed(value, used);
        return result;
    }

    int parseInt(const std::string &value)
    {
        size_t used = 0;
        int result = std::stoi(value, &used);
        requireConsumed(value, used);
        return result;
    }

    std::uint32_t parseSeed(const std::string &value)
    {
        // stoul would wrap "-1" around to the largest value
        if (value.empty() || value[0] == '-' || value[0] == '+')
            throw std::invalid_argument("seed must be a plain unsigned number");
        size_t used = 0;
        unsigned long long result = std::stoull(value, &used);
        requireConsumed(value, used);
        if (result > std::numeric_limits<std::uint32_t>::max())
            throw std::out_of_range("seed does not fit in 32 bits");
        return static_cast<std::uint32_t>(result);
    }

    const char *policyName(ParallelProcessor::SchedulingPolicy policy)
    {
        switch (policy)
        {
        case ParallelProcessor::SchedulingPolicy::Dynamic:
            return "dynamic";
        case ParallelProcessor::SchedulingPolicy::Guided:
            return "guided";
        default:
            return "static";
        }
    }

    ParallelProcessor::SchedulingPolicy parsePolicy(const std::string &value)
    {
        if (value == "static")
            return ParallelProcessor::SchedulingPolicy::Static;
        if (value == "dynamic")
            return ParallelProcessor::SchedulingPolicy::Dynamic;
        if (value == "guided")
            return ParallelProcessor::SchedulingPolicy::Guided;
        throw std::invalid_argument("expected static, dynamic or guided");
    }
}

bool SimulationSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# Crowd Simulation Settings (Hirai-Tarui force model)\n";
    file << "# angles in radians, lengths in meters\n";
    for (const auto &key : FORCE_KEYS)
    {
        file << key.name << "=" << params.*(key.member) << "\n";
    }

    file << "dt=" << dt << "\n";
    file << "steps=" << steps << "\n";
    file << "seed=" << seed << "\n";
    file << "interactionRadius=" << interactionRadius << "\n";
    file << "minPairDistance=" << minPairDistance << "\n";
    file << "speedEpsilon=" << speedEpsilon << "\n";
    file << "memoryCapacity=" << memoryCapacity << "\n";
    file << "memoryExpirySteps=" << memoryExpirySteps << "\n";
    file << "workerThreads=" << workerThreads << "\n";
    file << "schedulingPolicy=" << policyName(schedulingPolicy) << "\n";
    file << "logEvery=" << logEvery << "\n";
    file << "traceAgentId=" << traceAgentId << "\n";
    file << "windowWidth=" << windowWidth << "\n";
    file << "windowHeight=" << windowHeight << "\n";
    file << "pixelsPerMeter=" << pixelsPerMeter << "\n";
    file << "stepsPerFrame=" << stepsPerFrame << "\n";

    return true;
}

bool SimulationSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
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
            if (!applyValue(key, value))
            {
                std::cerr << "Warning: " << filename << ":" << lineNumber << ": unknown setting '" << key << "'" << std::endl;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error: " << filename << ":" << lineNumber << ": bad value '" << value
                      << "' for " << key << " (" << e.what() << ")" << std::endl;
            ok = false;
        }
    }

    validateAndClamp();
    return ok;
}

bool SimulationSettings::applyValue(const std::string &key, const std::string &value)
{
    for (const auto &forceKey : FORCE_KEYS)
    {
        if (key == forceKey.name)
        {
            params.*(forceKey.member) = parseFloat(value);
            return true;
        }
    }

    if (key == "dt")
        dt = parseFloat(value);
    else if (key == "steps")
        steps = parseInt(value);
    else if (key == "seed")
        seed = parseSeed(value);
    else if (key == "interactionRadius")
        interactionRadius = parseFloat(value);
    else if (key == "minPairDistance")
        minPairDistance = parseFloat(value);
    else if (key == "speedEpsilon")
        speedEpsilon = parseFloat(value);
    else if (key == "memoryCapacity")
        memoryCapacity = parseInt(value);
    else if (key == "memoryExpirySteps")
        memoryExpirySteps = parseInt(value);
    else if (key == "schedulingPolicy")
        schedulingPolicy = parsePolicy(value);
    else if (key == "workerThreads")
        workerThreads = parseInt(value);
    else if (key == "logEvery")
        logEvery = parseInt(value);
    else if (key == "traceAgentId")
        traceAgentId = parseInt(value);
    else if (key == "windowWidth")
        windowWidth = parseInt(value);
    else if (key == "windowHeight")
        windowHeight = parseInt(value);
    else if (key == "pixelsPerMeter")
        pixelsPerMeter = parseFloat(value);
    else if (key == "stepsPerFrame")
        stepsPerFrame = parseInt(value);
    else
        return false;

    return true;
}

std::vector<std::string> SimulationSettings::validate() const
{
    std::vector<std::string> issues;
    const auto &p = params;

    for (const auto &key : FORCE_KEYS)
    {
        if (!std::isfinite(p.*(key.member)))
            issues.push_back(std::string("parameter ") + key.name + " is not finite");
    }

    if (!(dt > 0.0f) || !std::isfinite(dt))
        issues.push_back("dt must be positive");
    if (steps < 0)
        issues.push_back("steps must not be negative");

    if (!(p.beta >= 0.0f && p.beta <= p.nuDist && p.nuDist <= p.gamma && p.gamma <= p.epsilon))
        issues.push_back("c1 breakpoints must satisfy 0 <= beta <= nuDist <= gamma <= epsilon");
    if (!(p.phi1 >= 0.0f && p.phi1 <= p.phi2 && p.phi2 <= p.phi3 && p.phi3 <= p.phi4))
        issues.push_back("c2 breakpoints must satisfy 0 <= phi1 <= phi2 <= phi3 <= phi4");
    if (!(p.lam >= 0.0f && p.lam <= p.sigma))
        issues.push_back("h1 breakpoints must satisfy 0 <= lam <= sigma");
    if (!(p.d > 0.0f))
        issues.push_back("wall cutoff d must be positive");
    if (p.visionRadius < 0.0f)
        issues.push_back("visionRadius must not be negative");
    if (p.exitRadius <= 0.0f)
        issues.push_back("exitRadius must be positive");
    if (p.cutoff < 0.0f)
        issues.push_back("cutoff must not be negative");

    if (!(interactionRadius > 0.0f))
        issues.push_back("interactionRadius must be positive");
    if (!(minPairDistance > 0.0f))
        issues.push_back("minPairDistance must be positive");
    if (speedEpsilon < 0.0f)
        issues.push_back("speedEpsilon must not be negative");
    if (memoryCapacity < 1)
        issues.push_back("memoryCapacity must be at least 1");
    if (memoryExpirySteps < 0)
        issues.push_back("memoryExpirySteps must not be negative");

    return issues;
}

void SimulationSettings::validateAndClamp()
{
    workerThreads = std::clamp(workerThreads, 0, 256);
    logEvery = std::max(0, logEvery);
    windowWidth = std::clamp(windowWidth, 320, 4096);
    windowHeight = std::clamp(windowHeight, 240, 4096);
    pixelsPerMeter = std::clamp(pixelsPerMeter, 1.0f, 500.0f);
    stepsPerFrame = std::clamp(stepsPerFrame, 1, 100);
}

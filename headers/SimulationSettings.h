#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "ParallelProcessor.h"

class SimulationSettings
{
public:
    // tunable constants of the force model, shared read only by every kernel in a run
    // angles are radians, lengths meters, forces newtons
    struct ForceParameters
    {
        // driving force
        float a = 1.0f;

        // wall repulsion (d is also the near-wall threshold of the random force)
        float d = 1.0f;
        float w0 = 6.0f; // scales the into-wall velocity term
        float w1 = 6.0f; // constant push while inside d

        // c1(r): cn0 at r=0, 0 at beta, cr0 from nuDist to gamma, 0 at epsilon
        float cn0 = -0.5f;
        float cr0 = 1.0f;
        float beta = 0.5f;
        float nuDist = 1.0f;
        float gamma = 2.0f;
        float epsilon = 3.0f;

        // c2(theta): cphi1 plateau, ramp to cphi2, plateau, ramp to 0
        float cphi1 = 1.0f;
        float cphi2 = 0.5f;
        float phi1 = 0.52359878f; // pi/6
        float phi2 = 1.04719755f; // pi/3
        float phi3 = 2.09439510f; // 2pi/3
        float phi4 = 2.61799388f; // 5pi/6

        // h1(r): hr0 up to lam, 0 at sigma
        float hr0 = 1.0f;
        float lam = 1.5f;
        float sigma = 2.5f;

        // h2(theta): hphi1 inside cohesionAlignAngle, hphi2 outside
        float hphi1 = 1.0f;
        float hphi2 = 0.5f;
        float cohesionAlignAngle = 1.04719755f; // pi/3

        // signs
        float etaSign = 1.0f;
        float etaMem = 1.0f;
        float visionRadius = 1.5f;
        float fovAngle = 2.09439510f; // 2pi/3, full cone of the agent
        float signFov = 1.57079633f;  // pi/2, full cone of the sign

        // exits (defaults for exits that do not set their own)
        float exitStrength = 0.5f;
        float exitRadius = 4.0f;

        // herding / panic (defaults for panic sources that do not set their own)
        float strength = 1.0f;
        float cutoff = 20.0f;

        // random fluctuation
        float q1 = 1.0f;
        float q2 = 2.0f;
    };

    ForceParameters params;

    // time stepping
    float dt = 0.05f;
    int steps = 2000;
    std::uint32_t seed = 42;

    // neighbor search and numeric guards
    float interactionRadius = 3.0f; // pairs beyond this never interact
    float minPairDistance = 1.0e-4f; // coincident agents are evaluated at this distance
    float speedEpsilon = 1.0e-6f;    // below this speed the desired heading is used

    // sign memory policy
    int memoryCapacity = 8;
    int memoryExpirySteps = 0; // 0 = entries never expire

    // execution
    int workerThreads = 0; // 0 = hardware concurrency minus one
    ParallelProcessor::SchedulingPolicy schedulingPolicy = ParallelProcessor::SchedulingPolicy::Static;
    int logEvery = 100;    // 0 = quiet
    int traceAgentId = -1; // prints the force breakdown of this agent every step

    // viewer
    int windowWidth = 1200;
    int windowHeight = 900;
    float pixelsPerMeter = 40.0f;
    int stepsPerFrame = 1;

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    // configuration errors, empty when the settings are usable
    std::vector<std::string> validate() const;

    // clamps viewer / logging values into sane ranges, never touches model parameters
    void validateAndClamp();

    static float degToRad(float degrees) { return degrees * 3.14159265f / 180.0f; }
    static float radToDeg(float radians) { return radians * 180.0f / 3.14159265f; }

private:
    bool applyValue(const std::string &key, const std::string &value);
};

#include <SFML/Graphics.hpp>
#include <SFML/Window.hpp>
#include <SFML/System.hpp>
#include <iostream>
#include <iomanip>
#include <optional>
#include <stdexcept>
#include <string>

#include "SimulationSettings.h"
#include "Scenario.h"
#include "CrowdSimulation.h"
#include "SceneRenderer.h"
#include "UIManager.h"

// agents in the built-in demo scenario
const int DEMO_AGENT_COUNT = 60;

struct CommandLine
{
    bool headless = false;
    std::string settingsFile;
    std::string scenarioFile;
    std::optional<long long> steps;
};

void printUsage(const char *program)
{
    std::cout << "usage: " << program << " [--headless] [--settings FILE] [--scenario FILE] [--steps N]" << std::endl;
    std::cout << "  without --scenario the built-in evacuation demo runs" << std::endl;
    std::cout << "  example: " << program << " --scenario scenarios/corridor.txt" << std::endl;
}

// returns false on a malformed command line
bool parseCommandLine(int argc, char **argv, CommandLine &cmd)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--headless")
        {
            cmd.headless = true;
        }
        else if (arg == "--settings" && hasValue)
        {
            cmd.settingsFile = argv[++i];
        }
        else if (arg == "--scenario" && hasValue)
        {
            cmd.scenarioFile = argv[++i];
        }
        else if (arg == "--steps" && hasValue)
        {
            try
            {
                cmd.steps = std::stoll(argv[++i]);
            }
            catch (const std::exception &)
            {
                std::cerr << "Error: --steps expects a number, got '" << argv[i] << "'" << std::endl;
                return false;
            }
        }
        else
        {
            std::cerr << "Error: unknown or incomplete argument '" << arg << "'" << std::endl;
            return false;
        }
    }
    return true;
}

void printSummary(const CrowdSimulation &simulation)
{
    const StepStatistics &stats = simulation.getLastResult().stats;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "=== Run Summary ===" << std::endl;
    std::cout << "  Steps: " << simulation.getStepCount() << " (" << simulation.getSimulatedTime() << " s)" << std::endl;
    std::cout << "  Agents: " << simulation.getAgentCount() << std::endl;
    std::cout << "  Regions: exit " << stats.count(Region::Exit)
              << ", sign " << stats.count(Region::VisibleSign)
              << ", memory " << stats.count(Region::Memory)
              << ", default " << stats.count(Region::Default) << std::endl;
    std::cout << "  Reached an exit: " << simulation.getEvacuatedCount() << std::endl;
    std::cout << "  Mean speed: " << stats.meanSpeed << " m/s" << std::endl;
    std::cout << "  Non-finite agents: " << stats.integration.nonFiniteAgents << std::endl;

    const auto metrics = simulation.getProcessor().getMetrics();
    if (metrics.totalOperations > 0)
    {
        std::cout << "  Parallel step time: avg " << metrics.avgExecutionTime << " ms, min "
                  << metrics.minExecutionTime << " ms, max " << metrics.maxExecutionTime << " ms" << std::endl;
    }
    std::cout << std::defaultfloat;
}

int runHeadless(CrowdSimulation &simulation, long long steps)
{
    std::cout << "Running " << steps << " steps headless" << std::endl;
    simulation.run(steps);
    printSummary(simulation);
    return 0;
}

int runViewer(CrowdSimulation &simulation, SimulationSettings &settings, const std::string &settingsFile)
{
    sf::RenderWindow window(sf::VideoMode({static_cast<unsigned int>(settings.windowWidth),
                                           static_cast<unsigned int>(settings.windowHeight)}),
                            "Crowd Simulation");
    window.setFramerateLimit(60);

    // initialize font
    sf::Font font;
    if (!font.openFromFile("DejaVuSans.ttf") &&
        !font.openFromFile("bin/DejaVuSans.ttf") &&
        !font.openFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"))
    {
        std::cout << "Warning: Could not load font file, HUD text may not display properly" << std::endl;
    }

    SceneRenderer renderer(settings.pixelsPerMeter);
    UIManager ui(font);

    ui.onReset = [&simulation]()
    { simulation.reset(); };
    ui.onSingleStep = [&simulation]()
    { simulation.step(); };
    ui.onSaveSettings = [&settings, &settingsFile]()
    {
        const std::string target = settingsFile.empty() ? "crowd_settings.txt" : settingsFile;
        if (settings.saveToFile(target))
            std::cout << "Settings saved to " << target << std::endl;
    };
    ui.onQuit = [&window]()
    { window.close(); };

    while (window.isOpen())
    {
        // handle events
        while (const std::optional event = window.pollEvent())
        {
            if (event->is<sf::Event::Closed>())
            {
                window.close();
            }

            if (const auto *keyPressed = event->getIf<sf::Event::KeyPressed>())
            {
                ui.handleInput(keyPressed, settings);
            }
        }

        if (!ui.isPaused())
        {
            for (int i = 0; i < settings.stepsPerFrame; ++i)
            {
                simulation.step();
            }
        }

        window.clear(sf::Color(20, 20, 28));
        renderer.draw(window, simulation);
        ui.drawHUD(window, simulation, settings);
        window.display();
    }
    return 0;
}

int main(int argc, char **argv)
{
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd))
    {
        printUsage(argv[0]);
        return 2;
    }

    SimulationSettings settings;
    if (!cmd.settingsFile.empty() && !settings.loadFromFile(cmd.settingsFile))
    {
        std::cerr << "Error: could not load settings from " << cmd.settingsFile << std::endl;
        return 1;
    }
    if (cmd.steps)
        settings.steps = static_cast<int>(*cmd.steps);

    Scenario scenario;
    if (!cmd.scenarioFile.empty())
    {
        if (!scenario.loadFromFile(cmd.scenarioFile, settings))
        {
            std::cerr << "Error: could not load scenario from " << cmd.scenarioFile << std::endl;
            return 1;
        }
    }
    else
    {
        scenario = Scenario::makeEvacuationDemo(settings, DEMO_AGENT_COUNT, settings.seed);
    }

    try
    {
        CrowdSimulation simulation(settings, std::move(scenario));

        if (cmd.headless)
            return runHeadless(simulation, settings.steps);
        return runViewer(simulation, settings, cmd.settingsFile);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

#include "UIManager.h"
#include "CrowdSimulation.h"
#include <sstream>
#include <iomanip>
#include <iostream>
#include <algorithm>

UIManager::UIManager(sf::Font &font) : font_(font) {}

void UIManager::handleInput(const sf::Event::KeyPressed *keyEvent, SimulationSettings &settings)
{
    if (!keyEvent)
        return;

    switch (keyEvent->code)
    {
    case sf::Keyboard::Key::Space:
        paused_ = !paused_;
        std::cout << (paused_ ? "Paused" : "Resumed") << std::endl;
        break;
    case sf::Keyboard::Key::N:
        // single stepping only makes sense while paused
        paused_ = true;
        if (onSingleStep)
            onSingleStep();
        break;
    case sf::Keyboard::Key::R:
        if (onReset)
            onReset();
        break;
    case sf::Keyboard::Key::Up:
        adjustParameter(settings.stepsPerFrame, 1, 1, 100);
        std::cout << "Steps per frame: " << settings.stepsPerFrame << std::endl;
        break;
    case sf::Keyboard::Key::Down:
        adjustParameter(settings.stepsPerFrame, -1, 1, 100);
        std::cout << "Steps per frame: " << settings.stepsPerFrame << std::endl;
        break;
    case sf::Keyboard::Key::T:
        showHud_ = !showHud_;
        break;
    case sf::Keyboard::Key::S:
        if (onSaveSettings)
            onSaveSettings();
        break;
    case sf::Keyboard::Key::Escape:
        if (onQuit)
            onQuit();
        break;

    default:
        break;
    }
}

void UIManager::drawHUD(sf::RenderWindow &window, const CrowdSimulation &simulation,
                        const SimulationSettings &settings)
{
    if (!showHud_)
        return;

    const StepStatistics &stats = simulation.getLastResult().stats;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    // basic info
    oss << "=== Crowd Simulation ===" << "\n";
    oss << "Step: " << simulation.getStepCount() << " | Time: " << simulation.getSimulatedTime() << "s"
        << (paused_ ? " | PAUSED" : "") << "\n";
    oss << "Agents: " << simulation.getAgentCount() << " | Update: " << simulation.getLastUpdateTime() << "ms"
        << " | Steps/frame [Up/Down]: " << settings.stepsPerFrame << "\n";
    oss << "Mean speed: " << stats.meanSpeed << " m/s | Max speed: " << stats.integration.maxSpeed << " m/s\n\n";

    // goal domains
    oss << "=== Regions ===" << "\n";
    oss << "Exit: " << stats.count(Region::Exit)
        << " | Sign: " << stats.count(Region::VisibleSign)
        << " | Memory: " << stats.count(Region::Memory)
        << " | Default: " << stats.count(Region::Default) << "\n";
    oss << "Panicked: " << stats.panickedAgents << " | Reached exit: " << simulation.getEvacuatedCount() << "\n";
    if (stats.integration.nonFiniteAgents > 0)
        oss << "DIVERGED: " << stats.integration.nonFiniteAgents << " agents\n";

    sf::Text text(font_, oss.str(), 14);
    text.setFillColor(hudTextColor_);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.5f);
    text.setPosition({10.0f, 10.0f});

    // draw background
    sf::FloatRect textBounds = text.getLocalBounds();
    drawBackground(window, sf::FloatRect({5, 5}, {textBounds.size.x + 10, textBounds.size.y + 10}));

    window.draw(text);

    drawHelpText(window, textBounds.size.y + 25.0f);
}

void UIManager::drawHelpText(sf::RenderWindow &window, float top)
{
    sf::Text help(font_, "[Space] Pause  [N] Step  [R] Reset  [T] HUD  [S] Save  [Esc] Quit", 12);
    help.setFillColor(hudAccentColor_);
    help.setOutlineColor(sf::Color::Black);
    help.setOutlineThickness(1.0f);
    help.setPosition({10.0f, top});
    window.draw(help);
}

void UIManager::adjustParameter(int &param, int delta, int min, int max)
{
    param = std::clamp(param + delta, min, max);
}

void UIManager::drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds)
{
    sf::RectangleShape background(sf::Vector2f(bounds.size.x, bounds.size.y));
    background.setPosition({bounds.position.x, bounds.position.y});
    background.setFillColor(hudBackgroundColor_);
    background.setOutlineThickness(1.0f);
    background.setOutlineColor(sf::Color(100, 100, 100));
    window.draw(background);
}

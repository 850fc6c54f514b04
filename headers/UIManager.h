#pragma once
#include <SFML/Graphics.hpp>
#include "SimulationSettings.h"
#include <functional>

class CrowdSimulation;

class UIManager
{
public:
    UIManager(sf::Font &font);

    // event handling
    void handleInput(const sf::Event::KeyPressed *keyEvent, SimulationSettings &settings);

    // rendering
    void drawHUD(sf::RenderWindow &window, const CrowdSimulation &simulation, const SimulationSettings &settings);

    // ui state
    bool isPaused() const { return paused_; }
    void setPaused(bool paused) { paused_ = paused; }
    bool isHudVisible() const { return showHud_; }

    // callbacks for simulation control
    std::function<void()> onReset;
    std::function<void()> onSingleStep;
    std::function<void()> onSaveSettings;
    std::function<void()> onQuit;

private:
    sf::Font &font_;
    bool paused_ = false;
    bool showHud_ = true;

    // ui styling
    sf::Color hudBackgroundColor_ = sf::Color(0, 0, 0, 150);
    sf::Color hudTextColor_ = sf::Color::White;
    sf::Color hudAccentColor_ = sf::Color::Yellow;

    // parameter adjustment
    void adjustParameter(int &param, int delta, int min, int max);

    // ui drawing helpers
    void drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds);
    void drawHelpText(sf::RenderWindow &window, float top);
};

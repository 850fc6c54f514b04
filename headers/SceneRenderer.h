#pragma once
#include <SFML/Graphics.hpp>
#include "CrowdSimulation.h"

// draws walls, signs, exits, panic sources and agents of a simulation in world units scaled to pixels
class SceneRenderer
{
public:
    SceneRenderer(float pixelsPerMeter, const sf::Vector2f &offset = sf::Vector2f(20.0f, 20.0f));

    void draw(sf::RenderWindow &window, const CrowdSimulation &simulation);

    void setScale(float pixelsPerMeter) { pixelsPerMeter_ = pixelsPerMeter; }

    static sf::Color regionColor(Region region);

private:
    float pixelsPerMeter_;
    sf::Vector2f offset_;

    sf::Vector2f toScreen(const sf::Vector2f &world) const { return offset_ + world * pixelsPerMeter_; }

    void drawWalls(sf::RenderWindow &window, const Scenario &scenario);
    void drawExits(sf::RenderWindow &window, const Scenario &scenario);
    void drawSigns(sf::RenderWindow &window, const Scenario &scenario, float visionRadius);
    void drawPanicSources(sf::RenderWindow &window, const std::vector<PanicSource> &sources);
    void drawAgents(sf::RenderWindow &window, const CrowdSimulation &simulation);
};

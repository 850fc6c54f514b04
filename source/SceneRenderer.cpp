#include "SceneRenderer.h"
#include "VectorMath.h"
#include <cmath>

namespace
{
    // agent body radius in meters, display only
    constexpr float AGENT_RADIUS = 0.25f;
}

SceneRenderer::SceneRenderer(float pixelsPerMeter, const sf::Vector2f &offset)
    : pixelsPerMeter_(pixelsPerMeter), offset_(offset)
{
}

sf::Color SceneRenderer::regionColor(Region region)
{
    switch (region)
    {
    case Region::Exit:
        return sf::Color(80, 255, 80);
    case Region::VisibleSign:
        return sf::Color(255, 210, 60);
    case Region::Memory:
        return sf::Color(80, 150, 255);
    case Region::Default:
        return sf::Color(220, 220, 220);
    }
    return sf::Color::White;
}

void SceneRenderer::draw(sf::RenderWindow &window, const CrowdSimulation &simulation)
{
    const Scenario &scenario = simulation.getScenario();

    drawExits(window, scenario);
    drawSigns(window, scenario, simulation.getSettings().params.visionRadius);
    drawPanicSources(window, simulation.getPanicSources());
    drawWalls(window, scenario);
    drawAgents(window, simulation);
}

void SceneRenderer::drawWalls(sf::RenderWindow &window, const Scenario &scenario)
{
    sf::VertexArray lines(sf::PrimitiveType::Lines);
    for (const auto &wall : scenario.walls)
    {
        lines.append(sf::Vertex{toScreen(wall.a), sf::Color(200, 200, 200)});
        lines.append(sf::Vertex{toScreen(wall.b), sf::Color(200, 200, 200)});
    }
    window.draw(lines);
}

void SceneRenderer::drawExits(sf::RenderWindow &window, const Scenario &scenario)
{
    for (const auto &exit : scenario.exits)
    {
        float r = exit.radius * pixelsPerMeter_;
        sf::CircleShape domain(r);
        domain.setOrigin({r, r});
        domain.setPosition(toScreen(exit.position));
        domain.setFillColor(sf::Color(40, 160, 40, 40));
        domain.setOutlineColor(sf::Color(80, 255, 80, 160));
        domain.setOutlineThickness(1.0f);
        window.draw(domain);

        sf::CircleShape marker(4.0f);
        marker.setOrigin({4.0f, 4.0f});
        marker.setPosition(toScreen(exit.position));
        marker.setFillColor(sf::Color(80, 255, 80));
        window.draw(marker);
    }
}

void SceneRenderer::drawSigns(sf::RenderWindow &window, const Scenario &scenario, float visionRadius)
{
    // triangle pointing along +x, rotated to the sign's facing
    static sf::ConvexShape arrow(3);
    static bool initialized = false;
    if (!initialized)
    {
        arrow.setPoint(0, {8.0f, 0.0f});
        arrow.setPoint(1, {-5.0f, 5.0f});
        arrow.setPoint(2, {-5.0f, -5.0f});
        arrow.setFillColor(sf::Color(255, 210, 60));
        initialized = true;
    }

    for (const auto &sign : scenario.signs)
    {
        float r = visionRadius * pixelsPerMeter_;
        sf::CircleShape range(r);
        range.setOrigin({r, r});
        range.setPosition(toScreen(sign.position));
        range.setFillColor(sf::Color::Transparent);
        range.setOutlineColor(sf::Color(255, 210, 60, 90));
        range.setOutlineThickness(1.0f);
        window.draw(range);

        arrow.setPosition(toScreen(sign.position));
        arrow.setRotation(sf::radians(std::atan2(sign.direction.y, sign.direction.x)));
        window.draw(arrow);
    }
}

void SceneRenderer::drawPanicSources(sf::RenderWindow &window, const std::vector<PanicSource> &sources)
{
    for (const auto &source : sources)
    {
        sf::CircleShape ring(10.0f);
        ring.setOrigin({10.0f, 10.0f});
        ring.setPosition(toScreen(source.position));
        ring.setFillColor(sf::Color::Transparent);
        ring.setOutlineColor(sf::Color(255, 60, 60));
        ring.setOutlineThickness(3.0f);
        window.draw(ring);
    }
}

void SceneRenderer::drawAgents(sf::RenderWindow &window, const CrowdSimulation &simulation)
{
    const auto &agents = simulation.getAgents();
    const auto &goals = simulation.getLastResult().goals;

    // reusing shapes to avoid allocation overhead
    float r = AGENT_RADIUS * pixelsPerMeter_;
    sf::CircleShape body(r);
    body.setOrigin({r, r});
    body.setOutlineThickness(1.0f);
    sf::VertexArray ticks(sf::PrimitiveType::Lines);

    for (size_t i = 0; i < agents.size(); ++i)
    {
        const Agent &agent = agents[i];
        if (!vecmath::isFinite(agent.position))
            continue;

        Region region = i < goals.size() ? goals[i].region : Region::Default;
        sf::Vector2f p = toScreen(agent.position);

        body.setPosition(p);
        body.setFillColor(regionColor(region));
        body.setOutlineColor(agent.panicked ? sf::Color(255, 60, 60) : sf::Color(40, 40, 40));
        window.draw(body);

        // velocity tick, one meter per m/s
        if (vecmath::isFinite(agent.velocity))
        {
            ticks.append(sf::Vertex{p, sf::Color::White});
            ticks.append(sf::Vertex{p + agent.velocity * pixelsPerMeter_, sf::Color::White});
        }
    }
    window.draw(ticks);
}

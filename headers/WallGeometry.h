#pragma once
#include <SFML/System/Vector2.hpp>
#include <limits>
#include <vector>
#include "Scenario.h"

// result of a nearest wall query
struct WallProximity
{
    float distance = std::numeric_limits<float>::infinity();
    sf::Vector2f normal = sf::Vector2f(0.0f, 0.0f); // unit, points from the wall toward the query point
    bool found = false;
};

/**
 * geometry collaborator seen by the force engine
 * the engine never stores or mutates walls, it only asks these two questions
 */
class WallGeometry
{
public:
    virtual ~WallGeometry() = default;

    virtual WallProximity nearestWall(const sf::Vector2f &position) const = 0;

    // true when no wall crosses the open segment from a to b
    virtual bool lineOfSight(const sf::Vector2f &a, const sf::Vector2f &b) const = 0;
};

// walls as a flat list of segments
class SegmentWallGeometry : public WallGeometry
{
public:
    // throws std::invalid_argument on zero length or non-finite segments
    explicit SegmentWallGeometry(std::vector<WallSegment> walls);

    WallProximity nearestWall(const sf::Vector2f &position) const override;
    bool lineOfSight(const sf::Vector2f &a, const sf::Vector2f &b) const override;

    const std::vector<WallSegment> &getWalls() const { return walls_; }
    size_t getWallCount() const { return walls_.size(); }

    // closest point on segment ab to p
    static sf::Vector2f closestPoint(const WallSegment &wall, const sf::Vector2f &p);

private:
    std::vector<WallSegment> walls_;
};

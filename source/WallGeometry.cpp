#include "WallGeometry.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace
{
    // walls shorter than this are degenerate
    constexpr float MIN_WALL_LENGTH = 1.0e-6f;

    // ignores crossings this close to either end of the sight line (agent on a wall, sign mounted on a wall)
    constexpr float SIGHT_END_TOLERANCE = 1.0e-4f;

    float cross(const sf::Vector2f &a, const sf::Vector2f &b)
    {
        return a.x * b.y - a.y * b.x;
    }
}

SegmentWallGeometry::SegmentWallGeometry(std::vector<WallSegment> walls)
    : walls_(std::move(walls))
{
    for (size_t i = 0; i < walls_.size(); ++i)
    {
        const auto &w = walls_[i];
        if (!std::isfinite(w.a.x) || !std::isfinite(w.a.y) || !std::isfinite(w.b.x) || !std::isfinite(w.b.y))
        {
            throw std::invalid_argument("wall " + std::to_string(i) + " has non-finite coordinates");
        }
        if (w.length() <= MIN_WALL_LENGTH)
        {
            throw std::invalid_argument("wall " + std::to_string(i) + " has zero length");
        }
    }
}

sf::Vector2f SegmentWallGeometry::closestPoint(const WallSegment &wall, const sf::Vector2f &p)
{
    sf::Vector2f ab = wall.b - wall.a;
    float lenSq = ab.x * ab.x + ab.y * ab.y;
    if (lenSq <= 0.0f)
        return wall.a;

    float t = std::clamp(((p - wall.a).x * ab.x + (p - wall.a).y * ab.y) / lenSq, 0.0f, 1.0f);
    return wall.a + ab * t;
}

WallProximity SegmentWallGeometry::nearestWall(const sf::Vector2f &position) const
{
    WallProximity result;

    // linear scan, scenes have tens of walls not thousands
    const WallSegment *nearest = nullptr;
    sf::Vector2f nearestPoint;
    for (const auto &wall : walls_)
    {
        sf::Vector2f q = closestPoint(wall, position);
        float dist = (position - q).length();
        if (dist < result.distance)
        {
            result.distance = dist;
            nearest = &wall;
            nearestPoint = q;
        }
    }

    if (!nearest)
        return result;

    result.found = true;
    sf::Vector2f away = position - nearestPoint;
    float len = away.length();
    if (len > 0.0f)
    {
        result.normal = away / len;
    }
    else
    {
        // standing exactly on the wall: use its left hand perpendicular
        sf::Vector2f along = (nearest->b - nearest->a) / nearest->length();
        result.normal = sf::Vector2f(-along.y, along.x);
    }
    return result;
}

bool SegmentWallGeometry::lineOfSight(const sf::Vector2f &a, const sf::Vector2f &b) const
{
    const sf::Vector2f r = b - a;
    for (const auto &wall : walls_)
    {
        const sf::Vector2f s = wall.b - wall.a;
        float denom = cross(r, s);
        if (std::abs(denom) < 1.0e-12f)
            continue; // parallel, grazing walls do not block

        const sf::Vector2f qp = wall.a - a;
        float t = cross(qp, s) / denom; // along the sight line
        float u = cross(qp, r) / denom; // along the wall

        if (t > SIGHT_END_TOLERANCE && t < 1.0f - SIGHT_END_TOLERANCE && u >= 0.0f && u <= 1.0f)
            return false;
    }
    return true;
}

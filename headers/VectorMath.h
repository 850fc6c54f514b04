#pragma once
#include <SFML/System/Vector2.hpp>
#include <algorithm>
#include <cmath>

// small helpers on top of sf::Vector2f
// SFML asserts on normalizing a zero vector so these guard it
namespace vecmath
{
    constexpr float PI = 3.14159265358979323846f;

    inline float length(const sf::Vector2f &v)
    {
        return v.length();
    }

    inline float dot(const sf::Vector2f &a, const sf::Vector2f &b)
    {
        return a.dot(b);
    }

    // unit vector along v, or the fallback when v is (nearly) zero
    inline sf::Vector2f normalizedOr(const sf::Vector2f &v, const sf::Vector2f &fallback, float minLength = 0.0f)
    {
        float len = v.length();
        if (!(len > minLength))
            return fallback;
        return v / len;
    }

    inline sf::Vector2f normalizedOrZero(const sf::Vector2f &v)
    {
        return normalizedOr(v, sf::Vector2f(0.0f, 0.0f));
    }

    // unsigned angle in [0, pi] between a and b, 0 if either is zero
    inline float angleBetween(const sf::Vector2f &a, const sf::Vector2f &b)
    {
        float la = a.length();
        float lb = b.length();
        if (la <= 0.0f || lb <= 0.0f)
            return 0.0f;
        float c = std::clamp(a.dot(b) / (la * lb), -1.0f, 1.0f);
        return std::acos(c);
    }

    inline bool isFinite(const sf::Vector2f &v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y);
    }
}

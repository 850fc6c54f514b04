#pragma once
#include <SFML/System/Vector2.hpp>
#include <vector>
#include <unordered_map>
#include <cstdint>
#include <cmath>
#include <algorithm>
#include <utility>

struct Agent;

/**
 * spatial hash grid for neighbor lookup
 * replaces the O(n^2) pair scan with a scan of the cells overlapping the query radius
 * cells are unbounded (hashed) so agents may wander anywhere in the plane
 */
class SpatialGrid
{
public:
    static constexpr size_t ESTIMATED_AGENTS_PER_CELL = 16;

    struct Cell
    {
        std::vector<size_t> agentIndices;

        Cell()
        {
            agentIndices.reserve(ESTIMATED_AGENTS_PER_CELL);
        }

        void clear()
        {
            agentIndices.clear();
        }

        void addAgent(size_t agentIndex)
        {
            agentIndices.push_back(agentIndex);
        }
    };

private:
    std::unordered_map<uint64_t, Cell> cells_;
    float cellSize_;
    float invCellSize_; // precomputed for faster division

    // combines two large primes, negative coordinates wrap into the upper range
    static constexpr uint64_t hashPosition(int x, int y)
    {
        return ((static_cast<uint64_t>(static_cast<uint32_t>(x)) * 92837111ULL) ^
                (static_cast<uint64_t>(static_cast<uint32_t>(y)) * 689287499ULL)) *
               15485863ULL;
    }

    // clamped so far away (diverging) agents still land in a valid cell
    inline std::pair<int, int> worldToGrid(float x, float y) const
    {
        constexpr float LIMIT = 1.0e9f;
        return {
            static_cast<int>(std::floor(std::clamp(x * invCellSize_, -LIMIT, LIMIT))),
            static_cast<int>(std::floor(std::clamp(y * invCellSize_, -LIMIT, LIMIT)))};
    }

public:
    // cell size should be the interaction radius
    explicit SpatialGrid(float cellSize);
    ~SpatialGrid() = default;

    void clear();
    void insertAgent(size_t agentIndex, float x, float y);
    void rebuild(const std::vector<Agent> &agents);

    // every agent in the cells overlapping the circle, a superset of the agents inside it
    std::vector<size_t> getNeighbors(float x, float y, float radius) const;
    void getNeighbors(float x, float y, float radius, std::vector<size_t> &out) const;

    float getCellSize() const { return cellSize_; }
    size_t getCellCount() const { return cells_.size(); }
    size_t getTotalAgentEntries() const;

    void reserve(size_t expectedAgents);
};

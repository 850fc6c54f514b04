#include "SpatialGrid.h"
#include "Agent.h"
#include <algorithm>
#include <stdexcept>

SpatialGrid::SpatialGrid(float cellSize)
    : cellSize_(cellSize), invCellSize_(0.0f)
{
    if (!(cellSize > 0.0f) || !std::isfinite(cellSize))
    {
        throw std::invalid_argument("spatial grid cell size must be positive");
    }
    invCellSize_ = 1.0f / cellSize_;
}

// cells left empty by the previous rebuild are dropped, so the map only holds
// cells occupied in the last two steps however far the crowd travels
void SpatialGrid::clear()
{
    for (auto it = cells_.begin(); it != cells_.end();)
    {
        if (it->second.agentIndices.empty())
        {
            it = cells_.erase(it);
        }
        else
        {
            it->second.clear();
            ++it;
        }
    }
}

void SpatialGrid::insertAgent(size_t agentIndex, float x, float y)
{
    auto [gridX, gridY] = worldToGrid(x, y);
    uint64_t hash = hashPosition(gridX, gridY);

    cells_[hash].addAgent(agentIndex);
}

void SpatialGrid::rebuild(const std::vector<Agent> &agents)
{
    clear();

    for (size_t i = 0; i < agents.size(); ++i)
    {
        // diverged agents are left out, they cannot be anyone's neighbor
        if (!std::isfinite(agents[i].position.x) || !std::isfinite(agents[i].position.y))
            continue;
        insertAgent(i, agents[i].position.x, agents[i].position.y);
    }
}

std::vector<size_t> SpatialGrid::getNeighbors(float x, float y, float radius) const
{
    std::vector<size_t> neighbors;
    neighbors.reserve(64);
    getNeighbors(x, y, radius, neighbors);
    return neighbors;
}

void SpatialGrid::getNeighbors(float x, float y, float radius, std::vector<size_t> &out) const
{
    out.clear();
    if (!std::isfinite(x) || !std::isfinite(y))
        return;

    int radiusInCells = static_cast<int>(std::ceil(radius * invCellSize_));
    auto [centerX, centerY] = worldToGrid(x, y);

    for (int dx = -radiusInCells; dx <= radiusInCells; ++dx)
    {
        for (int dy = -radiusInCells; dy <= radiusInCells; ++dy)
        {
            uint64_t hash = hashPosition(centerX + dx, centerY + dy);
            auto it = cells_.find(hash);

            if (it != cells_.end())
            {
                const auto &cell = it->second;
                out.insert(out.end(), cell.agentIndices.begin(), cell.agentIndices.end());
            }
        }
    }

    // hash collisions can map two visited cells onto one bucket
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
}

size_t SpatialGrid::getTotalAgentEntries() const
{
    size_t total = 0;
    for (const auto &[key, cell] : cells_)
    {
        total += cell.agentIndices.size();
    }
    return total;
}

void SpatialGrid::reserve(size_t expectedAgents)
{
    size_t expectedCells = expectedAgents / ESTIMATED_AGENTS_PER_CELL + 1;
    cells_.reserve(expectedCells);
}

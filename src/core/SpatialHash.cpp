#include "SpatialHash.h"
#include "WorldSettings.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace BouncePit {

SpatialHash::SpatialHash(double cellSize) : cell_size_(cellSize)
{
    if (!(cellSize > 0.0) || !std::isfinite(cellSize)) {
        throw std::invalid_argument("SpatialHash: cell size must be positive and finite");
    }
}

void SpatialHash::clear()
{
    lookup_.clear();
    cells_.clear();
}

void SpatialHash::build(const std::vector<Body>& bodies)
{
    clear();
    lookup_.reserve(bodies.size() * 2);
    for (uint32_t i = 0; i < bodies.size(); ++i) {
        insert(i, bodies[i]);
    }
}

int32_t SpatialHash::toCellCoordinate(double value) const
{
    const double cell = std::floor(value / cell_size_);
    return static_cast<int32_t>(std::clamp(cell, -MAX_CELL_COORDINATE, MAX_CELL_COORDINATE));
}

CellKey SpatialHash::cellFor(const Vector2d& point) const
{
    return CellKey{ toCellCoordinate(point.x), toCellCoordinate(point.y) };
}

std::pair<CellKey, CellKey> SpatialHash::cellRangeFor(const Body& body) const
{
    const CellKey min{ toCellCoordinate(body.position.x - body.radius),
                       toCellCoordinate(body.position.y - body.radius) };
    const CellKey max{ toCellCoordinate(body.position.x + body.radius),
                       toCellCoordinate(body.position.y + body.radius) };
    return { min, max };
}

void SpatialHash::insert(uint32_t bodyIndex, const Body& body)
{
    const auto [min, max] = cellRangeFor(body);
    for (int32_t cx = min.x; cx <= max.x; ++cx) {
        for (int32_t cy = min.y; cy <= max.y; ++cy) {
            const CellKey key{ cx, cy };
            auto [it, inserted] = lookup_.try_emplace(key, static_cast<uint32_t>(cells_.size()));
            if (inserted) {
                cells_.emplace_back(key, std::vector<uint32_t>{});
            }
            cells_[it->second].second.push_back(bodyIndex);
        }
    }
}

const std::vector<uint32_t>* SpatialHash::bodiesInCell(const CellKey& key) const
{
    auto it = lookup_.find(key);
    if (it == lookup_.end()) {
        return nullptr;
    }
    return &cells_[it->second].second;
}

size_t SpatialHash::entryCount() const
{
    size_t total = 0;
    for (const auto& cell : cells_) {
        total += cell.second.size();
    }
    return total;
}

std::optional<double> SpatialHash::computeTunedCellSize(
    const std::vector<Body>& bodies, const WorldSettings& settings)
{
    if (bodies.empty()) {
        return std::nullopt;
    }

    double radiusSum = 0.0;
    for (const Body& body : bodies) {
        radiusSum += body.radius;
    }
    const double averageRadius = radiusSum / static_cast<double>(bodies.size());

    return std::clamp(
        averageRadius * settings.cell_size_radius_factor,
        settings.min_cell_size,
        settings.max_cell_size);
}

} // namespace BouncePit

#pragma once

#include "Body.h"
#include "Vector2.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace BouncePit {

struct WorldSettings;

/**
 * @brief Integer coordinate of one square broadphase cell.
 */
struct CellKey {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const CellKey& other) const { return x == other.x && y == other.y; }
};

} // namespace BouncePit

namespace std {
template <>
struct hash<BouncePit::CellKey> {
    std::size_t operator()(const BouncePit::CellKey& key) const noexcept
    {
        const uint64_t packed =
            (static_cast<uint64_t>(static_cast<uint32_t>(key.x)) << 32)
            | static_cast<uint32_t>(key.y);
        return std::hash<uint64_t>{}(packed);
    }
};
} // namespace std

namespace BouncePit {

/**
 * SpatialHash: uniform-grid broadphase rebuilt from scratch every step.
 *
 * Each body is inserted into every cell its bounding square
 * [x-r, x+r] x [y-r, y+r] touches, so a body straddling a cell edge is listed
 * in several cells and pairs across the edge are still tested. Cells are
 * visited in first-insertion order, which keeps resolution deterministic.
 *
 * Usage:
 *   SpatialHash hash(settings.cell_size);
 *   hash.build(bodies);
 *   hash.forEachCell([&](const CellKey& key, const std::vector<uint32_t>& ids) { ... });
 */
class SpatialHash {
public:
    explicit SpatialHash(double cellSize);

    // Clears the map and inserts every body by its dense index.
    void build(const std::vector<Body>& bodies);

    void insert(uint32_t bodyIndex, const Body& body);
    void clear();

    CellKey cellFor(const Vector2d& point) const;

    // Inclusive cell range covered by the body's bounding square.
    std::pair<CellKey, CellKey> cellRangeFor(const Body& body) const;

    // nullptr when no body touches the cell.
    const std::vector<uint32_t>* bodiesInCell(const CellKey& key) const;

    template <typename Fn>
    void forEachCell(Fn&& fn) const
    {
        for (const auto& [key, ids] : cells_) {
            fn(key, ids);
        }
    }

    size_t cellCount() const { return cells_.size(); }
    double getCellSize() const { return cell_size_; }

    // Total entries across all cells; exceeds the body count when bodies straddle.
    size_t entryCount() const;

    /**
     * @brief Cell size for the current population.
     *
     * average radius * cell_size_radius_factor, clamped to
     * [min_cell_size, max_cell_size]. Empty world: std::nullopt (keep current).
     */
    static std::optional<double> computeTunedCellSize(
        const std::vector<Body>& bodies, const WorldSettings& settings);

private:
    // Cell coordinates are clamped so far-away bodies cannot overflow int32.
    static constexpr double MAX_CELL_COORDINATE = 1.0e9;

    int32_t toCellCoordinate(double value) const;

    double cell_size_;
    std::unordered_map<CellKey, uint32_t> lookup_; // Key -> position in cells_.
    std::vector<std::pair<CellKey, std::vector<uint32_t>>> cells_;
};

} // namespace BouncePit

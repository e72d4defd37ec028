#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ag {

struct Point2D {
    double x = 0.0;
    double y = 0.0;

    nlohmann::json to_json() const { return nlohmann::json::array({x, y}); }
};

struct Point3D {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    nlohmann::json to_json() const { return nlohmann::json::array({x, y, z}); }
};

enum class LayoutType {
    SPRING,     // projection of the 3D circular layout
    CIRCULAR,
    GRID
};

std::string layout_type_to_string(LayoutType type);

/**
 * @throws std::invalid_argument for anything but "spring", "circular", "grid"
 */
LayoutType layout_type_from_string(const std::string& value);

// ============================================================================
// Deterministic layouts
//
// Coordinates depend only on the position of an id in the input list, never
// on graph content, so repeated calls produce identical output.
// ============================================================================

/**
 * @brief Position i at (cos(2*pi*i/n), sin(2*pi*i/n))
 */
std::vector<Point2D> circular_layout_2d(size_t n);

/**
 * @brief Circular layout in the z = 0 plane
 */
std::vector<Point3D> circular_layout_3d(size_t n);

/**
 * @brief Position i at (i mod ceil(sqrt(n)), i div ceil(sqrt(n)))
 */
std::vector<Point2D> grid_layout(size_t n);

/**
 * @brief Keyed variants, id -> coordinates
 */
std::map<std::string, Point2D> create_circular_layout(const std::vector<std::string>& asset_ids);
std::map<std::string, Point2D> create_grid_layout(const std::vector<std::string>& asset_ids);

/**
 * @brief 2D "spring" layout: the first two coordinates of precomputed 3D positions
 *
 * Ids missing from positions_3d are omitted from the result. No force
 * simulation is run.
 */
std::map<std::string, Point2D> create_spring_layout_2d(
    const std::map<std::string, Point3D>& positions_3d,
    const std::vector<std::string>& asset_ids
);

} // namespace ag

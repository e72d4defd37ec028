#pragma once

#include "index/relationship_index.hpp"
#include "render/layout_engine.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ag {

/// Fraction of the source->target segment at which direction markers sit
constexpr double DIRECTION_MARKER_T = 0.7;

/**
 * @brief Rendering hint marking the direction of a one-way edge
 */
struct DirectionMarker {
    std::string source_id;
    std::string target_id;
    std::string relationship_type;
    Point3D position;
    std::string hover_text;

    nlohmann::json to_json() const;
};

/**
 * @brief Place a marker at source + 0.7 * (target - source) for every indexed
 *        edge that has no reverse edge of the same type
 *
 * @param index     Edge index built over the same id ordering as positions
 * @param positions One coordinate per id in that ordering
 * @throws StructuralValidationError when positions and the index disagree in
 *         size or contain non-finite values
 */
std::vector<DirectionMarker> compute_directional_markers(
    const RelationshipIndex& index,
    const std::vector<Point3D>& positions
);

/**
 * @brief Marker point for a single segment
 */
Point3D marker_position(const Point3D& source, const Point3D& target, double t = DIRECTION_MARKER_T);

} // namespace ag

#include "render/directional_overlay.hpp"
#include "core/errors.hpp"
#include <cmath>

namespace ag {

nlohmann::json DirectionMarker::to_json() const {
    nlohmann::json j;
    j["source_id"] = source_id;
    j["target_id"] = target_id;
    j["relationship_type"] = relationship_type;
    j["position"] = position.to_json();
    j["hover_text"] = hover_text;
    return j;
}

Point3D marker_position(const Point3D& source, const Point3D& target, double t) {
    return {
        source.x + t * (target.x - source.x),
        source.y + t * (target.y - source.y),
        source.z + t * (target.z - source.z)
    };
}

std::vector<DirectionMarker> compute_directional_markers(
    const RelationshipIndex& index,
    const std::vector<Point3D>& positions
) {
    if (positions.size() != index.asset_positions.size()) {
        throw StructuralValidationError(
            "positions length (" + std::to_string(positions.size()) +
            ") must match asset_ids length (" + std::to_string(index.asset_positions.size()) + ")");
    }
    for (const auto& p : positions) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) {
            throw StructuralValidationError("Invalid positions: values must be finite numbers");
        }
    }

    std::vector<DirectionMarker> markers;
    for (const auto& entry : index.entries()) {
        if (index.has_reverse(entry.key)) {
            continue;
        }
        const auto& src = positions[index.position_of(entry.key.source_id)];
        const auto& tgt = positions[index.position_of(entry.key.target_id)];

        DirectionMarker marker;
        marker.source_id = entry.key.source_id;
        marker.target_id = entry.key.target_id;
        marker.relationship_type = entry.key.relationship_type;
        marker.position = marker_position(src, tgt);
        marker.hover_text = "Direction: " + entry.key.source_id + " → " +
                            entry.key.target_id + "<br>Type: " + entry.key.relationship_type;
        markers.push_back(std::move(marker));
    }
    return markers;
}

} // namespace ag

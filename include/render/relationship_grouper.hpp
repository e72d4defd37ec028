#pragma once

#include "index/relationship_index.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ag {

/// relationship type -> shown; types absent from the map are shown
using RelationshipFilters = std::map<std::string, bool>;

struct GroupedRelationship {
    std::string source_id;
    std::string target_id;
    double strength = 0.0;

    nlohmann::json to_json() const {
        return {{"source_id", source_id}, {"target_id", target_id}, {"strength", strength}};
    }
};

/**
 * @brief All edges of one relationship type and one directionality
 */
struct RelationshipGroup {
    std::string relationship_type;
    bool bidirectional = false;
    std::vector<GroupedRelationship> relationships;

    nlohmann::json to_json() const;
};

/**
 * @brief Group indexed edges by (type, bidirectional)
 *
 * An edge is bidirectional when the reverse (target, source, type) entry is
 * also indexed. Each bidirectional pair is emitted once, from whichever
 * direction the index reaches first; one-directional edges are never merged.
 * Groups appear in the order their first edge is met, records keep index
 * order, and empty groups are dropped.
 */
std::vector<RelationshipGroup> group_relationships(
    const RelationshipIndex& index,
    const RelationshipFilters& filters = {}
);

/**
 * @brief True when filters explicitly hide the given type
 */
bool is_filtered_out(const RelationshipFilters& filters, const std::string& relationship_type);

} // namespace ag

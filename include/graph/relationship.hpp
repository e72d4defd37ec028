#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ag {

/**
 * @brief One directed, typed, weighted edge stored under its source id
 *
 * A "bidirectional" relationship is simply two of these, one under each
 * endpoint, with equal type and strength.
 */
struct Relationship {
    std::string target_id;
    std::string relationship_type;
    double strength = 0.0;

    bool operator==(const Relationship& other) const {
        return target_id == other.target_id &&
               relationship_type == other.relationship_type &&
               strength == other.strength;
    }
    bool operator!=(const Relationship& other) const { return !(*this == other); }

    nlohmann::json to_json() const {
        return {
            {"target", target_id},
            {"relationship_type", relationship_type},
            {"strength", strength}
        };
    }
};

/// source id -> outgoing edges in insertion order
using RelationshipMap = std::map<std::string, std::vector<Relationship>>;

} // namespace ag

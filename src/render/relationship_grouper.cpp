#include "render/relationship_grouper.hpp"
#include <unordered_set>
#include <utility>

namespace ag {

nlohmann::json RelationshipGroup::to_json() const {
    nlohmann::json j;
    j["relationship_type"] = relationship_type;
    j["bidirectional"] = bidirectional;
    nlohmann::json rels = nlohmann::json::array();
    for (const auto& rel : relationships) {
        rels.push_back(rel.to_json());
    }
    j["relationships"] = rels;
    return j;
}

bool is_filtered_out(const RelationshipFilters& filters, const std::string& relationship_type) {
    auto it = filters.find(relationship_type);
    return it != filters.end() && !it->second;
}

std::vector<RelationshipGroup> group_relationships(
    const RelationshipIndex& index,
    const RelationshipFilters& filters
) {
    std::vector<RelationshipGroup> groups;
    std::map<std::pair<std::string, bool>, size_t> group_positions;
    std::unordered_set<EdgeKey, EdgeKeyHash> processed_pairs;

    for (const auto& entry : index.entries()) {
        const EdgeKey& key = entry.key;
        if (is_filtered_out(filters, key.relationship_type)) {
            continue;
        }

        bool is_bidirectional = index.has_reverse(key);
        if (is_bidirectional) {
            // insert() reports false when the canonical pair was already emitted
            if (!processed_pairs.insert(key.canonical()).second) {
                continue;
            }
        }

        auto group_key = std::make_pair(key.relationship_type, is_bidirectional);
        auto it = group_positions.find(group_key);
        if (it == group_positions.end()) {
            it = group_positions.emplace(group_key, groups.size()).first;
            groups.push_back({key.relationship_type, is_bidirectional, {}});
        }
        groups[it->second].relationships.push_back({key.source_id, key.target_id, entry.strength});
    }

    return groups;
}

} // namespace ag

#include "graph/asset_graph.hpp"
#include "core/errors.hpp"
#include "index/relationship_index.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace ag {

std::string skip_reason_to_string(SkipReason reason) {
    switch (reason) {
        case SkipReason::UNKNOWN_EVENT_SOURCE: return "unknown_event_source";
        case SkipReason::UNKNOWN_EVENT_TARGET: return "unknown_event_target";
        case SkipReason::DUPLICATE_RELATIONSHIP: return "duplicate_relationship";
    }
    return "duplicate_relationship";
}

// ==========================================
// VisualizationData Implementation
// ==========================================

void VisualizationData::validate() const {
    const size_t n = asset_ids.size();
    if (positions.size() != n || colors.size() != n || hover_texts.size() != n) {
        throw StructuralValidationError(
            "positions, asset_ids, colors and hover_texts must have equal length (" +
            std::to_string(positions.size()) + ", " + std::to_string(n) + ", " +
            std::to_string(colors.size()) + ", " + std::to_string(hover_texts.size()) + ")");
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < n; ++i) {
        if (asset_ids[i].empty()) {
            throw StructuralValidationError("asset_ids must contain non-empty strings");
        }
        if (!seen.insert(asset_ids[i]).second) {
            throw StructuralValidationError("Duplicate asset_ids detected: " + asset_ids[i]);
        }
        if (colors[i].empty()) {
            throw StructuralValidationError("colors must contain non-empty strings");
        }
        if (hover_texts[i].empty()) {
            throw StructuralValidationError("hover_texts must contain non-empty strings");
        }
        const auto& p = positions[i];
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) {
            throw StructuralValidationError("Invalid positions: values must be finite numbers");
        }
    }
}

nlohmann::json VisualizationData::to_json() const {
    nlohmann::json j;
    nlohmann::json pos = nlohmann::json::array();
    for (const auto& p : positions) {
        pos.push_back(p.to_json());
    }
    j["positions"] = pos;
    j["asset_ids"] = asset_ids;
    j["colors"] = colors;
    j["hover"] = hover_texts;
    j["placeholder"] = placeholder;

    nlohmann::json groups_json = nlohmann::json::array();
    for (const auto& group : groups) {
        groups_json.push_back(group.to_json());
    }
    j["relationship_groups"] = groups_json;

    nlohmann::json markers_json = nlohmann::json::array();
    for (const auto& marker : direction_markers) {
        markers_json.push_back(marker.to_json());
    }
    j["direction_markers"] = markers_json;
    return j;
}

// ==========================================
// AssetGraph Implementation
// ==========================================

AssetGraph::AssetGraph() : rules_(default_rules()) {}

void AssetGraph::add_asset(const Asset& asset) {
    assets_.insert_or_assign(asset.id, asset);
}

void AssetGraph::add_regulatory_event(const RegulatoryEvent& event) {
    regulatory_events_.push_back(event);
}

const Asset* AssetGraph::get_asset(const std::string& asset_id) const {
    auto it = assets_.find(asset_id);
    return it != assets_.end() ? &it->second : nullptr;
}

bool AssetGraph::has_asset(const std::string& asset_id) const {
    return assets_.count(asset_id) > 0;
}

std::vector<Relationship> AssetGraph::get_relationships(const std::string& source_id) const {
    auto it = relationships_.find(source_id);
    if (it == relationships_.end()) {
        return {};
    }
    return it->second;
}

size_t AssetGraph::num_relationships() const {
    size_t count = 0;
    for (const auto& [source_id, rels] : relationships_) {
        count += rels.size();
    }
    return count;
}

void AssetGraph::add_rule(RulePtr rule) {
    if (!rule) {
        throw std::invalid_argument("Relationship rule must not be null");
    }
    rules_.push_back(std::move(rule));
}

void AssetGraph::clear() {
    assets_.clear();
    relationships_.clear();
    regulatory_events_.clear();
}

// ==========================================
// Relationship Inference
// ==========================================

void AssetGraph::build_relationships() {
    relationships_.clear();

    // std::map iterates in ascending id order
    std::vector<const Asset*> ordered;
    ordered.reserve(assets_.size());
    for (const auto& [id, asset] : assets_) {
        ordered.push_back(&asset);
    }

    for (size_t i = 0; i < ordered.size(); ++i) {
        for (size_t j = i + 1; j < ordered.size(); ++j) {
            for (const auto& rule : rules_) {
                auto inferred = rule->evaluate(*ordered[i], *ordered[j]);
                if (!inferred) {
                    continue;
                }
                add_relationship(
                    inferred->source_id,
                    inferred->target_id,
                    inferred->relationship_type,
                    inferred->strength,
                    inferred->bidirectional
                );
            }
        }
    }

    apply_event_impacts();
}

void AssetGraph::apply_event_impacts() {
    for (const auto& event : regulatory_events_) {
        if (!has_asset(event.asset_id)) {
            report_skip(SkipReason::UNKNOWN_EVENT_SOURCE, event.asset_id, "", EVENT_IMPACT_TYPE, event.id);
            continue;
        }
        const double strength = std::fabs(event.impact_score);
        for (const auto& target_id : event.related_assets) {
            if (!has_asset(target_id)) {
                report_skip(SkipReason::UNKNOWN_EVENT_TARGET, event.asset_id, target_id,
                            EVENT_IMPACT_TYPE, event.id);
                continue;
            }
            if (!append_relationship(event.asset_id, target_id, EVENT_IMPACT_TYPE, strength)) {
                report_skip(SkipReason::DUPLICATE_RELATIONSHIP, event.asset_id, target_id,
                            EVENT_IMPACT_TYPE, event.id);
            }
        }
    }
}

void AssetGraph::add_relationship(
    const std::string& source_id,
    const std::string& target_id,
    const std::string& relationship_type,
    double strength,
    bool bidirectional
) {
    if (!append_relationship(source_id, target_id, relationship_type, strength)) {
        report_skip(SkipReason::DUPLICATE_RELATIONSHIP, source_id, target_id, relationship_type);
    }
    if (bidirectional) {
        if (!append_relationship(target_id, source_id, relationship_type, strength)) {
            report_skip(SkipReason::DUPLICATE_RELATIONSHIP, target_id, source_id, relationship_type);
        }
    }
}

bool AssetGraph::append_relationship(
    const std::string& source_id,
    const std::string& target_id,
    const std::string& relationship_type,
    double strength
) {
    auto& rels = relationships_[source_id];
    auto existing = std::find_if(rels.begin(), rels.end(), [&](const Relationship& rel) {
        return rel.target_id == target_id && rel.relationship_type == relationship_type;
    });
    if (existing != rels.end()) {
        return false;
    }
    rels.push_back({target_id, relationship_type, strength});
    return true;
}

void AssetGraph::report_skip(SkipReason reason,
                             const std::string& source_id,
                             const std::string& target_id,
                             const std::string& relationship_type,
                             const std::string& event_id) const {
    if (!skip_observer_) {
        return;
    }
    skip_observer_(SkippedRelationship{reason, source_id, target_id, relationship_type, event_id});
}

std::set<std::string> AssetGraph::collect_participating_asset_ids() const {
    std::set<std::string> ids;
    for (const auto& [id, asset] : assets_) {
        ids.insert(id);
    }
    for (const auto& [source_id, rels] : relationships_) {
        for (const auto& rel : rels) {
            ids.insert(rel.target_id);
        }
    }
    return ids;
}

// ==========================================
// Visualization
// ==========================================

VisualizationData AssetGraph::visualization_data(
    const std::vector<std::string>& id_order,
    const RelationshipFilters& filters
) const {
    VisualizationData data;

    if (id_order.empty()) {
        auto ids = collect_participating_asset_ids();
        data.asset_ids.assign(ids.begin(), ids.end());
    } else {
        data.asset_ids = id_order;
    }

    if (data.asset_ids.empty()) {
        data.positions.push_back({0.0, 0.0, 0.0});
        data.asset_ids.push_back(PLACEHOLDER_ID);
        data.colors.push_back(PLACEHOLDER_COLOR);
        data.hover_texts.push_back(std::string("Asset ") + PLACEHOLDER_ID);
        data.placeholder = true;
        return data;
    }

    data.positions = circular_layout_3d(data.asset_ids.size());
    data.colors.assign(data.asset_ids.size(), NODE_COLOR);
    data.hover_texts.reserve(data.asset_ids.size());
    for (const auto& id : data.asset_ids) {
        data.hover_texts.push_back("Asset: " + id);
    }

    RelationshipIndex index;
    index.build(relationships_, data.asset_ids);
    data.groups = group_relationships(index, filters);
    data.direction_markers = compute_directional_markers(index, data.positions);
    return data;
}

} // namespace ag

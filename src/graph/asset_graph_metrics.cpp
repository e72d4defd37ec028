#include "graph/asset_graph.hpp"
#include <algorithm>

namespace ag {

namespace {

constexpr double EVENT_SATURATION_K = 10.0;
constexpr double STRENGTH_WEIGHT = 0.7;
constexpr double EVENT_WEIGHT = 0.3;

}  // namespace

nlohmann::json NetworkMetrics::to_json() const {
    nlohmann::json j;
    j["total_assets"] = total_assets;
    j["total_relationships"] = total_relationships;
    j["average_relationship_strength"] = average_relationship_strength;
    j["relationship_density"] = relationship_density;
    j["relationship_distribution"] = relationship_distribution;
    j["asset_class_distribution"] = asset_class_distribution;

    nlohmann::json top = nlohmann::json::array();
    for (const auto& rel : top_relationships) {
        top.push_back(rel.to_json());
    }
    j["top_relationships"] = top;

    j["regulatory_event_count"] = regulatory_event_count;
    j["regulatory_event_norm"] = regulatory_event_norm;
    j["quality_score"] = quality_score;
    return j;
}

double AssetGraph::clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

double AssetGraph::saturating_norm(size_t count, double k) {
    if (count == 0) {
        return 0.0;
    }
    const double c = static_cast<double>(count);
    return c / (c + k);
}

double AssetGraph::relationship_density(size_t asset_count, size_t relationship_count) {
    if (asset_count <= 1) {
        return 0.0;
    }
    const double n = static_cast<double>(asset_count);
    return static_cast<double>(relationship_count) / (n * (n - 1.0)) * 100.0;
}

std::map<std::string, int> AssetGraph::asset_class_distribution() const {
    std::map<std::string, int> distribution;
    for (const auto& [id, asset] : assets_) {
        distribution[asset_class_to_string(asset.asset_class)]++;
    }
    return distribution;
}

NetworkMetrics AssetGraph::calculate_metrics() const {
    NetworkMetrics metrics;
    metrics.total_assets = collect_participating_asset_ids().size();

    std::vector<TopRelationship> all_relationships;
    double strength_sum = 0.0;

    for (const auto& [source_id, rels] : relationships_) {
        for (const auto& rel : rels) {
            metrics.relationship_distribution[rel.relationship_type]++;
            all_relationships.push_back({source_id, rel.target_id, rel.relationship_type, rel.strength});
            strength_sum += rel.strength;
        }
    }

    metrics.total_relationships = all_relationships.size();
    if (!all_relationships.empty()) {
        metrics.average_relationship_strength =
            strength_sum / static_cast<double>(all_relationships.size());
    }
    metrics.relationship_density = relationship_density(metrics.total_assets, metrics.total_relationships);

    // Ties keep traversal order
    std::stable_sort(all_relationships.begin(), all_relationships.end(),
                     [](const TopRelationship& a, const TopRelationship& b) {
                         return a.strength > b.strength;
                     });
    if (all_relationships.size() > TOP_RELATIONSHIPS) {
        all_relationships.resize(TOP_RELATIONSHIPS);
    }
    metrics.top_relationships = std::move(all_relationships);

    metrics.asset_class_distribution = asset_class_distribution();
    metrics.regulatory_event_count = regulatory_events_.size();
    metrics.regulatory_event_norm = saturating_norm(metrics.regulatory_event_count, EVENT_SATURATION_K);
    metrics.quality_score = clamp01(
        STRENGTH_WEIGHT * clamp01(metrics.average_relationship_strength) +
        EVENT_WEIGHT * metrics.regulatory_event_norm
    );

    return metrics;
}

} // namespace ag

#ifndef ASSET_GRAPH_HPP
#define ASSET_GRAPH_HPP

#include "graph/relationship.hpp"
#include "graph/relationship_rules.hpp"
#include "model/financial_models.hpp"
#include "render/directional_overlay.hpp"
#include "render/layout_engine.hpp"
#include "render/relationship_grouper.hpp"
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace ag {

/**
 * @brief One entry of the strongest-relationships ranking
 */
struct TopRelationship {
    std::string source_id;
    std::string target_id;
    std::string relationship_type;
    double strength = 0.0;

    nlohmann::json to_json() const {
        return nlohmann::json::array({source_id, target_id, relationship_type, strength});
    }
};

/**
 * @brief Network statistics over assets, relationships and events
 *
 * Every field is zero or empty for an empty graph.
 */
struct NetworkMetrics {
    size_t total_assets = 0;                               // effective asset count
    size_t total_relationships = 0;
    double average_relationship_strength = 0.0;
    double relationship_density = 0.0;                     // percent; above 100 when a pair has several edge types
    std::map<std::string, int> relationship_distribution;  // type -> count
    std::map<std::string, int> asset_class_distribution;   // explicit assets only
    std::vector<TopRelationship> top_relationships;        // at most 10
    size_t regulatory_event_count = 0;
    double regulatory_event_norm = 0.0;
    double quality_score = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Why a relationship insert was dropped
 */
enum class SkipReason {
    UNKNOWN_EVENT_SOURCE,
    UNKNOWN_EVENT_TARGET,
    DUPLICATE_RELATIONSHIP
};

std::string skip_reason_to_string(SkipReason reason);

struct SkippedRelationship {
    SkipReason reason = SkipReason::DUPLICATE_RELATIONSHIP;
    std::string source_id;
    std::string target_id;
    std::string relationship_type;
    std::string event_id;          // set for event-driven skips
};

/**
 * @brief Optional observer for dropped inserts; never set by default
 */
using SkipObserver = std::function<void(const SkippedRelationship&)>;

/**
 * @brief Node and edge data prepared for a renderer
 *
 * positions, asset_ids, colors and hover_texts are parallel arrays.
 * groups and direction_markers are computed over the same id ordering.
 */
struct VisualizationData {
    std::vector<Point3D> positions;
    std::vector<std::string> asset_ids;
    std::vector<std::string> colors;
    std::vector<std::string> hover_texts;
    std::vector<RelationshipGroup> groups;
    std::vector<DirectionMarker> direction_markers;

    // true when the graph had no assets and a single stand-in point was emitted
    bool placeholder = false;

    size_t size() const { return asset_ids.size(); }

    /**
     * @brief Check the parallel arrays for coherence
     * @throws StructuralValidationError on length mismatch, empty strings,
     *         duplicate ids or non-finite coordinates
     */
    void validate() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Graph of financial assets, inferred relationships and regulatory events
 *
 * The relationship store is derived state: build_relationships() clears and
 * regenerates it from the assets and events using the registered rules.
 * Nothing here locks; share an instance across threads through
 * ThreadSafeGraph.
 */
class AssetGraph {
public:
    static constexpr const char* NODE_COLOR = "#4ECDC4";
    static constexpr const char* PLACEHOLDER_COLOR = "#888888";
    static constexpr const char* PLACEHOLDER_ID = "A";
    static constexpr size_t TOP_RELATIONSHIPS = 10;

    AssetGraph();

    // ==========================================
    // Assets and Events
    // ==========================================

    /**
     * @brief Add or replace an asset keyed by its id
     */
    void add_asset(const Asset& asset);

    /**
     * @brief Append a regulatory event
     */
    void add_regulatory_event(const RegulatoryEvent& event);

    const Asset* get_asset(const std::string& asset_id) const;
    bool has_asset(const std::string& asset_id) const;

    const std::map<std::string, Asset>& assets() const { return assets_; }
    const std::vector<RegulatoryEvent>& regulatory_events() const { return regulatory_events_; }
    const RelationshipMap& relationships() const { return relationships_; }

    /**
     * @brief Outgoing edges of one asset (empty if none)
     */
    std::vector<Relationship> get_relationships(const std::string& source_id) const;

    size_t num_assets() const { return assets_.size(); }
    size_t num_relationships() const;
    bool empty() const { return assets_.empty() && relationships_.empty() && regulatory_events_.empty(); }

    // ==========================================
    // Relationship Inference
    // ==========================================

    /**
     * @brief Rebuild the whole relationship store from assets and events
     *
     * Pairs are visited in ascending id order and each registered rule is
     * applied in registration order. Regulatory events are then applied in
     * insertion order, adding event_impact edges with strength
     * |impact_score|. Unknown event endpoints and duplicate inserts are
     * dropped and reported only to the skip observer.
     */
    void build_relationships();

    /**
     * @brief Insert an edge unless (source, target, type) already exists
     * @param bidirectional Also insert target -> source with the same type
     */
    void add_relationship(
        const std::string& source_id,
        const std::string& target_id,
        const std::string& relationship_type,
        double strength,
        bool bidirectional = false
    );

    void clear_relationships() { relationships_.clear(); }

    void add_rule(RulePtr rule);
    void clear_rules() { rules_.clear(); }
    const std::vector<RulePtr>& rules() const { return rules_; }

    void set_skip_observer(SkipObserver observer) { skip_observer_ = std::move(observer); }

    // ==========================================
    // Analysis
    // ==========================================

    /**
     * @brief Explicit asset ids plus every relationship target id
     */
    std::set<std::string> collect_participating_asset_ids() const;

    /**
     * @brief Compute network metrics in a single pass
     */
    NetworkMetrics calculate_metrics() const;

    /**
     * @brief Prepare node positions, colors, hover texts, relationship groups
     *        and direction markers
     *
     * @param id_order Ordering of ids to lay out; empty means the sorted
     *                 effective asset set
     * @param filters  Relationship types to hide from the groups
     *
     * With no ids at all a single placeholder point is returned and
     * VisualizationData::placeholder is set.
     */
    VisualizationData visualization_data(
        const std::vector<std::string>& id_order = {},
        const RelationshipFilters& filters = {}
    ) const;

    /**
     * @brief Remove assets, events and relationships (rules are kept)
     */
    void clear();

    // ==========================================
    // Helpers
    // ==========================================

    static double clamp01(double value);

    /**
     * @brief count / (count + k), 0 for count <= 0
     */
    static double saturating_norm(size_t count, double k);

    /**
     * @brief Directed edge density in percent, 0 when asset_count <= 1
     */
    static double relationship_density(size_t asset_count, size_t relationship_count);

private:
    std::map<std::string, Asset> assets_;
    RelationshipMap relationships_;
    std::vector<RegulatoryEvent> regulatory_events_;

    std::vector<RulePtr> rules_;
    SkipObserver skip_observer_;

    /**
     * @brief Append unless the same (target, type) exists under source
     * @return false when the insert was dropped as a duplicate
     */
    bool append_relationship(
        const std::string& source_id,
        const std::string& target_id,
        const std::string& relationship_type,
        double strength
    );

    void apply_event_impacts();

    void report_skip(SkipReason reason,
                     const std::string& source_id,
                     const std::string& target_id,
                     const std::string& relationship_type,
                     const std::string& event_id = "") const;

    std::map<std::string, int> asset_class_distribution() const;
};

} // namespace ag

#endif // ASSET_GRAPH_HPP

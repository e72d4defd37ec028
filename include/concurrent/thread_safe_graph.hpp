#pragma once

#include "graph/asset_graph.hpp"
#include <mutex>
#include <nlohmann/json.hpp>
#include <vector>

namespace ag {

/**
 * @brief Mutex-guarded owner of one AssetGraph
 *
 * Every call holds the same lock for its full duration, so calls are
 * strictly serialized. Reads return copies taken under the lock; callers
 * never see a reference into the guarded graph.
 */
class ThreadSafeGraph {
public:
    ThreadSafeGraph() = default;
    explicit ThreadSafeGraph(AssetGraph graph);

    ThreadSafeGraph(const ThreadSafeGraph&) = delete;
    ThreadSafeGraph& operator=(const ThreadSafeGraph&) = delete;

    std::map<std::string, Asset> assets() const;
    RelationshipMap relationships() const;
    std::vector<RegulatoryEvent> regulatory_events() const;

    void add_asset(const Asset& asset);
    void add_regulatory_event(const RegulatoryEvent& event);

    void build_relationships();
    NetworkMetrics calculate_metrics() const;

    VisualizationData visualization_data(
        const std::vector<std::string>& id_order = {},
        const RelationshipFilters& filters = {}
    ) const;

    /**
     * @brief Copy of the whole graph
     */
    AssetGraph snapshot() const;

    /**
     * @brief Replace the guarded graph (an empty graph by default)
     */
    void reset(AssetGraph graph = AssetGraph());

    size_t num_assets() const;

private:
    mutable std::mutex mutex_;
    AssetGraph graph_;
};

} // namespace ag

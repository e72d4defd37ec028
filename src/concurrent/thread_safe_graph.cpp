#include "concurrent/thread_safe_graph.hpp"

namespace ag {

ThreadSafeGraph::ThreadSafeGraph(AssetGraph graph) : graph_(std::move(graph)) {}

std::map<std::string, Asset> ThreadSafeGraph::assets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_.assets();
}

RelationshipMap ThreadSafeGraph::relationships() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_.relationships();
}

std::vector<RegulatoryEvent> ThreadSafeGraph::regulatory_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_.regulatory_events();
}

void ThreadSafeGraph::add_asset(const Asset& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.add_asset(asset);
}

void ThreadSafeGraph::add_regulatory_event(const RegulatoryEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.add_regulatory_event(event);
}

void ThreadSafeGraph::build_relationships() {
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.build_relationships();
}

NetworkMetrics ThreadSafeGraph::calculate_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_.calculate_metrics();
}

VisualizationData ThreadSafeGraph::visualization_data(
    const std::vector<std::string>& id_order,
    const RelationshipFilters& filters
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_.visualization_data(id_order, filters);
}

AssetGraph ThreadSafeGraph::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_;
}

void ThreadSafeGraph::reset(AssetGraph graph) {
    std::lock_guard<std::mutex> lock(mutex_);
    graph_ = std::move(graph);
}

size_t ThreadSafeGraph::num_assets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_.num_assets();
}

} // namespace ag

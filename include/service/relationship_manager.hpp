#pragma once

#include "concurrent/thread_safe_graph.hpp"
#include <memory>
#include <string>

namespace ag {

/**
 * @brief Tool surface over a shared graph
 *
 * The graph is injected; whoever bootstraps the application owns its
 * lifetime. Every tool goes through the ThreadSafeGraph guard.
 */
class RelationshipManager {
public:
    static constexpr const char* NAME = "AssetGraph-Relationship-Manager";

    explicit RelationshipManager(std::shared_ptr<ThreadSafeGraph> graph, bool verbose = false);

    /**
     * @brief Validate and add an equity
     * @return "Successfully added: NAME (SYMBOL)" or "Validation Error: <reason>"
     */
    std::string add_equity_node(const std::string& asset_id,
                                const std::string& symbol,
                                const std::string& name,
                                const std::string& sector,
                                double price);

    /**
     * @brief Current 3D layout as {"asset_ids", "positions", "colors", "hover"}
     */
    std::string layout_json() const;

    /**
     * @brief Current network metrics as JSON
     */
    std::string metrics_json() const;

    /**
     * @brief Re-run inference on the shared graph
     */
    void rebuild_relationships();

    const std::shared_ptr<ThreadSafeGraph>& graph() const { return graph_; }

private:
    std::shared_ptr<ThreadSafeGraph> graph_;
    bool verbose_;
};

} // namespace ag

#pragma once

#include "graph/asset_graph.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ag {

// ============================================================================
// Cache snapshot
//
// {
//   "assets": [ {..., "__type__": "Equity"}, ... ],
//   "regulatory_events": [ ... ],
//   "relationships": { source: [ {target, relationship_type, strength} ] },
//   "incoming_relationships": { target: [ {source, relationship_type, strength} ] }
// }
//
// incoming_relationships is derived on write and ignored on read.
// ============================================================================

class GraphCache {
public:
    static nlohmann::json serialize_graph(const AssetGraph& graph);

    /**
     * @brief Rebuild a graph from a snapshot
     *
     * Relationships are re-added one-directionally in snapshot order; the
     * inference rules are not run.
     *
     * @throws ConstructionError for invalid asset or event records
     * @throws StructuralValidationError for malformed relationship entries
     */
    static AssetGraph deserialize_graph(const nlohmann::json& payload);

    /**
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static AssetGraph load_from_cache(const std::string& path);

    /**
     * @brief Write the snapshot to a sibling temp file, then rename it over path
     *
     * Parent directories are created as needed. A reader never observes a
     * partially written cache file.
     *
     * @throws std::runtime_error on I/O failure
     */
    static void save_to_cache(const AssetGraph& graph, const std::string& path);
};

} // namespace ag

#pragma once

#include "graph/relationship_rules.hpp"
#include "render/layout_engine.hpp"
#include "render/relationship_grouper.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ag {

// ============================================================================
// Application Configuration
// ============================================================================

/**
 * @brief Settings shared by the CLI, the graph source and the relationship manager
 */
struct AppConfig {
    // Data source
    std::string cache_path;                        ///< Snapshot file; empty disables caching
    bool use_sample_fallback = true;               ///< Use the sample dataset when no cache loads
    bool persist_cache = true;                     ///< Write the graph back to cache_path

    // Inference
    std::vector<std::string> relationship_rules = available_rule_names();

    // Rendering
    std::string layout = "spring";                 ///< "spring", "circular" or "grid"
    RelationshipFilters relationship_filters;      ///< type -> shown
    bool show_direction_markers = true;
    std::string title = "Financial Asset Network";
    std::string output_directory = "output";

    bool verbose = false;                          ///< Progress logging on stdout

    /**
     * @brief Load configuration from a JSON file
     * @throws ConfigError if the file cannot be read or a field has the wrong type
     */
    static AppConfig from_json_file(const std::string& path);

    static AppConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    /**
     * @brief Save configuration to a JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by ASSETGRAPH_* environment variables
     */
    static AppConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    LayoutType layout_type() const { return layout_type_from_string(layout); }

    /**
     * @brief Instantiate the configured inference rules in order
     * @throws ConfigError for an unknown rule name
     */
    std::vector<RulePtr> create_rules() const;
};

/**
 * @brief Load config from the given path, then ./assetgraph.json, then the environment
 *
 * Unreadable or invalid files are reported on stderr and skipped.
 */
AppConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace ag

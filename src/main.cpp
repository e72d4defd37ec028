#include "cli/cli.hpp"
#include "concurrent/thread_safe_graph.hpp"
#include "config/app_config.hpp"
#include "core/errors.hpp"
#include "data/graph_cache.hpp"
#include "data/graph_source.hpp"
#include "render/graph_renderer.hpp"
#include "service/relationship_manager.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

using namespace ag;

// ============== Helper Functions ==============

// Config file, then command-line overrides
AppConfig resolve_config(const ParsedArgs& args) {
    AppConfig config = load_config_with_fallback(args.get("config").str());

    if (args.has("cache")) config.cache_path = args.get("cache").str();
    if (args.has("layout")) config.layout = args.get("layout").str();
    if (args.has("output-dir")) config.output_directory = args.get("output-dir").str();
    if (args.has("no-fallback")) config.use_sample_fallback = false;
    if (args.has("no-persist")) config.persist_cache = false;
    if (args.has("verbose")) config.verbose = true;

    for (const auto& type : args.get("hide").to_list()) {
        config.relationship_filters[type] = false;
    }

    std::string error;
    if (!config.validate(error)) {
        throw ConfigError(error);
    }
    return config;
}

// Application bootstrap: the shared graph is created here and handed out
std::shared_ptr<ThreadSafeGraph> bootstrap_graph(const AppConfig& config) {
    GraphSource source(config);
    auto graph = std::make_shared<ThreadSafeGraph>(source.create_graph());
    if (config.verbose) {
        std::cout << (source.loaded_from_cache() ? "Graph loaded from cache\n"
                                                 : "Graph built from fallback dataset\n");
    }
    return graph;
}

std::vector<OptionSpec> shared_options() {
    return {
        {"config", "c", "Path to JSON config file", "", false, false},
        {"cache", "", "Graph cache snapshot path", "", false, false},
        {"no-fallback", "", "Do not fall back to the sample dataset", "", false, true},
        {"no-persist", "", "Do not write the graph back to the cache", "", false, true},
        {"verbose", "V", "Print progress information", "", false, true}
    };
}

void print_metrics(const NetworkMetrics& metrics) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Network Metrics\n";
    std::cout << std::string(60, '=') << "\n\n";

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Assets:                 " << metrics.total_assets << "\n";
    std::cout << "Relationships:          " << metrics.total_relationships << "\n";
    std::cout << "Average strength:       " << metrics.average_relationship_strength << "\n";
    std::cout << "Density (%):            " << metrics.relationship_density << "\n";
    std::cout << "Regulatory events:      " << metrics.regulatory_event_count << "\n";
    std::cout << "Quality score:          " << metrics.quality_score << "\n";

    std::cout << "\nRelationship distribution:\n";
    for (const auto& [type, count] : metrics.relationship_distribution) {
        std::cout << "  " << type << ": " << count << "\n";
    }

    std::cout << "\nAsset class distribution:\n";
    for (const auto& [asset_class, count] : metrics.asset_class_distribution) {
        std::cout << "  " << asset_class << ": " << count << "\n";
    }

    std::cout << "\nTop relationships:\n";
    for (const auto& rel : metrics.top_relationships) {
        std::cout << "  " << rel.source_id << " -> " << rel.target_id
                  << " [" << rel.relationship_type << "] " << rel.strength << "\n";
    }
    std::cout << "\n";
}

// ============== assetgraph build ==============
int cmd_build(const ParsedArgs& args) {
    AppConfig config = resolve_config(args);
    auto graph = bootstrap_graph(config);

    AssetGraph snapshot = graph->snapshot();
    std::cout << "Assets: " << snapshot.num_assets()
              << ", relationships: " << snapshot.num_relationships()
              << ", regulatory events: " << snapshot.regulatory_events().size() << "\n";

    if (args.has("output")) {
        std::string output_path = args.get("output").str();
        GraphCache::save_to_cache(snapshot, output_path);
        std::cout << "Snapshot written to: " << output_path << "\n";
    }
    return 0;
}

// ============== assetgraph metrics ==============
int cmd_metrics(const ParsedArgs& args) {
    AppConfig config = resolve_config(args);
    auto graph = bootstrap_graph(config);

    auto metrics = graph->calculate_metrics();
    if (args.has("json")) {
        std::cout << metrics.to_json().dump(2) << "\n";
    } else {
        print_metrics(metrics);
    }
    return 0;
}

// ============== assetgraph render ==============
int cmd_render(const ParsedArgs& args) {
    AppConfig config = resolve_config(args);
    auto graph = bootstrap_graph(config);

    std::string mode = args.get("mode", "3d").str();
    if (mode != "3d" && mode != "2d") {
        throw UsageError("--mode expects 3d or 2d, got '" + mode + "'");
    }

    SceneOptions options;
    options.filters = config.relationship_filters;
    options.show_all_relationships = config.relationship_filters.empty();
    options.show_direction_markers = config.show_direction_markers && !args.has("no-arrows");
    options.base_title = config.title;

    AssetGraph snapshot = graph->snapshot();
    GraphRenderer renderer(snapshot);
    Scene scene = mode == "3d" ? renderer.build_3d_scene(options)
                               : renderer.build_2d_scene(config.layout_type(), options);

    fs::create_directories(config.output_directory);
    std::string default_name = mode == "3d" ? "asset_network_3d" : "asset_network_2d";
    std::string output_path = args.get("output", "").str();
    if (output_path.empty()) {
        output_path = (fs::path(config.output_directory) /
                       (default_name + (args.has("json") ? ".json" : ".html"))).string();
    }

    if (args.has("json")) {
        std::ofstream file(output_path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + output_path);
        }
        file << scene.to_json().dump(2);
    } else {
        GraphRenderer::export_html(scene, output_path);
    }

    std::cout << scene.title << "\n";
    std::cout << "Scene written to: " << output_path << "\n";
    return 0;
}

// ============== assetgraph layout ==============
int cmd_layout(const ParsedArgs& args) {
    AppConfig config = resolve_config(args);
    RelationshipManager manager(bootstrap_graph(config), config.verbose);
    std::cout << manager.layout_json() << "\n";
    return 0;
}

// ============== assetgraph add-equity ==============
int cmd_add_equity(const ParsedArgs& args) {
    AppConfig config = resolve_config(args);
    auto graph = bootstrap_graph(config);
    RelationshipManager manager(graph, config.verbose);

    std::string result = manager.add_equity_node(
        args.require("id"),
        args.require("symbol"),
        args.require("name"),
        args.get("sector", "").str(),
        args.get("price").to_double()
    );
    std::cout << result << "\n";

    if (result.rfind("Validation Error", 0) == 0) {
        return 1;
    }

    manager.rebuild_relationships();
    if (config.persist_cache && !config.cache_path.empty()) {
        GraphCache::save_to_cache(graph->snapshot(), config.cache_path);
        if (config.verbose) {
            std::cout << "Cache updated: " << config.cache_path << "\n";
        }
    }
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CommandLine cli("assetgraph", "1.0.0");
    cli.add_shared_options(shared_options());

    cli.add({"build", "Load or build the asset graph and report its size",
             {{"output", "o", "Also write a snapshot to this path", "", false, false}},
             cmd_build})
       .add({"metrics", "Compute network metrics",
             {{"json", "j", "Print metrics as JSON", "", false, true}},
             cmd_metrics})
       .add({"render", "Render the relationship network as a Plotly page or scene JSON",
             {
                 {"mode", "m", "3d or 2d", "3d", false, false},
                 {"layout", "l", "2D layout: spring, circular or grid", "", false, false},
                 {"hide", "", "Comma-separated relationship types to hide", "", false, false},
                 {"no-arrows", "", "Omit direction markers", "", false, true},
                 {"output", "o", "Output file", "", false, false},
                 {"output-dir", "", "Output directory", "", false, false},
                 {"json", "j", "Write scene JSON instead of HTML", "", false, true}
             },
             cmd_render})
       .add({"layout", "Print the 3D layout as JSON", {}, cmd_layout})
       .add({"add-equity", "Validate and add an equity, then rebuild relationships",
             {
                 {"id", "", "Asset id", "", true, false},
                 {"symbol", "", "Ticker symbol", "", true, false},
                 {"name", "", "Company name", "", true, false},
                 {"sector", "", "Sector", "", false, false},
                 {"price", "", "Price", "", true, false}
             },
             cmd_add_equity});

    return cli.run(argc, argv);
}

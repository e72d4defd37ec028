#include "data/graph_cache.hpp"
#include "data/sample_data.hpp"
#include "graph/asset_graph.hpp"
#include "render/graph_renderer.hpp"
#include <iomanip>
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>

using namespace ag;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

int main() {
    print_separator("Asset Graph Example - Relationship Inference");

    const std::string output_dir = "output";
    mkdir(output_dir.c_str(), 0755);

    AssetGraph graph;

    // 1. Two technology equities share a sector
    std::cout << "1. Adding equities:\n";
    graph.add_asset(make_equity("AAPL", "AAPL", "Apple Inc.", "Technology", 175.50));
    graph.add_asset(make_equity("MSFT", "MSFT", "Microsoft Corporation", "Technology", 378.85));
    graph.add_asset(make_equity("XOM", "XOM", "Exxon Mobil Corporation", "Energy", 104.20));
    std::cout << "   AAPL, MSFT (Technology), XOM (Energy)\n";

    // 2. A corporate bond linked to its issuer
    std::cout << "\n2. Adding a bond issued by AAPL:\n";
    graph.add_asset(make_bond("AAPL_BOND", "AAPL4.65", "Apple Inc. 4.65% 2046 Notes",
                              "Corporate", 95.80, std::string("AAPL")));
    std::cout << "   AAPL_BOND --corporate_link--> AAPL\n";

    // 3. An event whose impact spreads to related assets
    std::cout << "\n3. Adding an earnings report:\n";
    graph.add_regulatory_event(RegulatoryEvent(
        "AAPL_Q4", "AAPL", RegulatoryActivity::EARNINGS_REPORT, "2024-11-01",
        "Q4 earnings", 0.12, {"MSFT", "UNKNOWN"}));
    std::cout << "   AAPL_Q4 affects MSFT (UNKNOWN is not in the graph and is skipped)\n";

    graph.set_skip_observer([](const SkippedRelationship& skip) {
        std::cout << "   skipped " << skip.source_id << " -> " << skip.target_id
                  << " (" << skip_reason_to_string(skip.reason) << ")\n";
    });

    print_separator("Building relationships");
    graph.build_relationships();

    for (const auto& [source_id, rels] : graph.relationships()) {
        for (const auto& rel : rels) {
            std::cout << "  " << source_id << " -> " << rel.target_id
                      << " [" << rel.relationship_type << "] "
                      << std::fixed << std::setprecision(2) << rel.strength << "\n";
        }
    }

    print_separator("Metrics");
    auto metrics = graph.calculate_metrics();
    std::cout << metrics.to_json().dump(2) << "\n";

    print_separator("Rendering");
    GraphRenderer renderer(graph);
    auto scene = renderer.build_3d_scene();
    std::cout << scene.title << "\n";
    GraphRenderer::export_html(scene, output_dir + "/example_network_3d.html");
    std::cout << "Saved " << output_dir << "/example_network_3d.html\n";

    auto sample = create_sample_database();
    GraphCache::save_to_cache(sample, output_dir + "/sample_graph.json");
    std::cout << "Saved sample dataset snapshot (" << sample.num_assets() << " assets, "
              << sample.num_relationships() << " relationships) to "
              << output_dir << "/sample_graph.json\n";

    return 0;
}

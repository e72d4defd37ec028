#include "data/graph_source.hpp"
#include "core/errors.hpp"
#include "data/graph_cache.hpp"
#include "data/sample_data.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace ag {

GraphSource::GraphSource(AppConfig config, GraphFactory fallback_factory)
    : config_(std::move(config)), fallback_factory_(std::move(fallback_factory)) {
    if (!fallback_factory_ && config_.use_sample_fallback) {
        fallback_factory_ = create_sample_database;
    }
}

AssetGraph GraphSource::create_graph() {
    loaded_from_cache_ = false;

    AssetGraph graph;
    if (try_load_cache(graph)) {
        loaded_from_cache_ = true;
        return graph;
    }

    graph = fallback();
    persist_cache(graph);
    return graph;
}

bool GraphSource::try_load_cache(AssetGraph& graph) const {
    if (config_.cache_path.empty()) {
        return false;
    }

    std::error_code ec;
    if (!fs::exists(config_.cache_path, ec)) {
        return false;
    }

    try {
        if (config_.verbose) {
            std::cout << "Loading asset graph from cache at " << config_.cache_path << "\n";
        }
        graph = GraphCache::load_from_cache(config_.cache_path);
        graph.clear_rules();
        for (const auto& rule : config_.create_rules()) {
            graph.add_rule(rule);
        }
        if (config_.verbose) {
            std::cout << "  Loaded " << graph.num_assets() << " assets, "
                      << graph.num_relationships() << " relationships\n";
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to load cached dataset; proceeding with fallback: " << e.what() << "\n";
        return false;
    }
}

AssetGraph GraphSource::fallback() const {
    if (!fallback_factory_) {
        throw AssetGraphError("No graph data available: cache is missing and sample fallback is disabled");
    }

    if (config_.verbose) {
        std::cout << "Building asset graph from fallback dataset\n";
    }

    AssetGraph graph = fallback_factory_();
    graph.clear_rules();
    for (const auto& rule : config_.create_rules()) {
        graph.add_rule(rule);
    }
    graph.build_relationships();

    if (config_.verbose) {
        std::cout << "  Built " << graph.num_assets() << " assets, "
                  << graph.num_relationships() << " relationships\n";
    }
    return graph;
}

void GraphSource::persist_cache(const AssetGraph& graph) const {
    if (!config_.persist_cache || config_.cache_path.empty()) {
        return;
    }

    try {
        GraphCache::save_to_cache(graph, config_.cache_path);
        if (config_.verbose) {
            std::cout << "Persisted asset graph cache to " << config_.cache_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to persist dataset cache to " << config_.cache_path << ": " << e.what() << "\n";
    }
}

} // namespace ag

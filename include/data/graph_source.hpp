#pragma once

#include "config/app_config.hpp"
#include "graph/asset_graph.hpp"
#include <functional>
#include <string>

namespace ag {

using GraphFactory = std::function<AssetGraph()>;

/**
 * @brief Produces the application graph from cache or from a fallback dataset
 *
 * create_graph() loads config.cache_path when it exists. If there is no
 * cache, or it fails to load, the fallback factory builds the graph, the
 * configured rules are installed and relationships are rebuilt, and the
 * result is written back to the cache when persist_cache is set. Cache
 * problems are logged and never abort the load.
 */
class GraphSource {
public:
    /**
     * @param fallback_factory Graph builder used when no cache is loaded;
     *        defaults to the sample dataset if config.use_sample_fallback
     */
    explicit GraphSource(AppConfig config, GraphFactory fallback_factory = nullptr);

    /**
     * @throws AssetGraphError when no cache loads and no fallback is configured
     */
    AssetGraph create_graph();

    bool loaded_from_cache() const { return loaded_from_cache_; }
    const AppConfig& config() const { return config_; }

private:
    AppConfig config_;
    GraphFactory fallback_factory_;
    bool loaded_from_cache_ = false;

    bool try_load_cache(AssetGraph& graph) const;
    AssetGraph fallback() const;
    void persist_cache(const AssetGraph& graph) const;
};

} // namespace ag

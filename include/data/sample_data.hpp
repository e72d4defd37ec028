#pragma once

#include "graph/asset_graph.hpp"
#include <vector>

namespace ag {

/**
 * @brief Offline reference dataset
 *
 * Four equities (AAPL, MSFT, XOM, JPM), the TLT and LQD bond proxies plus a
 * corporate bond issued by AAPL, gold and crude futures (GC_FUTURE,
 * CL_FUTURE), three USD crosses (EURUSD, GBPUSD, JPYUSD) and three
 * regulatory events. Prices are fixed so that the graph is reproducible.
 */
std::vector<Asset> sample_assets();
std::vector<RegulatoryEvent> sample_regulatory_events();

/**
 * @brief Sample assets and events with relationships already built
 */
AssetGraph create_sample_database();

} // namespace ag

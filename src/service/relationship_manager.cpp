#include "service/relationship_manager.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <stdexcept>

namespace ag {

RelationshipManager::RelationshipManager(std::shared_ptr<ThreadSafeGraph> graph, bool verbose)
    : graph_(std::move(graph)), verbose_(verbose) {
    if (!graph_) {
        throw std::invalid_argument("RelationshipManager requires a graph");
    }
}

std::string RelationshipManager::add_equity_node(const std::string& asset_id,
                                                 const std::string& symbol,
                                                 const std::string& name,
                                                 const std::string& sector,
                                                 double price) {
    try {
        Asset equity = make_equity(asset_id, symbol, name, sector, price);
        graph_->add_asset(equity);
        if (verbose_) {
            std::cout << "Added equity " << equity.id << " to shared graph\n";
        }
        return "Successfully added: " + equity.name + " (" + equity.symbol + ")";
    } catch (const ConstructionError& e) {
        return std::string("Validation Error: ") + e.what();
    }
}

std::string RelationshipManager::layout_json() const {
    auto data = graph_->visualization_data();

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& p : data.positions) {
        positions.push_back(p.to_json());
    }

    nlohmann::json j;
    j["asset_ids"] = data.asset_ids;
    j["positions"] = positions;
    j["colors"] = data.colors;
    j["hover"] = data.hover_texts;
    return j.dump();
}

std::string RelationshipManager::metrics_json() const {
    return graph_->calculate_metrics().to_json().dump();
}

void RelationshipManager::rebuild_relationships() {
    graph_->build_relationships();
    if (verbose_) {
        std::cout << "Rebuilt relationships on shared graph\n";
    }
}

} // namespace ag

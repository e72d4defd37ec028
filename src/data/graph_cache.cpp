#include "data/graph_cache.hpp"
#include "core/errors.hpp"
#include "index/relationship_index.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace ag {

nlohmann::json GraphCache::serialize_graph(const AssetGraph& graph) {
    nlohmann::json payload;

    nlohmann::json assets = nlohmann::json::array();
    for (const auto& [id, asset] : graph.assets()) {
        assets.push_back(asset.to_json());
    }
    payload["assets"] = assets;

    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : graph.regulatory_events()) {
        events.push_back(event.to_json());
    }
    payload["regulatory_events"] = events;

    nlohmann::json outgoing = nlohmann::json::object();
    nlohmann::json incoming = nlohmann::json::object();
    for (const auto& [source_id, rels] : graph.relationships()) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& rel : rels) {
            list.push_back(rel.to_json());
            incoming[rel.target_id].push_back({
                {"source", source_id},
                {"relationship_type", rel.relationship_type},
                {"strength", rel.strength}
            });
        }
        outgoing[source_id] = list;
    }
    payload["relationships"] = outgoing;
    payload["incoming_relationships"] = incoming;

    return payload;
}

AssetGraph GraphCache::deserialize_graph(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw StructuralValidationError(std::string("cache payload must be an object, got ") +
                                        payload.type_name());
    }

    AssetGraph graph;

    if (payload.contains("assets")) {
        if (!payload.at("assets").is_array()) {
            throw StructuralValidationError("assets must be a list");
        }
        for (const auto& record : payload.at("assets")) {
            graph.add_asset(Asset::from_json(record));
        }
    }

    if (payload.contains("regulatory_events")) {
        if (!payload.at("regulatory_events").is_array()) {
            throw StructuralValidationError("regulatory_events must be a list");
        }
        for (const auto& record : payload.at("regulatory_events")) {
            graph.add_regulatory_event(RegulatoryEvent::from_json(record));
        }
    }

    if (payload.contains("relationships")) {
        const auto& relationships = payload.at("relationships");
        if (!relationships.is_object()) {
            throw StructuralValidationError(std::string("relationships must be an object, got ") +
                                            relationships.type_name());
        }
        for (const auto& [source_id, rels] : relationships.items()) {
            if (!rels.is_array()) {
                throw StructuralValidationError("relationships for '" + source_id +
                                                "' must be a list, got " + rels.type_name());
            }
            for (size_t idx = 0; idx < rels.size(); ++idx) {
                auto rel = RelationshipIndex::parse_entry(rels[idx], idx, source_id);
                graph.add_relationship(source_id, rel.target_id, rel.relationship_type,
                                       rel.strength, false);
            }
        }
    }

    return graph;
}

AssetGraph GraphCache::load_from_cache(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open cache file for reading: " + path);
    }

    nlohmann::json payload;
    try {
        file >> payload;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse cache file " + path + ": " + e.what());
    }
    file.close();

    return deserialize_graph(payload);
}

void GraphCache::save_to_cache(const AssetGraph& graph, const std::string& path) {
    const fs::path target = fs::absolute(fs::path(path));
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create cache directory " +
                                     target.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path temp = target;
    temp += ".tmp";

    {
        std::ofstream file(temp);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + temp.string());
        }
        file << serialize_graph(graph).dump(2);
        if (!file) {
            throw std::runtime_error("Failed to write cache file: " + temp.string());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(temp, ec);
        throw std::runtime_error("Failed to replace cache file " + target.string() + ": " + reason);
    }
}

} // namespace ag

#pragma once

#include "core/errors.hpp"
#include "graph/relationship.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ag {

/**
 * @brief (source, target, type) key used for O(1) edge lookup
 */
struct EdgeKey {
    std::string source_id;
    std::string target_id;
    std::string relationship_type;

    bool operator==(const EdgeKey& other) const {
        return source_id == other.source_id &&
               target_id == other.target_id &&
               relationship_type == other.relationship_type;
    }

    EdgeKey reversed() const { return {target_id, source_id, relationship_type}; }

    /**
     * @brief Order-independent key (min, max, type) for bidirectional dedup
     */
    EdgeKey canonical() const {
        return source_id <= target_id ? *this : reversed();
    }
};

struct EdgeKeyHash {
    size_t operator()(const EdgeKey& key) const {
        std::hash<std::string> h;
        size_t seed = h(key.source_id);
        seed ^= h(key.target_id) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= h(key.relationship_type) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

struct IndexedRelationship {
    EdgeKey key;
    double strength = 0.0;
};

/**
 * @brief Map asset ids to their positions in a requested ordering
 * @throws StructuralValidationError on empty or duplicate ids
 */
inline std::unordered_map<std::string, size_t> build_asset_id_index(
    const std::vector<std::string>& asset_ids
) {
    std::unordered_map<std::string, size_t> index;
    index.reserve(asset_ids.size());
    for (size_t i = 0; i < asset_ids.size(); ++i) {
        if (asset_ids[i].empty()) {
            throw StructuralValidationError("asset_ids must contain non-empty strings");
        }
        if (!index.emplace(asset_ids[i], i).second) {
            throw StructuralValidationError("Duplicate asset_ids detected: " + asset_ids[i]);
        }
    }
    return index;
}

/**
 * @brief Edge index restricted to a requested set of asset ids
 *
 * Holds every (source, target, type) -> strength entry whose endpoints are
 * both in the requested set, in insertion order (source order of the store,
 * then list order). Building the index is where relationship data coming from
 * outside the inference engine gets validated; consumers of a built index
 * can assume well-formed entries.
 */
struct RelationshipIndex {
    std::unordered_map<std::string, size_t> asset_positions;

    void build(const RelationshipMap& relationships, const std::vector<std::string>& asset_ids) {
        clear();
        asset_positions = build_asset_id_index(asset_ids);

        for (const auto& [source_id, rels] : relationships) {
            if (asset_positions.find(source_id) == asset_positions.end()) {
                continue;
            }
            for (size_t idx = 0; idx < rels.size(); ++idx) {
                const auto& rel = rels[idx];
                if (rel.target_id.empty()) {
                    throw StructuralValidationError(entry_label(idx, source_id) +
                                                    ": target_id must be a non-empty string");
                }
                if (rel.relationship_type.empty()) {
                    throw StructuralValidationError(entry_label(idx, source_id) +
                                                    ": rel_type must be a non-empty string");
                }
                if (!std::isfinite(rel.strength)) {
                    throw StructuralValidationError(entry_label(idx, source_id) +
                                                    ": strength must be a finite number");
                }
                if (asset_positions.count(rel.target_id)) {
                    insert({source_id, rel.target_id, rel.relationship_type}, rel.strength);
                }
            }
        }
    }

    /**
     * @brief Build from an untyped "relationships" payload (cache snapshot shape)
     *
     * Accepts entries either as {target, relationship_type, strength} objects
     * or as [target, type, strength] arrays.
     */
    void build_from_json(const nlohmann::json& relationships, const std::vector<std::string>& asset_ids) {
        clear();
        asset_positions = build_asset_id_index(asset_ids);

        if (!relationships.is_object()) {
            throw StructuralValidationError(std::string("relationships must be an object, got ") +
                                            relationships.type_name());
        }

        for (const auto& [source_id, rels] : relationships.items()) {
            if (asset_positions.find(source_id) == asset_positions.end()) {
                continue;
            }
            if (!rels.is_array()) {
                throw StructuralValidationError("relationships for '" + source_id +
                                                "' must be a list, got " + rels.type_name());
            }
            for (size_t idx = 0; idx < rels.size(); ++idx) {
                auto entry = parse_entry(rels[idx], idx, source_id);
                if (asset_positions.count(entry.target_id)) {
                    insert({source_id, entry.target_id, entry.relationship_type}, entry.strength);
                }
            }
        }
    }

    /**
     * @brief Validate one untyped edge entry
     * @throws StructuralValidationError on wrong arity or types
     */
    static Relationship parse_entry(const nlohmann::json& rel, size_t idx, const std::string& source_id) {
        const nlohmann::json* target = nullptr;
        const nlohmann::json* rel_type = nullptr;
        const nlohmann::json* strength = nullptr;

        if (rel.is_array()) {
            if (rel.size() != 3) {
                throw StructuralValidationError(entry_label(idx, source_id) +
                    " must be a 3-element tuple (target_id, rel_type, strength)");
            }
            target = &rel[0];
            rel_type = &rel[1];
            strength = &rel[2];
        } else if (rel.is_object()) {
            if (!rel.contains("target") || !rel.contains("relationship_type") || !rel.contains("strength")) {
                throw StructuralValidationError(entry_label(idx, source_id) +
                    " must have keys target, relationship_type and strength");
            }
            target = &rel.at("target");
            rel_type = &rel.at("relationship_type");
            strength = &rel.at("strength");
        } else {
            throw StructuralValidationError(entry_label(idx, source_id) +
                " must be a 3-element tuple (target_id, rel_type, strength)");
        }

        if (!target->is_string() || target->get<std::string>().empty()) {
            throw StructuralValidationError("target_id at index " + std::to_string(idx) +
                                            " for '" + source_id + "' must be a string");
        }
        if (!rel_type->is_string() || rel_type->get<std::string>().empty()) {
            throw StructuralValidationError("rel_type at index " + std::to_string(idx) +
                                            " for '" + source_id + "' must be a string");
        }

        double value = 0.0;
        if (strength->is_number()) {
            value = strength->get<double>();
        } else if (strength->is_string()) {
            // numeric strings are accepted, as a float() conversion would
            const auto text = strength->get<std::string>();
            size_t consumed = 0;
            try {
                value = std::stod(text, &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != text.size()) {
                throw StructuralValidationError("strength at index " + std::to_string(idx) +
                                                " for '" + source_id + "' must be numeric");
            }
        } else {
            throw StructuralValidationError("strength at index " + std::to_string(idx) +
                                            " for '" + source_id + "' must be numeric");
        }
        if (!std::isfinite(value)) {
            throw StructuralValidationError("strength at index " + std::to_string(idx) +
                                            " for '" + source_id + "' must be a finite number");
        }

        return Relationship{target->get<std::string>(), rel_type->get<std::string>(), value};
    }

    // ---- lookups ----

    bool contains(const EdgeKey& key) const {
        return lookup_.find(key) != lookup_.end();
    }

    std::optional<double> strength(const EdgeKey& key) const {
        auto it = lookup_.find(key);
        if (it == lookup_.end()) {
            return std::nullopt;
        }
        return entries_[it->second].strength;
    }

    bool has_reverse(const EdgeKey& key) const {
        return contains(key.reversed());
    }

    size_t position_of(const std::string& asset_id) const {
        auto it = asset_positions.find(asset_id);
        if (it == asset_positions.end()) {
            throw StructuralValidationError("asset id '" + asset_id + "' is not part of the index");
        }
        return it->second;
    }

    const std::vector<IndexedRelationship>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    void clear() {
        asset_positions.clear();
        entries_.clear();
        lookup_.clear();
    }

private:
    std::vector<IndexedRelationship> entries_;
    std::unordered_map<EdgeKey, size_t, EdgeKeyHash> lookup_;

    // Re-inserting a key keeps its original position and takes the new strength
    void insert(const EdgeKey& key, double strength) {
        auto it = lookup_.find(key);
        if (it != lookup_.end()) {
            entries_[it->second].strength = strength;
            return;
        }
        lookup_.emplace(key, entries_.size());
        entries_.push_back({key, strength});
    }

    static std::string entry_label(size_t idx, const std::string& source_id) {
        return "relationship at index " + std::to_string(idx) + " for '" + source_id + "'";
    }
};

} // namespace ag

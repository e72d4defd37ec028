#pragma once

#include "graph/asset_graph.hpp"
#include "render/layout_engine.hpp"
#include "render/relationship_grouper.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ag {

// Relationship type -> line colour; anything unlisted draws in DEFAULT_EDGE_COLOR
extern const std::map<std::string, std::string> REL_TYPE_COLORS;
extern const std::map<std::string, std::string> ASSET_CLASS_COLORS;
constexpr const char* DEFAULT_EDGE_COLOR = "#888888";

/**
 * @brief Line segments for one relationship group
 *
 * Coordinates come in (source, target, gap) triples; the gap is emitted as
 * JSON null so that a plotting front end breaks the line between edges.
 */
struct EdgeTrace {
    std::string relationship_type;
    std::string name;
    std::string color;
    bool bidirectional = false;
    double width = 2.0;
    std::string dash = "solid";

    std::vector<std::optional<double>> x;
    std::vector<std::optional<double>> y;
    std::vector<std::optional<double>> z;       // empty for 2D scenes
    std::vector<std::optional<std::string>> hover;

    size_t edge_count() const { return x.size() / 3; }

    nlohmann::json to_json(bool is_3d) const;
};

struct NodeTrace {
    std::vector<std::string> asset_ids;
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> z;                      // empty for 2D scenes
    std::vector<std::string> colors;
    std::vector<std::string> hover;

    nlohmann::json to_json(bool is_3d) const;
};

/**
 * @brief Rendering options shared by the 3D and 2D scenes
 */
struct SceneOptions {
    RelationshipFilters filters;
    bool show_all_relationships = true;         // overrides filters when true
    bool show_direction_markers = true;         // 3D only
    std::string base_title = "Financial Asset Network";
    int width = 1200;
    int height = 800;
};

/**
 * @brief A renderer-agnostic figure: edge traces, direction markers and nodes
 */
struct Scene {
    bool is_3d = true;
    std::string title;
    std::string layout_name;                    // 2D scenes only
    std::vector<EdgeTrace> edge_traces;
    std::vector<DirectionMarker> direction_markers;
    NodeTrace nodes;
    int width = 1200;
    int height = 800;

    /**
     * @brief Number of edges drawn; each bidirectional pair counts once
     */
    size_t visible_relationships() const;

    /**
     * @brief Plotly figure JSON: {"data": [...], "layout": {...}}
     */
    nlohmann::json to_json() const;
};

/**
 * @brief Composes visualization scenes from an AssetGraph
 *
 * The 3D scene lays out the effective asset set and draws one trace per
 * relationship group. The 2D scene lays out the explicit assets with the
 * requested layout and draws one trace per relationship type.
 */
class GraphRenderer {
public:
    explicit GraphRenderer(const AssetGraph& graph);

    /**
     * @throws StructuralValidationError if the visualization data is incoherent
     */
    Scene build_3d_scene(const SceneOptions& options = {}) const;

    Scene build_2d_scene(LayoutType layout, const SceneOptions& options = {}) const;

    /**
     * @brief Write a self-contained Plotly page for the scene
     * @throws std::runtime_error if the file cannot be opened
     */
    static void export_html(const Scene& scene, const std::string& filename);

    static std::string relationship_color(const std::string& relationship_type);

    /**
     * @brief "same_sector" -> "Same Sector (↔)" / "Same Sector (→)"
     */
    static std::string format_trace_name(const std::string& relationship_type, bool bidirectional);

    static std::string title_case(const std::string& relationship_type);

    static std::string dynamic_title(size_t num_assets, size_t num_relationships,
                                     const std::string& base_title = "Financial Asset Network");

private:
    const AssetGraph& graph_;

    std::map<std::string, Point2D> resolve_2d_positions(LayoutType layout,
                                                        const std::vector<std::string>& asset_ids) const;
};

} // namespace ag

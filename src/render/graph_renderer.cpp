#include "render/graph_renderer.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ag {

const std::map<std::string, std::string> REL_TYPE_COLORS = {
    {"same_sector", "#FF6B6B"},
    {"market_cap_similar", "#4ECDC4"},
    {"correlation", "#45B7D1"},
    {"corporate_bond_to_equity", "#96CEB4"},
    {"commodity_currency", "#FFEAA7"},
    {"income_comparison", "#DDA0DD"},
    {"regulatory_impact", "#FFA07A"}
};

const std::map<std::string, std::string> ASSET_CLASS_COLORS = {
    {"equity", "#1f77b4"},
    {"fixed_income", "#2ca02c"},
    {"commodity", "#ff7f0e"},
    {"currency", "#d62728"}
};

namespace {

std::string escape_html(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

// "</" cannot appear inside an inline <script> block
std::string escape_script_json(const std::string& json) {
    std::string out;
    out.reserve(json.size());
    for (size_t i = 0; i < json.size(); ++i) {
        out += json[i];
        if (json[i] == '<' && i + 1 < json.size() && json[i + 1] == '/') {
            out += '\\';
        }
    }
    return out;
}

template <typename T>
nlohmann::json optional_array(const std::vector<std::optional<T>>& values) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& v : values) {
        if (v.has_value()) {
            arr.push_back(*v);
        } else {
            arr.push_back(nullptr);
        }
    }
    return arr;
}

std::string format_strength(double strength) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << strength;
    return ss.str();
}

std::string edge_hover(const std::string& source_id, const std::string& target_id,
                       const std::string& relationship_type, double strength, bool bidirectional) {
    return source_id + (bidirectional ? " ↔ " : " → ") + target_id +
           "<br>Type: " + relationship_type +
           "<br>Strength: " + format_strength(strength);
}

nlohmann::json legend_json() {
    return {
        {"x", 0.02},
        {"y", 0.98},
        {"bgcolor", "rgba(255, 255, 255, 0.8)"},
        {"bordercolor", "rgba(0, 0, 0, 0.3)"},
        {"borderwidth", 1}
    };
}

}  // namespace

// ==========================================
// Traces
// ==========================================

nlohmann::json EdgeTrace::to_json(bool is_3d) const {
    nlohmann::json j;
    j["type"] = is_3d ? "scatter3d" : "scatter";
    j["mode"] = "lines";
    j["x"] = optional_array(x);
    j["y"] = optional_array(y);
    if (is_3d) {
        j["z"] = optional_array(z);
    }
    j["line"] = {{"color", color}, {"width", width}, {"dash", dash}};
    j["hovertext"] = optional_array(hover);
    j["hoverinfo"] = "text";
    j["name"] = name;
    j["showlegend"] = true;
    j["legendgroup"] = relationship_type;
    return j;
}

nlohmann::json NodeTrace::to_json(bool is_3d) const {
    nlohmann::json j;
    j["type"] = is_3d ? "scatter3d" : "scatter";
    j["mode"] = "markers+text";
    j["x"] = x;
    j["y"] = y;
    if (is_3d) {
        j["z"] = z;
    }
    j["marker"] = {
        {"size", is_3d ? 15 : 20},
        {"color", colors},
        {"opacity", 0.9},
        {"line", {{"color", "rgba(0,0,0,0.8)"}, {"width", 2}}},
        {"symbol", "circle"}
    };
    j["text"] = asset_ids;
    j["hovertext"] = hover;
    j["hoverinfo"] = "text";
    j["textposition"] = "top center";
    j["textfont"] = {{"size", 12}, {"color", "black"}};
    j["name"] = "Assets";
    return j;
}

// ==========================================
// Scene
// ==========================================

size_t Scene::visible_relationships() const {
    size_t count = 0;
    for (const auto& trace : edge_traces) {
        count += trace.edge_count();
    }
    return count;
}

nlohmann::json Scene::to_json() const {
    nlohmann::json data = nlohmann::json::array();
    for (const auto& trace : edge_traces) {
        data.push_back(trace.to_json(is_3d));
    }

    if (!direction_markers.empty()) {
        nlohmann::json arrows;
        arrows["type"] = "scatter3d";
        arrows["mode"] = "markers";
        nlohmann::json xs = nlohmann::json::array();
        nlohmann::json ys = nlohmann::json::array();
        nlohmann::json zs = nlohmann::json::array();
        nlohmann::json hovers = nlohmann::json::array();
        for (const auto& marker : direction_markers) {
            xs.push_back(marker.position.x);
            ys.push_back(marker.position.y);
            zs.push_back(marker.position.z);
            hovers.push_back(marker.hover_text);
        }
        arrows["x"] = xs;
        arrows["y"] = ys;
        arrows["z"] = zs;
        arrows["marker"] = {
            {"symbol", "diamond"},
            {"size", 8},
            {"color", "rgba(255, 0, 0, 0.8)"},
            {"line", {{"color", "red"}, {"width", 1}}}
        };
        arrows["hovertext"] = hovers;
        arrows["hoverinfo"] = "text";
        arrows["name"] = "Direction Arrows";
        arrows["showlegend"] = false;
        data.push_back(arrows);
    }

    if (!nodes.asset_ids.empty()) {
        data.push_back(nodes.to_json(is_3d));
    }

    nlohmann::json layout;
    layout["width"] = width;
    layout["height"] = height;
    layout["hovermode"] = "closest";
    layout["showlegend"] = true;
    layout["legend"] = legend_json();

    if (is_3d) {
        const std::string gridcolor = "rgba(200, 200, 200, 0.3)";
        layout["title"] = {
            {"text", title},
            {"x", 0.5},
            {"xanchor", "center"},
            {"font", {{"size", 16}}}
        };
        layout["scene"] = {
            {"xaxis", {{"title", "Dimension 1"}, {"showgrid", true}, {"gridcolor", gridcolor}}},
            {"yaxis", {{"title", "Dimension 2"}, {"showgrid", true}, {"gridcolor", gridcolor}}},
            {"zaxis", {{"title", "Dimension 3"}, {"showgrid", true}, {"gridcolor", gridcolor}}},
            {"bgcolor", "rgba(248, 248, 248, 0.95)"},
            {"camera", {{"eye", {{"x", 1.5}, {"y", 1.5}, {"z", 1.5}}}}}
        };
    } else {
        nlohmann::json axis = {
            {"showgrid", true},
            {"gridcolor", "rgba(200, 200, 200, 0.3)"},
            {"zeroline", false},
            {"showticklabels", false}
        };
        layout["title"] = {{"text", title}};
        layout["plot_bgcolor"] = "white";
        layout["paper_bgcolor"] = "#F8F9FA";
        layout["xaxis"] = axis;
        layout["yaxis"] = axis;
        if (!layout_name.empty()) {
            layout["annotations"] = nlohmann::json::array({{
                {"text", "Layout: " + layout_name},
                {"xref", "paper"},
                {"yref", "paper"},
                {"x", 0.5},
                {"y", -0.05},
                {"showarrow", false},
                {"font", {{"size", 12}, {"color", "gray"}}}
            }});
        }
    }

    return {{"data", data}, {"layout", layout}};
}

// ==========================================
// GraphRenderer
// ==========================================

GraphRenderer::GraphRenderer(const AssetGraph& graph) : graph_(graph) {}

std::string GraphRenderer::relationship_color(const std::string& relationship_type) {
    auto it = REL_TYPE_COLORS.find(relationship_type);
    return it != REL_TYPE_COLORS.end() ? it->second : DEFAULT_EDGE_COLOR;
}

std::string GraphRenderer::title_case(const std::string& relationship_type) {
    std::string result;
    result.reserve(relationship_type.size());
    bool word_start = true;
    for (char c : relationship_type) {
        if (c == '_') {
            c = ' ';
        }
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            result += static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc));
            word_start = false;
        } else {
            result += c;
            word_start = true;
        }
    }
    return result;
}

std::string GraphRenderer::format_trace_name(const std::string& relationship_type, bool bidirectional) {
    return title_case(relationship_type) + (bidirectional ? " (↔)" : " (→)");
}

std::string GraphRenderer::dynamic_title(size_t num_assets, size_t num_relationships,
                                         const std::string& base_title) {
    return base_title + " - " + std::to_string(num_assets) + " Assets, " +
           std::to_string(num_relationships) + " Relationships";
}

Scene GraphRenderer::build_3d_scene(const SceneOptions& options) const {
    const RelationshipFilters filters =
        options.show_all_relationships ? RelationshipFilters{} : options.filters;

    auto data = graph_.visualization_data({}, filters);
    data.validate();

    std::map<std::string, size_t> positions_by_id;
    for (size_t i = 0; i < data.asset_ids.size(); ++i) {
        positions_by_id[data.asset_ids[i]] = i;
    }

    Scene scene;
    scene.is_3d = true;
    scene.width = options.width;
    scene.height = options.height;

    for (const auto& group : data.groups) {
        EdgeTrace trace;
        trace.relationship_type = group.relationship_type;
        trace.bidirectional = group.bidirectional;
        trace.name = format_trace_name(group.relationship_type, group.bidirectional);
        trace.color = relationship_color(group.relationship_type);
        trace.width = group.bidirectional ? 4.0 : 2.0;
        trace.dash = group.bidirectional ? "solid" : "dash";

        for (const auto& rel : group.relationships) {
            const auto& src = data.positions[positions_by_id.at(rel.source_id)];
            const auto& tgt = data.positions[positions_by_id.at(rel.target_id)];
            trace.x.insert(trace.x.end(), {src.x, tgt.x, std::nullopt});
            trace.y.insert(trace.y.end(), {src.y, tgt.y, std::nullopt});
            trace.z.insert(trace.z.end(), {src.z, tgt.z, std::nullopt});

            const auto hover = edge_hover(rel.source_id, rel.target_id,
                                          group.relationship_type, rel.strength, group.bidirectional);
            trace.hover.insert(trace.hover.end(), {hover, hover, std::nullopt});
        }
        scene.edge_traces.push_back(std::move(trace));
    }

    if (options.show_direction_markers) {
        scene.direction_markers = std::move(data.direction_markers);
    }

    for (size_t i = 0; i < data.asset_ids.size(); ++i) {
        scene.nodes.asset_ids.push_back(data.asset_ids[i]);
        scene.nodes.x.push_back(data.positions[i].x);
        scene.nodes.y.push_back(data.positions[i].y);
        scene.nodes.z.push_back(data.positions[i].z);
        scene.nodes.colors.push_back(data.colors[i]);
        scene.nodes.hover.push_back(data.hover_texts[i]);
    }

    scene.title = dynamic_title(data.size(), scene.visible_relationships(), options.base_title);
    return scene;
}

std::map<std::string, Point2D> GraphRenderer::resolve_2d_positions(
    LayoutType layout,
    const std::vector<std::string>& asset_ids
) const {
    switch (layout) {
        case LayoutType::CIRCULAR:
            return create_circular_layout(asset_ids);
        case LayoutType::GRID:
            return create_grid_layout(asset_ids);
        case LayoutType::SPRING:
            break;
    }

    auto data = graph_.visualization_data();
    std::map<std::string, Point3D> positions_3d;
    for (size_t i = 0; i < data.asset_ids.size(); ++i) {
        positions_3d[data.asset_ids[i]] = data.positions[i];
    }
    return create_spring_layout_2d(positions_3d, asset_ids);
}

Scene GraphRenderer::build_2d_scene(LayoutType layout, const SceneOptions& options) const {
    Scene scene;
    scene.is_3d = false;
    scene.width = options.width;
    scene.height = options.height;

    std::vector<std::string> asset_ids;
    for (const auto& [id, asset] : graph_.assets()) {
        asset_ids.push_back(id);
    }

    if (asset_ids.empty()) {
        scene.title = "2D Asset Relationship Network (No Assets)";
        return scene;
    }

    std::string layout_name = layout_type_to_string(layout);
    layout_name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(layout_name[0])));
    scene.layout_name = layout_name;
    scene.title = "2D Asset Relationship Network (" + layout_name + " Layout)";

    const auto positions = resolve_2d_positions(layout, asset_ids);

    // One trace per relationship type, in first-seen order; no bidirectional merging
    std::map<std::string, size_t> trace_positions;
    for (const auto& source_id : asset_ids) {
        if (!positions.count(source_id)) {
            continue;
        }
        auto rels_it = graph_.relationships().find(source_id);
        if (rels_it == graph_.relationships().end()) {
            continue;
        }
        for (const auto& rel : rels_it->second) {
            if (!positions.count(rel.target_id) || !graph_.has_asset(rel.target_id)) {
                continue;
            }
            if (!options.show_all_relationships && is_filtered_out(options.filters, rel.relationship_type)) {
                continue;
            }

            auto it = trace_positions.find(rel.relationship_type);
            if (it == trace_positions.end()) {
                EdgeTrace trace;
                trace.relationship_type = rel.relationship_type;
                trace.name = title_case(rel.relationship_type);
                trace.color = relationship_color(rel.relationship_type);
                trace.width = 2.0;
                it = trace_positions.emplace(rel.relationship_type, scene.edge_traces.size()).first;
                scene.edge_traces.push_back(std::move(trace));
            }

            auto& trace = scene.edge_traces[it->second];
            const auto& src = positions.at(source_id);
            const auto& tgt = positions.at(rel.target_id);
            trace.x.insert(trace.x.end(), {src.x, tgt.x, std::nullopt});
            trace.y.insert(trace.y.end(), {src.y, tgt.y, std::nullopt});
            const auto hover = edge_hover(source_id, rel.target_id, rel.relationship_type,
                                          rel.strength, false);
            trace.hover.insert(trace.hover.end(), {hover, hover, std::nullopt});
        }
    }

    for (const auto& id : asset_ids) {
        auto pos = positions.find(id);
        if (pos == positions.end()) {
            continue;
        }
        const Asset* asset = graph_.get_asset(id);
        const auto class_name = asset_class_to_string(asset->asset_class);
        auto color = ASSET_CLASS_COLORS.find(class_name);

        scene.nodes.asset_ids.push_back(id);
        scene.nodes.x.push_back(pos->second.x);
        scene.nodes.y.push_back(pos->second.y);
        scene.nodes.colors.push_back(color != ASSET_CLASS_COLORS.end() ? color->second : DEFAULT_EDGE_COLOR);
        scene.nodes.hover.push_back(asset->name + " (" + asset->symbol + ")<br>Class: " +
                                    class_name + "<br>Sector: " + asset->sector);
    }

    return scene;
}

void GraphRenderer::export_html(const Scene& scene, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    const auto figure = scene.to_json();

    file << R"(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>)" << escape_html(scene.title) << R"(</title>
    <script src="https://cdn.plot.ly/plotly-2.27.0.min.js"></script>
    <style>
        body {
            margin: 0;
            font-family: 'Segoe UI', Tahoma, Geneva, Verdana, sans-serif;
            background: #F8F9FA;
        }
        #graph {
            width: 100vw;
            height: 100vh;
        }
    </style>
</head>
<body>
    <div id="graph"></div>
    <script>
        const figure = )" << escape_script_json(figure.dump()) << R"(;
        Plotly.newPlot('graph', figure.data, figure.layout, {responsive: true});
    </script>
</body>
</html>
)";
}

} // namespace ag

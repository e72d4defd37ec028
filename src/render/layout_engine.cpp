#include "render/layout_engine.hpp"
#include <cmath>
#include <stdexcept>

namespace {

constexpr double TWO_PI = 2.0 * 3.14159265358979323846;

size_t grid_columns(size_t n) {
    auto cols = static_cast<size_t>(std::ceil(std::sqrt(static_cast<double>(n))));
    return cols == 0 ? 1 : cols;
}

}  // namespace

namespace ag {

std::string layout_type_to_string(LayoutType type) {
    switch (type) {
        case LayoutType::SPRING: return "spring";
        case LayoutType::CIRCULAR: return "circular";
        case LayoutType::GRID: return "grid";
    }
    return "spring";
}

LayoutType layout_type_from_string(const std::string& value) {
    if (value == "spring") return LayoutType::SPRING;
    if (value == "circular") return LayoutType::CIRCULAR;
    if (value == "grid") return LayoutType::GRID;
    throw std::invalid_argument("Unknown layout type: " + value);
}

std::vector<Point2D> circular_layout_2d(size_t n) {
    std::vector<Point2D> positions;
    positions.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        double angle = TWO_PI * static_cast<double>(i) / static_cast<double>(n);
        positions.push_back({std::cos(angle), std::sin(angle)});
    }
    return positions;
}

std::vector<Point3D> circular_layout_3d(size_t n) {
    std::vector<Point3D> positions;
    positions.reserve(n);
    for (const auto& p : circular_layout_2d(n)) {
        positions.push_back({p.x, p.y, 0.0});
    }
    return positions;
}

std::vector<Point2D> grid_layout(size_t n) {
    std::vector<Point2D> positions;
    if (n == 0) {
        return positions;
    }
    positions.reserve(n);
    size_t cols = grid_columns(n);
    for (size_t i = 0; i < n; ++i) {
        positions.push_back({static_cast<double>(i % cols), static_cast<double>(i / cols)});
    }
    return positions;
}

std::map<std::string, Point2D> create_circular_layout(const std::vector<std::string>& asset_ids) {
    std::map<std::string, Point2D> result;
    auto points = circular_layout_2d(asset_ids.size());
    for (size_t i = 0; i < asset_ids.size(); ++i) {
        result[asset_ids[i]] = points[i];
    }
    return result;
}

std::map<std::string, Point2D> create_grid_layout(const std::vector<std::string>& asset_ids) {
    std::map<std::string, Point2D> result;
    auto points = grid_layout(asset_ids.size());
    for (size_t i = 0; i < asset_ids.size(); ++i) {
        result[asset_ids[i]] = points[i];
    }
    return result;
}

std::map<std::string, Point2D> create_spring_layout_2d(
    const std::map<std::string, Point3D>& positions_3d,
    const std::vector<std::string>& asset_ids
) {
    std::map<std::string, Point2D> result;
    if (positions_3d.empty() || asset_ids.empty()) {
        return result;
    }
    for (const auto& asset_id : asset_ids) {
        auto it = positions_3d.find(asset_id);
        if (it != positions_3d.end()) {
            result[asset_id] = {it->second.x, it->second.y};
        }
    }
    return result;
}

} // namespace ag

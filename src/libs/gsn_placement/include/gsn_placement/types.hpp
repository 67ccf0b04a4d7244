#pragma once

#include <gsn_placement/layout_constants.hpp>
#include <string>
#include <utility>
#include <vector>

namespace gsn_placement {

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double left() const { return x; }
    double right() const { return x + width; }
    double top() const { return y; }
    double bottom() const { return y + height; }
    double cx() const { return x + width * 0.5; }
    double cy() const { return y + height * 0.5; }
};

// Runtime layout parameters, seeded from the compile-time constants.
struct LayoutOptions {
    double sibling_gap = layout::sibling_gap;
    double level_gap = layout::level_gap;
    double tree_gap = layout::tree_gap;
    double satellite_gap = layout::satellite_gap;
    double satellite_vertical_gap = layout::satellite_vertical_gap;
    double overlap_margin = layout::overlap_margin;
    int overlap_max_iterations = layout::overlap_max_iterations;
    // Top-left corner of the packed forest.
    double origin_x = 0;
    double origin_y = 0;
};

enum class RouteStyle {
    Solid,   // supported-by
    Dashed   // in-context-of
};

struct RelationRoute {
    std::string relation_id;
    std::string source_id;
    std::string target_id;
    RouteStyle style = RouteStyle::Solid;
    std::vector<std::pair<double, double>> points; // polyline in world coordinates
};

} // namespace gsn_placement

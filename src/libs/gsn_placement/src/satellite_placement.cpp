#include <gsn_placement/layout_forest.hpp>
#include <algorithm>
#include <limits>
#include <utility>

namespace gsn_placement {

namespace {

struct Column {
    std::size_t begin;
    std::size_t end;
    bool right_side;
};

// Sibling tree nodes immediately left and right of n, or no_node.
std::pair<std::size_t, std::size_t> neighbours(const LayoutForest& forest, std::size_t n) {
    const LayoutNode& node = forest.nodes[n];
    if (node.parent == no_node) return { no_node, no_node };
    const auto& siblings = forest.nodes[node.parent].children;
    const auto it = std::find(siblings.begin(), siblings.end(), n);
    if (it == siblings.end()) return { no_node, no_node };
    const std::size_t left = it == siblings.begin() ? no_node : *(it - 1);
    const std::size_t right = it + 1 == siblings.end() ? no_node : *(it + 1);
    return { left, right };
}

void stack_column(LayoutForest& forest, std::size_t n, const Column& column,
    double limit, const LayoutOptions& options)
{
    if (column.begin >= column.end) return;
    const LayoutNode parent = forest.nodes[n];
    const double min_clearance = 2.0 * options.overlap_margin;

    double stack_height = 0.0;
    for (std::size_t i = column.begin; i < column.end; ++i)
        stack_height += forest.nodes[parent.satellites[i]].height;
    stack_height += static_cast<double>(column.end - column.begin - 1) * options.satellite_vertical_gap;

    double top = parent.y - stack_height * 0.5;
    for (std::size_t i = column.begin; i < column.end; ++i) {
        LayoutNode& s = forest.nodes[parent.satellites[i]];
        const double half = s.width * 0.5;
        if (column.right_side) {
            const double nearest = parent.x + parent.width * 0.5 + min_clearance + half;
            s.x = parent.x + parent.width * 0.5 + options.satellite_gap + half;
            if (s.x + half > limit) s.x = std::max(nearest, limit - half);
        } else {
            const double nearest = parent.x - parent.width * 0.5 - min_clearance - half;
            s.x = parent.x - parent.width * 0.5 - options.satellite_gap - half;
            if (s.x - half < limit) s.x = std::min(nearest, limit + half);
        }
        s.y = top + s.height * 0.5;
        top += s.height + options.satellite_vertical_gap;
    }
}

} // namespace

void place_satellites(LayoutForest& forest, const LayoutTree& tree, const LayoutOptions& options) {
    for (std::size_t n : tree.order) {
        const LayoutNode& node = forest.nodes[n];
        if (node.satellites.empty()) continue;

        const std::size_t count = node.satellites.size();
        const std::size_t split = (count + 1) / 2;

        // Satellites may not reach into a sibling's own satellite reserve.
        const auto [left_sibling, right_sibling] = neighbours(forest, n);
        double right_limit = std::numeric_limits<double>::max();
        double left_limit = std::numeric_limits<double>::lowest();
        if (right_sibling != no_node) {
            const LayoutNode& r = forest.nodes[right_sibling];
            right_limit = r.x - r.width * 0.5 - r.left_reserve - options.overlap_margin;
        }
        if (left_sibling != no_node) {
            const LayoutNode& l = forest.nodes[left_sibling];
            left_limit = l.x + l.width * 0.5 + l.right_reserve + options.overlap_margin;
        }

        stack_column(forest, n, Column{ 0, split, true }, right_limit, options);
        stack_column(forest, n, Column{ split, count, false }, left_limit, options);
    }
}

} // namespace gsn_placement

#include <gsn_placement/layout_forest.hpp>
#include <algorithm>

namespace gsn_placement {

namespace {

// Horizontal extent of one depth level of a subtree, relative to the subtree root's centre.
struct Extent {
    double left;
    double right;
};

using Contour = std::vector<Extent>;

// First ceil(n/2) satellites go to the right column, the rest to the left one.
std::size_t right_column_count(const LayoutNode& node) {
    return (node.satellites.size() + 1) / 2;
}

double column_width(const LayoutForest& forest, const LayoutNode& node, std::size_t begin, std::size_t end) {
    double w = 0.0;
    for (std::size_t i = begin; i < end; ++i)
        w = std::max(w, forest.nodes[node.satellites[i]].width);
    return w;
}

double column_height(const LayoutForest& forest, const LayoutNode& node, std::size_t begin, std::size_t end,
    double vertical_gap)
{
    if (begin >= end) return 0.0;
    double h = 0.0;
    for (std::size_t i = begin; i < end; ++i)
        h += forest.nodes[node.satellites[i]].height;
    return h + static_cast<double>(end - begin - 1) * vertical_gap;
}

void compute_reserves(LayoutForest& forest, std::size_t n, const LayoutOptions& options) {
    LayoutNode& node = forest.nodes[n];
    const std::size_t split = right_column_count(node);
    const std::size_t count = node.satellites.size();
    node.right_reserve = split > 0 ? options.satellite_gap + column_width(forest, node, 0, split) : 0.0;
    node.left_reserve = count > split ? options.satellite_gap + column_width(forest, node, split, count) : 0.0;
}

// Tallest of the node itself and its two satellite stacks.
double row_footprint(const LayoutForest& forest, const LayoutNode& node, const LayoutOptions& options) {
    const std::size_t split = right_column_count(node);
    const std::size_t count = node.satellites.size();
    return std::max({ node.height,
        column_height(forest, node, 0, split, options.satellite_vertical_gap),
        column_height(forest, node, split, count, options.satellite_vertical_gap) });
}

// Centre distance that keeps two neighbours and their satellite columns `gap` apart.
double required_spacing(const LayoutNode& left, const LayoutNode& right, double gap) {
    return left.width * 0.5 + left.right_reserve + gap + right.left_reserve + right.width * 0.5;
}

} // namespace

void position_tree(LayoutForest& forest, const LayoutTree& tree, const LayoutOptions& options) {
    for (std::size_t n : tree.order)
        compute_reserves(forest, n, options);

    // First pass, children before parents. `mid` is each node's centre over its children in
    // the children's own frame; contours are relative to the node's centre.
    std::vector<double> mid(forest.nodes.size(), 0.0);
    std::vector<Contour> contour(forest.nodes.size());

    for (auto it = tree.order.rbegin(); it != tree.order.rend(); ++it) {
        const std::size_t v = *it;
        LayoutNode& node = forest.nodes[v];
        const Extent own{ -(node.width * 0.5 + node.left_reserve), node.width * 0.5 + node.right_reserve };

        if (node.children.empty()) {
            mid[v] = 0.0;
            contour[v] = { own };
            continue;
        }

        Contour merged; // children levels, in the children's frame
        for (std::size_t i = 0; i < node.children.size(); ++i) {
            const std::size_t c = node.children[i];
            LayoutNode& child = forest.nodes[c];
            if (i == 0) {
                child.x = mid[c];
            } else {
                const LayoutNode& left = forest.nodes[node.children[i - 1]];
                child.x = left.x + required_spacing(left, child, options.sibling_gap);
                // Keep the whole subtree clear of every subtree placed to its left.
                double shift = 0.0;
                const std::size_t levels = std::min(merged.size(), contour[c].size());
                for (std::size_t d = 0; d < levels; ++d) {
                    const double overlap = merged[d].right + options.sibling_gap - (child.x + contour[c][d].left);
                    shift = std::max(shift, overlap);
                }
                child.x += shift;
            }
            child.mod = child.x - mid[c];

            const Contour& sub = contour[c];
            const std::size_t known = merged.size();
            if (known < sub.size()) merged.resize(sub.size(), Extent{ 0.0, 0.0 });
            for (std::size_t d = 0; d < sub.size(); ++d) {
                const Extent e{ child.x + sub[d].left, child.x + sub[d].right };
                merged[d] = d < known
                    ? Extent{ std::min(merged[d].left, e.left), std::max(merged[d].right, e.right) }
                    : e;
            }
            contour[c].clear();
            contour[c].shrink_to_fit();
        }

        const double first_x = forest.nodes[node.children.front()].x;
        const double last_x = forest.nodes[node.children.back()].x;
        mid[v] = (first_x + last_x) * 0.5;

        Contour& out = contour[v];
        out.reserve(merged.size() + 1);
        out.push_back(own);
        for (const Extent& e : merged)
            out.push_back(Extent{ e.left - mid[v], e.right - mid[v] });
    }

    LayoutNode& root = forest.nodes[tree.root];
    root.x = mid[tree.root];
    root.mod = 0.0;

    // Row heights per depth.
    std::vector<double> row_height;
    for (std::size_t n : tree.order) {
        const LayoutNode& node = forest.nodes[n];
        if (row_height.size() <= node.depth) row_height.resize(node.depth + 1, 0.0);
        row_height[node.depth] = std::max(row_height[node.depth], row_footprint(forest, node, options));
    }
    std::vector<double> row_top(row_height.size(), 0.0);
    for (std::size_t d = 1; d < row_height.size(); ++d)
        row_top[d] = row_top[d - 1] + row_height[d - 1] + options.level_gap;

    // Second pass, parents before children: accumulate ancestor modifiers.
    std::vector<double> mod_sum(forest.nodes.size(), 0.0);
    for (std::size_t n : tree.order) {
        LayoutNode& node = forest.nodes[n];
        if (node.parent != no_node) {
            const LayoutNode& parent = forest.nodes[node.parent];
            mod_sum[n] = mod_sum[node.parent] + parent.mod;
        }
        node.x += mod_sum[n];
        node.y = row_top[node.depth] + row_height[node.depth] * 0.5;
    }

    place_satellites(forest, tree, options);
}

} // namespace gsn_placement

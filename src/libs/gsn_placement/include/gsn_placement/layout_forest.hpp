#pragma once

#include <gsn_model/graph_index.hpp>
#include <gsn_model/types.hpp>
#include <gsn_placement/types.hpp>
#include <cstddef>
#include <vector>

namespace gsn_placement {

constexpr std::size_t no_node = static_cast<std::size_t>(-1);

// One record of the flat arena. Links are arena indices.
struct LayoutNode {
    std::size_t element = 0;        // index into the input element list
    std::size_t parent = no_node;
    std::size_t depth = 0;
    std::vector<std::size_t> children;
    std::vector<std::size_t> satellites;
    bool is_satellite = false;

    double width = 0;
    double height = 0;
    // Centre. Relative to the left sibling after the first pass, absolute after the second.
    double x = 0;
    double y = 0;
    // Offset applied to every descendant in the second pass.
    double mod = 0;
    // Horizontal room kept for the satellite columns.
    double left_reserve = 0;
    double right_reserve = 0;

    Rect rect() const { return Rect{ x - width * 0.5, y - height * 0.5, width, height }; }
};

struct LayoutTree {
    std::size_t root = no_node;
    // Tree nodes in pre-order (satellites excluded).
    std::vector<std::size_t> order;
    // Every node of the tree, satellites included.
    std::vector<std::size_t> members;
};

struct LayoutForest {
    std::vector<LayoutNode> nodes;
    std::vector<LayoutTree> trees;
    // Per element, its arena node or no_node when no tree reached it.
    std::vector<std::size_t> node_of_element;
};

struct OverlapStats {
    int iterations = 0;
    std::size_t remaining = 0;  // intersecting pairs found by the last pass
};

// Roots are non-satellite elements without an incoming supported-by relation, in input order.
// Non-satellite elements left unreached (cyclic islands) get a synthetic-root tree each.
// An element is claimed by the first tree that reaches it.
LayoutForest build_layout_forest(const std::vector<gsn_model::Element>& elements,
    const std::vector<gsn_model::Size>& sizes,
    const gsn_model::GraphIndex& graph);

// Satellite split and reserves, both Reingold-Tilford passes and row assignment, in the
// tree's local frame (root row top at y = 0).
void position_tree(LayoutForest& forest, const LayoutTree& tree, const LayoutOptions& options);

// Stacks each node's satellites beside it. Expects absolute tree node positions.
void place_satellites(LayoutForest& forest, const LayoutTree& tree, const LayoutOptions& options);

// Pushes intersecting margin-padded boxes apart across every tree of the forest, within the
// iteration cap. Expects packed positions.
OverlapStats resolve_overlaps(LayoutForest& forest, const LayoutOptions& options);

// Lays the trees out left to right starting at the options' origin.
void pack_forest(LayoutForest& forest, const LayoutOptions& options);

Rect bounding_box(const LayoutForest& forest, const LayoutTree& tree);

} // namespace gsn_placement

#include <gsn_placement/layout_forest.hpp>
#include <algorithm>
#include <limits>

namespace gsn_placement {

namespace {

using gsn_model::Element;
using gsn_model::GraphIndex;

class ForestBuilder {
public:
    ForestBuilder(const std::vector<Element>& elements,
        const std::vector<gsn_model::Size>& sizes,
        const GraphIndex& graph)
        : elements_(elements), sizes_(sizes), graph_(graph)
    {
        forest_.node_of_element.assign(elements.size(), no_node);
    }

    void build_tree(std::size_t root_element) {
        if (forest_.node_of_element[root_element] != no_node) return;

        LayoutTree tree;
        tree.root = add_node(root_element, no_node, false, tree);

        // Explicit-stack DFS; a frame walks its element's supported-by targets in order.
        struct Frame {
            std::size_t node;
            std::size_t next_target;
        };
        std::vector<Frame> stack;
        stack.push_back({ tree.root, 0 });
        while (!stack.empty()) {
            Frame& top = stack.back();
            const std::size_t parent = top.node;
            const auto& targets = graph_.supported_by[forest_.nodes[parent].element];
            if (top.next_target == targets.size()) {
                stack.pop_back();
                continue;
            }
            const std::size_t target = targets[top.next_target++];
            if (forest_.node_of_element[target] != no_node) continue; // revisit ends the branch
            if (gsn_model::is_satellite_kind(elements_[target].kind)) continue;
            const std::size_t child = add_node(target, parent, false, tree);
            stack.push_back({ child, 0 });
        }

        forest_.trees.push_back(std::move(tree));
    }

    LayoutForest take() { return std::move(forest_); }

private:
    std::size_t add_node(std::size_t element, std::size_t parent, bool satellite, LayoutTree& tree) {
        const std::size_t index = forest_.nodes.size();
        LayoutNode node;
        node.element = element;
        node.parent = parent;
        node.is_satellite = satellite;
        node.width = sizes_[element].width;
        node.height = sizes_[element].height;
        if (parent != no_node) node.depth = forest_.nodes[parent].depth + (satellite ? 0 : 1);
        forest_.nodes.push_back(std::move(node));
        forest_.node_of_element[element] = index;
        tree.members.push_back(index);

        if (parent != no_node) {
            auto& p = forest_.nodes[parent];
            (satellite ? p.satellites : p.children).push_back(index);
        }
        if (!satellite) {
            tree.order.push_back(index);
            attach_satellites(index, tree);
        }
        return index;
    }

    // in-context-of targets, and supported-by targets of a satellite kind.
    void attach_satellites(std::size_t node, LayoutTree& tree) {
        const std::size_t element = forest_.nodes[node].element;
        for (std::size_t target : graph_.in_context_of[element]) {
            if (forest_.node_of_element[target] == no_node)
                add_node(target, node, true, tree);
        }
        for (std::size_t target : graph_.supported_by[element]) {
            if (forest_.node_of_element[target] == no_node && gsn_model::is_satellite_kind(elements_[target].kind))
                add_node(target, node, true, tree);
        }
    }

    const std::vector<Element>& elements_;
    const std::vector<gsn_model::Size>& sizes_;
    const GraphIndex& graph_;
    LayoutForest forest_;
};

} // namespace

LayoutForest build_layout_forest(const std::vector<Element>& elements,
    const std::vector<gsn_model::Size>& sizes,
    const GraphIndex& graph)
{
    ForestBuilder builder(elements, sizes, graph);

    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (gsn_model::is_satellite_kind(elements[i].kind)) continue;
        if (graph.incoming_supported_by[i] == 0) builder.build_tree(i);
    }
    // Islands: cycles with no entry point. The first one also covers a fully cyclic graph.
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (!gsn_model::is_satellite_kind(elements[i].kind)) builder.build_tree(i);
    }
    return builder.take();
}

Rect bounding_box(const LayoutForest& forest, const LayoutTree& tree) {
    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = std::numeric_limits<double>::lowest();
    for (std::size_t n : tree.members) {
        const Rect r = forest.nodes[n].rect();
        min_x = std::min(min_x, r.left());
        min_y = std::min(min_y, r.top());
        max_x = std::max(max_x, r.right());
        max_y = std::max(max_y, r.bottom());
    }
    if (tree.members.empty()) return {};
    return Rect{ min_x, min_y, max_x - min_x, max_y - min_y };
}

} // namespace gsn_placement

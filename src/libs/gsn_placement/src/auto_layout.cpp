#include <gsn_placement/auto_layout.hpp>
#include <gsn_placement/element_sizing.hpp>
#include <gsn_placement/layout_forest.hpp>
#include <gsn_model/graph_index.hpp>
#include <spdlog/spdlog.h>
#include <memory>

namespace gsn_placement {

namespace {

std::shared_ptr<spdlog::logger> layout_logger() {
    auto logger = spdlog::get("gsn");
    return logger ? logger : spdlog::default_logger();
}

void offset_tree(LayoutForest& forest, const LayoutTree& tree, double dx, double dy) {
    for (std::size_t n : tree.members) {
        forest.nodes[n].x += dx;
        forest.nodes[n].y += dy;
    }
}

} // namespace

void pack_forest(LayoutForest& forest, const LayoutOptions& options) {
    double cursor = options.origin_x;
    for (const auto& tree : forest.trees) {
        const Rect box = bounding_box(forest, tree);
        offset_tree(forest, tree, cursor - box.left(), options.origin_y - box.top());
        cursor += box.width + options.tree_gap;
    }
}

std::vector<gsn_model::Element> auto_layout(const std::vector<gsn_model::Element>& elements,
    const std::vector<gsn_model::Relation>& relations,
    const gsn_model::ModuleLookup* modules,
    const LayoutOptions& options)
{
    if (elements.empty()) return elements;

    const auto graph = gsn_model::build_graph_index(elements, relations);
    std::vector<gsn_model::Size> sizes;
    sizes.reserve(elements.size());
    for (const auto& e : elements)
        sizes.push_back(compute_element_size(e, modules));

    LayoutForest forest = build_layout_forest(elements, sizes, graph);
    if (forest.trees.empty()) {
        layout_logger()->debug("auto_layout skipped: no non-satellite element among {}", elements.size());
        return elements;
    }

    for (const auto& tree : forest.trees)
        position_tree(forest, tree, options);
    pack_forest(forest, options);

    const OverlapStats stats = resolve_overlaps(forest, options);
    if (stats.remaining > 0) {
        layout_logger()->warn("overlap_unresolved trees={} pairs={} iterations={}",
            forest.trees.size(), stats.remaining, stats.iterations);
    }

    std::vector<gsn_model::Element> out = elements;
    std::size_t placed = 0;
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i].size = sizes[i];
        const std::size_t n = forest.node_of_element[i];
        if (n == no_node) continue;
        out[i].position = gsn_model::Point{ forest.nodes[n].x, forest.nodes[n].y };
        ++placed;
    }

    layout_logger()->debug("auto_layout elements={} trees={} placed={}",
        elements.size(), forest.trees.size(), placed);
    return out;
}

gsn_model::Diagram auto_layout(const gsn_model::Diagram& diagram,
    const gsn_model::ModuleLookup* modules,
    const LayoutOptions& options)
{
    gsn_model::Diagram out;
    out.title = diagram.title;
    out.elements = auto_layout(diagram.elements, diagram.relations, modules, options);
    out.relations = diagram.relations;
    return out;
}

} // namespace gsn_placement

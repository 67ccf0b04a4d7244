#include <gsn_placement/element_sizing.hpp>
#include <gsn_placement/layout_constants.hpp>
#include <gsn_placement/text_metrics.hpp>
#include <gsn_model/graph_index.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace gsn_placement {

namespace {

using namespace layout;

// Width growth steps tried when the text still overflows at maximum height.
constexpr int max_widen_steps = 12;
constexpr double widen_factor = 1.1;

struct TextBlock {
    std::vector<double> line_widths;
    double total_width = 0.0;
};

TextBlock measure(const std::string& text, double scale) {
    TextBlock block;
    for (auto line : split_lines(text)) {
        const double w = estimate_text_width(line) * scale;
        block.line_widths.push_back(w);
        block.total_width += w;
    }
    return block;
}

// Height needed to wrap the text into inner_width.
double wrapped_height(const TextBlock& block, double inner_width, double scale) {
    std::size_t rows = 0;
    for (double w : block.line_widths) {
        if (inner_width <= 0.0) {
            rows += 1;
            continue;
        }
        rows += std::max<std::size_t>(1, static_cast<std::size_t>(std::ceil(w / inner_width)));
    }
    return static_cast<double>(rows) * line_height * scale;
}

gsn_model::Size empty_size(const SizeBounds& b) {
    const double h = b.min_height;
    const double w = std::clamp(h * golden_ratio, b.min_width, b.max_width);
    return { std::round(w), std::round(h) };
}

gsn_model::Size diamond_size(const std::string& text, const SizeBounds& b) {
    if (text.empty()) return { b.min_width, b.min_height };
    const TextBlock block = measure(text, 1.0);
    // The text box inscribed in a diamond is half its side each way.
    const double side = 2.0 * std::sqrt(block.total_width * line_height) + chrome_width();
    const double s = std::round(std::clamp(side, b.min_width, b.max_width));
    return { s, s };
}

} // namespace

const gsn_model::Element* find_top_level_goal(const gsn_model::Diagram& diagram) {
    const auto graph = gsn_model::build_graph_index(diagram.elements, diagram.relations);
    const gsn_model::Element* first_goal = nullptr;
    for (std::size_t i = 0; i < diagram.elements.size(); ++i) {
        const auto& e = diagram.elements[i];
        if (e.kind != gsn_model::ElementKind::Goal) continue;
        if (graph.incoming_supported_by[i] == 0) return &e;
        if (!first_goal) first_goal = &e;
    }
    return first_goal;
}

std::string measured_text(const gsn_model::Element& element, const gsn_model::ModuleLookup* modules) {
    if (element.kind == gsn_model::ElementKind::Module && modules && !element.module_ref.empty()) {
        auto it = modules->find(element.module_ref);
        if (it != modules->end()) {
            if (const gsn_model::Element* goal = find_top_level_goal(it->second)) {
                std::string nested = strip_markup(goal->content);
                if (!nested.empty()) return nested;
            }
        }
    }
    return strip_markup(element.content);
}

gsn_model::Size compute_element_size(const gsn_model::Element& element,
    const gsn_model::ModuleLookup* modules)
{
    const SizeBounds b = bounds_for(element.kind);
    const std::string text = measured_text(element, modules);

    if (element.kind == gsn_model::ElementKind::Undeveloped) return diamond_size(text, b);
    if (text.empty()) return empty_size(b);

    const double scale = is_elliptical(element.kind) ? ellipse_text_factor : 1.0;
    const TextBlock block = measure(text, scale);
    const double chrome_h = chrome_height(element.kind);

    // Golden-ratio box whose inner area matches the text area.
    const double text_area = block.total_width * line_height * scale;
    double w = std::clamp(std::sqrt(text_area * golden_ratio) + chrome_width(), b.min_width, b.max_width);
    double needed_h = wrapped_height(block, w - chrome_width(), scale) + chrome_h;

    // At maximum height, widen until the wrapped text fits or the width bound is hit.
    for (int step = 0; step < max_widen_steps && needed_h > b.max_height && w < b.max_width; ++step) {
        w = std::min(b.max_width, w * widen_factor);
        needed_h = wrapped_height(block, w - chrome_width(), scale) + chrome_h;
    }

    const double h = std::clamp(std::max(w / golden_ratio, needed_h), b.min_height, b.max_height);
    return { std::round(w), std::round(h) };
}

} // namespace gsn_placement

#pragma once

#include <gsn_model/types.hpp>
#include <string>

namespace gsn_placement {

// Content-driven size: the box approaches the golden ratio while the wrapped text still fits,
// clamped to the kind's bounds. Module elements resolved through `modules` are sized from the
// nested diagram's top-level goal. Undeveloped elements are square.
gsn_model::Size compute_element_size(const gsn_model::Element& element,
    const gsn_model::ModuleLookup* modules = nullptr);

// Plain text the element is measured by (markup stripped, module content resolved).
std::string measured_text(const gsn_model::Element& element,
    const gsn_model::ModuleLookup* modules = nullptr);

// First goal without an incoming supported-by relation, or the first goal at all.
const gsn_model::Element* find_top_level_goal(const gsn_model::Diagram& diagram);

} // namespace gsn_placement

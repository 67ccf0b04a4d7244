#pragma once

#include <gsn_model/types.hpp>
#include <gsn_placement/types.hpp>
#include <vector>

namespace gsn_placement {

// Recomputes size and position of every element reached by the forest and returns the new
// list; other fields pass through. Empty and all-satellite inputs come back unchanged.
// Satellite elements without a parent keep their position. `modules` may be null.
std::vector<gsn_model::Element> auto_layout(const std::vector<gsn_model::Element>& elements,
    const std::vector<gsn_model::Relation>& relations,
    const gsn_model::ModuleLookup* modules = nullptr,
    const LayoutOptions& options = {});

gsn_model::Diagram auto_layout(const gsn_model::Diagram& diagram,
    const gsn_model::ModuleLookup* modules = nullptr,
    const LayoutOptions& options = {});

} // namespace gsn_placement

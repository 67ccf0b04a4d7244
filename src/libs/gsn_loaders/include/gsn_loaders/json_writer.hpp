#pragma once

#include <gsn_analysis/validator.hpp>
#include <gsn_model/types.hpp>
#include <gsn_placement/types.hpp>
#include <nlohmann/json.hpp>
#include <vector>

namespace gsn_loaders {

// Same shape the loader accepts: {title, nodes, links}.
nlohmann::json diagram_to_json(const gsn_model::Diagram& diagram);

// {isValid, errors: [{type, code, message, nodeIds}], warnings: [...]}
nlohmann::json validation_result_to_json(const gsn_analysis::ValidationResult& result);

// [{id, source, target, style, points: [[x, y], ...]}]
nlohmann::json relation_routes_to_json(const std::vector<gsn_placement::RelationRoute>& routes);

} // namespace gsn_loaders

#include <gsn_loaders/json_writer.hpp>
#include <string>

namespace gsn_loaders {

namespace {

nlohmann::json diagnostic_to_json(const gsn_analysis::Diagnostic& d) {
    return {
        { "type", std::string(gsn_analysis::severity_name(d.severity)) },
        { "code", std::string(gsn_analysis::code_name(d.code)) },
        { "message", d.message },
        { "nodeIds", d.element_ids },
    };
}

} // namespace

nlohmann::json diagram_to_json(const gsn_model::Diagram& diagram) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& e : diagram.elements) {
        nlohmann::json n = {
            { "id", e.id },
            { "type", std::string(gsn_model::kind_name(e.kind)) },
            { "content", e.content },
            { "position", { { "x", e.position.x }, { "y", e.position.y } } },
            { "size", { { "width", e.size.width }, { "height", e.size.height } } },
        };
        if (!e.label.empty()) n["label"] = e.label;
        if (!e.module_ref.empty()) n["moduleId"] = e.module_ref;
        nodes.push_back(std::move(n));
    }

    nlohmann::json links = nlohmann::json::array();
    for (const auto& r : diagram.relations) {
        links.push_back({
            { "id", r.id },
            { "source", r.source_id },
            { "target", r.target_id },
            { "type", std::string(gsn_model::relation_kind_name(r.kind)) },
        });
    }

    nlohmann::json out = { { "nodes", std::move(nodes) }, { "links", std::move(links) } };
    if (!diagram.title.empty()) out["title"] = diagram.title;
    return out;
}

nlohmann::json validation_result_to_json(const gsn_analysis::ValidationResult& result) {
    nlohmann::json errors = nlohmann::json::array();
    for (const auto& d : result.errors) errors.push_back(diagnostic_to_json(d));
    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& d : result.warnings) warnings.push_back(diagnostic_to_json(d));
    return { { "isValid", result.is_valid }, { "errors", std::move(errors) }, { "warnings", std::move(warnings) } };
}

nlohmann::json relation_routes_to_json(const std::vector<gsn_placement::RelationRoute>& routes) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : routes) {
        nlohmann::json points = nlohmann::json::array();
        for (const auto& [x, y] : r.points) points.push_back({ x, y });
        out.push_back({
            { "id", r.relation_id },
            { "source", r.source_id },
            { "target", r.target_id },
            { "style", r.style == gsn_placement::RouteStyle::Dashed ? "dashed" : "solid" },
            { "points", std::move(points) },
        });
    }
    return out;
}

} // namespace gsn_loaders

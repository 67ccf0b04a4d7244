#include <gsn_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>
#include <limits>
#include <memory>
#include <utility>

namespace gsn_loaders {

namespace {

std::shared_ptr<spdlog::logger> loader_logger() {
    auto logger = spdlog::get("gsn");
    return logger ? logger : spdlog::default_logger();
}

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

double number_or(const nlohmann::json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

std::optional<gsn_model::Element> parse_node(const nlohmann::json& n) {
    if (!n.is_object() || !n.contains("id") || !n["id"].is_string()) {
        loader_logger()->error("node without a string id");
        return std::nullopt;
    }
    gsn_model::Element e;
    e.id = n["id"].get<std::string>();

    const std::string type = string_or(n, "type");
    const auto kind = gsn_model::kind_from_string(type);
    if (!kind) {
        loader_logger()->error("node {} has unknown type '{}'", e.id, type);
        return std::nullopt;
    }
    e.kind = *kind;
    e.content = string_or(n, "content");
    e.label = string_or(n, "label");
    e.module_ref = string_or(n, "moduleId");
    if (n.contains("position") && n["position"].is_object()) {
        e.position.x = number_or(n["position"], "x", 0);
        e.position.y = number_or(n["position"], "y", 0);
    }
    if (n.contains("size") && n["size"].is_object()) {
        e.size.width = number_or(n["size"], "width", e.size.width);
        e.size.height = number_or(n["size"], "height", e.size.height);
    }
    return e;
}

std::optional<gsn_model::Relation> parse_link(const nlohmann::json& l) {
    if (!l.is_object()) {
        loader_logger()->error("link entry is not an object");
        return std::nullopt;
    }
    gsn_model::Relation r;
    r.id = string_or(l, "id");
    if (!l.contains("source") || !l["source"].is_string()
        || !l.contains("target") || !l["target"].is_string()) {
        loader_logger()->error("link '{}' needs string source and target", r.id);
        return std::nullopt;
    }
    r.source_id = l["source"].get<std::string>();
    r.target_id = l["target"].get<std::string>();
    if (l.contains("type")) {
        const std::string type = string_or(l, "type");
        const auto kind = gsn_model::relation_kind_from_string(type);
        if (!kind) {
            loader_logger()->error("link {} has unknown type '{}'", r.id, type);
            return std::nullopt;
        }
        r.kind = *kind;
    }
    return r;
}

std::optional<gsn_model::Diagram> parse_diagram(const nlohmann::json& j) {
    gsn_model::Diagram d;
    if (!j.is_object() || !j.contains("nodes") || !j["nodes"].is_array()) {
        loader_logger()->error("diagram has no 'nodes' array");
        return std::nullopt;
    }

    for (const auto& n : j["nodes"]) {
        auto e = parse_node(n);
        if (!e) return std::nullopt;
        d.elements.push_back(std::move(*e));
    }
    if (j.contains("links") && j["links"].is_array()) {
        for (const auto& l : j["links"]) {
            auto r = parse_link(l);
            if (!r) return std::nullopt;
            d.relations.push_back(std::move(*r));
        }
    }
    d.title = string_or(j, "title");
    return d;
}

std::optional<DiagramSnapshot> parse_snapshot(const nlohmann::json& j) {
    DiagramSnapshot snapshot;

    if (j.contains("modules") && j["modules"].is_object()) {
        for (const auto& [id, module_json] : j["modules"].items()) {
            auto nested = parse_diagram(module_json);
            if (!nested) {
                loader_logger()->error("module '{}' is not a valid diagram", id);
                return std::nullopt;
            }
            snapshot.modules.emplace(id, std::move(*nested));
        }
    }

    if (j.contains("nodes")) {
        auto top = parse_diagram(j);
        if (!top) return std::nullopt;
        snapshot.diagram = std::move(*top);
        return snapshot;
    }

    // Project export: the current (or root) module is the top-level diagram.
    const std::string current = string_or(j, "currentDiagramId", "root");
    auto it = snapshot.modules.find(current);
    if (it == snapshot.modules.end()) {
        loader_logger()->error("snapshot has neither nodes nor a '{}' module", current);
        return std::nullopt;
    }
    snapshot.diagram = it->second;
    return snapshot;
}

void read_option(const nlohmann::json& j, const char* key, double& value, bool allow_negative = false) {
    if (!j.contains(key)) return;
    if (!j[key].is_number() || (!allow_negative && j[key].get<double>() < 0)) {
        loader_logger()->warn("layout option '{}' ignored: expected a {}number", key,
            allow_negative ? "" : "non-negative ");
        return;
    }
    value = j[key].get<double>();
}

} // namespace

std::optional<DiagramSnapshot> load_diagram_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_snapshot(j);
    } catch (const nlohmann::json::exception& e) {
        loader_logger()->error("diagram JSON rejected: {}", e.what());
        return std::nullopt;
    }
}

std::optional<DiagramSnapshot> load_diagram_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        loader_logger()->error("cannot open diagram file {}", path);
        return std::nullopt;
    }
    return load_diagram_from_json(f);
}

std::optional<gsn_placement::LayoutOptions> load_layout_options_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_object()) {
            loader_logger()->error("layout options must be a JSON object");
            return std::nullopt;
        }
        gsn_placement::LayoutOptions options;
        read_option(j, "sibling_gap", options.sibling_gap);
        read_option(j, "level_gap", options.level_gap);
        read_option(j, "tree_gap", options.tree_gap);
        read_option(j, "satellite_gap", options.satellite_gap);
        read_option(j, "satellite_vertical_gap", options.satellite_vertical_gap);
        read_option(j, "overlap_margin", options.overlap_margin);
        read_option(j, "origin_x", options.origin_x, true);
        read_option(j, "origin_y", options.origin_y, true);
        if (j.contains("overlap_max_iterations")) {
            const auto& cap = j["overlap_max_iterations"];
            const std::int64_t value = cap.is_number_integer() ? cap.get<std::int64_t>() : -1;
            if (value >= 0 && value <= std::numeric_limits<int>::max())
                options.overlap_max_iterations = static_cast<int>(value);
            else
                loader_logger()->warn("layout option 'overlap_max_iterations' ignored: expected a non-negative integer");
        }
        return options;
    } catch (const nlohmann::json::exception& e) {
        loader_logger()->error("layout options JSON rejected: {}", e.what());
        return std::nullopt;
    }
}

std::optional<gsn_placement::LayoutOptions> load_layout_options_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        loader_logger()->error("cannot open layout options file {}", path);
        return std::nullopt;
    }
    return load_layout_options_from_json(f);
}

} // namespace gsn_loaders

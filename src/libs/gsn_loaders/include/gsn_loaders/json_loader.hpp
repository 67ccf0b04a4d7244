#pragma once

#include <gsn_model/types.hpp>
#include <gsn_placement/types.hpp>
#include <optional>
#include <istream>
#include <string>

namespace gsn_loaders {

// A top-level diagram plus the nested diagrams its Module elements refer to.
struct DiagramSnapshot {
    gsn_model::Diagram diagram;
    gsn_model::ModuleLookup modules;
};

// Accepts a single diagram ({title, nodes, links}, optionally with "modules") or a project
// export ({modules: {root: ..., ...}, currentDiagramId}). Returns nullopt on malformed input.
std::optional<DiagramSnapshot> load_diagram_from_json(std::istream& in);
std::optional<DiagramSnapshot> load_diagram_from_json_file(const std::string& path);

// Every key is optional; missing or invalid keys keep their defaults.
std::optional<gsn_placement::LayoutOptions> load_layout_options_from_json(std::istream& in);
std::optional<gsn_placement::LayoutOptions> load_layout_options_from_json_file(const std::string& path);

} // namespace gsn_loaders

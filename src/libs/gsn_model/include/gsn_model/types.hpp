#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gsn_model {

enum class ElementKind {
    Goal,
    Strategy,
    Context,
    Evidence,
    Assumption,
    Justification,
    Undeveloped,
    Module
};

enum class RelationKind {
    SupportedBy,   // hierarchical, solid line
    InContextOf    // satellite, dashed line
};

struct Point {
    double x = 0;
    double y = 0;
};

struct Size {
    double width = 0;
    double height = 0;
};

struct Element {
    std::string id;
    ElementKind kind = ElementKind::Goal;
    std::string content;
    // Centre of the element; the editor draws it at position +/- size / 2.
    Point position;
    Size size{180, 120};
    std::string label;
    // Nested diagram id, only meaningful for Module elements.
    std::string module_ref;
};

struct Relation {
    std::string id;
    std::string source_id;
    std::string target_id;
    RelationKind kind = RelationKind::SupportedBy;
};

struct Diagram {
    std::string title;
    std::vector<Element> elements;
    std::vector<Relation> relations;
};

// module_ref -> nested diagram.
using ModuleLookup = std::unordered_map<std::string, Diagram>;

// Context, Assumption and Justification are drawn beside the element that points to them.
inline constexpr bool is_satellite_kind(ElementKind kind) {
    return kind == ElementKind::Context
        || kind == ElementKind::Assumption
        || kind == ElementKind::Justification;
}

// Kinds that end an argument branch.
inline constexpr bool is_terminal_kind(ElementKind kind) {
    return kind == ElementKind::Evidence
        || kind == ElementKind::Undeveloped
        || kind == ElementKind::Module;
}

inline constexpr std::string_view kind_name(ElementKind kind) {
    switch (kind) {
    case ElementKind::Goal: return "Goal";
    case ElementKind::Strategy: return "Strategy";
    case ElementKind::Context: return "Context";
    case ElementKind::Evidence: return "Evidence";
    case ElementKind::Assumption: return "Assumption";
    case ElementKind::Justification: return "Justification";
    case ElementKind::Undeveloped: return "Undeveloped";
    case ElementKind::Module: return "Module";
    }
    return "Goal";
}

inline std::optional<ElementKind> kind_from_string(std::string_view s) {
    static const ElementKind all[] = {
        ElementKind::Goal, ElementKind::Strategy, ElementKind::Context, ElementKind::Evidence,
        ElementKind::Assumption, ElementKind::Justification, ElementKind::Undeveloped,
        ElementKind::Module,
    };
    for (ElementKind k : all)
        if (kind_name(k) == s) return k;
    return std::nullopt;
}

inline constexpr std::string_view relation_kind_name(RelationKind kind) {
    return kind == RelationKind::InContextOf ? "in-context-of" : "supported-by";
}

// Accepts the editor's legacy "solid"/"dashed" link types as well.
inline std::optional<RelationKind> relation_kind_from_string(std::string_view s) {
    if (s == "supported-by" || s == "solid") return RelationKind::SupportedBy;
    if (s == "in-context-of" || s == "dashed") return RelationKind::InContextOf;
    return std::nullopt;
}

} // namespace gsn_model

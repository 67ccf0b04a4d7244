#pragma once

#include <gsn_model/types.hpp>

namespace gsn_placement {

// Shared layout constants for GSN elements (used by sizing, tree layout and routing).
// All values in world units (1 unit = 1 editor pixel at zoom 1).

namespace layout {

constexpr double golden_ratio = 1.618;

// Text measurement heuristic: estimated advance per glyph.
constexpr double ascii_glyph_width = 8.0;
constexpr double wide_glyph_width = 14.0;   // CJK and full-width forms
constexpr double other_glyph_width = 10.0;  // accented Latin, Cyrillic, Greek, ...
constexpr double line_height = 20.0;

constexpr double content_padding_x = 12.0;
constexpr double content_padding_y = 10.0;
// Module elements draw a folder tab above the content.
constexpr double module_tab_height = 20.0;
// Ellipses (Evidence, Assumption, Justification) only fit text in their inscribed box.
constexpr double ellipse_text_factor = 1.3;

// Tree spacing.
constexpr double sibling_gap = 40.0;
constexpr double level_gap = 80.0;
constexpr double tree_gap = 120.0;

// Satellite columns beside a tree node.
constexpr double satellite_gap = 30.0;
constexpr double satellite_vertical_gap = 24.0;

// Overlap resolution.
constexpr double overlap_margin = 8.0;
constexpr int overlap_max_iterations = 100;

struct SizeBounds {
    double min_width;
    double max_width;
    double min_height;
    double max_height;
};

constexpr SizeBounds hierarchical_bounds{ 140.0, 360.0, 90.0, 280.0 };
constexpr SizeBounds satellite_bounds{ 90.0, 260.0, 60.0, 200.0 };
constexpr SizeBounds undeveloped_bounds{ 48.0, 120.0, 48.0, 120.0 };

inline constexpr SizeBounds bounds_for(gsn_model::ElementKind kind) {
    if (kind == gsn_model::ElementKind::Undeveloped) return undeveloped_bounds;
    return gsn_model::is_satellite_kind(kind) ? satellite_bounds : hierarchical_bounds;
}

inline constexpr bool is_elliptical(gsn_model::ElementKind kind) {
    return kind == gsn_model::ElementKind::Evidence
        || kind == gsn_model::ElementKind::Assumption
        || kind == gsn_model::ElementKind::Justification;
}

// Vertical room taken by chrome that is not text.
inline constexpr double chrome_height(gsn_model::ElementKind kind) {
    const double tab = kind == gsn_model::ElementKind::Module ? module_tab_height : 0.0;
    return 2.0 * content_padding_y + tab;
}

inline constexpr double chrome_width() {
    return 2.0 * content_padding_x;
}

} // namespace layout
} // namespace gsn_placement

#include <gsn_placement/layout_forest.hpp>
#include <algorithm>
#include <vector>

namespace gsn_placement {

namespace {

// Penetrations below this are treated as touching.
constexpr double touch_epsilon = 1e-6;

struct Inflated {
    double left, top, right, bottom;
};

// BB expanded by margin on every side.
Inflated inflated_rect(const LayoutNode& n, double m) {
    return Inflated{ n.x - n.width * 0.5 - m, n.y - n.height * 0.5 - m,
        n.x + n.width * 0.5 + m, n.y + n.height * 0.5 + m };
}

// Pushes both nodes apart along the axis of smaller penetration, half the correction each.
// Returns false when the padded boxes do not intersect.
bool resolve_overlap(LayoutNode& a, LayoutNode& b, double margin) {
    const Inflated ra = inflated_rect(a, margin);
    const Inflated rb = inflated_rect(b, margin);
    const double overlap_x = std::min(ra.right, rb.right) - std::max(ra.left, rb.left);
    const double overlap_y = std::min(ra.bottom, rb.bottom) - std::max(ra.top, rb.top);
    if (overlap_x <= touch_epsilon || overlap_y <= touch_epsilon) return false;

    if (overlap_x <= overlap_y) {
        const double dx = (overlap_x + touch_epsilon) * 0.5;
        if (a.x <= b.x) {
            a.x -= dx;
            b.x += dx;
        } else {
            a.x += dx;
            b.x -= dx;
        }
    } else {
        const double dy = (overlap_y + touch_epsilon) * 0.5;
        if (a.y <= b.y) {
            a.y -= dy;
            b.y += dy;
        } else {
            a.y += dy;
            b.y -= dy;
        }
    }
    return true;
}

} // namespace

OverlapStats resolve_overlaps(LayoutForest& forest, const LayoutOptions& options) {
    OverlapStats stats;
    std::vector<std::size_t> members;
    for (const auto& tree : forest.trees)
        members.insert(members.end(), tree.members.begin(), tree.members.end());

    // Repeated passes let a push propagate (A pushes B, B pushes C, ...).
    for (int iter = 0; iter < options.overlap_max_iterations; ++iter) {
        std::size_t resolved = 0;
        for (std::size_t i = 0; i < members.size(); ++i) {
            for (std::size_t j = i + 1; j < members.size(); ++j) {
                if (resolve_overlap(forest.nodes[members[i]], forest.nodes[members[j]], options.overlap_margin))
                    ++resolved;
            }
        }
        stats.iterations = iter + 1;
        stats.remaining = resolved;
        if (resolved == 0) break;
    }
    return stats;
}

} // namespace gsn_placement

#include <gsn_placement/relation_routes.hpp>
#include <cmath>
#include <string>
#include <unordered_map>

namespace gsn_placement {

namespace {

// Below this horizontal offset a supported-by route is drawn straight.
constexpr double straight_tolerance = 5.0;

Rect element_rect(const gsn_model::Element& e) {
    return Rect{ e.position.x - e.size.width * 0.5, e.position.y - e.size.height * 0.5,
        e.size.width, e.size.height };
}

struct Endpoints {
    gsn_model::Point from;
    gsn_model::Point to;
};

Endpoints support_endpoints(const Rect& parent, const Rect& child) {
    return { { parent.cx(), parent.bottom() }, { child.cx(), child.top() } };
}

// A context link leaves the owner through the side facing the satellite. Satellites sit to
// the left or right of their owner, so the side exits win ties against top/bottom.
Endpoints context_endpoints(const Rect& owner, const Rect& satellite) {
    const Endpoints sides[] = {
        { { owner.right(), owner.cy() }, { satellite.left(), satellite.cy() } },
        { { owner.left(), owner.cy() }, { satellite.right(), satellite.cy() } },
        { { owner.cx(), owner.bottom() }, { satellite.cx(), satellite.top() } },
        { { owner.cx(), owner.top() }, { satellite.cx(), satellite.bottom() } },
    };
    auto length_sq = [](const Endpoints& e) {
        const double dx = e.to.x - e.from.x;
        const double dy = e.to.y - e.from.y;
        return dx * dx + dy * dy;
    };
    const Endpoints* shortest = &sides[0];
    for (const Endpoints& e : sides)
        if (length_sq(e) < length_sq(*shortest)) shortest = &e;
    return *shortest;
}

} // namespace

std::vector<RelationRoute> compute_relation_routes(const std::vector<gsn_model::Element>& elements,
    const std::vector<gsn_model::Relation>& relations)
{
    std::unordered_map<std::string, Rect> rects;
    rects.reserve(elements.size());
    for (const auto& e : elements)
        rects.emplace(e.id, element_rect(e));

    std::vector<RelationRoute> routes;
    routes.reserve(relations.size());
    for (const auto& rel : relations) {
        auto src = rects.find(rel.source_id);
        auto dst = rects.find(rel.target_id);
        if (src == rects.end() || dst == rects.end()) continue;

        RelationRoute route;
        route.relation_id = rel.id;
        route.source_id = rel.source_id;
        route.target_id = rel.target_id;

        if (rel.kind == gsn_model::RelationKind::SupportedBy) {
            route.style = RouteStyle::Solid;
            const Endpoints a = support_endpoints(src->second, dst->second);
            route.points.push_back({ a.from.x, a.from.y });
            if (std::abs(a.to.x - a.from.x) > straight_tolerance) {
                const double mid_y = (a.from.y + a.to.y) * 0.5;
                route.points.push_back({ a.from.x, mid_y });
                route.points.push_back({ a.to.x, mid_y });
            }
            route.points.push_back({ a.to.x, a.to.y });
        } else {
            route.style = RouteStyle::Dashed;
            const Endpoints a = context_endpoints(src->second, dst->second);
            route.points.push_back({ a.from.x, a.from.y });
            if (std::abs(a.to.x - a.from.x) > std::abs(a.to.y - a.from.y)) {
                const double mid_x = (a.from.x + a.to.x) * 0.5;
                route.points.push_back({ mid_x, a.from.y });
                route.points.push_back({ mid_x, a.to.y });
            } else {
                const double mid_y = (a.from.y + a.to.y) * 0.5;
                route.points.push_back({ a.from.x, mid_y });
                route.points.push_back({ a.to.x, mid_y });
            }
            route.points.push_back({ a.to.x, a.to.y });
        }
        routes.push_back(std::move(route));
    }
    return routes;
}

} // namespace gsn_placement

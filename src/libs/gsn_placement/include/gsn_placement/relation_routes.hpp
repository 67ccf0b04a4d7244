#pragma once

#include <gsn_model/types.hpp>
#include <gsn_placement/types.hpp>
#include <vector>

namespace gsn_placement {

// Connector polylines for the relations of a placed snapshot.
// supported-by: bottom centre of the source to top centre of the target, with an orthogonal
// bend at mid height when the two are not vertically aligned.
// in-context-of: the closest pair of side/top/bottom anchors, with an orthogonal bend.
// Relations with a missing endpoint are skipped.
std::vector<RelationRoute> compute_relation_routes(const std::vector<gsn_model::Element>& elements,
    const std::vector<gsn_model::Relation>& relations);

} // namespace gsn_placement

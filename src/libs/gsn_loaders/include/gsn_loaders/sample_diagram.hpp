#pragma once

#include <gsn_loaders/json_loader.hpp>

namespace gsn_loaders {

// Braking-system safety case: context/assumption/justification satellites, a module reference
// and the nested module diagram it points to. Positions are left at the origin.
DiagramSnapshot generate_sample_diagram();

} // namespace gsn_loaders

#pragma once

#include "geofix/types.hpp"

#include <string_view>

namespace geofix {

    // Number of nested array levels, following the first element at each level.
    // A scalar or an empty array has depth 0.
    int CoordinateDepth(const json &coords);

    // Required coordinate depth for a geometry type, or 0 when the type is not structurally repaired.
    int TargetDepth(std::string_view type);

    // Returns a copy of the geometry with Polygon/MultiPolygon coordinates brought to their target depth.
    // One missing level is added by wrapping; excess levels are removed by following the first element.
    // Once at the target depth, every ring whose last position differs from its first is closed.
    // Throws NormalizeError if the depth does not converge within opts.max_corrections steps.
    json NormalizeGeometry(json geometry, const NormalizeOptions &opts = {});

} // namespace geofix

#pragma once

#include "geofix/types.hpp"

#include <cstddef>
#include <filesystem>

namespace geofix {

    // Loads a GeoJSON document. The top level must be a JSON object; every field is kept as read.
    json ReadFeatureCollection(const std::filesystem::path &file, std::size_t max_depth = 64);

    json ParseFeatureCollection(const std::string &text, std::size_t max_depth = 64);

} // namespace geofix

#pragma once

#include "geofix/types.hpp"

#include <filesystem>
#include <string>

namespace geofix {

    namespace detail {
        // Escapes quotes, backslashes and control characters; other UTF-8 is left untouched.
        std::string escape_string(boost::json::string_view s);

        // Shortest text that reads back as the same double; integral values keep a ".0" suffix.
        std::string format_double(double d);
    } // namespace detail

    // Indented JSON text: "," plus a newline between items, ": " after keys, one member per line,
    // "[]" and "{}" for empty containers.
    std::string toJson(json const &doc, int indent = 2);

    void WriteFeatureCollection(json const &doc, std::filesystem::path const &outPath, int indent = 2);

} // namespace geofix

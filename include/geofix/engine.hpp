#pragma once

#include "geofix/types.hpp"

namespace geofix {

    // Geometry capabilities the repair pipeline relies on. Failures are reported as GeometryError.
    class GeometryEngine {
      public:
        virtual ~GeometryEngine() = default;

        virtual GeometryPtr parse(const boost::json::object &geometry) const = 0;

        virtual bool is_valid(const Geometry &geometry) const = 0;

        virtual bool is_empty(const Geometry &geometry) const = 0;

        virtual GeometryPtr buffer_zero(const Geometry &geometry) const = 0;

        virtual boost::json::object to_geojson(const Geometry &geometry) const = 0;
    };

} // namespace geofix

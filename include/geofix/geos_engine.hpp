#pragma once

#include "geofix/engine.hpp"

#include <memory>

namespace geofix {

    // GeometryEngine backed by the GEOS C API. Each engine owns one reentrant GEOS context and must outlive
    // every Geometry it produced. Not safe to share between threads.
    class GeosEngine : public GeometryEngine {
      public:
        struct Options {
            int quadrant_segments = 16;
        };

        GeosEngine();
        explicit GeosEngine(Options opts);
        ~GeosEngine() override;

        GeosEngine(const GeosEngine &) = delete;
        GeosEngine &operator=(const GeosEngine &) = delete;

        GeometryPtr parse(const boost::json::object &geometry) const override;

        bool is_valid(const Geometry &geometry) const override;

        bool is_empty(const Geometry &geometry) const override;

        GeometryPtr buffer_zero(const Geometry &geometry) const override;

        boost::json::object to_geojson(const Geometry &geometry) const override;

      private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace geofix

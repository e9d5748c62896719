#pragma once

#include "geofix/engine.hpp"
#include "geofix/normalize.hpp"

#include <memory>
#include <string>
#include <utility>

// Scripted engine for pipeline tests. A geometry dict drives its own fate:
//   "invalid": true          -> is_valid() reports false
//   "buffer": "throws"       -> buffer_zero() raises GeometryError
//   "buffer": "invalid"      -> buffer_zero() returns a geometry that is still invalid
//   "validity": "throws"     -> is_valid() raises GeometryError
//   "buffer": "empty"        -> buffer_zero() returns a valid but empty geometry
// A geometry with an empty coordinates array is empty.
// parse() rejects non-array coordinates and Polygon/MultiPolygon at the wrong depth.
namespace geofix::test {

    class FakeGeometry : public Geometry {
      public:
        explicit FakeGeometry(boost::json::object d) : dict(std::move(d)) {}
        boost::json::object dict;
    };

    class FakeEngine : public GeometryEngine {
      public:
        mutable int parse_calls = 0;
        mutable int valid_calls = 0;
        mutable int buffer_calls = 0;

        GeometryPtr parse(const boost::json::object &geometry) const override {
            ++parse_calls;
            auto *type = geometry.if_contains("type");
            auto *coords = geometry.if_contains("coordinates");
            if (!type || !type->is_string() || !coords || !coords->is_array())
                throw GeometryError("fake: cannot parse geometry");
            std::string t(type->get_string().data(), type->get_string().size());
            int target = TargetDepth(t);
            if (target != 0 && CoordinateDepth(*coords) != target)
                throw GeometryError("fake: wrong coordinate depth for " + t);
            return std::make_unique<FakeGeometry>(geometry);
        }

        bool is_valid(const Geometry &geometry) const override {
            ++valid_calls;
            auto const &d = dict(geometry);
            if (flag(d, "validity") == "throws")
                throw GeometryError("fake: validity check failed");
            auto *inv = d.if_contains("invalid");
            return !(inv && inv->is_bool() && inv->get_bool());
        }

        bool is_empty(const Geometry &geometry) const override {
            auto *coords = dict(geometry).if_contains("coordinates");
            return !coords || !coords->is_array() || coords->get_array().empty();
        }

        GeometryPtr buffer_zero(const Geometry &geometry) const override {
            ++buffer_calls;
            auto d = dict(geometry);
            auto mode = flag(d, "buffer");
            if (mode == "throws")
                throw GeometryError("fake: TopologyException");
            if (mode != "invalid")
                d.erase("invalid");
            if (mode == "empty")
                d["coordinates"] = boost::json::array();
            d.erase("buffer");
            d["buffered"] = true;
            return std::make_unique<FakeGeometry>(std::move(d));
        }

        boost::json::object to_geojson(const Geometry &geometry) const override { return dict(geometry); }

      private:
        static const boost::json::object &dict(const Geometry &geometry) {
            return dynamic_cast<const FakeGeometry &>(geometry).dict;
        }

        static std::string flag(const boost::json::object &d, const char *key) {
            auto *v = d.if_contains(key);
            if (!v || !v->is_string())
                return "";
            return std::string(v->get_string().data(), v->get_string().size());
        }
    };

} // namespace geofix::test

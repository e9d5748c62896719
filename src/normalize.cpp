#include "geofix/normalize.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace geofix {

    namespace {
        bool samePosition(const json &a, const json &b) {
            if (!a.is_array() || !b.is_array())
                return a == b;
            auto const &pa = a.get_array();
            auto const &pb = b.get_array();
            if (pa.size() != pb.size())
                return false;
            for (std::size_t i = 0; i < pa.size(); ++i) {
                if (pa[i].is_number() && pb[i].is_number()) {
                    if (pa[i].to_number<double>() != pb[i].to_number<double>())
                        return false;
                } else if (pa[i] != pb[i]) {
                    return false;
                }
            }
            return true;
        }

        // Appends the first position to a ring whose last position differs from it.
        void closeRing(json &ring) {
            auto *arr = ring.if_array();
            if (!arr || arr->empty())
                return;
            if (!samePosition(arr->front(), arr->back())) {
                json first = arr->front();
                arr->push_back(std::move(first));
            }
        }

        void closeRings(json &coords, int target) {
            auto *arr = coords.if_array();
            if (!arr)
                return;
            for (auto &item : *arr) {
                if (target == 3) {
                    closeRing(item);
                } else if (auto *rings = item.if_array()) {
                    for (auto &ring : *rings)
                        closeRing(ring);
                }
            }
        }
    } // namespace

    int CoordinateDepth(const json &coords) {
        int depth = 0;
        const json *cur = &coords;
        while (cur->is_array() && !cur->as_array().empty()) {
            ++depth;
            cur = &cur->as_array().front();
        }
        return depth;
    }

    int TargetDepth(std::string_view type) {
        if (type == "Polygon")
            return 3;
        if (type == "MultiPolygon")
            return 4;
        return 0;
    }

    json NormalizeGeometry(json geometry, const NormalizeOptions &opts) {
        auto *obj = geometry.if_object();
        if (!obj)
            return geometry;

        auto *type = obj->if_contains("type");
        auto *coords = obj->if_contains("coordinates");
        if (!type || !coords || !type->is_string())
            return geometry;

        auto const &name = type->get_string();
        int target = TargetDepth(std::string_view(name.data(), name.size()));
        if (target == 0)
            return geometry;

        int depth = CoordinateDepth(*coords);
        if (depth == target - 1) {
            boost::json::array wrapped;
            wrapped.push_back(std::move(*coords));
            *coords = std::move(wrapped);
            depth = target;
        }

        int steps = 0;
        while (depth > target) {
            if (steps == opts.max_corrections) {
                throw NormalizeError("geofix::NormalizeGeometry(): " + std::string(name.data(), name.size()) +
                                     " coordinates still at depth " + std::to_string(depth) + " after " +
                                     std::to_string(steps) + " corrections");
            }
            // Detach the first element before overwriting its parent.
            json first = std::move(coords->as_array().front());
            *coords = std::move(first);
            depth = CoordinateDepth(*coords);
            ++steps;
        }

        if (depth == target)
            closeRings(*coords, target);
        return geometry;
    }

} // namespace geofix

#include "geofix/repair.hpp"

#include <utility>

namespace geofix {

    RepairResult RepairValidity(const GeometryEngine &engine, GeometryPtr geometry) {
        if (!geometry)
            return {RepairStatus::Unrepairable, nullptr};

        // An empty result carries nothing to keep, valid or not.
        try {
            if (engine.is_valid(*geometry)) {
                if (engine.is_empty(*geometry))
                    return {RepairStatus::Unrepairable, nullptr};
                return {RepairStatus::AlreadyValid, std::move(geometry)};
            }

            auto fixed = engine.buffer_zero(*geometry);
            if (fixed && engine.is_valid(*fixed) && !engine.is_empty(*fixed))
                return {RepairStatus::Buffered, std::move(fixed)};
        } catch (const GeometryError &) {
            // topology failure: the feature cannot be repaired
        }
        return {RepairStatus::Unrepairable, nullptr};
    }

} // namespace geofix

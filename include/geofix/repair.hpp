#pragma once

#include "geofix/engine.hpp"

namespace geofix {

    enum class RepairStatus { AlreadyValid, Buffered, Unrepairable };

    struct RepairResult {
        RepairStatus status;
        GeometryPtr geometry; // null when Unrepairable
    };

    RepairResult RepairValidity(const GeometryEngine &engine, GeometryPtr geometry);

} // namespace geofix

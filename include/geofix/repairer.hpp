#pragma once

#include "geofix/engine.hpp"
#include "geofix/types.hpp"

#include <filesystem>

namespace geofix {

    namespace progress {
        constexpr int kLoading = 10;
        constexpr int kParsed = 30;
        constexpr int kFeatureSpan = 60;
        constexpr int kDone = 100;
    } // namespace progress

    // Normalizes and repairs every feature geometry of doc in place. Features whose geometry cannot be
    // parsed or repaired are removed; features without geometry are kept untouched.
    RepairSummary RepairFeatureCollection(json &doc, const GeometryEngine &engine, ProgressReporter &reporter,
                                          const RepairOptions &opts = {});

    // Full run: load input, repair, write output. Reports exactly one outcome to the reporter and
    // returns it. Only exceptions raised by the reporter itself escape.
    RepairOutcome RepairFile(const std::filesystem::path &input, const std::filesystem::path &output,
                             const GeometryEngine &engine, ProgressReporter &reporter,
                             const RepairOptions &opts = {});

} // namespace geofix

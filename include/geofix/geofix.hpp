#pragma once

#include "engine.hpp"
#include "geos_engine.hpp"
#include "normalize.hpp"
#include "parser.hpp"
#include "repair.hpp"
#include "repairer.hpp"
#include "types.hpp"
#include "writer.hpp"

namespace geofix {

    json read(const std::filesystem::path &file);

    void write(const json &doc, const std::filesystem::path &outPath);

    // Repairs input into output with a default GEOS engine.
    RepairOutcome repair(const std::filesystem::path &input, const std::filesystem::path &output,
                         ProgressReporter &reporter, const RepairOptions &opts = {});

    RepairOutcome repair(const std::filesystem::path &input, const std::filesystem::path &output);

} // namespace geofix

#include "geofix/geofix.hpp"

#include <memory>

namespace geofix {

    json read(const std::filesystem::path &file) { return ReadFeatureCollection(file); }

    void write(const json &doc, const std::filesystem::path &outPath) { WriteFeatureCollection(doc, outPath); }

    RepairOutcome repair(const std::filesystem::path &input, const std::filesystem::path &output,
                         ProgressReporter &reporter, const RepairOptions &opts) {
        std::unique_ptr<GeosEngine> engine;
        try {
            engine = std::make_unique<GeosEngine>();
        } catch (const std::exception &e) {
            RepairOutcome outcome;
            outcome.message = e.what();
            reporter.failed(outcome.message);
            return outcome;
        }
        return RepairFile(input, output, *engine, reporter, opts);
    }

    RepairOutcome repair(const std::filesystem::path &input, const std::filesystem::path &output) {
        NullReporter reporter;
        return repair(input, output, reporter);
    }

} // namespace geofix

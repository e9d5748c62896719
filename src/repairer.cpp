#include "geofix/repairer.hpp"
#include "geofix/normalize.hpp"
#include "geofix/parser.hpp"
#include "geofix/repair.hpp"
#include "geofix/writer.hpp"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace geofix {

    namespace {
        bool hasGeometry(const boost::json::object &feature) {
            auto *geom = feature.if_contains("geometry");
            if (!geom || geom->is_null())
                return false;
            if (geom->is_object() && geom->get_object().empty())
                return false;
            return true;
        }

        enum class FeatureResult { NoGeometry, Kept, Buffered, Unparseable, Unrepairable };

        FeatureResult repairFeature(boost::json::object &feature, const GeometryEngine &engine,
                                    const RepairOptions &opts) {
            if (!hasGeometry(feature))
                return FeatureResult::NoGeometry;

            GeometryPtr parsed;
            try {
                json normalized = NormalizeGeometry(feature.at("geometry"), opts.normalize);
                if (!normalized.is_object())
                    return FeatureResult::Unparseable;
                parsed = engine.parse(normalized.get_object());
            } catch (const NormalizeError &) {
                return FeatureResult::Unparseable;
            } catch (const GeometryError &) {
                return FeatureResult::Unparseable;
            }

            auto repaired = RepairValidity(engine, std::move(parsed));
            if (repaired.status == RepairStatus::Unrepairable)
                return FeatureResult::Unrepairable;

            try {
                feature["geometry"] = engine.to_geojson(*repaired.geometry);
            } catch (const GeometryError &) {
                return FeatureResult::Unrepairable;
            }
            return repaired.status == RepairStatus::Buffered ? FeatureResult::Buffered : FeatureResult::Kept;
        }
    } // namespace

    std::ostream &operator<<(std::ostream &os, RepairSummary const &s) {
        os << "FEATURES: " << s.total << "\n"
           << "  KEPT: " << s.kept() << "\n"
           << "    WITHOUT GEOMETRY: " << s.without_geometry << "\n"
           << "    VALID: " << s.valid_as_is << "\n"
           << "    REPAIRED (BUFFER 0): " << s.repaired_by_buffer << "\n"
           << "  DROPPED: " << s.dropped() << "\n"
           << "    UNPARSEABLE: " << s.dropped_unparseable << "\n"
           << "    UNREPAIRABLE: " << s.dropped_unrepairable << "\n";
        return os;
    }

    RepairSummary RepairFeatureCollection(json &doc, const GeometryEngine &engine, ProgressReporter &reporter,
                                          const RepairOptions &opts) {
        auto &root = doc.as_object();
        RepairSummary summary;

        boost::json::array features;
        if (auto *f = root.if_contains("features")) {
            if (!f->is_array())
                throw std::runtime_error("geofix::RepairFeatureCollection(): 'features' is not an array");
            features = std::move(f->get_array());
        }

        summary.total = features.size();
        const std::size_t n = std::max<std::size_t>(1, features.size());

        boost::json::array survivors;
        survivors.reserve(features.size());

        std::size_t i = 0;
        for (auto &feat : features) {
            ++i;
            if (!feat.is_object()) {
                throw std::runtime_error("geofix::RepairFeatureCollection(): feature " + std::to_string(i) +
                                         " is not an object");
            }

            switch (repairFeature(feat.get_object(), engine, opts)) {
            case FeatureResult::NoGeometry:
                ++summary.without_geometry;
                survivors.push_back(std::move(feat));
                break;
            case FeatureResult::Kept:
                ++summary.valid_as_is;
                survivors.push_back(std::move(feat));
                break;
            case FeatureResult::Buffered:
                ++summary.repaired_by_buffer;
                survivors.push_back(std::move(feat));
                break;
            case FeatureResult::Unparseable:
                ++summary.dropped_unparseable;
                break;
            case FeatureResult::Unrepairable:
                ++summary.dropped_unrepairable;
                break;
            }

            reporter.progress(progress::kParsed + static_cast<int>(progress::kFeatureSpan * i / n));
        }

        root["features"] = std::move(survivors);
        return summary;
    }

    RepairOutcome RepairFile(const std::filesystem::path &input, const std::filesystem::path &output,
                             const GeometryEngine &engine, ProgressReporter &reporter, const RepairOptions &opts) {
        RepairOutcome outcome;
        try {
            reporter.progress(progress::kLoading);
            json doc = ReadFeatureCollection(input, opts.max_json_depth);
            reporter.progress(progress::kParsed);

            outcome.summary = RepairFeatureCollection(doc, engine, reporter, opts);

            WriteFeatureCollection(doc, output, opts.indent);
            reporter.progress(progress::kDone);
        } catch (const std::exception &e) {
            outcome.ok = false;
            outcome.message = e.what();
            reporter.failed(outcome.message);
            return outcome;
        }

        outcome.ok = true;
        outcome.output = output;
        reporter.succeeded(output, outcome.summary);
        return outcome;
    }

} // namespace geofix

#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>

namespace geofix {

    using json = boost::json::value;

    // Raised by a GeometryEngine when a geometry cannot be parsed or a topology operation fails.
    class GeometryError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Raised when coordinate nesting cannot be brought to the depth required by the geometry type.
    class NormalizeError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Engine-native geometry. Concrete engines derive from it; callers only move it around.
    class Geometry {
      public:
        virtual ~Geometry() = default;
    };

    using GeometryPtr = std::unique_ptr<Geometry>;

    struct NormalizeOptions {
        int max_corrections = 32;
    };

    struct RepairOptions {
        int indent = 2;
        std::size_t max_json_depth = 64;
        NormalizeOptions normalize;
    };

    struct RepairSummary {
        std::size_t total = 0;
        std::size_t without_geometry = 0;
        std::size_t valid_as_is = 0;
        std::size_t repaired_by_buffer = 0;
        std::size_t dropped_unparseable = 0;
        std::size_t dropped_unrepairable = 0;

        std::size_t kept() const { return without_geometry + valid_as_is + repaired_by_buffer; }
        std::size_t dropped() const { return dropped_unparseable + dropped_unrepairable; }
    };

    std::ostream &operator<<(std::ostream &os, RepairSummary const &s);

    struct RepairOutcome {
        bool ok = false;
        std::filesystem::path output;
        std::string message;
        RepairSummary summary;
    };

    // Receives progress in [0,100] and exactly one terminal call per run.
    class ProgressReporter {
      public:
        virtual ~ProgressReporter() = default;

        virtual void progress(int value) = 0;
        virtual void succeeded(const std::filesystem::path &output, const RepairSummary &summary) = 0;
        virtual void failed(const std::string &message) = 0;
    };

    class NullReporter : public ProgressReporter {
      public:
        void progress(int) override {}
        void succeeded(const std::filesystem::path &, const RepairSummary &) override {}
        void failed(const std::string &) override {}
    };

} // namespace geofix

#include "geofix/geofix.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace {
    class ConsoleReporter : public geofix::ProgressReporter {
      public:
        void progress(int value) override {
            if (value == last_)
                return;
            last_ = value;
            std::cout << "PROGRESS: " << value << "%\n";
        }

        void succeeded(const std::filesystem::path &output, const geofix::RepairSummary &summary) override {
            std::cout << summary;
            std::cout << "Repaired GeoJSON written to " << output.string() << "\n";
        }

        void failed(const std::string &message) override { std::cerr << "ERROR: " << message << "\n"; }

      private:
        int last_ = -1;
    };
} // namespace

int main(int argc, char **argv) {
    if (argc != 3) {
        std::cerr << "usage: " << argv[0] << " <input.geojson> <output.geojson>\n";
        return 2;
    }

    const std::filesystem::path input = argv[1];
    const std::filesystem::path output = argv[2];

    std::error_code ec;
    if (!std::filesystem::is_regular_file(input, ec)) {
        std::cerr << "ERROR: input file does not exist: " << input.string() << "\n";
        return 2;
    }
    if (output.empty()) {
        std::cerr << "ERROR: no output path given\n";
        return 2;
    }

    ConsoleReporter reporter;
    auto outcome = geofix::repair(input, output, reporter);
    return outcome.ok ? 0 : 1;
}

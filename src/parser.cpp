#include "geofix/parser.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace geofix {

    json ParseFeatureCollection(const std::string &text, std::size_t max_depth) {
        boost::json::parse_options popts;
        popts.max_depth = max_depth;

        json j = boost::json::parse(text, {}, popts);
        if (!j.is_object()) {
            throw std::runtime_error("geofix::ReadFeatureCollection(): top-level value is not an object");
        }
        return j;
    }

    json ReadFeatureCollection(const std::filesystem::path &file, std::size_t max_depth) {
        std::ifstream ifs(file, std::ios::binary);
        if (!ifs) {
            throw std::runtime_error("geofix::ReadFeatureCollection(): cannot open \"" + file.string() + '\"');
        }

        std::stringstream buffer;
        buffer << ifs.rdbuf();
        if (ifs.bad()) {
            throw std::runtime_error("geofix::ReadFeatureCollection(): error reading \"" + file.string() + '\"');
        }
        return ParseFeatureCollection(buffer.str(), max_depth);
    }

} // namespace geofix

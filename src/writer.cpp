#include "geofix/writer.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace geofix {

    namespace detail {
        std::string escape_string(boost::json::string_view s) {
            std::string result;
            result.reserve(s.size() + 2);
            for (char c : s) {
                switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        result += buf;
                    } else {
                        result += c;
                    }
                    break;
                }
            }
            return result;
        }

        std::string format_double(double d) {
            if (!std::isfinite(d))
                throw std::runtime_error("geofix::toJson(): cannot write non-finite number");

            char buf[32];
            auto res = std::to_chars(buf, buf + sizeof(buf), d);
            std::string out(buf, res.ptr);
            if (out.find_first_of(".eE") == std::string::npos)
                out += ".0";
            return out;
        }

        void write_value(std::ostream &os, json const &v, int indent, int level) {
            auto newline = [&](int lvl) {
                os << '\n';
                for (int i = 0; i < indent * lvl; ++i)
                    os << ' ';
            };

            switch (v.kind()) {
            case boost::json::kind::null:
                os << "null";
                break;
            case boost::json::kind::bool_:
                os << (v.get_bool() ? "true" : "false");
                break;
            case boost::json::kind::int64:
                os << v.get_int64();
                break;
            case boost::json::kind::uint64:
                os << v.get_uint64();
                break;
            case boost::json::kind::double_:
                os << format_double(v.get_double());
                break;
            case boost::json::kind::string:
                os << '"' << escape_string(v.get_string()) << '"';
                break;
            case boost::json::kind::array: {
                auto const &arr = v.get_array();
                if (arr.empty()) {
                    os << "[]";
                    break;
                }
                os << '[';
                bool first = true;
                for (auto const &item : arr) {
                    if (!first)
                        os << ',';
                    first = false;
                    newline(level + 1);
                    write_value(os, item, indent, level + 1);
                }
                newline(level);
                os << ']';
                break;
            }
            case boost::json::kind::object: {
                auto const &obj = v.get_object();
                if (obj.empty()) {
                    os << "{}";
                    break;
                }
                os << '{';
                bool first = true;
                for (auto const &kv : obj) {
                    if (!first)
                        os << ',';
                    first = false;
                    newline(level + 1);
                    os << '"' << escape_string(kv.key()) << "\": ";
                    write_value(os, kv.value(), indent, level + 1);
                }
                newline(level);
                os << '}';
                break;
            }
            }
        }
    } // namespace detail

    std::string toJson(json const &doc, int indent) {
        std::ostringstream oss;
        detail::write_value(oss, doc, indent, 0);
        return oss.str();
    }

    void WriteFeatureCollection(json const &doc, std::filesystem::path const &outPath, int indent) {
        std::string j = toJson(doc, indent);
        std::ofstream ofs(outPath, std::ios::binary);
        if (!ofs)
            throw std::runtime_error("geofix::WriteFeatureCollection(): cannot open for write: " + outPath.string());
        ofs << j << "\n";
        ofs.flush();
        if (!ofs)
            throw std::runtime_error("geofix::WriteFeatureCollection(): write failed: " + outPath.string());
    }

} // namespace geofix

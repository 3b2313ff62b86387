#include "value.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace dbutils::core {

std::string to_string(const Value& value) {
    struct Visitor {
        std::string operator()(std::monostate) const { return "NULL"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(std::int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            std::ostringstream oss;
            oss << std::setprecision(15) << d;
            return oss.str();
        }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(Visitor{}, value);
}

const char* type_name(const Value& value) noexcept {
    switch (value.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "integer";
        case 3: return "double";
        case 4: return "string";
        default: return "unknown";
    }
}

namespace detail {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

std::int64_t parse_integer(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) {
        throw ValueConversionError("empty text cannot be converted to integer");
    }

    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(t.c_str(), &end, 10);
    if (errno == ERANGE || end != t.c_str() + t.size()) {
        throw ValueConversionError("'" + text + "' is not a valid integer");
    }
    return static_cast<std::int64_t>(parsed);
}

double parse_floating(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) {
        throw ValueConversionError("empty text cannot be converted to floating point");
    }

    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(t.c_str(), &end);
    if (errno == ERANGE || end != t.c_str() + t.size()) {
        throw ValueConversionError("'" + text + "' is not a valid number");
    }
    return parsed;
}

bool parse_boolean(const std::string& text) {
    std::string t = trim(text);
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (t == "1" || t == "true" || t == "yes") return true;
    if (t == "0" || t == "false" || t == "no") return false;
    throw ValueConversionError("'" + text + "' is not a valid boolean");
}

void throw_conversion(const Value& value, const char* target) {
    std::ostringstream oss;
    oss << "cannot convert " << type_name(value) << " value '" << to_string(value)
        << "' to " << target;
    throw ValueConversionError(oss.str());
}

} // namespace detail

} // namespace dbutils::core

#include "connection_config.hpp"
#include "core/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace dbutils::config {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Values containing separators or braces are wrapped in {} with } doubled
std::string quote_value(const std::string& value) {
    bool needs_braces = value.find_first_of(";{}=") != std::string::npos ||
                        (!value.empty() && (std::isspace(static_cast<unsigned char>(value.front())) ||
                                            std::isspace(static_cast<unsigned char>(value.back()))));
    if (!needs_braces) {
        return value;
    }

    std::string quoted = "{";
    for (char c : value) {
        quoted += c;
        if (c == '}') {
            quoted += '}';
        }
    }
    quoted += '}';
    return quoted;
}

bool is_password_key(const std::string& lower_key) {
    return lower_key == "pwd" || lower_key == "password";
}

std::string string_field(const nlohmann::json& doc, const char* key, bool required) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        if (required) {
            throw ConfigError(std::string("connection settings need a \"") + key + "\" value");
        }
        return "";
    }
    if (!it->is_string()) {
        throw ConfigError(std::string("connection setting \"") + key + "\" must be a string");
    }
    return it->get<std::string>();
}

// Split into key=value segments on ; outside braces, keeping the raw text
template <typename Visitor>
void for_each_segment(const std::string& conn_str, Visitor&& visit) {
    std::string current;
    bool in_braces = false;

    for (size_t i = 0; i < conn_str.size(); ++i) {
        char c = conn_str[i];
        if (c == '{' && !in_braces) {
            in_braces = true;
        } else if (c == '}' && in_braces) {
            if (i + 1 < conn_str.size() && conn_str[i + 1] == '}') {
                current += c;
                ++i;
            } else {
                in_braces = false;
            }
        } else if (c == ';' && !in_braces) {
            visit(current);
            current.clear();
            continue;
        }
        current += c;
    }

    if (!trim(current).empty()) {
        visit(current);
    }
}

std::string unquote_value(const std::string& raw) {
    std::string value = trim(raw);
    if (value.size() < 2 || value.front() != '{' || value.back() != '}') {
        return value;
    }

    std::string inner = value.substr(1, value.length() - 2);
    std::string result;
    for (size_t i = 0; i < inner.size(); ++i) {
        result += inner[i];
        if (inner[i] == '}' && i + 1 < inner.size() && inner[i + 1] == '}') {
            ++i;
        }
    }
    return result;
}

} // anonymous namespace

std::string ConnectionSettings::to_connection_string() const {
    std::ostringstream oss;
    oss << "Driver={" << driver << "};";

    std::string data_source = server;
    if (!instance.empty()) {
        data_source += "\\" + instance;
    }
    oss << "Server=" << quote_value(data_source) << ";";
    oss << "Database=" << quote_value(database) << ";";

    if (integrated_security) {
        oss << "Trusted_Connection=yes;";
    } else {
        oss << "UID=" << quote_value(user) << ";";
        if (!password.empty()) {
            oss << "PWD=" << quote_value(password) << ";";
        }
    }

    for (const auto& [key, value] : options) {
        oss << key << "=" << quote_value(value) << ";";
    }

    return oss.str();
}

ConnectionSettings parse_connection_settings(const std::string& json_text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("connection settings are not valid JSON: ") + e.what());
    }

    if (!root.is_object()) {
        throw ConfigError("connection settings must be a JSON object");
    }

    const nlohmann::json* doc = &root;
    auto nested = root.find("connection_string");
    if (nested != root.end()) {
        if (!nested->is_object()) {
            throw ConfigError("\"connection_string\" must be an object");
        }
        doc = &*nested;
    }

    ConnectionSettings settings;
    settings.server = string_field(*doc, "server", true);
    settings.instance = string_field(*doc, "instance", false);
    settings.database = string_field(*doc, "database", true);
    settings.user = string_field(*doc, "user", false);
    settings.password = string_field(*doc, "password", false);

    std::string driver = string_field(*doc, "driver", false);
    if (!driver.empty()) {
        settings.driver = driver;
    }

    // Without a password only integrated security can authenticate
    auto integrated = doc->find("integrated_security");
    if (integrated != doc->end() && !integrated->is_null()) {
        if (!integrated->is_boolean()) {
            throw ConfigError("\"integrated_security\" must be true or false");
        }
        settings.integrated_security = integrated->get<bool>();
    } else {
        settings.integrated_security = settings.password.empty();
    }

    if (!settings.integrated_security && settings.user.empty()) {
        throw ConfigError("\"user\" is required unless integrated_security is enabled");
    }

    auto options = doc->find("options");
    if (options != doc->end() && !options->is_null()) {
        if (!options->is_object()) {
            throw ConfigError("\"options\" must be an object of strings");
        }
        for (const auto& [key, value] : options->items()) {
            if (!value.is_string()) {
                throw ConfigError("option \"" + key + "\" must be a string");
            }
            settings.options[key] = value.get<std::string>();
        }
    }

    return settings;
}

ConnectionSettings load_connection_settings(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open connection settings file " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return parse_connection_settings(buffer.str());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

std::string resolve_connection_string(const std::string& connection_or_path) {
    std::error_code ec;
    bool is_file = !connection_or_path.empty() &&
                   std::filesystem::is_regular_file(connection_or_path, ec);

    LOG_IF(is_file, "Reading connection settings from " + connection_or_path,
           "Using literal connection string");
    if (!is_file) {
        return connection_or_path;
    }

    return load_connection_settings(connection_or_path).to_connection_string();
}

std::unordered_map<std::string, std::string> parse_connection_string_pairs(
    const std::string& conn_str) {
    std::unordered_map<std::string, std::string> result;

    for_each_segment(conn_str, [&result](const std::string& segment) {
        auto eq_pos = segment.find('=');
        if (eq_pos == std::string::npos) {
            return;
        }
        std::string key = trim(segment.substr(0, eq_pos));
        if (!key.empty()) {
            result[to_lower(key)] = unquote_value(segment.substr(eq_pos + 1));
        }
    });

    return result;
}

std::string redact_connection_string(const std::string& conn_str) {
    std::string redacted;

    for_each_segment(conn_str, [&redacted](const std::string& segment) {
        auto eq_pos = segment.find('=');
        if (eq_pos != std::string::npos &&
            is_password_key(to_lower(trim(segment.substr(0, eq_pos))))) {
            redacted += segment.substr(0, eq_pos + 1) + "***;";
        } else {
            redacted += segment + ";";
        }
    });

    return redacted;
}

} // namespace dbutils::config

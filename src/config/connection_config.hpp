#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace dbutils::config {

// Malformed or incomplete connection settings document
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// SQL Server connection settings, as read from a JSON document:
//
//   {
//     "connection_string": {
//       "server": "db01", "instance": "SQLEXPRESS", "database": "Fleet",
//       "user": "fleet_app", "password": "...", "integrated_security": false,
//       "driver": "ODBC Driver 18 for SQL Server",
//       "options": { "TrustServerCertificate": "yes" }
//     }
//   }
//
// The settings may also sit at the top level of the document.
struct ConnectionSettings {
    std::string driver = "ODBC Driver 18 for SQL Server";
    std::string server;
    std::string instance;
    std::string database;
    std::string user;
    std::string password;
    bool integrated_security = true;
    std::map<std::string, std::string> options;

    // Driver={...};Server=server\instance;Database=...;Trusted_Connection=yes or UID/PWD
    std::string to_connection_string() const;
};

ConnectionSettings parse_connection_settings(const std::string& json_text);

ConnectionSettings load_connection_settings(const std::string& path);

// A path to an existing file is loaded as a settings document; any other
// input is taken as a literal connection string
std::string resolve_connection_string(const std::string& connection_or_path);

// Parse key=value pairs of a connection string; keys are lower-cased,
// {braced} values are unquoted
std::unordered_map<std::string, std::string> parse_connection_string_pairs(
    const std::string& conn_str);

// Replace password values (PWD, Password) with "***" for logging
std::string redact_connection_string(const std::string& conn_str);

} // namespace dbutils::config

#include <gtest/gtest.h>
#include "config/connection_config.hpp"
#include <filesystem>
#include <fstream>

using namespace dbutils::config;

class ConnectionConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() / "dbutils_connection_test.json";
        std::filesystem::remove(path);
    }

    void TearDown() override {
        std::filesystem::remove(path);
    }

    void write(const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path path;
};

TEST_F(ConnectionConfigTest, NestedSqlLogin) {
    auto settings = parse_connection_settings(R"({
        "connection_string": {
            "server": "db01",
            "instance": "SQLEXPRESS",
            "database": "Fleet",
            "user": "fleet_app",
            "password": "s3cret",
            "integrated_security": false
        }
    })");

    EXPECT_EQ(settings.server, "db01");
    EXPECT_EQ(settings.instance, "SQLEXPRESS");
    EXPECT_FALSE(settings.integrated_security);
    EXPECT_EQ(settings.to_connection_string(),
              "Driver={ODBC Driver 18 for SQL Server};Server=db01\\SQLEXPRESS;Database=Fleet;"
              "UID=fleet_app;PWD=s3cret;");
}

TEST_F(ConnectionConfigTest, TopLevelIntegratedSecurity) {
    auto settings = parse_connection_settings(R"({"server": "db01", "database": "Fleet"})");

    EXPECT_TRUE(settings.integrated_security);
    EXPECT_EQ(settings.to_connection_string(),
              "Driver={ODBC Driver 18 for SQL Server};Server=db01;Database=Fleet;"
              "Trusted_Connection=yes;");
}

TEST_F(ConnectionConfigTest, DriverAndOptions) {
    auto settings = parse_connection_settings(R"({
        "server": "db01", "database": "Fleet",
        "driver": "ODBC Driver 17 for SQL Server",
        "options": {"TrustServerCertificate": "yes", "Encrypt": "no"}
    })");

    EXPECT_EQ(settings.to_connection_string(),
              "Driver={ODBC Driver 17 for SQL Server};Server=db01;Database=Fleet;"
              "Trusted_Connection=yes;Encrypt=no;TrustServerCertificate=yes;");
}

TEST_F(ConnectionConfigTest, SpecialCharactersAreBraced) {
    ConnectionSettings settings;
    settings.server = "db01";
    settings.database = "Fleet";
    settings.integrated_security = false;
    settings.user = "app";
    settings.password = "a;b}c";

    EXPECT_NE(settings.to_connection_string().find("PWD={a;b}}c};"), std::string::npos);

    auto pairs = parse_connection_string_pairs(settings.to_connection_string());
    EXPECT_EQ(pairs["pwd"], "a;b}c");
    EXPECT_EQ(pairs["driver"], "ODBC Driver 18 for SQL Server");
}

TEST_F(ConnectionConfigTest, MissingRequiredFields) {
    EXPECT_THROW(parse_connection_settings(R"({"database": "Fleet"})"), ConfigError);
    EXPECT_THROW(parse_connection_settings(R"({"server": "db01"})"), ConfigError);
    EXPECT_THROW(parse_connection_settings(
                     R"({"server": "db01", "database": "Fleet", "integrated_security": false})"),
                 ConfigError);
}

TEST_F(ConnectionConfigTest, MalformedDocuments) {
    EXPECT_THROW(parse_connection_settings("{ not json"), ConfigError);
    EXPECT_THROW(parse_connection_settings("[1, 2]"), ConfigError);
    EXPECT_THROW(parse_connection_settings(R"({"server": 1, "database": "Fleet"})"), ConfigError);
    EXPECT_THROW(parse_connection_settings(R"({"connection_string": "x"})"), ConfigError);
}

TEST_F(ConnectionConfigTest, ResolveFileToConnectionString) {
    write(R"({"connection_string": {"server": "db02", "database": "Trips"}})");

    EXPECT_EQ(resolve_connection_string(path.string()),
              "Driver={ODBC Driver 18 for SQL Server};Server=db02;Database=Trips;"
              "Trusted_Connection=yes;");
}

TEST_F(ConnectionConfigTest, ResolveLiteralConnectionString) {
    std::string literal = "Driver={ODBC Driver 18 for SQL Server};Server=db01;Database=Fleet;";
    EXPECT_EQ(resolve_connection_string(literal), literal);
}

TEST_F(ConnectionConfigTest, LoadMissingFileThrows) {
    EXPECT_THROW(load_connection_settings(path.string()), ConfigError);
}

TEST_F(ConnectionConfigTest, LoadErrorNamesTheFile) {
    write("{}");
    try {
        load_connection_settings(path.string());
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
}

TEST_F(ConnectionConfigTest, RedactPasswords) {
    std::string redacted = redact_connection_string(
        "Driver={ODBC Driver 18 for SQL Server};Server=db01;UID=app;PWD={a;b};Password=x");

    EXPECT_EQ(redacted.find("a;b"), std::string::npos);
    EXPECT_NE(redacted.find("PWD=***;"), std::string::npos);
    EXPECT_NE(redacted.find("Password=***;"), std::string::npos);
    EXPECT_NE(redacted.find("UID=app;"), std::string::npos);
}

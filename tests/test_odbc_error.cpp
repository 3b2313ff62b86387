#include <gtest/gtest.h>
#include "core/odbc_error.hpp"

using namespace dbutils::core;

TEST(OdbcErrorTest, ConstructWithMessage) {
    OdbcError error("Test error");
    EXPECT_STREQ(error.what(), "Test error");
}

TEST(OdbcErrorTest, DiagnosticsEmpty) {
    OdbcError error("Test error");
    EXPECT_TRUE(error.diagnostics().empty());
}

TEST(OdbcErrorTest, FormatDiagnostics) {
    std::vector<OdbcDiagnostic> diags;
    
    OdbcDiagnostic diag1;
    diag1.sqlstate = "08001";
    diag1.native_error = 12345;
    diag1.message = "Connection failed";
    diag1.record_number = 1;
    diags.push_back(diag1);
    
    OdbcError error("Connection error", std::move(diags));
    
    std::string formatted = error.format_diagnostics();
    EXPECT_NE(formatted.find("08001"), std::string::npos);
    EXPECT_NE(formatted.find("12345"), std::string::npos);
    EXPECT_NE(formatted.find("Connection failed"), std::string::npos);
}

TEST(OdbcErrorTest, SqlstateOfFirstRecord) {
    OdbcError error("Insert failed", {
        OdbcDiagnostic{"23000", 2627, "Violation of PRIMARY KEY constraint", 1},
        OdbcDiagnostic{"01000", 3621, "The statement has been terminated.", 2},
    });
    EXPECT_EQ(error.sqlstate(), "23000");
    EXPECT_EQ(error.diagnostics().size(), 2u);
}

TEST(OdbcErrorTest, SqlstateEmptyWithoutRecords) {
    OdbcError error("No diagnostics");
    EXPECT_EQ(error.sqlstate(), "");
}

TEST(OdbcErrorTest, FormatDiagnosticLines) {
    std::string lines = format_diagnostic_lines({
        OdbcDiagnostic{"42S02", 208, "Invalid object name 'Drvier'.", 1},
    });
    EXPECT_NE(lines.find("[42S02]"), std::string::npos);
    EXPECT_NE(lines.find("208"), std::string::npos);
    EXPECT_NE(lines.find("Invalid object name"), std::string::npos);
}

TEST(OdbcErrorTest, CheckOdbcResultAcceptsSuccess) {
    EXPECT_NO_THROW(check_odbc_result(SQL_SUCCESS, SQL_HANDLE_ENV, SQL_NULL_HANDLE, "noop"));
    EXPECT_NO_THROW(check_odbc_result(SQL_SUCCESS_WITH_INFO, SQL_HANDLE_ENV, SQL_NULL_HANDLE, "noop"));
}

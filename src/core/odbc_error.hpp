#pragma once

#include <string>
#include <vector>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace dbutils::core {

// Diagnostic record from SQLGetDiagRec
struct OdbcDiagnostic {
    std::string sqlstate;           // 5-character SQLSTATE code
    SQLINTEGER native_error = 0;    // Server error number (SQL Server: msg id)
    std::string message;
    SQLSMALLINT record_number = 0;
};

// Read every diagnostic record attached to a handle
std::vector<OdbcDiagnostic> collect_diagnostics(SQLSMALLINT handle_type, SQLHANDLE handle);

// Exception class for ODBC errors
class OdbcError : public std::runtime_error {
public:
    // Extract all diagnostic records from a handle
    static OdbcError from_handle(SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context = "");

    explicit OdbcError(const std::string& message);
    OdbcError(const std::string& message, std::vector<OdbcDiagnostic> diagnostics);

    const std::vector<OdbcDiagnostic>& diagnostics() const noexcept { return diagnostics_; }

    // SQLSTATE of the first record, empty when there is none
    std::string sqlstate() const;

    std::string format_diagnostics() const;

private:
    std::vector<OdbcDiagnostic> diagnostics_;
};

// "  [SQLSTATE] (Native: n) message" lines, shared with ExecutionError
std::string format_diagnostic_lines(const std::vector<OdbcDiagnostic>& diagnostics);

// Check ODBC return code and throw on error
void check_odbc_result(SQLRETURN ret, SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context);

} // namespace dbutils::core

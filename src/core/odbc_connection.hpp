#pragma once

#include "odbc_environment.hpp"
#include "odbc_error.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dbutils::core {

class OdbcConnection;

// Receives informational messages (SQL_SUCCESS_WITH_INFO: PRINT output,
// low severity RAISERROR, context changes) raised on a connection
using InfoHandler = std::function<void(OdbcConnection&, const std::vector<OdbcDiagnostic>&)>;

// RAII wrapper for ODBC Connection handle
//
// The destructor rolls back a transaction that is still open and
// disconnects, so a connection never outlives its scope half-committed.
class OdbcConnection {
public:
    explicit OdbcConnection(OdbcEnvironment& env);
    ~OdbcConnection();

    // Non-copyable, non-movable (due to reference member)
    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;
    OdbcConnection(OdbcConnection&&) = delete;
    OdbcConnection& operator=(OdbcConnection&&) = delete;

    void connect(std::string_view connection_string);
    void disconnect();
    bool is_connected() const noexcept { return connected_; }

    // Manual-commit mode until commit() or rollback()
    void begin_transaction();
    void commit();
    void rollback();
    bool in_transaction() const noexcept { return in_transaction_; }

    void set_info_handler(InfoHandler handler) { info_handler_ = std::move(handler); }

    // Forward the diagnostics of a SQL_SUCCESS_WITH_INFO return to the handler
    void dispatch_info(SQLSMALLINT handle_type, SQLHANDLE handle);

    SQLHDBC get_handle() const noexcept { return handle_; }

private:
    void end_transaction(SQLSMALLINT completion, const char* context);
    void check(SQLRETURN ret, const std::string& context);

    SQLHDBC handle_ = SQL_NULL_HDBC;
    OdbcEnvironment& env_;
    bool connected_ = false;
    bool in_transaction_ = false;
    InfoHandler info_handler_;
};

} // namespace dbutils::core

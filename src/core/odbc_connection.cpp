#include "odbc_connection.hpp"
#include "logger.hpp"

namespace dbutils::core {

OdbcConnection::OdbcConnection(OdbcEnvironment& env)
    : env_(env) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_DBC, env_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, env_.get_handle(), "SQLAllocHandle(DBC)");
}

OdbcConnection::~OdbcConnection() {
    if (in_transaction_) {
        try {
            rollback();
        } catch (const OdbcError& e) {
            LOG_ERROR(std::string("Rollback on connection release failed: ") + e.what());
        }
    }

    if (connected_) {
        try {
            disconnect();
        } catch (const OdbcError& e) {
            LOG_WARN(std::string("Disconnect failed: ") + e.what());
        }
    }

    if (handle_ != SQL_NULL_HDBC) {
        SQLFreeHandle(SQL_HANDLE_DBC, handle_);
    }
}

void OdbcConnection::connect(std::string_view connection_string) {
    if (connected_) {
        throw OdbcError("Already connected");
    }

    SQLCHAR out_conn_str[1024];
    SQLSMALLINT out_conn_str_len;

    SQLRETURN ret = SQLDriverConnect(
        handle_,
        nullptr,  // No window handle
        (SQLCHAR*)connection_string.data(),
        static_cast<SQLSMALLINT>(connection_string.length()),
        out_conn_str,
        sizeof(out_conn_str),
        &out_conn_str_len,
        SQL_DRIVER_NOPROMPT
    );

    check(ret, "SQLDriverConnect");
    connected_ = true;
    LOG_TRACE("Connected");
}

void OdbcConnection::disconnect() {
    if (!connected_) {
        return;
    }

    SQLRETURN ret = SQLDisconnect(handle_);
    connected_ = false;
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDisconnect");
    LOG_TRACE("Disconnected");
}

void OdbcConnection::begin_transaction() {
    if (in_transaction_) {
        throw OdbcError("Transaction already started");
    }

    SQLRETURN ret = SQLSetConnectAttr(handle_, SQL_ATTR_AUTOCOMMIT,
                                      (SQLPOINTER)SQL_AUTOCOMMIT_OFF, SQL_IS_UINTEGER);
    check(ret, "SQLSetConnectAttr(AUTOCOMMIT_OFF)");
    in_transaction_ = true;
    LOG_TRACE("Transaction started");
}

void OdbcConnection::commit() {
    end_transaction(SQL_COMMIT, "SQLEndTran(COMMIT)");
}

void OdbcConnection::rollback() {
    end_transaction(SQL_ROLLBACK, "SQLEndTran(ROLLBACK)");
}

void OdbcConnection::end_transaction(SQLSMALLINT completion, const char* context) {
    if (!in_transaction_) {
        throw OdbcError(std::string(context) + ": no transaction in progress");
    }

    // A failed COMMIT leaves the transaction open; rollback() must still reach the server
    SQLRETURN ret = SQLEndTran(SQL_HANDLE_DBC, handle_, completion);
    check(ret, context);
    in_transaction_ = false;

    ret = SQLSetConnectAttr(handle_, SQL_ATTR_AUTOCOMMIT,
                            (SQLPOINTER)SQL_AUTOCOMMIT_ON, SQL_IS_UINTEGER);
    check(ret, "SQLSetConnectAttr(AUTOCOMMIT_ON)");
    LOG_TRACE(context);
}

void OdbcConnection::dispatch_info(SQLSMALLINT handle_type, SQLHANDLE handle) {
    if (!info_handler_) {
        return;
    }

    auto diagnostics = collect_diagnostics(handle_type, handle);
    if (!diagnostics.empty()) {
        info_handler_(*this, diagnostics);
    }
}

void OdbcConnection::check(SQLRETURN ret, const std::string& context) {
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, context);
    if (ret == SQL_SUCCESS_WITH_INFO) {
        dispatch_info(SQL_HANDLE_DBC, handle_);
    }
}

} // namespace dbutils::core

#include "odbc_environment.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace dbutils::core {

OdbcEnvironment::OdbcEnvironment() {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, SQL_NULL_HANDLE, "SQLAllocHandle(ENV)");

    ret = SQLSetEnvAttr(handle_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
    if (!SQL_SUCCEEDED(ret)) {
        OdbcError error = OdbcError::from_handle(SQL_HANDLE_ENV, handle_, "SQLSetEnvAttr(ODBC_VERSION)");
        SQLFreeHandle(SQL_HANDLE_ENV, handle_);
        handle_ = SQL_NULL_HENV;
        throw error;
    }

    LOG_TRACE("ODBC environment allocated");
}

OdbcEnvironment::~OdbcEnvironment() {
    if (handle_ != SQL_NULL_HENV) {
        SQLFreeHandle(SQL_HANDLE_ENV, handle_);
    }
}

std::vector<std::string> OdbcEnvironment::installed_drivers() const {
    std::vector<std::string> drivers;

    SQLCHAR description[256];
    SQLCHAR attributes[1024];
    SQLSMALLINT description_len = 0;
    SQLSMALLINT attributes_len = 0;
    SQLUSMALLINT direction = SQL_FETCH_FIRST;

    for (;;) {
        SQLRETURN ret = SQLDrivers(handle_, direction,
                                   description, sizeof(description), &description_len,
                                   attributes, sizeof(attributes), &attributes_len);
        if (ret == SQL_NO_DATA) {
            break;
        }
        check_odbc_result(ret, SQL_HANDLE_ENV, handle_, "SQLDrivers");

        drivers.emplace_back(reinterpret_cast<char*>(description));
        direction = SQL_FETCH_NEXT;
    }

    return drivers;
}

} // namespace dbutils::core

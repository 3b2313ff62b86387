#pragma once

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

#include <string>
#include <vector>

namespace dbutils::core {

// RAII wrapper for ODBC Environment handle (ODBC 3.x behaviour)
class OdbcEnvironment {
public:
    OdbcEnvironment();
    ~OdbcEnvironment();

    OdbcEnvironment(const OdbcEnvironment&) = delete;
    OdbcEnvironment& operator=(const OdbcEnvironment&) = delete;
    OdbcEnvironment(OdbcEnvironment&&) = delete;
    OdbcEnvironment& operator=(OdbcEnvironment&&) = delete;

    // Descriptions of the drivers registered with the driver manager
    std::vector<std::string> installed_drivers() const;

    SQLHENV get_handle() const noexcept { return handle_; }

private:
    SQLHENV handle_ = SQL_NULL_HENV;
};

} // namespace dbutils::core

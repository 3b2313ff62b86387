#pragma once

#include "core/odbc_error.hpp"
#include "orm/db_enum.hpp"
#include "orm/orm_error.hpp"
#include "orm/row.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace dbutils::reporting {

// Output of the dbutils command line tool
class Reporter {
public:
    virtual ~Reporter() = default;

    // The command about to run (connection string already redacted)
    virtual void report_start(const std::string& target, const std::string& command_text) = 0;

    virtual void report_rows(const std::vector<orm::Row>& rows) = 0;

    virtual void report_enum(const std::vector<orm::DbEnum<std::string>>& entries) = 0;

    virtual void report_affected(std::int64_t count) = 0;

    // A transactional run failed and was rolled back
    virtual void report_failure(const orm::ExecutionError& error) = 0;

    // Informational messages raised by the server during the run
    virtual void report_messages(const std::vector<core::OdbcDiagnostic>& messages) = 0;

    virtual void report_end() = 0;
};

} // namespace dbutils::reporting

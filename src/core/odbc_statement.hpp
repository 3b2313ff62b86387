#pragma once

#include "odbc_connection.hpp"
#include "value.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace dbutils::core {

// Result column metadata from SQLDescribeCol
struct ColumnInfo {
    std::string name;
    SQLSMALLINT sql_type = SQL_UNKNOWN_TYPE;
    SQLSMALLINT decimal_digits = 0;
};

// RAII wrapper for ODBC Statement handle
class OdbcStatement {
public:
    explicit OdbcStatement(OdbcConnection& conn);
    ~OdbcStatement();

    // Non-copyable, non-movable (due to reference member)
    OdbcStatement(const OdbcStatement&) = delete;
    OdbcStatement& operator=(const OdbcStatement&) = delete;
    OdbcStatement(OdbcStatement&&) = delete;
    OdbcStatement& operator=(OdbcStatement&&) = delete;

    void execute(std::string_view sql);
    void prepare(std::string_view sql);

    // Bind input parameters to the ? markers of the prepared statement, in order.
    // The values are copied into buffers owned by the statement.
    void bind_parameters(const std::vector<Value>& values);

    void execute_prepared();

    // Affected rows of the current result, -1 when not applicable
    SQLLEN row_count();

    // Advance to the next result of a batch; false when there is none
    bool more_results();

    std::vector<ColumnInfo> describe_columns();

    bool fetch();

    // Read a column of the current row (1-based)
    Value get_value(SQLUSMALLINT column, const ColumnInfo& info);

    void close_cursor();

    SQLHSTMT get_handle() const noexcept { return handle_; }

private:
    struct ParamBuffer {
        Value value;
        SQLLEN indicator = 0;
        SQLBIGINT integer = 0;
        SQLDOUBLE floating = 0.0;
        SQLCHAR bit = 0;
        std::string text;
    };

    void recycle() noexcept;
    void check(SQLRETURN ret, const std::string& context);
    std::string get_text(SQLUSMALLINT column, bool& is_null);

    SQLHSTMT handle_ = SQL_NULL_HSTMT;
    OdbcConnection& conn_;
    std::vector<ParamBuffer> params_;
};

} // namespace dbutils::core

#include "odbc_statement.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace dbutils::core {

namespace {

// SQL Server switches to (n)varchar(max) semantics past this length
constexpr SQLULEN kMaxInlineVarchar = 8000;

} // anonymous namespace

OdbcStatement::OdbcStatement(OdbcConnection& conn)
    : conn_(conn) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, conn_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, conn_.get_handle(), "SQLAllocHandle(STMT)");
}

OdbcStatement::~OdbcStatement() {
    if (handle_ != SQL_NULL_HSTMT) {
        SQLFreeHandle(SQL_HANDLE_STMT, handle_);
    }
}

void OdbcStatement::recycle() noexcept {
    // SQL_CLOSE succeeds even when no cursor is open
    SQLFreeStmt(handle_, SQL_CLOSE);
    SQLFreeStmt(handle_, SQL_RESET_PARAMS);
    params_.clear();
}

void OdbcStatement::check(SQLRETURN ret, const std::string& context) {
    // SQL_NO_DATA from SQLExecute means a searched UPDATE/DELETE matched nothing
    if (ret == SQL_NO_DATA) {
        return;
    }
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, context);
    if (ret == SQL_SUCCESS_WITH_INFO) {
        conn_.dispatch_info(SQL_HANDLE_STMT, handle_);
    }
}

void OdbcStatement::execute(std::string_view sql) {
    recycle();
    SQLRETURN ret = SQLExecDirect(handle_, (SQLCHAR*)sql.data(), static_cast<SQLINTEGER>(sql.length()));
    check(ret, "SQLExecDirect");
}

void OdbcStatement::prepare(std::string_view sql) {
    recycle();
    SQLRETURN ret = SQLPrepare(handle_, (SQLCHAR*)sql.data(), static_cast<SQLINTEGER>(sql.length()));
    check(ret, "SQLPrepare");
}

void OdbcStatement::bind_parameters(const std::vector<Value>& values) {
    SQLFreeStmt(handle_, SQL_RESET_PARAMS);
    params_.clear();
    params_.resize(values.size());

    // Fill every buffer first; the vector is not resized again, so the
    // addresses handed to the driver stay valid until recycle()
    for (size_t i = 0; i < values.size(); ++i) {
        params_[i].value = values[i];
    }

    for (size_t i = 0; i < params_.size(); ++i) {
        ParamBuffer& p = params_[i];
        auto number = static_cast<SQLUSMALLINT>(i + 1);
        SQLRETURN ret = SQL_ERROR;

        switch (p.value.index()) {
            case 0:  // NULL
                p.indicator = SQL_NULL_DATA;
                ret = SQLBindParameter(handle_, number, SQL_PARAM_INPUT,
                                       SQL_C_CHAR, SQL_VARCHAR, 1, 0,
                                       nullptr, 0, &p.indicator);
                break;
            case 1:  // bool
                p.bit = std::get<bool>(p.value) ? 1 : 0;
                p.indicator = 0;
                ret = SQLBindParameter(handle_, number, SQL_PARAM_INPUT,
                                       SQL_C_BIT, SQL_BIT, 1, 0,
                                       &p.bit, 0, &p.indicator);
                break;
            case 2:  // integer
                p.integer = static_cast<SQLBIGINT>(std::get<std::int64_t>(p.value));
                p.indicator = 0;
                ret = SQLBindParameter(handle_, number, SQL_PARAM_INPUT,
                                       SQL_C_SBIGINT, SQL_BIGINT, 19, 0,
                                       &p.integer, 0, &p.indicator);
                break;
            case 3:  // double
                p.floating = std::get<double>(p.value);
                p.indicator = 0;
                ret = SQLBindParameter(handle_, number, SQL_PARAM_INPUT,
                                       SQL_C_DOUBLE, SQL_DOUBLE, 15, 0,
                                       &p.floating, 0, &p.indicator);
                break;
            case 4: {  // string
                p.text = std::get<std::string>(p.value);
                p.indicator = static_cast<SQLLEN>(p.text.size());
                SQLULEN size = p.text.empty() ? 1 : static_cast<SQLULEN>(p.text.size());
                SQLSMALLINT sql_type = size > kMaxInlineVarchar ? SQL_LONGVARCHAR : SQL_VARCHAR;
                ret = SQLBindParameter(handle_, number, SQL_PARAM_INPUT,
                                       SQL_C_CHAR, sql_type, size, 0,
                                       (SQLPOINTER)p.text.data(),
                                       static_cast<SQLLEN>(p.text.size()), &p.indicator);
                break;
            }
        }

        check(ret, "SQLBindParameter(" + std::to_string(number) + ")");
        LOG_TRACE("Bound parameter " + std::to_string(number) + " (" + type_name(p.value) +
                  ") = " + to_string(p.value));
    }
}

void OdbcStatement::execute_prepared() {
    // Close any open cursor from a previous execution, but keep the bindings
    SQLFreeStmt(handle_, SQL_CLOSE);
    SQLRETURN ret = SQLExecute(handle_);
    check(ret, "SQLExecute");
}

SQLLEN OdbcStatement::row_count() {
    SQLLEN count = -1;
    SQLRETURN ret = SQLRowCount(handle_, &count);
    check(ret, "SQLRowCount");
    return count;
}

bool OdbcStatement::more_results() {
    SQLRETURN ret = SQLMoreResults(handle_);
    if (ret == SQL_NO_DATA) {
        return false;
    }
    check(ret, "SQLMoreResults");
    return true;
}

std::vector<ColumnInfo> OdbcStatement::describe_columns() {
    SQLSMALLINT count = 0;
    SQLRETURN ret = SQLNumResultCols(handle_, &count);
    check(ret, "SQLNumResultCols");

    std::vector<ColumnInfo> columns;
    columns.reserve(static_cast<size_t>(count));

    for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(count); ++i) {
        SQLCHAR name[256] = {0};
        SQLSMALLINT name_len = 0;
        SQLSMALLINT data_type = SQL_UNKNOWN_TYPE;
        SQLULEN column_size = 0;
        SQLSMALLINT digits = 0;
        SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;

        ret = SQLDescribeCol(handle_, i, name, sizeof(name), &name_len,
                             &data_type, &column_size, &digits, &nullable);
        check(ret, "SQLDescribeCol");

        ColumnInfo info;
        info.name = reinterpret_cast<char*>(name);
        info.sql_type = data_type;
        info.decimal_digits = digits;
        columns.push_back(std::move(info));
    }

    return columns;
}

bool OdbcStatement::fetch() {
    SQLRETURN ret = SQLFetch(handle_);

    if (ret == SQL_NO_DATA) {
        return false;
    }

    check(ret, "SQLFetch");
    return true;
}

Value OdbcStatement::get_value(SQLUSMALLINT column, const ColumnInfo& info) {
    SQLLEN indicator = 0;
    SQLRETURN ret = SQL_ERROR;

    switch (info.sql_type) {
        case SQL_BIT: {
            SQLCHAR bit = 0;
            ret = SQLGetData(handle_, column, SQL_C_BIT, &bit, 0, &indicator);
            check(ret, "SQLGetData(BIT)");
            if (indicator == SQL_NULL_DATA) return Value();
            return Value(bit != 0);
        }
        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
        case SQL_BIGINT: {
            SQLBIGINT integer = 0;
            ret = SQLGetData(handle_, column, SQL_C_SBIGINT, &integer, 0, &indicator);
            check(ret, "SQLGetData(BIGINT)");
            if (indicator == SQL_NULL_DATA) return Value();
            return Value(static_cast<std::int64_t>(integer));
        }
        case SQL_DECIMAL:
        case SQL_NUMERIC:
            if (info.decimal_digits == 0) {
                SQLBIGINT integer = 0;
                ret = SQLGetData(handle_, column, SQL_C_SBIGINT, &integer, 0, &indicator);
                check(ret, "SQLGetData(NUMERIC)");
                if (indicator == SQL_NULL_DATA) return Value();
                return Value(static_cast<std::int64_t>(integer));
            }
            [[fallthrough]];
        case SQL_REAL:
        case SQL_FLOAT:
        case SQL_DOUBLE: {
            SQLDOUBLE floating = 0.0;
            ret = SQLGetData(handle_, column, SQL_C_DOUBLE, &floating, 0, &indicator);
            check(ret, "SQLGetData(DOUBLE)");
            if (indicator == SQL_NULL_DATA) return Value();
            return Value(static_cast<double>(floating));
        }
        default: {
            bool is_null = false;
            std::string text = get_text(column, is_null);
            if (is_null) return Value();
            return Value(std::move(text));
        }
    }
}

std::string OdbcStatement::get_text(SQLUSMALLINT column, bool& is_null) {
    std::string text;
    char buffer[4096];
    is_null = false;

    for (;;) {
        SQLLEN indicator = 0;
        SQLRETURN ret = SQLGetData(handle_, column, SQL_C_CHAR, buffer, sizeof(buffer), &indicator);
        if (ret == SQL_NO_DATA) {
            break;
        }
        // 01004 (truncation) is expected while reading in chunks, so no info dispatch
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLGetData(CHAR)");

        if (indicator == SQL_NULL_DATA) {
            is_null = true;
            return std::string();
        }

        if (indicator == SQL_NO_TOTAL || indicator >= static_cast<SQLLEN>(sizeof(buffer))) {
            text.append(buffer, sizeof(buffer) - 1);
            continue;
        }

        text.append(buffer, static_cast<size_t>(indicator));
        break;
    }

    return text;
}

void OdbcStatement::close_cursor() {
    SQLFreeStmt(handle_, SQL_CLOSE);
}

} // namespace dbutils::core

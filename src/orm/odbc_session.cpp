#include "odbc_session.hpp"
#include "parameter_markers.hpp"
#include "core/odbc_statement.hpp"
#include "core/logger.hpp"
#include "config/connection_config.hpp"

namespace dbutils::orm {

namespace {

void prepare_and_execute(core::OdbcStatement& stmt, const Command& command) {
    BoundSql bound = bind_command(command);
    LOG_DEBUG(std::string(to_string(command.type)) + ": " + bound.sql +
              " [" + std::to_string(bound.values.size()) + " parameter(s)]");

    stmt.prepare(bound.sql);
    stmt.bind_parameters(bound.values);
    stmt.execute_prepared();
}

} // anonymous namespace

OdbcSession::OdbcSession(std::shared_ptr<core::OdbcEnvironment> env,
                         const std::string& connection_string,
                         const core::InfoHandler& info_handler)
    : env_(std::move(env)), conn_(*env_) {
    conn_.set_info_handler(info_handler);
    conn_.connect(connection_string);
    LOG_TRACE("Session opened");
}

OdbcSession::~OdbcSession() {
    // conn_ rolls back an unfinished transaction and disconnects
    LOG_TRACE("Session closed");
}

void OdbcSession::begin_transaction() {
    conn_.begin_transaction();
}

void OdbcSession::commit() {
    conn_.commit();
}

void OdbcSession::rollback() {
    conn_.rollback();
}

std::int64_t OdbcSession::execute_non_query(const Command& command) {
    core::OdbcStatement stmt(conn_);
    prepare_and_execute(stmt, command);

    // A batch yields one count per statement
    std::int64_t total = 0;
    bool reported = false;
    do {
        SQLLEN count = stmt.row_count();
        if (count >= 0) {
            total += static_cast<std::int64_t>(count);
            reported = true;
        }
    } while (stmt.more_results());

    return reported ? total : -1;
}

void OdbcSession::execute_reader(const Command& command, const RowHandler& on_row) {
    core::OdbcStatement stmt(conn_);
    prepare_and_execute(stmt, command);

    // Skip row-count-only results (INSERTs inside a procedure) up to the first rowset
    auto columns = stmt.describe_columns();
    while (columns.empty()) {
        if (!stmt.more_results()) {
            return;
        }
        columns = stmt.describe_columns();
    }

    auto names = std::make_shared<std::vector<std::string>>();
    names->reserve(columns.size());
    for (const auto& column : columns) {
        names->push_back(column.name);
    }
    std::shared_ptr<const std::vector<std::string>> shared_names = names;

    size_t row_count = 0;
    while (stmt.fetch()) {
        std::vector<core::Value> values;
        values.reserve(columns.size());
        for (size_t i = 0; i < columns.size(); ++i) {
            values.push_back(stmt.get_value(static_cast<SQLUSMALLINT>(i + 1), columns[i]));
        }
        on_row(Row(shared_names, std::move(values)));
        ++row_count;
    }
    stmt.close_cursor();

    LOG_DEBUG("Read " + std::to_string(row_count) + " row(s)");
}

OdbcSessionFactory::OdbcSessionFactory(std::string connection_string,
                                       core::InfoHandler info_handler)
    : env_(std::make_shared<core::OdbcEnvironment>()),
      connection_string_(std::move(connection_string)),
      info_handler_(std::move(info_handler)) {
    LOG_INFO("Database target: " + config::redact_connection_string(connection_string_));
}

std::unique_ptr<Session> OdbcSessionFactory::open() {
    return std::make_unique<OdbcSession>(env_, connection_string_, info_handler_);
}

} // namespace dbutils::orm

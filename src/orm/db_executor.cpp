#include "db_executor.hpp"
#include "odbc_session.hpp"
#include "config/connection_config.hpp"

namespace dbutils::orm {

DbExecutor::DbExecutor(const std::string& connection, core::InfoHandler info_handler)
    : sessions_(std::make_unique<OdbcSessionFactory>(
          config::resolve_connection_string(connection), std::move(info_handler))) {
}

DbExecutor::DbExecutor(std::unique_ptr<SessionFactory> sessions)
    : sessions_(std::move(sessions)) {
    if (!sessions_) {
        throw InvalidCallError("session factory must not be null");
    }
}

Result<std::int64_t> DbExecutor::execute(const std::string& procedure_or_query,
                                         const Parameters& parameters) {
    Command command = make_command(procedure_or_query, parameters);

    return run<std::int64_t>(command, [this](Session& session, const Command& c) {
        return run_non_query(session, c);
    });
}

Result<std::int64_t> DbExecutor::execute_procedure(const std::string& procedure,
                                                   const Parameters& parameters) {
    Command command = make_command(procedure, parameters);
    if (command.type != CommandType::StoredProcedure) {
        throw InvalidCallError("'" + procedure + "' is not a procedure name");
    }
    return execute(procedure, parameters);
}

Result<std::vector<Row>> DbExecutor::query(const std::string& procedure_or_query,
                                           const Parameters& parameters) {
    Command command = make_command(procedure_or_query, parameters);

    return run<std::vector<Row>>(command, [](Session& session, const Command& c) {
        std::vector<Row> rows;
        session.execute_reader(c, [&rows](const Row& row) { rows.push_back(row); });
        return rows;
    });
}

std::int64_t DbExecutor::run_non_query(Session& session, const Command& command) {
    std::int64_t affected = session.execute_non_query(command);
    LOG_DEBUG(std::to_string(affected) + " row(s) affected");
    return affected;
}

bool DbExecutor::rollback_after_failure(Session& session, const std::string& reason) {
    LOG_WARN("Rolling back: " + reason);
    try {
        session.rollback();
        return true;
    } catch (const core::OdbcError& e) {
        LOG_ERROR(std::string("Rollback failed: ") + e.format_diagnostics());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Rollback failed: ") + e.what());
        return false;
    }
}

} // namespace dbutils::orm

#pragma once

#include "session.hpp"
#include "core/odbc_connection.hpp"
#include "core/odbc_environment.hpp"
#include <memory>
#include <string>

namespace dbutils::orm {

// Session over one ODBC connection
class OdbcSession : public Session {
public:
    OdbcSession(std::shared_ptr<core::OdbcEnvironment> env,
                const std::string& connection_string,
                const core::InfoHandler& info_handler);
    ~OdbcSession() override;

    void begin_transaction() override;
    void commit() override;
    void rollback() override;

    std::int64_t execute_non_query(const Command& command) override;
    void execute_reader(const Command& command, const RowHandler& on_row) override;

private:
    // Declared before conn_ so the environment outlives the connection
    std::shared_ptr<core::OdbcEnvironment> env_;
    core::OdbcConnection conn_;
};

// Opens OdbcSessions on a fixed connection string; the ODBC environment is
// allocated once and shared by every session
class OdbcSessionFactory : public SessionFactory {
public:
    explicit OdbcSessionFactory(std::string connection_string,
                                core::InfoHandler info_handler = {});

    std::unique_ptr<Session> open() override;

private:
    std::shared_ptr<core::OdbcEnvironment> env_;
    std::string connection_string_;
    core::InfoHandler info_handler_;
};

} // namespace dbutils::orm

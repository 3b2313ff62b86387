#include <gtest/gtest.h>
#include "core/odbc_connection.hpp"
#include "core/odbc_environment.hpp"
#include "core/odbc_statement.hpp"
#include <cstdlib>

using namespace dbutils::core;

class OdbcConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        env = std::make_unique<OdbcEnvironment>();
    }

    std::unique_ptr<OdbcEnvironment> env;
};

TEST_F(OdbcConnectionTest, ConstructorDoesNotThrow) {
    EXPECT_NO_THROW({
        OdbcConnection conn(*env);
    });
}

TEST_F(OdbcConnectionTest, GetHandleReturnsNonNull) {
    OdbcConnection conn(*env);
    EXPECT_NE(conn.get_handle(), static_cast<SQLHDBC>(SQL_NULL_HDBC));
}

TEST_F(OdbcConnectionTest, InitiallyNotConnected) {
    OdbcConnection conn(*env);
    EXPECT_FALSE(conn.is_connected());
    EXPECT_FALSE(conn.in_transaction());
}

TEST_F(OdbcConnectionTest, ConnectToUnknownDriverThrows) {
    OdbcConnection conn(*env);
    EXPECT_THROW(conn.connect("Driver={No Such Driver 0.0};Server=nowhere;"), OdbcError);
    EXPECT_FALSE(conn.is_connected());
}

TEST_F(OdbcConnectionTest, InstalledDriversDoesNotThrow) {
    EXPECT_NO_THROW(env->installed_drivers());
}

TEST_F(OdbcConnectionTest, ConnectWithSqlServer) {
    const char* conn_str = std::getenv("MSSQL_ODBC_CONNECTION");
    if (!conn_str) {
        GTEST_SKIP() << "MSSQL_ODBC_CONNECTION not set";
    }

    OdbcConnection conn(*env);
    EXPECT_NO_THROW(conn.connect(conn_str));
    EXPECT_TRUE(conn.is_connected());
}

TEST_F(OdbcConnectionTest, Disconnect) {
    const char* conn_str = std::getenv("MSSQL_ODBC_CONNECTION");
    if (!conn_str) {
        GTEST_SKIP() << "MSSQL_ODBC_CONNECTION not set";
    }

    OdbcConnection conn(*env);
    conn.connect(conn_str);
    EXPECT_TRUE(conn.is_connected());

    EXPECT_NO_THROW(conn.disconnect());
    EXPECT_FALSE(conn.is_connected());
}

TEST_F(OdbcConnectionTest, TransactionCommitAndRollback) {
    const char* conn_str = std::getenv("MSSQL_ODBC_CONNECTION");
    if (!conn_str) {
        GTEST_SKIP() << "MSSQL_ODBC_CONNECTION not set";
    }

    OdbcConnection conn(*env);
    conn.connect(conn_str);

    conn.begin_transaction();
    EXPECT_TRUE(conn.in_transaction());
    conn.commit();
    EXPECT_FALSE(conn.in_transaction());

    conn.begin_transaction();
    conn.rollback();
    EXPECT_FALSE(conn.in_transaction());
}

TEST_F(OdbcConnectionTest, PrintMessagesReachInfoHandler) {
    const char* conn_str = std::getenv("MSSQL_ODBC_CONNECTION");
    if (!conn_str) {
        GTEST_SKIP() << "MSSQL_ODBC_CONNECTION not set";
    }

    OdbcConnection conn(*env);
    std::vector<OdbcDiagnostic> received;
    conn.set_info_handler([&received](OdbcConnection&, const std::vector<OdbcDiagnostic>& messages) {
        received.insert(received.end(), messages.begin(), messages.end());
    });
    conn.connect(conn_str);

    OdbcStatement stmt(conn);
    stmt.execute("PRINT 'hello from the server'");

    bool found = false;
    for (const auto& diag : received) {
        if (diag.message.find("hello from the server") != std::string::npos) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

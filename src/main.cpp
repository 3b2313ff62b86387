#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <CLI/CLI.hpp>
#include "dbutils/version.hpp"
#include "config/connection_config.hpp"
#include "core/logger.hpp"
#include "core/odbc_environment.hpp"
#include "core/odbc_error.hpp"
#include "core/value.hpp"
#include "orm/db_executor.hpp"
#include "reporting/console_reporter.hpp"
#include "reporting/json_reporter.hpp"

using namespace dbutils;

namespace {

// "null", integers and decimals are typed; anything else stays text
core::Value parse_parameter_value(const std::string& text) {
    if (text == "null" || text == "NULL") {
        return core::Value{};
    }
    if (text.empty()) {
        return core::Value{text};
    }

    errno = 0;
    char* end = nullptr;
    long long integer = std::strtoll(text.c_str(), &end, 10);
    if (errno == 0 && end == text.c_str() + text.size()) {
        return core::Value{static_cast<std::int64_t>(integer)};
    }

    bool decimal = text.find_first_not_of("+-.0123456789") == std::string::npos;
    errno = 0;
    double number = std::strtod(text.c_str(), &end);
    if (decimal && errno == 0 && end == text.c_str() + text.size()) {
        return core::Value{number};
    }
    return core::Value{text};
}

orm::Parameters parse_parameters(const std::vector<std::string>& assignments) {
    orm::Parameters parameters;
    for (const auto& assignment : assignments) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw orm::InvalidCallError("parameter must be name=value: " + assignment);
        }
        parameters.emplace_back(assignment.substr(0, eq),
                                parse_parameter_value(assignment.substr(eq + 1)));
    }
    return parameters;
}

// Report a Result: value on success, failure details otherwise
template <typename T, typename Report>
int report_result(const orm::Result<T>& result, reporting::Reporter& reporter, Report&& report) {
    if (!result) {
        reporter.report_failure(result.error());
        return 1;
    }
    report(result.value());
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{
        "dbutils - SQL Server data access from the command line\n"
        "\n"
        "  Runs statements, queries and stored procedures over ODBC with\n"
        "  named parameters and optional transactions.\n"
        "\n"
        "Examples:\n"
        "  dbutils -c settings.json query \"SELECT * FROM Driver WHERE Id = @Id\" -p Id=7\n"
        "  dbutils -c \"Driver={ODBC Driver 18 for SQL Server};...\" proc GetDriverVehicles -p DriverId=7\n"
        "  dbutils -c settings.json --transactions exec \"DELETE FROM Trip WHERE Id = @Id\" -p Id=3\n"
        "  dbutils -c settings.json enum VehicleKind -o json -f kinds.json\n",
        "dbutils"
    };

    app.set_version_flag("--version,-V", DBUTILS_VERSION);
    app.require_subcommand(1);

    std::string connection;
    app.add_option("-c,--connection", connection,
                   "ODBC connection string or path of a JSON settings file");

    bool use_transactions = false;
    app.add_flag("--transactions", use_transactions,
                 "Run the command inside a transaction, rolled back on failure");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Show target and command before the results");

    std::string output_format = "console";
    app.add_option("-o,--output", output_format,
                   "Output format: 'console' (default) or 'json'")
        ->check(CLI::IsMember({"console", "json"}));

    std::string json_file;
    app.add_option("-f,--file", json_file,
                   "Write JSON output to FILE instead of stdout");

    std::string log_level = "warn";
    app.add_option("--log-level", log_level,
                   "trace, debug, info, warn (default), error or fatal");

    std::string log_file;
    app.add_option("--log-file", log_file, "Append log lines to FILE");

    std::string command_text;
    std::vector<std::string> param_assignments;

    auto* exec_cmd = app.add_subcommand("exec", "Execute a statement or procedure, report affected rows");
    auto* query_cmd = app.add_subcommand("query", "Run a query or procedure, report the rows");
    auto* proc_cmd = app.add_subcommand("proc", "Execute a stored procedure by name");
    for (auto* sub : {exec_cmd, query_cmd, proc_cmd}) {
        sub->add_option("text", command_text, "SQL text, or a procedure name without whitespace")
            ->required();
        sub->add_option("-p,--param", param_assignments, "Parameter as name=value (repeatable)");
    }

    auto* enum_cmd = app.add_subcommand("enum", "List the name/value pairs of a lookup table");
    std::string enum_table;
    std::string name_column = "Name";
    std::string value_column = "Id";
    enum_cmd->add_option("table", enum_table, "Lookup table")->required();
    enum_cmd->add_option("--name-column", name_column, "Column holding the names (default Name)");
    enum_cmd->add_option("--value-column", value_column, "Column holding the values (default Id)");

    auto* drivers_cmd = app.add_subcommand("drivers", "List the ODBC drivers installed on this machine");

    CLI11_PARSE(app, argc, argv);

    auto level = core::parse_log_level(log_level);
    if (!level) {
        std::cerr << "Error: unknown log level '" << log_level << "'\n";
        return 3;
    }
    core::Logger::instance().set_level(*level);
    if (!log_file.empty()) {
        core::Logger::instance().set_output(log_file);
    }

    try {
        if (drivers_cmd->parsed()) {
            core::OdbcEnvironment env;
            for (const auto& driver : env.installed_drivers()) {
                std::cout << driver << "\n";
            }
            return 0;
        }

        if (connection.empty()) {
            std::cerr << "Error: --connection is required for this command\n";
            return 3;
        }

        std::unique_ptr<reporting::Reporter> reporter;
        if (output_format == "json") {
            reporter = std::make_unique<reporting::JsonReporter>(json_file);
        } else {
            reporter = std::make_unique<reporting::ConsoleReporter>(std::cout, verbose);
        }

        // A settings file is read once; the executor gets the resulting string
        std::string connection_string = config::resolve_connection_string(connection);

        reporting::Reporter& out = *reporter;
        orm::DbExecutor executor(connection_string,
            [&out](core::OdbcConnection&, const std::vector<core::OdbcDiagnostic>& messages) {
                out.report_messages(messages);
            });
        executor.set_use_transactions(use_transactions);

        std::string target = config::redact_connection_string(connection_string);
        orm::Parameters parameters = parse_parameters(param_assignments);

        int status = 0;
        if (exec_cmd->parsed()) {
            out.report_start(target, command_text);
            status = report_result(executor.execute(command_text, parameters), out,
                                   [&out](std::int64_t count) { out.report_affected(count); });
        } else if (proc_cmd->parsed()) {
            out.report_start(target, command_text);
            status = report_result(executor.execute_procedure(command_text, parameters), out,
                                   [&out](std::int64_t count) { out.report_affected(count); });
        } else if (query_cmd->parsed()) {
            out.report_start(target, command_text);
            status = report_result(executor.query(command_text, parameters), out,
                                   [&out](const std::vector<orm::Row>& rows) { out.report_rows(rows); });
        } else if (enum_cmd->parsed()) {
            out.report_start(target, enum_table);
            status = report_result(executor.get_enum<std::string>(enum_table, name_column, value_column), out,
                                   [&out](const std::vector<orm::DbEnum<std::string>>& entries) {
                                       out.report_enum(entries);
                                   });
        }

        out.report_end();
        return status;

    } catch (const core::OdbcError& e) {
        LOG_ERROR(e.what());
        std::cerr << "\nODBC Error: " << e.what() << "\n";
        std::cerr << e.format_diagnostics() << "\n";
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
        std::cerr << "\nError: " << e.what() << "\n";
        return 3;
    }
}

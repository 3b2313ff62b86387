#pragma once

#include "command.hpp"
#include "db_enum.hpp"
#include "query_builder.hpp"
#include "result.hpp"
#include "row.hpp"
#include "session.hpp"
#include "table_mapping.hpp"
#include "core/logger.hpp"
#include "core/odbc_connection.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dbutils::orm {

// Executes generated CRUD statements, queries and stored procedures, one
// connection per call.
//
// With use_transactions() every call runs inside a transaction that is
// committed on success; any exception rolls it back and the call returns a
// failed Result. Without transactions exceptions propagate to the caller.
// Invalid calls (empty collection, blank text) and mapping errors detected
// before execution are always thrown.
//
// set_use_transactions() is not synchronized: set it once before the
// executor is shared between threads.
class DbExecutor {
public:
    // `connection` is an ODBC connection string or the path of a JSON
    // connection settings file; `info_handler` receives server messages
    explicit DbExecutor(const std::string& connection, core::InfoHandler info_handler = {});

    explicit DbExecutor(std::unique_ptr<SessionFactory> sessions);

    bool use_transactions() const noexcept { return use_transactions_; }
    void set_use_transactions(bool enabled) noexcept { use_transactions_ = enabled; }

    // INSERT every instance in one batch; true when any row was inserted
    template <typename T>
    Result<bool> create(const std::vector<T>& instances);

    template <typename T>
    Result<bool> create(const T& instance) {
        return create(std::vector<T>{instance});
    }

    // Run a query or procedure and map each row onto a new T
    template <typename T>
    Result<std::vector<T>> retrieve(const std::string& procedure_or_query,
                                    const Parameters& parameters = {});

    // SELECT * FROM <table of T>
    template <typename T>
    Result<std::vector<T>> retrieve();

    // Affected rows; 0 when no row has the instance's key
    template <typename T>
    Result<std::int64_t> update(const T& instance);

    // DELETE by key; true when a row was deleted
    template <typename T>
    Result<bool> remove(const T& instance);

    template <typename V>
    Result<std::vector<DbEnum<V>>> get_enum(const std::string& table,
                                            const std::string& name_column = "Name",
                                            const std::string& value_column = "Id");

    Result<std::int64_t> execute(const std::string& procedure_or_query,
                                 const Parameters& parameters = {});

    Result<std::int64_t> execute_procedure(const std::string& procedure,
                                           const Parameters& parameters = {});

    // Every mapped column of `arguments` becomes a same-named parameter
    template <typename P>
    Result<std::int64_t> execute_procedure(const std::string& procedure, const P& arguments);

    // Untyped read
    Result<std::vector<Row>> query(const std::string& procedure_or_query,
                                   const Parameters& parameters = {});

private:
    template <typename R, typename Action>
    Result<R> run(const Command& command, Action&& action);

    std::int64_t run_non_query(Session& session, const Command& command);

    // Returns whether the rollback succeeded
    static bool rollback_after_failure(Session& session, const std::string& reason);

    std::unique_ptr<SessionFactory> sessions_;
    bool use_transactions_ = false;
};

template <typename R, typename Action>
Result<R> DbExecutor::run(const Command& command, Action&& action) {
    std::unique_ptr<Session> session = sessions_->open();

    LOG_IF(use_transactions_, "Running inside a transaction", "Running in autocommit mode");
    if (!use_transactions_) {
        return Result<R>::success(action(*session, command));
    }

    session->begin_transaction();
    try {
        R value = action(*session, command);
        session->commit();
        return Result<R>::success(std::move(value));
    } catch (const core::OdbcError& e) {
        bool rolled_back = rollback_after_failure(*session, e.what());
        return Result<R>::failure(ExecutionError(e.what(), e.diagnostics(), rolled_back));
    } catch (const std::exception& e) {
        bool rolled_back = rollback_after_failure(*session, e.what());
        return Result<R>::failure(ExecutionError(e.what(), {}, rolled_back));
    }
}

template <typename T>
Result<bool> DbExecutor::create(const std::vector<T>& instances) {
    if (instances.empty()) {
        throw InvalidCallError("create needs at least one instance");
    }

    const auto mapping = mapping_for<T>();
    Command command = build_insert(mapping, instances);

    return run<bool>(command, [this](Session& session, const Command& c) {
        return run_non_query(session, c) > 0;
    });
}

template <typename T>
Result<std::vector<T>> DbExecutor::retrieve(const std::string& procedure_or_query,
                                            const Parameters& parameters) {
    Command command = make_command(procedure_or_query, parameters);

    return run<std::vector<T>>(command, [](Session& session, const Command& c) {
        const auto mapping = mapping_for<T>();
        auto selection = mapping.fields_for(Operation::Retrieve, false);

        std::vector<T> instances;
        session.execute_reader(c, [&](const Row& row) {
            T instance{};
            for (const auto* field : selection.fields) {
                const core::Value& value = row.at(field->name);
                try {
                    field->set(instance, value);
                } catch (const core::ValueConversionError& e) {
                    throw MappingError("column " + field->name + " of " + mapping.table_name() +
                                       ": " + e.what());
                }
            }
            instances.push_back(std::move(instance));
        });
        return instances;
    });
}

template <typename T>
Result<std::vector<T>> DbExecutor::retrieve() {
    const auto mapping = mapping_for<T>();
    return retrieve<T>(build_select_all(mapping).text);
}

template <typename T>
Result<std::int64_t> DbExecutor::update(const T& instance) {
    const auto mapping = mapping_for<T>();
    Command command = build_update(mapping, instance);

    return run<std::int64_t>(command, [this](Session& session, const Command& c) {
        std::int64_t affected = run_non_query(session, c);
        return affected < 0 ? std::int64_t{0} : affected;
    });
}

template <typename T>
Result<bool> DbExecutor::remove(const T& instance) {
    const auto mapping = mapping_for<T>();
    Command command = build_delete(mapping, instance);

    return run<bool>(command, [this](Session& session, const Command& c) {
        return run_non_query(session, c) > 0;
    });
}

template <typename V>
Result<std::vector<DbEnum<V>>> DbExecutor::get_enum(const std::string& table,
                                                    const std::string& name_column,
                                                    const std::string& value_column) {
    Command command = build_enum_select(table, name_column, value_column);
    return retrieve<DbEnum<V>>(command.text);
}

template <typename P>
Result<std::int64_t> DbExecutor::execute_procedure(const std::string& procedure, const P& arguments) {
    const auto mapping = mapping_for<P>();

    Parameters parameters;
    for (const auto& field : mapping.fields()) {
        parameters.emplace_back(field.name, field.get(arguments));
    }
    return execute_procedure(procedure, parameters);
}

} // namespace dbutils::orm

#pragma once

#include "command.hpp"
#include "row.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace dbutils::orm {

using RowHandler = std::function<void(const Row&)>;

// One connection and at most one transaction, for the duration of a single
// executor call. Destroying the session releases the connection and rolls
// back a transaction that was neither committed nor rolled back.
class Session {
public:
    virtual ~Session() = default;

    virtual void begin_transaction() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    // Total affected rows of every statement in the command, -1 if none reported
    virtual std::int64_t execute_non_query(const Command& command) = 0;

    // Stream the rows of the first result set to `on_row`
    virtual void execute_reader(const Command& command, const RowHandler& on_row) = 0;
};

class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    // Opens a connected session
    virtual std::unique_ptr<Session> open() = 0;
};

} // namespace dbutils::orm

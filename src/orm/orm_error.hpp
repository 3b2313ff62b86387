#pragma once

#include "core/odbc_error.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace dbutils::orm {

// Base class for errors raised by the mapping layer itself
class OrmError : public std::runtime_error {
public:
    explicit OrmError(const std::string& message)
        : std::runtime_error(message) {}
};

// The call cannot be executed as given (empty collection, blank command text)
class InvalidCallError : public OrmError {
public:
    explicit InvalidCallError(const std::string& message)
        : OrmError(message) {}
};

// The mapping does not fit the operation or the result set: missing or
// duplicate key, duplicate column, a mapped column absent from a result row
class MappingError : public OrmError {
public:
    explicit MappingError(const std::string& message)
        : OrmError(message) {}
};

// Failure of a transactional run, reported through Result<T> after rollback
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(const std::string& message,
                   std::vector<core::OdbcDiagnostic> diagnostics,
                   bool rolled_back)
        : std::runtime_error(message),
          diagnostics_(std::move(diagnostics)),
          rolled_back_(rolled_back) {}

    const std::vector<core::OdbcDiagnostic>& diagnostics() const noexcept { return diagnostics_; }

    // False when the rollback itself failed
    bool rolled_back() const noexcept { return rolled_back_; }

    std::string format_diagnostics() const {
        return std::string(what()) + (rolled_back_ ? " (rolled back)\n" : " (rollback failed)\n") +
               core::format_diagnostic_lines(diagnostics_);
    }

private:
    std::vector<core::OdbcDiagnostic> diagnostics_;
    bool rolled_back_;
};

} // namespace dbutils::orm

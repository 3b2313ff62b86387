#pragma once

#include "command.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace dbutils::orm {

// Statement text ready for SQLPrepare with its ? marker values in order
struct BoundSql {
    std::string sql;
    std::vector<core::Value> values;
};

// Rewrite every @name marker that matches a parameter (case-insensitive) into
// an ODBC ? marker. Markers inside string literals, [bracketed] or "quoted"
// identifiers and comments are left alone, as are @@functions and @variables
// that match no parameter (T-SQL local variables).
BoundSql bind_named_parameters(std::string_view text, const Parameters& parameters);

// EXEC <procedure> @a = ?, @b = ?
BoundSql build_procedure_call(std::string_view procedure, const Parameters& parameters);

// Dispatch on the command type
BoundSql bind_command(const Command& command);

} // namespace dbutils::orm

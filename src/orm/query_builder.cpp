#include "query_builder.hpp"

namespace dbutils::orm {

Command build_enum_select(const std::string& table,
                          const std::string& name_column,
                          const std::string& value_column) {
    if (table.empty() || name_column.empty() || value_column.empty()) {
        throw InvalidCallError("enum table and column names must not be empty");
    }
    return make_command("SELECT " + value_column + " AS Value, " + name_column +
                        " AS Name FROM " + table);
}

} // namespace dbutils::orm

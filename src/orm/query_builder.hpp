#pragma once

#include "command.hpp"
#include "table_mapping.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace dbutils::orm {

namespace detail {

inline std::string insert_parameter_name(const std::string& column, size_t row) {
    return column + "_" + std::to_string(row);
}

template <typename T>
const Field<T>& require_key(const TableMapping<T>& mapping, const FieldSelection<T>& selection,
                            Operation operation) {
    if (!selection.primary_key) {
        throw MappingError("table " + mapping.table_name() + " has no key column for " +
                           to_string(operation) +
                           (mapping.has_key() ? " (the key is skipped for this operation)" : ""));
    }
    return *selection.primary_key;
}

} // namespace detail

// One "INSERT INTO T(a, b) VALUES (@a_i, @b_i)" line per instance, i being the
// 1-based position; the key column is left to the database.
template <typename T>
Command build_insert(const TableMapping<T>& mapping, const std::vector<T>& instances) {
    if (instances.empty()) {
        throw InvalidCallError("no instances to insert into " + mapping.table_name());
    }

    auto selection = mapping.fields_for(Operation::Create, true);
    if (selection.fields.empty()) {
        throw MappingError("table " + mapping.table_name() + " has no columns to insert");
    }

    std::string column_list;
    for (const auto* field : selection.fields) {
        if (!column_list.empty()) column_list += ", ";
        column_list += field->name;
    }

    Command command;
    command.type = CommandType::Text;
    command.parameters.reserve(instances.size() * selection.fields.size());

    std::ostringstream sql;
    for (size_t row = 0; row < instances.size(); ++row) {
        sql << "INSERT INTO " << mapping.table_name() << "(" << column_list << ") VALUES (";
        for (size_t i = 0; i < selection.fields.size(); ++i) {
            const auto* field = selection.fields[i];
            auto name = detail::insert_parameter_name(field->name, row + 1);
            sql << (i == 0 ? "@" : ", @") << name;
            command.parameters.emplace_back(name, field->get(instances[row]));
        }
        sql << ")\n";
    }

    command.text = sql.str();
    return command;
}

template <typename T>
Command build_select_all(const TableMapping<T>& mapping) {
    return make_command("SELECT * FROM " + mapping.table_name());
}

// UPDATE T SET a = @a, b = @b WHERE key = @key
template <typename T>
Command build_update(const TableMapping<T>& mapping, const T& instance) {
    auto selection = mapping.fields_for(Operation::Update, false);
    const Field<T>& key = detail::require_key(mapping, selection, Operation::Update);

    Command command;
    command.type = CommandType::Text;

    std::string assignments;
    for (const auto* field : selection.fields) {
        command.parameters.emplace_back(field->name, field->get(instance));
        if (field == &key) {
            continue;
        }
        if (!assignments.empty()) assignments += ", ";
        assignments += field->name + " = @" + field->name;
    }

    if (assignments.empty()) {
        throw MappingError("table " + mapping.table_name() + " has no columns to update");
    }

    command.text = "UPDATE " + mapping.table_name() + " SET " + assignments +
                   " WHERE " + key.name + " = @" + key.name;
    return command;
}

// DELETE FROM T WHERE key = @key
template <typename T>
Command build_delete(const TableMapping<T>& mapping, const T& instance) {
    auto selection = mapping.fields_for(Operation::Delete, false);
    const Field<T>& key = detail::require_key(mapping, selection, Operation::Delete);

    Command command;
    command.type = CommandType::Text;
    command.text = "DELETE FROM " + mapping.table_name() + " WHERE " + key.name + " = @" + key.name;
    command.parameters.emplace_back(key.name, key.get(instance));
    return command;
}

// SELECT value_column AS Value, name_column AS Name FROM table
Command build_enum_select(const std::string& table,
                          const std::string& name_column,
                          const std::string& value_column);

} // namespace dbutils::orm

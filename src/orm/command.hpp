#pragma once

#include "core/value.hpp"
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dbutils::orm {

// Named parameter binding. The name is stored without the '@' prefix;
// "@driverId" and "driverId" name the same parameter.
struct Parameter {
    std::string name;
    core::Value value;

    Parameter(std::string parameter_name, core::Value parameter_value);
    Parameter(std::string parameter_name, const char* text);

    template <typename V,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<V>, core::Value>>>
    Parameter(std::string parameter_name, const V& parameter_value)
        : Parameter(std::move(parameter_name), core::to_value(parameter_value)) {}
};

using Parameters = std::vector<Parameter>;

enum class CommandType {
    Text,
    StoredProcedure
};

// Generated or caller supplied statement: text plus ordered parameters
struct Command {
    std::string text;
    CommandType type = CommandType::Text;
    Parameters parameters;
};

// A single word (no whitespace) names a stored procedure, anything else is SQL text
CommandType infer_command_type(std::string_view text) noexcept;

// Validates the text and infers the command type; blank text throws InvalidCallError
Command make_command(std::string text, Parameters parameters = {});

// Strip a leading '@'
std::string normalize_parameter_name(std::string name);

const char* to_string(CommandType type) noexcept;

} // namespace dbutils::orm

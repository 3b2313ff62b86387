#include "command.hpp"
#include "orm_error.hpp"
#include <algorithm>
#include <cctype>

namespace dbutils::orm {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

std::string normalize_parameter_name(std::string name) {
    if (!name.empty() && name.front() == '@') {
        name.erase(0, 1);
    }
    return name;
}

Parameter::Parameter(std::string parameter_name, core::Value parameter_value)
    : name(normalize_parameter_name(std::move(parameter_name))),
      value(std::move(parameter_value)) {
    if (name.empty()) {
        throw InvalidCallError("parameter name must not be empty");
    }
}

Parameter::Parameter(std::string parameter_name, const char* text)
    : Parameter(std::move(parameter_name), core::to_value(text)) {}

CommandType infer_command_type(std::string_view text) noexcept {
    return std::any_of(text.begin(), text.end(), is_space)
        ? CommandType::Text
        : CommandType::StoredProcedure;
}

Command make_command(std::string text, Parameters parameters) {
    if (std::all_of(text.begin(), text.end(), is_space)) {
        throw InvalidCallError("command text must not be blank");
    }

    Command command;
    command.type = infer_command_type(text);
    command.text = std::move(text);
    command.parameters = std::move(parameters);
    return command;
}

const char* to_string(CommandType type) noexcept {
    switch (type) {
        case CommandType::Text: return "Text";
        case CommandType::StoredProcedure: return "StoredProcedure";
        default: return "Unknown";
    }
}

} // namespace dbutils::orm

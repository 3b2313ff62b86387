#include "parameter_markers.hpp"
#include <cctype>

namespace dbutils::orm {

namespace {

bool is_identifier_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '#' || c == '$';
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

const Parameter* find_parameter(const Parameters& parameters, std::string_view name) {
    for (const auto& p : parameters) {
        if (iequals(p.name, name)) {
            return &p;
        }
    }
    return nullptr;
}

// Copy a quoted region starting at text[i] up to and including its closing
// delimiter; a doubled delimiter is an escaped one. Returns the index past it.
size_t copy_quoted(std::string_view text, size_t i, char close, std::string& out) {
    out += text[i++];
    while (i < text.size()) {
        char c = text[i++];
        out += c;
        if (c == close) {
            if (i < text.size() && text[i] == close) {
                out += text[i++];
                continue;
            }
            break;
        }
    }
    return i;
}

// T-SQL block comments nest. Returns the index past the comment that starts
// at text[i], or the end of the text when it is never closed.
size_t skip_block_comment(std::string_view text, size_t i) {
    int depth = 0;
    while (i < text.size()) {
        if (text[i] == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            ++depth;
            i += 2;
        } else if (text[i] == '*' && i + 1 < text.size() && text[i + 1] == '/') {
            i += 2;
            if (--depth == 0) {
                return i;
            }
        } else {
            ++i;
        }
    }
    return text.size();
}

} // anonymous namespace

BoundSql bind_named_parameters(std::string_view text, const Parameters& parameters) {
    BoundSql bound;
    bound.sql.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];

        if (c == '\'') {
            i = copy_quoted(text, i, '\'', bound.sql);
        } else if (c == '[') {
            i = copy_quoted(text, i, ']', bound.sql);
        } else if (c == '"') {
            i = copy_quoted(text, i, '"', bound.sql);
        } else if (c == '-' && i + 1 < text.size() && text[i + 1] == '-') {
            size_t end = text.find('\n', i);
            end = end == std::string_view::npos ? text.size() : end;
            bound.sql.append(text.substr(i, end - i));
            i = end;
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            size_t end = skip_block_comment(text, i);
            bound.sql.append(text.substr(i, end - i));
            i = end;
        } else if (c == '@') {
            if (i + 1 < text.size() && text[i + 1] == '@') {
                // @@ROWCOUNT, @@IDENTITY
                size_t end = i + 2;
                while (end < text.size() && is_identifier_char(text[end])) ++end;
                bound.sql.append(text.substr(i, end - i));
                i = end;
                continue;
            }

            size_t end = i + 1;
            while (end < text.size() && is_identifier_char(text[end])) ++end;
            std::string_view name = text.substr(i + 1, end - i - 1);

            const Parameter* parameter = name.empty() ? nullptr : find_parameter(parameters, name);
            if (parameter) {
                bound.sql += '?';
                bound.values.push_back(parameter->value);
            } else {
                bound.sql.append(text.substr(i, end - i));
            }
            i = end;
        } else {
            bound.sql += c;
            ++i;
        }
    }

    return bound;
}

BoundSql build_procedure_call(std::string_view procedure, const Parameters& parameters) {
    BoundSql bound;
    bound.sql = "EXEC ";
    bound.sql.append(procedure);

    for (size_t i = 0; i < parameters.size(); ++i) {
        bound.sql += i == 0 ? " @" : ", @";
        bound.sql += parameters[i].name;
        bound.sql += " = ?";
        bound.values.push_back(parameters[i].value);
    }

    return bound;
}

BoundSql bind_command(const Command& command) {
    if (command.type == CommandType::StoredProcedure) {
        return build_procedure_call(command.text, command.parameters);
    }
    return bind_named_parameters(command.text, command.parameters);
}

} // namespace dbutils::orm

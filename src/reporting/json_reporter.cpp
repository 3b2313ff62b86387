#include "json_reporter.hpp"
#include "dbutils/version.hpp"
#include <ctime>
#include <iostream>
#include <iomanip>

namespace dbutils::reporting {

namespace {

nlohmann::json diagnostics_to_json(const std::vector<core::OdbcDiagnostic>& diagnostics) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& diag : diagnostics) {
        nlohmann::json d;
        d["sqlstate"] = diag.sqlstate;
        d["native_error"] = diag.native_error;
        d["message"] = diag.message;
        array.push_back(d);
    }
    return array;
}

} // anonymous namespace

nlohmann::json value_to_json(const core::Value& value) {
    struct Visitor {
        nlohmann::json operator()(std::monostate) const { return nullptr; }
        nlohmann::json operator()(bool b) const { return b; }
        nlohmann::json operator()(std::int64_t i) const { return i; }
        nlohmann::json operator()(double d) const { return d; }
        nlohmann::json operator()(const std::string& s) const { return s; }
    };
    return std::visit(Visitor{}, value);
}

void JsonReporter::report_start(const std::string& target, const std::string& command_text) {
    root_ = nlohmann::json::object();
    root_["version"] = DBUTILS_VERSION;
    root_["target"] = target;
    root_["command"] = command_text;
    root_["timestamp"] = std::time(nullptr);
    messages_ = nlohmann::json::array();
}

void JsonReporter::report_rows(const std::vector<orm::Row>& rows) {
    nlohmann::json columns = nlohmann::json::array();
    if (!rows.empty()) {
        for (const auto& name : rows.front().columns()) {
            columns.push_back(name);
        }
    }

    nlohmann::json array = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json object = nlohmann::json::object();
        for (size_t i = 0; i < row.size(); ++i) {
            object[row.column_name(i)] = value_to_json(row.value(i));
        }
        array.push_back(object);
    }

    root_["columns"] = columns;
    root_["rows"] = array;
    root_["row_count"] = rows.size();
}

void JsonReporter::report_enum(const std::vector<orm::DbEnum<std::string>>& entries) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& entry : entries) {
        array.push_back({{"name", entry.name}, {"value", entry.value}});
    }
    root_["entries"] = array;
}

void JsonReporter::report_affected(std::int64_t count) {
    root_["affected_rows"] = count;
}

void JsonReporter::report_failure(const orm::ExecutionError& error) {
    nlohmann::json failure;
    failure["message"] = error.what();
    failure["rolled_back"] = error.rolled_back();
    failure["diagnostics"] = diagnostics_to_json(error.diagnostics());
    root_["failure"] = failure;
}

void JsonReporter::report_messages(const std::vector<core::OdbcDiagnostic>& messages) {
    for (auto& m : diagnostics_to_json(messages)) {
        messages_.push_back(m);
    }
}

void JsonReporter::report_end() {
    root_["messages"] = messages_;

    if (output_file_.empty()) {
        std::cout << std::setw(2) << root_ << std::endl;
    } else {
        std::ofstream file(output_file_);
        if (file.is_open()) {
            file << std::setw(2) << root_ << std::endl;
            std::cerr << "JSON report written to: " << output_file_ << std::endl;
        } else {
            std::cerr << "Error: Could not write to " << output_file_ << std::endl;
        }
    }
}

} // namespace dbutils::reporting

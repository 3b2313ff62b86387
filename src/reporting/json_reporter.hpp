#pragma once

#include "reporter.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace dbutils::reporting {

// Value as JSON: null, boolean, number or string
nlohmann::json value_to_json(const core::Value& value);

// JSON document written to stdout or a file at report_end()
class JsonReporter : public Reporter {
public:
    explicit JsonReporter(const std::string& output_file = "")
        : output_file_(output_file) {}

    void report_start(const std::string& target, const std::string& command_text) override;
    void report_rows(const std::vector<orm::Row>& rows) override;
    void report_enum(const std::vector<orm::DbEnum<std::string>>& entries) override;
    void report_affected(std::int64_t count) override;
    void report_failure(const orm::ExecutionError& error) override;
    void report_messages(const std::vector<core::OdbcDiagnostic>& messages) override;
    void report_end() override;

    const nlohmann::json& document() const noexcept { return root_; }

private:
    std::string output_file_;
    nlohmann::json root_ = nlohmann::json::object();
    nlohmann::json messages_ = nlohmann::json::array();
};

} // namespace dbutils::reporting

#pragma once

#include "reporter.hpp"
#include <iostream>

namespace dbutils::reporting {

// Aligned text tables on a stream
class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& out = std::cout, bool verbose = false)
        : out_(out), verbose_(verbose) {}

    void report_start(const std::string& target, const std::string& command_text) override;
    void report_rows(const std::vector<orm::Row>& rows) override;
    void report_enum(const std::vector<orm::DbEnum<std::string>>& entries) override;
    void report_affected(std::int64_t count) override;
    void report_failure(const orm::ExecutionError& error) override;
    void report_messages(const std::vector<core::OdbcDiagnostic>& messages) override;
    void report_end() override;

private:
    void print_table(const std::vector<std::string>& header,
                     const std::vector<std::vector<std::string>>& cells);

    std::ostream& out_;
    bool verbose_;
};

} // namespace dbutils::reporting

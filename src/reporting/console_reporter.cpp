#include "console_reporter.hpp"
#include "dbutils/version.hpp"
#include <algorithm>
#include <iomanip>

namespace dbutils::reporting {

namespace {

// Wider cells are cut and marked with "..."
constexpr size_t kMaxCellWidth = 40;

std::string clip(const std::string& text) {
    if (text.size() <= kMaxCellWidth) {
        return text;
    }
    return text.substr(0, kMaxCellWidth - 3) + "...";
}

} // anonymous namespace

void ConsoleReporter::report_start(const std::string& target, const std::string& command_text) {
    if (!verbose_) {
        return;
    }
    out_ << "dbutils v" << DBUTILS_VERSION << "\n"
         << "  Target:  " << target << "\n"
         << "  Command: " << command_text << "\n\n";
}

void ConsoleReporter::report_rows(const std::vector<orm::Row>& rows) {
    if (rows.empty()) {
        out_ << "(0 rows)\n";
        return;
    }

    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size());
    for (const auto& row : rows) {
        std::vector<std::string> line;
        line.reserve(row.size());
        for (const auto& value : row.values()) {
            line.push_back(clip(core::to_string(value)));
        }
        cells.push_back(std::move(line));
    }

    print_table(rows.front().columns(), cells);
    out_ << "(" << rows.size() << (rows.size() == 1 ? " row)\n" : " rows)\n");
}

void ConsoleReporter::report_enum(const std::vector<orm::DbEnum<std::string>>& entries) {
    std::vector<std::vector<std::string>> cells;
    cells.reserve(entries.size());
    for (const auto& entry : entries) {
        cells.push_back({clip(entry.value), clip(entry.name)});
    }

    print_table({"Value", "Name"}, cells);
    out_ << "(" << entries.size() << (entries.size() == 1 ? " entry)\n" : " entries)\n");
}

void ConsoleReporter::report_affected(std::int64_t count) {
    if (count < 0) {
        out_ << "Command completed (no row count reported)\n";
    } else {
        out_ << count << (count == 1 ? " row affected\n" : " rows affected\n");
    }
}

void ConsoleReporter::report_failure(const orm::ExecutionError& error) {
    out_ << "FAILED: " << error.what() << "\n";
    out_ << (error.rolled_back() ? "  Transaction rolled back\n" : "  Rollback failed\n");
    out_ << core::format_diagnostic_lines(error.diagnostics());
}

void ConsoleReporter::report_messages(const std::vector<core::OdbcDiagnostic>& messages) {
    for (const auto& message : messages) {
        out_ << "  [" << message.sqlstate << "] " << message.message << "\n";
    }
}

void ConsoleReporter::report_end() {
    out_ << std::flush;
}

void ConsoleReporter::print_table(const std::vector<std::string>& header,
                                  const std::vector<std::vector<std::string>>& cells) {
    std::vector<size_t> widths(header.size(), 0);
    for (size_t i = 0; i < header.size(); ++i) {
        widths[i] = clip(header[i]).size();
    }
    for (const auto& line : cells) {
        for (size_t i = 0; i < line.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], line[i].size());
        }
    }

    auto print_line = [&](const std::vector<std::string>& line) {
        for (size_t i = 0; i < widths.size(); ++i) {
            const std::string text = i < line.size() ? line[i] : std::string();
            out_ << (i == 0 ? "" : " | ") << std::left << std::setw(static_cast<int>(widths[i])) << text;
        }
        out_ << "\n";
    };

    std::vector<std::string> clipped_header;
    for (const auto& name : header) {
        clipped_header.push_back(clip(name));
    }
    print_line(clipped_header);

    for (size_t i = 0; i < widths.size(); ++i) {
        out_ << (i == 0 ? "" : "-+-") << std::string(widths[i], '-');
    }
    out_ << "\n";

    for (const auto& line : cells) {
        print_line(line);
    }
}

} // namespace dbutils::reporting

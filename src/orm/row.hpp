#pragma once

#include "core/value.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dbutils::orm {

// One result row. Column names are shared by all rows of a result set.
class Row {
public:
    Row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<core::Value> values);

    size_t size() const noexcept { return values_.size(); }
    const std::vector<std::string>& columns() const noexcept { return *columns_; }
    const std::vector<core::Value>& values() const noexcept { return values_; }

    const std::string& column_name(size_t index) const { return columns_->at(index); }
    const core::Value& value(size_t index) const { return values_.at(index); }

    // Case-insensitive lookup; nullptr when the row has no such column
    const core::Value* find(std::string_view column) const noexcept;

    // Case-insensitive lookup; throws MappingError when the column is missing
    const core::Value& at(std::string_view column) const;

private:
    std::shared_ptr<const std::vector<std::string>> columns_;
    std::vector<core::Value> values_;
};

} // namespace dbutils::orm

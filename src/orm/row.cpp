#include "row.hpp"
#include "orm_error.hpp"
#include <cctype>

namespace dbutils::orm {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
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

} // anonymous namespace

Row::Row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<core::Value> values)
    : columns_(std::move(columns)), values_(std::move(values)) {
    if (!columns_ || columns_->size() != values_.size()) {
        throw OrmError("row has " + std::to_string(values_.size()) + " values for " +
                       std::to_string(columns_ ? columns_->size() : 0) + " columns");
    }
}

const core::Value* Row::find(std::string_view column) const noexcept {
    // An exact match wins over a case-insensitive one
    for (size_t i = 0; i < columns_->size(); ++i) {
        if ((*columns_)[i] == column) {
            return &values_[i];
        }
    }
    for (size_t i = 0; i < columns_->size(); ++i) {
        if (iequals((*columns_)[i], column)) {
            return &values_[i];
        }
    }
    return nullptr;
}

const core::Value& Row::at(std::string_view column) const {
    const core::Value* value = find(column);
    if (!value) {
        throw MappingError("result set has no column " + std::string(column));
    }
    return *value;
}

} // namespace dbutils::orm

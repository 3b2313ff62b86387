#pragma once

#include "core/value.hpp"
#include "operation.hpp"
#include "orm_error.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace dbutils::orm {

// One mapped column of record type T
template <typename T>
struct Field {
    std::string name;
    bool primary_key = false;
    Operation skipped = Operation::None;
    std::function<core::Value(const T&)> get;
    std::function<void(T&, const core::Value&)> set;

    bool skips(Operation operation) const noexcept { return has_flag(skipped, operation); }
};

// Columns taking part in one operation, in declaration order
template <typename T>
struct FieldSelection {
    std::vector<const Field<T>*> fields;
    const Field<T>* primary_key = nullptr;
};

// Explicit table mapping of a record type: table name, ordered columns,
// at most one key column and per-column skip flags.
//
//   TableMapping<Driver>("Driver")
//       .key("Id", &Driver::id, Operation::Create)
//       .column("Name", &Driver::name)
//       .column("CreatedAt", &Driver::created_at, Operation::Create | Operation::Update);
//
// Registration errors (second key, duplicate or empty names) throw MappingError.
template <typename T>
class TableMapping {
public:
    explicit TableMapping(std::string table_name)
        : table_name_(std::move(table_name)) {
        if (table_name_.empty()) {
            throw MappingError("table name must not be empty");
        }
    }

    template <typename M>
    TableMapping& column(std::string name, M T::*member, Operation skip = Operation::None) {
        add(std::move(name), member, skip, false);
        return *this;
    }

    template <typename M>
    TableMapping& key(std::string name, M T::*member, Operation skip = Operation::None) {
        if (has_key()) {
            throw MappingError("table " + table_name_ + " already has key column " +
                               key_field()->name + "; cannot add key " + name);
        }
        add(std::move(name), member, skip, true);
        return *this;
    }

    const std::string& table_name() const noexcept { return table_name_; }
    const std::vector<Field<T>>& fields() const noexcept { return fields_; }

    bool has_key() const noexcept { return key_field() != nullptr; }

    const Field<T>* key_field() const noexcept {
        auto it = std::find_if(fields_.begin(), fields_.end(),
                               [](const Field<T>& f) { return f.primary_key; });
        return it == fields_.end() ? nullptr : &*it;
    }

    // Columns not skipped for `operation`; the key is looked up among them and,
    // with exclude_primary_key, removed from `fields` but still reported.
    FieldSelection<T> fields_for(Operation operation, bool exclude_primary_key) const {
        FieldSelection<T> selection;
        for (const auto& field : fields_) {
            if (field.skips(operation)) {
                continue;
            }
            if (field.primary_key) {
                if (!selection.primary_key) {
                    selection.primary_key = &field;
                }
                if (exclude_primary_key) {
                    continue;
                }
            }
            selection.fields.push_back(&field);
        }
        return selection;
    }

private:
    template <typename M>
    void add(std::string name, M T::*member, Operation skip, bool primary_key) {
        if (name.empty()) {
            throw MappingError("column name must not be empty in table " + table_name_);
        }
        // SQL Server column names are case-insensitive, and so is marker binding
        for (const auto& existing : fields_) {
            if (same_column(existing.name, name)) {
                throw MappingError("column " + name + " is mapped twice in table " + table_name_);
            }
        }

        Field<T> field;
        field.name = std::move(name);
        field.primary_key = primary_key;
        field.skipped = skip;
        field.get = [member](const T& instance) {
            return core::ValueTraits<M>::to_value(instance.*member);
        };
        field.set = [member](T& instance, const core::Value& value) {
            instance.*member = core::ValueTraits<M>::from_value(value);
        };
        fields_.push_back(std::move(field));
    }

    static bool same_column(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }

    std::string table_name_;
    std::vector<Field<T>> fields_;
};

// Specialize for every mapped record type:
//
//   template <>
//   struct TableMapper<Driver> {
//       static TableMapping<Driver> describe();
//   };
template <typename T>
struct TableMapper;

// The mapping is described anew on every call; nothing is cached
template <typename T>
TableMapping<T> mapping_for() {
    return TableMapper<T>::describe();
}

} // namespace dbutils::orm

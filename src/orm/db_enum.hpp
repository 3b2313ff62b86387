#pragma once

#include "table_mapping.hpp"
#include <string>

namespace dbutils::orm {

// A row of a lookup ("enum") table: display name and value, usually the id
template <typename V>
struct DbEnum {
    std::string name;
    V value{};
};

template <typename V>
struct TableMapper<DbEnum<V>> {
    static TableMapping<DbEnum<V>> describe() {
        return TableMapping<DbEnum<V>>("DbEnum")
            .column("Name", &DbEnum<V>::name)
            .column("Value", &DbEnum<V>::value);
    }
};

} // namespace dbutils::orm

#pragma once

#include "orm/table_mapping.hpp"
#include <optional>
#include <string>

namespace fleet {

struct Driver {
    int id = 0;
    std::string name;
    std::optional<std::string> license;
    double rating = 0.0;
    bool active = false;
    std::string notes;
};

// No key column
struct AuditEntry {
    std::string message;
    int severity = 0;
};

struct DriverVehiclesArgs {
    int driver_id = 0;
};

} // namespace fleet

namespace dbutils::orm {

template <>
struct TableMapper<fleet::Driver> {
    static TableMapping<fleet::Driver> describe() {
        return TableMapping<fleet::Driver>("Driver")
            .key("Id", &fleet::Driver::id, Operation::Create)
            .column("Name", &fleet::Driver::name)
            .column("License", &fleet::Driver::license)
            .column("Rating", &fleet::Driver::rating)
            .column("Active", &fleet::Driver::active)
            .column("Notes", &fleet::Driver::notes, Operation::Create | Operation::Update);
    }
};

template <>
struct TableMapper<fleet::AuditEntry> {
    static TableMapping<fleet::AuditEntry> describe() {
        return TableMapping<fleet::AuditEntry>("AuditEntry")
            .column("Message", &fleet::AuditEntry::message)
            .column("Severity", &fleet::AuditEntry::severity);
    }
};

template <>
struct TableMapper<fleet::DriverVehiclesArgs> {
    static TableMapping<fleet::DriverVehiclesArgs> describe() {
        return TableMapping<fleet::DriverVehiclesArgs>("DriverVehiclesArgs")
            .column("driverId", &fleet::DriverVehiclesArgs::driver_id);
    }
};

} // namespace dbutils::orm

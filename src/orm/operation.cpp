#include "operation.hpp"

namespace dbutils::orm {

std::string to_string(Operation operation) {
    if (operation == Operation::None) {
        return "None";
    }

    static const struct {
        Operation flag;
        const char* name;
    } names[] = {
        {Operation::Create, "Create"},
        {Operation::Retrieve, "Retrieve"},
        {Operation::Update, "Update"},
        {Operation::Delete, "Delete"},
    };

    std::string result;
    for (const auto& entry : names) {
        if (has_flag(operation, entry.flag)) {
            if (!result.empty()) {
                result += "|";
            }
            result += entry.name;
        }
    }
    return result;
}

} // namespace dbutils::orm

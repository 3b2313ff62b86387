#pragma once

#include <string>

namespace dbutils::orm {

// CRUD operations as combinable flags, so a column can be skipped for
// several operations at once (Operation::Create | Operation::Update)
enum class Operation : unsigned {
    None     = 0,
    Create   = 1u << 0,
    Retrieve = 1u << 1,
    Update   = 1u << 2,
    Delete   = 1u << 3
};

constexpr Operation operator|(Operation a, Operation b) noexcept {
    return static_cast<Operation>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

constexpr Operation operator&(Operation a, Operation b) noexcept {
    return static_cast<Operation>(static_cast<unsigned>(a) & static_cast<unsigned>(b));
}

constexpr Operation& operator|=(Operation& a, Operation b) noexcept {
    a = a | b;
    return a;
}

// True when every flag of `flag` is set in `set`; Operation::None is never contained
constexpr bool has_flag(Operation set, Operation flag) noexcept {
    return flag != Operation::None && (set & flag) == flag;
}

// "Create|Update", "None"
std::string to_string(Operation operation);

} // namespace dbutils::orm

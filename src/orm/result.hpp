#pragma once

#include "orm_error.hpp"
#include <optional>
#include <stdexcept>
#include <utility>

namespace dbutils::orm {

// Outcome of an executor call: either a value or the ExecutionError of a
// transactional run that was rolled back. A failed call and a call that
// affected zero rows are never confused.
template <typename T>
class Result {
public:
    static Result success(T value) {
        Result result;
        result.value_.emplace(std::move(value));
        return result;
    }

    static Result failure(ExecutionError error) {
        Result result;
        result.error_.emplace(std::move(error));
        return result;
    }

    bool ok() const noexcept { return value_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    // Throws the ExecutionError when the call failed
    const T& value() const& {
        if (!ok()) throw *error_;
        return *value_;
    }

    T& value() & {
        if (!ok()) throw *error_;
        return *value_;
    }

    T&& value() && {
        if (!ok()) throw *error_;
        return std::move(*value_);
    }

    // The value, or `fallback` for a failed call
    T value_or(T fallback) const& {
        return ok() ? *value_ : std::move(fallback);
    }

    const ExecutionError& error() const {
        if (ok()) throw std::logic_error("Result holds a value, not an error");
        return *error_;
    }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<ExecutionError> error_;
};

} // namespace dbutils::orm

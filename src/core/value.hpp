#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace dbutils::core {

// A single column or parameter value. std::monostate is SQL NULL.
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

inline bool is_null(const Value& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

// Render a value for logs and console output ("NULL" for SQL NULL)
std::string to_string(const Value& value);

// Name of the held alternative ("null", "bool", "integer", "double", "string")
const char* type_name(const Value& value) noexcept;

// Thrown when a value cannot be represented by the requested C++ type
class ValueConversionError : public std::runtime_error {
public:
    explicit ValueConversionError(const std::string& message)
        : std::runtime_error(message) {}
};

namespace detail {

std::int64_t parse_integer(const std::string& text);
double parse_floating(const std::string& text);
bool parse_boolean(const std::string& text);

[[noreturn]] void throw_conversion(const Value& value, const char* target);

} // namespace detail

// Conversion between record field types and Value. Specialized below for
// integral, floating point, bool, std::string and std::optional<U>.
template <typename T, typename Enable = void>
struct ValueTraits;

template <>
struct ValueTraits<bool> {
    static Value to_value(bool v) { return Value(v); }

    static bool from_value(const Value& value) {
        if (auto b = std::get_if<bool>(&value)) return *b;
        if (auto i = std::get_if<std::int64_t>(&value)) return *i != 0;
        if (auto s = std::get_if<std::string>(&value)) return detail::parse_boolean(*s);
        detail::throw_conversion(value, "bool");
    }
};

template <typename T>
struct ValueTraits<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static Value to_value(T v) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
            if (v > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
                throw ValueConversionError("unsigned value " + std::to_string(v) +
                                           " does not fit a signed 64-bit column");
            }
        }
        return Value(static_cast<std::int64_t>(v));
    }

    static T from_value(const Value& value) {
        std::int64_t wide = 0;
        if (auto i = std::get_if<std::int64_t>(&value)) {
            wide = *i;
        } else if (auto b = std::get_if<bool>(&value)) {
            wide = *b ? 1 : 0;
        } else if (auto d = std::get_if<double>(&value)) {
            if (*d != static_cast<double>(static_cast<std::int64_t>(*d))) {
                detail::throw_conversion(value, "integer");
            }
            wide = static_cast<std::int64_t>(*d);
        } else if (auto s = std::get_if<std::string>(&value)) {
            wide = detail::parse_integer(*s);
        } else {
            detail::throw_conversion(value, "integer");
        }

        if constexpr (std::is_signed_v<T>) {
            if (wide < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
                wide > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
                detail::throw_conversion(value, "integer (out of range)");
            }
        } else {
            if (wide < 0 ||
                static_cast<std::uint64_t>(wide) > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                detail::throw_conversion(value, "unsigned integer (out of range)");
            }
        }
        return static_cast<T>(wide);
    }
};

template <typename T>
struct ValueTraits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static Value to_value(T v) { return Value(static_cast<double>(v)); }

    static T from_value(const Value& value) {
        if (auto d = std::get_if<double>(&value)) return static_cast<T>(*d);
        if (auto i = std::get_if<std::int64_t>(&value)) return static_cast<T>(*i);
        if (auto b = std::get_if<bool>(&value)) return *b ? T(1) : T(0);
        if (auto s = std::get_if<std::string>(&value)) return static_cast<T>(detail::parse_floating(*s));
        detail::throw_conversion(value, "floating point");
    }
};

template <>
struct ValueTraits<std::string> {
    static Value to_value(const std::string& v) { return Value(v); }

    // Any non-NULL value has a textual form
    static std::string from_value(const Value& value) {
        if (auto s = std::get_if<std::string>(&value)) return *s;
        if (is_null(value)) detail::throw_conversion(value, "string");
        return to_string(value);
    }
};

template <typename U>
struct ValueTraits<std::optional<U>> {
    static Value to_value(const std::optional<U>& v) {
        if (!v) return Value();
        return ValueTraits<U>::to_value(*v);
    }

    static std::optional<U> from_value(const Value& value) {
        if (is_null(value)) return std::nullopt;
        return ValueTraits<U>::from_value(value);
    }
};

template <typename T>
Value to_value(const T& v) {
    return ValueTraits<T>::to_value(v);
}

inline Value to_value(const char* v) {
    return v ? Value(std::string(v)) : Value();
}

template <typename T>
T from_value(const Value& value) {
    return ValueTraits<T>::from_value(value);
}

} // namespace dbutils::core

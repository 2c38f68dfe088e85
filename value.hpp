#pragma once

#include <optional>
#include <string>
#include <variant>

namespace linescript {

// Runtime value produced by evaluation. std::monostate is the "no value"
// result of a print statement.
struct Value {
    using Variant = std::variant<std::monostate, double, bool, std::string>;

    Variant v;

    Value() = default;
    Value(double d) : v{d} {}
    Value(bool b) : v{b} {}
    Value(std::string str) : v{std::move(str)} {}
    Value(const char* str) : v{std::string{str}} {}

    bool is_nothing() const;
    bool is_number() const;
    bool is_bool() const;
    bool is_text() const;

    const char* type_name() const;
};

// Booleans convert to 0 and 1, text is parsed as a decimal number. Fails for
// anything else.
std::optional<double> to_number(const Value& value);

// Numbers are true when not zero, text must spell true or false in any case.
std::optional<bool> to_bool(const Value& value);

std::string to_text(const Value& value);

// Shortest decimal text that reads back as the same double.
std::string format_number(double d);

}  // namespace linescript

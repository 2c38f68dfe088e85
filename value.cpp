#include "value.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <type_traits>

namespace {

std::string_view trim(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }

    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }

    return str;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }

    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }

    return true;
}

constexpr bool is_digit(char ch) { return ch >= '0' && ch <= '9'; }

// [+-]digits[.digits][(e|E)[+-]digits], where either side of the point may be
// empty but not both. strtod alone would also take hex, inf and nan.
bool is_decimal(std::string_view str) {
    std::size_t i = 0;

    const auto digits = [&] {
        const auto start = i;

        while (i < str.size() && is_digit(str[i])) {
            ++i;
        }

        return i - start;
    };

    if (i < str.size() && (str[i] == '+' || str[i] == '-')) {
        ++i;
    }

    auto mantissa = digits();

    if (i < str.size() && str[i] == '.') {
        ++i;
        mantissa += digits();
    }

    if (mantissa == 0) {
        return false;
    }

    if (i < str.size() && (str[i] == 'e' || str[i] == 'E')) {
        ++i;

        if (i < str.size() && (str[i] == '+' || str[i] == '-')) {
            ++i;
        }

        if (digits() == 0) {
            return false;
        }
    }

    return i == str.size();
}

std::optional<double> parse_number(std::string_view text) {
    const std::string str{trim(text)};

    if (!is_decimal(str)) {
        return std::nullopt;
    }

    char* end = nullptr;
    double d = std::strtod(str.c_str(), &end);

    if (end != str.c_str() + str.size()) {
        return std::nullopt;
    }

    return d;
}

}  // namespace

namespace linescript {

bool Value::is_nothing() const { return std::holds_alternative<std::monostate>(v); }
bool Value::is_number() const { return std::holds_alternative<double>(v); }
bool Value::is_bool() const { return std::holds_alternative<bool>(v); }
bool Value::is_text() const { return std::holds_alternative<std::string>(v); }

const char* Value::type_name() const {
    return std::visit(
        [](auto&& value) -> const char* {
            using T = std::decay_t<decltype(value)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return "nothing";
            } else if constexpr (std::is_same_v<T, double>) {
                return "number";
            } else if constexpr (std::is_same_v<T, bool>) {
                return "boolean";
            } else {
                return "text";
            }
        },
        v);
}

std::optional<double> to_number(const Value& value) {
    return std::visit(
        [](auto&& v) -> std::optional<double> {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, double>) {
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? 1.0 : 0.0;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return parse_number(v);
            } else {
                return std::nullopt;
            }
        },
        value.v);
}

std::optional<bool> to_bool(const Value& value) {
    return std::visit(
        [](auto&& v) -> std::optional<bool> {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, bool>) {
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                // NaN is not equal to zero and so is true
                return v != 0;
            } else if constexpr (std::is_same_v<T, std::string>) {
                const auto str = trim(v);

                if (iequals(str, "true")) {
                    return true;
                }

                if (iequals(str, "false")) {
                    return false;
                }

                return std::nullopt;
            } else {
                return false;
            }
        },
        value.v);
}

std::string to_text(const Value& value) {
    return std::visit(
        [](auto&& v) -> std::string {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, double>) {
                return format_number(v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "True" : "False";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return {};
            }
        },
        value.v);
}

std::string format_number(double d) {
    if (std::isnan(d)) {
        return "NaN";
    }

    if (std::isinf(d)) {
        return d > 0 ? "Infinity" : "-Infinity";
    }

    // Negative zero prints as 0
    if (d == 0) {
        return "0";
    }

    char buf[32];

    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, d);

        if (std::strtod(buf, nullptr) == d) {
            break;
        }
    }

    std::string str{buf};

    // 1E+20, not 1e+20
    for (auto& ch : str) {
        if (ch == 'e') {
            ch = 'E';
        }
    }

    return str;
}

}  // namespace linescript

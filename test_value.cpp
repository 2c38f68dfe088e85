#include <cassert>
#include <cmath>
#include <limits>
#include <string>

#include "value.hpp"

int main() {
    using namespace linescript;

    assert(format_number(7) == "7");
    assert(format_number(-3) == "-3");
    assert(format_number(0.5) == "0.5");
    assert(format_number(0.1) == "0.1");
    assert(format_number(2.25) == "2.25");
    assert(format_number(123456789) == "123456789");
    assert(format_number(1.0 / 3) == "0.3333333333333333");
    assert(format_number(-0.0) == "0");
    assert(format_number(1e20) == "1E+20");
    assert(format_number(1e-5) == "1E-05");
    assert(format_number(std::numeric_limits<double>::infinity()) == "Infinity");
    assert(format_number(-std::numeric_limits<double>::infinity()) == "-Infinity");
    assert(format_number(std::nan("")) == "NaN");

    assert(*to_number(Value{2.5}) == 2.5);
    assert(*to_number(Value{true}) == 1);
    assert(*to_number(Value{false}) == 0);
    assert(*to_number(Value{"  42 "}) == 42);
    assert(*to_number(Value{"-1.5"}) == -1.5);
    assert(*to_number(Value{"+3"}) == 3);
    assert(*to_number(Value{"1."}) == 1);
    assert(*to_number(Value{".5"}) == 0.5);
    assert(*to_number(Value{"1E+20"}) == 1e20);
    assert(!to_number(Value{"abc"}));
    assert(!to_number(Value{"0x10"}));
    assert(!to_number(Value{"inf"}));
    assert(!to_number(Value{"Infinity"}));
    assert(!to_number(Value{"nan"}));
    assert(!to_number(Value{"."}));
    assert(!to_number(Value{"-"}));
    assert(!to_number(Value{"1e"}));
    assert(!to_number(Value{"1 2"}));
    assert(!to_number(Value{"4x"}));
    assert(!to_number(Value{""}));
    assert(!to_number(Value{}));

    assert(*to_bool(Value{true}));
    assert(!*to_bool(Value{0.0}));
    assert(*to_bool(Value{-2.0}));
    assert(*to_bool(Value{" true "}));
    assert(!*to_bool(Value{"False"}));
    assert(!to_bool(Value{"yes"}));
    assert(!*to_bool(Value{}));

    assert(to_text(Value{1.5}) == "1.5");
    assert(to_text(Value{true}) == "True");
    assert(to_text(Value{false}) == "False");
    assert(to_text(Value{"text"}) == "text");
    assert(to_text(Value{}).empty());

    assert(std::string{Value{}.type_name()} == "nothing");
    assert(std::string{Value{1.0}.type_name()} == "number");
    assert(std::string{Value{false}.type_name()} == "boolean");
    assert(std::string{Value{"a"}.type_name()} == "text");

    assert(Value{}.is_nothing());
    assert(Value{1.0}.is_number());
    assert(Value{true}.is_bool());
    assert(Value{std::string{"a"}}.is_text());

    return 0;
}

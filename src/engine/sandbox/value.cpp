// SPDX-License-Identifier: Apache-2.0
#include "engine/sandbox/value.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace duel::sandbox {

std::string number_to_string(double d)
{
    if (std::isnan(d))
        return "NaN";
    if (std::isinf(d))
        return d > 0 ? "Infinity" : "-Infinity";
    if (d == 0.0)
        return "0"; // also -0
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d);
    return std::string(buf, res.ptr);
}

namespace {

double parse_number(const std::string &s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return 0.0;
    size_t e = s.find_last_not_of(" \t\r\n");
    std::string trimmed = s.substr(b, e - b + 1);
    if (trimmed == "Infinity" || trimmed == "+Infinity")
        return std::numeric_limits<double>::infinity();
    if (trimmed == "-Infinity")
        return -std::numeric_limits<double>::infinity();
    char *end = nullptr;
    double v = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size())
        return std::numeric_limits<double>::quiet_NaN();
    return v;
}

} // namespace

bool Value::truthy() const
{
    switch (type()) {
        case Type::undefined:
        case Type::null:
            return false;
        case Type::boolean:
            return as_bool();
        case Type::number: {
            double d = as_number();
            return d != 0.0 && !std::isnan(d);
        }
        case Type::string:
            return !as_string().empty();
        default:
            return true;
    }
}

double Value::to_number() const
{
    switch (type()) {
        case Type::null:
            return 0.0;
        case Type::boolean:
            return as_bool() ? 1.0 : 0.0;
        case Type::number:
            return as_number();
        case Type::string:
            return parse_number(as_string());
        default:
            return std::numeric_limits<double>::quiet_NaN();
    }
}

std::string Value::to_display_string() const
{
    switch (type()) {
        case Type::undefined:
            return "undefined";
        case Type::null:
            return "null";
        case Type::boolean:
            return as_bool() ? "true" : "false";
        case Type::number:
            return number_to_string(as_number());
        case Type::string:
            return as_string();
        case Type::object:
            return "[object Object]";
        case Type::array: {
            std::string out;
            const auto &items = as_array()->items;
            for (size_t i = 0; i < items.size(); ++i) {
                if (i)
                    out += ',';
                if (!items[i].is_nullish())
                    out += items[i].to_display_string();
            }
            return out;
        }
        case Type::function:
            return "function " + as_function()->name + "() { [native code] }";
    }
    return "undefined";
}

const char *Value::type_name() const
{
    switch (type()) {
        case Type::undefined:
            return "undefined";
        case Type::boolean:
            return "boolean";
        case Type::number:
            return "number";
        case Type::string:
            return "string";
        case Type::function:
            return "function";
        default:
            return "object";
    }
}

bool Value::strict_equals(const Value &other) const
{
    if (type() != other.type())
        return false;
    switch (type()) {
        case Type::undefined:
        case Type::null:
            return true;
        case Type::boolean:
            return as_bool() == other.as_bool();
        case Type::number:
            return as_number() == other.as_number();
        case Type::string:
            return as_string() == other.as_string();
        case Type::object:
            return as_object() == other.as_object();
        case Type::array:
            return as_array() == other.as_array();
        case Type::function:
            return as_function() == other.as_function();
    }
    return false;
}

bool Value::loose_equals(const Value &other) const
{
    if (type() == other.type())
        return strict_equals(other);
    if (is_nullish() || other.is_nullish())
        return is_nullish() && other.is_nullish();
    auto primitive = [](const Value &v) {
        return v.type() == Type::boolean || v.type() == Type::number || v.type() == Type::string;
    };
    if (primitive(*this) && primitive(other))
        return to_number() == other.to_number();
    return false;
}

} // namespace duel::sandbox

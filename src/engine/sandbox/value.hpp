// SPDX-License-Identifier: Apache-2.0
// value.hpp - Dynamic values manipulated by behavior scripts
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace duel::sandbox {

class Value;
struct ObjectData;
struct ArrayData;

using NativeFn = std::function<Value(std::span<const Value>)>;

struct NativeFunction
{
    std::string name;
    NativeFn fn;
};

struct Undefined
{
    bool operator==(const Undefined &) const = default;
};

struct Null
{
    bool operator==(const Null &) const = default;
};

class Value
{
public:
    enum class Type
    {
        undefined,
        null,
        boolean,
        number,
        string,
        object,
        array,
        function
    };

    Value() = default;
    Value(Null) : m_v(Null{}) {}
    Value(bool b) : m_v(b) {}
    Value(double d) : m_v(d) {}
    Value(float f) : m_v(static_cast<double>(f)) {}
    Value(int i) : m_v(static_cast<double>(i)) {}
    Value(uint64_t i) : m_v(static_cast<double>(i)) {}
    Value(std::string s) : m_v(std::move(s)) {}
    Value(const char *s) : m_v(std::string(s)) {}
    Value(std::shared_ptr<ObjectData> o) : m_v(std::move(o)) {}
    Value(std::shared_ptr<ArrayData> a) : m_v(std::move(a)) {}
    Value(std::shared_ptr<const NativeFunction> f) : m_v(std::move(f)) {}

    Type type() const
    {
        return static_cast<Type>(m_v.index());
    }

    bool is_undefined() const
    {
        return type() == Type::undefined;
    }
    bool is_nullish() const
    {
        return type() == Type::undefined || type() == Type::null;
    }
    bool is_number() const
    {
        return type() == Type::number;
    }
    bool is_string() const
    {
        return type() == Type::string;
    }
    bool is_object() const
    {
        return type() == Type::object;
    }
    bool is_array() const
    {
        return type() == Type::array;
    }
    bool is_function() const
    {
        return type() == Type::function;
    }

    bool as_bool() const
    {
        return std::get<bool>(m_v);
    }
    double as_number() const
    {
        return std::get<double>(m_v);
    }
    const std::string &as_string() const
    {
        return std::get<std::string>(m_v);
    }
    const std::shared_ptr<ObjectData> &as_object() const
    {
        return std::get<std::shared_ptr<ObjectData>>(m_v);
    }
    const std::shared_ptr<ArrayData> &as_array() const
    {
        return std::get<std::shared_ptr<ArrayData>>(m_v);
    }
    const std::shared_ptr<const NativeFunction> &as_function() const
    {
        return std::get<std::shared_ptr<const NativeFunction>>(m_v);
    }

    // JavaScript-flavoured conversions
    bool truthy() const;
    double to_number() const;
    std::string to_display_string() const;
    const char *type_name() const; // typeof

    bool strict_equals(const Value &other) const;
    bool loose_equals(const Value &other) const;

private:
    // Alternative order must match Type.
    std::variant<
        Undefined,
        Null,
        bool,
        double,
        std::string,
        std::shared_ptr<ObjectData>,
        std::shared_ptr<ArrayData>,
        std::shared_ptr<const NativeFunction>>
        m_v;
};

struct ObjectData
{
    std::unordered_map<std::string, Value> fields;
    bool frozen{false}; // host objects (api, Math) reject writes
};

struct ArrayData
{
    std::vector<Value> items;
};

std::string number_to_string(double d);

inline Value make_object(std::initializer_list<std::pair<const std::string, Value>> fields, bool frozen = false)
{
    auto obj = std::make_shared<ObjectData>();
    obj->fields = fields;
    obj->frozen = frozen;
    return Value(std::move(obj));
}

inline Value make_native(std::string name, NativeFn fn)
{
    return Value(std::make_shared<const NativeFunction>(NativeFunction{std::move(name), std::move(fn)}));
}

} // namespace duel::sandbox

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace JsonTree {

// Untyped destination: what a JSON value becomes when the caller names no
// concrete type. Numbers are doubles, objects are string-keyed maps.
class Value {
public:
    using Array = std::vector<Value>;
    // Value is still incomplete here; libstdc++ and libc++ both accept a
    // std::map of an incomplete mapped type.
    using Object = std::map<std::string, Value>;
    using Storage = std::variant<std::nullptr_t, double, std::string, bool, Array, Object>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(double d) : m_data(d) {}
    Value(std::string s) : m_data(std::move(s)) {}
    Value(const char * s) : m_data(std::string(s)) {}
    Value(bool b) : m_data(b) {}
    Value(Array a) : m_data(std::move(a)) {}
    Value(Object o) : m_data(std::move(o)) {}

    bool isNull() const   { return std::holds_alternative<std::nullptr_t>(m_data); }
    bool isNumber() const { return std::holds_alternative<double>(m_data); }
    bool isString() const { return std::holds_alternative<std::string>(m_data); }
    bool isBool() const   { return std::holds_alternative<bool>(m_data); }
    bool isArray() const  { return std::holds_alternative<Array>(m_data); }
    bool isObject() const { return std::holds_alternative<Object>(m_data); }

    double              asNumber() const { return std::get<double>(m_data); }
    const std::string & asString() const { return std::get<std::string>(m_data); }
    bool                asBool()   const { return std::get<bool>(m_data); }
    const Array &       asArray()  const { return std::get<Array>(m_data); }
    const Object &      asObject() const { return std::get<Object>(m_data); }

    const Storage & data() const { return m_data; }

    friend bool operator==(const Value & a, const Value & b) {
        return a.m_data == b.m_data;
    }

private:
    Storage m_data;
};

} // namespace JsonTree

#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "decimal.hpp"
#include "errors.hpp"

namespace JsonTree {

enum class NodeKind {
    Number,
    String,
    Object,
    Array,
    Boolean,
    Null
};

constexpr std::string_view kind_to_string(NodeKind k) {
    switch(k) {
    case NodeKind::Number: return "number"; break;
    case NodeKind::String: return "string"; break;
    case NodeKind::Object: return "object"; break;
    case NodeKind::Array: return "array"; break;
    case NodeKind::Boolean: return "boolean"; break;
    case NodeKind::Null: return "null"; break;
    }
    return "N/A";
}

class Node;
using NodePtr = std::shared_ptr<const Node>;

namespace detail {
struct StringHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view s) const {
        return std::hash<std::string_view>{}(s);
    }
};
}

// Ordered key/value pairs. Setting an existing key replaces its value and
// keeps the key at the position of its first occurrence.
class Object {
public:
    using Entry = std::pair<std::string, NodePtr>;

    Object() = default;
    Object(std::initializer_list<Entry> entries) {
        for(const auto & e : entries) set(e.first, e.second);
    }

    void set(std::string key, NodePtr value) {
        auto it = m_index.find(key);
        if(it != m_index.end()) {
            m_entries[it->second].second = std::move(value);
            return;
        }
        m_index.emplace(key, m_entries.size());
        m_entries.emplace_back(std::move(key), std::move(value));
    }

    std::size_t numFields() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(m_entries.size());
        for(const auto & e : m_entries) out.push_back(e.first);
        return out;
    }

    // ("", nullptr) when i is past the last field
    const Entry & field(std::size_t i) const {
        static const Entry none{};
        if(i >= m_entries.size()) return none;
        return m_entries[i];
    }

    // nullptr when the key is absent
    NodePtr fieldByName(std::string_view key) const {
        auto it = m_index.find(key);
        if(it == m_index.end()) return nullptr;
        return m_entries[it->second].second;
    }

    auto begin() const { return m_entries.begin(); }
    auto end() const { return m_entries.end(); }

private:
    std::vector<Entry> m_entries;
    std::unordered_map<std::string, std::size_t, detail::StringHash, std::equal_to<>> m_index;
};

using Array = std::vector<NodePtr>;

// One parsed JSON value. Immutable once built; children are owned through
// NodePtr so a subtree can be handed out without copying.
class Node : public std::enable_shared_from_this<Node> {
public:
    using Storage = std::variant<std::monostate, Decimal, std::string, Object, Array, bool>;

    explicit Node(Storage data) : m_data(std::move(data)) {}

    static NodePtr makeNull() {
        static const NodePtr null = std::make_shared<const Node>(Storage{});
        return null;
    }
    static NodePtr makeNumber(Decimal d) {
        return std::make_shared<const Node>(Storage{std::in_place_type<Decimal>, std::move(d)});
    }
    static NodePtr makeString(std::string s) {
        return std::make_shared<const Node>(Storage{std::in_place_type<std::string>, std::move(s)});
    }
    static NodePtr makeObject(Object o) {
        return std::make_shared<const Node>(Storage{std::in_place_type<Object>, std::move(o)});
    }
    static NodePtr makeArray(Array a) {
        return std::make_shared<const Node>(Storage{std::in_place_type<Array>, std::move(a)});
    }
    static NodePtr makeBool(bool b) {
        return std::make_shared<const Node>(Storage{std::in_place_type<bool>, b});
    }

    NodeKind kind() const {
        switch(m_data.index()) {
        case 1: return NodeKind::Number;
        case 2: return NodeKind::String;
        case 3: return NodeKind::Object;
        case 4: return NodeKind::Array;
        case 5: return NodeKind::Boolean;
        default: return NodeKind::Null;
        }
    }
    std::string_view type() const { return kind_to_string(kind()); }

    bool isNull() const { return std::holds_alternative<std::monostate>(m_data); }

    const Decimal *     asNumber() const { return std::get_if<Decimal>(&m_data); }
    const std::string * asString() const { return std::get_if<std::string>(&m_data); }
    const Object *      asObject() const { return std::get_if<Object>(&m_data); }
    const Array *       asArray()  const { return std::get_if<Array>(&m_data); }
    const bool *        asBool()   const { return std::get_if<bool>(&m_data); }

    // Decodes this node into dst. dst is an lvalue slot or a pointer to one;
    // opts are callables from JsonTree::options. Defined in decoder.hpp.
    template<class T, class... Opts>
    DecodeResult decode(T && dst, Opts && ... opts) const;

    friend bool operator==(const Node & a, const Node & b) {
        if(a.m_data.index() != b.m_data.index()) return false;
        if(const auto * arr = a.asArray()) {
            const auto & other = *b.asArray();
            if(arr->size() != other.size()) return false;
            for(std::size_t i = 0; i < arr->size(); i ++) {
                if(!sameNode((*arr)[i], other[i])) return false;
            }
            return true;
        }
        if(const auto * obj = a.asObject()) {
            const auto & other = *b.asObject();
            if(obj->numFields() != other.numFields()) return false;
            for(std::size_t i = 0; i < obj->numFields(); i ++) {
                if(obj->field(i).first != other.field(i).first) return false;
                if(!sameNode(obj->field(i).second, other.field(i).second)) return false;
            }
            return true;
        }
        switch(a.kind()) {
        case NodeKind::Number: return *a.asNumber() == *b.asNumber();
        case NodeKind::String: return *a.asString() == *b.asString();
        case NodeKind::Boolean: return *a.asBool() == *b.asBool();
        default: return true;
        }
    }

private:
    Storage m_data;

    static bool sameNode(const NodePtr & a, const NodePtr & b) {
        if(!a || !b) return a == b;
        return *a == *b;
    }
};

} // namespace JsonTree

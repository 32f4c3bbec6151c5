#include "test_helpers.hpp"

#include <string>
#include <vector>

using namespace TestHelpers;
using JsonTree::Array;
using JsonTree::Decimal;
using JsonTree::Node;
using JsonTree::NodeKind;
using JsonTree::NodePtr;
using JsonTree::Object;

int main() {
    // ============================================================================
    // Kinds
    // ============================================================================

    Check(Node::makeNumber(Decimal::fromInt64(1))->type() == "number", "number");
    Check(Node::makeString("x")->type() == "string", "string");
    Check(Node::makeObject({})->type() == "object", "object");
    Check(Node::makeArray({})->type() == "array", "array");
    Check(Node::makeBool(true)->type() == "boolean", "boolean");
    Check(Node::makeNull()->type() == "null", "null");
    Check(Node::makeNull() == Node::makeNull(), "null is shared");

    {
        auto n = Node::makeString("abc");
        Check(n->asString() && !n->asNumber() && !n->asObject() && !n->asArray() && !n->asBool(),
              "Only the matching accessor returns a value");
    }

    // ============================================================================
    // Objects
    // ============================================================================

    {
        Object obj;
        obj.set("a", Node::makeNumber(Decimal::fromInt64(1)));
        obj.set("b", Node::makeNumber(Decimal::fromInt64(2)));
        obj.set("a", Node::makeNumber(Decimal::fromInt64(3)));
        Check(obj.numFields() == 2, "Setting an existing key does not add a field");
        Check(obj.keys() == std::vector<std::string>{"a", "b"}, "Replaced key keeps its first position");
        Check(obj.fieldByName("a")->asNumber()->toInt64() == 3, "Last write wins");
        Check(obj.field(1).first == "b", "Field by index");
        Check(obj.field(2).first.empty() && obj.field(2).second == nullptr, "Field index past the end");
        Check(Object{}.field(0).second == nullptr, "Field of an empty object");
        Check(obj.fieldByName("zzz") == nullptr, "Missing key gives nullptr");
    }
    {
        auto n = ParseTree(R"({"a":1,"b":2,"a":3})");
        Check(n && n->asObject()->keys() == std::vector<std::string>{"a", "b"}, "Duplicate keys in source");
        Check(n && n->asObject()->fieldByName("a")->asNumber()->toInt64() == 3, "Duplicate key: last value kept");
    }
    {
        auto n = ParseTree(R"({"x":{"y":[true,null]}})");
        Check(n != nullptr, "Nested parse");
        if(n) {
            NodePtr y = n->asObject()->fieldByName("x")->asObject()->fieldByName("y");
            Check(y && y->asArray()->size() == 2, "Walk down nested nodes");
            Check(y && (*y->asArray())[1]->isNull(), "Null inside array");
        }
    }

    // ============================================================================
    // Structural equality
    // ============================================================================

    {
        auto built = Node::makeObject(Object{
            {"k", Node::makeArray(Array{Node::makeNumber(Decimal::fromInt64(1)), Node::makeString("two")})},
            {"t", Node::makeBool(true)},
        });
        auto parsed = ParseTree(R"({"k":[1,"two"],"t":true})");
        Check(parsed && *built == *parsed, "Built tree equals parsed tree");
        auto other = ParseTree(R"({"k":[1,"two"],"t":false})");
        Check(other && !(*built == *other), "Different leaf, different tree");
        auto shorter = ParseTree(R"({"k":[1],"t":true})");
        Check(shorter && !(*built == *shorter), "Different length, different tree");
    }

    return Report();
}

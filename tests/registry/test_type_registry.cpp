#include "test_helpers.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace TestHelpers;
using JsonTree::Context;
using JsonTree::DecodeError;
using JsonTree::DecodeResult;
using JsonTree::Node;
using JsonTree::TypeRegistry;
namespace options = JsonTree::options;

struct Shape {
    virtual ~Shape() = default;
    virtual std::string kindName() const = 0;
    virtual double area() const = 0;
};

struct Circle : Shape {
    std::string kind;
    double r = 0;

    std::string kindName() const override { return "circle"; }
    double area() const override { return 3.0 * r * r; }
};

struct Square : Shape {
    std::string kind;
    double side = 0;

    std::string kindName() const override { return "square"; }
    double area() const override { return side * side; }
};

template<>
struct JsonTree::StructMeta<Circle> {
    using Fields = StructFields<Field<&Circle::kind, "kind">, Field<&Circle::r, "r">>;
};

template<>
struct JsonTree::StructMeta<Square> {
    using Fields = StructFields<Field<&Square::kind, "kind">, Field<&Square::side, "side">>;
};

// Picks the implementation from the "kind" member and decodes the whole
// node into it under the caller's context.
DecodeResult makeShape(const Node & node, const Context & ctx, std::unique_ptr<Shape> & out) {
    const JsonTree::Object * obj = node.asObject();
    if(obj == nullptr) {
        return DecodeResult::Failure("object expected");
    }
    JsonTree::NodePtr kind = obj->fieldByName("kind");
    if(!kind || kind->asString() == nullptr) {
        return DecodeResult::Failure("malformed object");
    }
    if(*kind->asString() == "circle") {
        auto c = std::make_unique<Circle>();
        if(auto r = node.decode(*c, options::context(ctx)); !r) return r;
        out = std::move(c);
    } else if(*kind->asString() == "square") {
        auto s = std::make_unique<Square>();
        if(auto r = node.decode(*s, options::context(ctx)); !r) return r;
        out = std::move(s);
    } else {
        return DecodeResult::Failure("unknown kind '" + *kind->asString() + "'");
    }
    return {};
}

struct Drawing {
    std::string title;
    std::vector<std::unique_ptr<Shape>> shapes;
    std::shared_ptr<Shape> background;
};

struct Plugin {
    virtual ~Plugin() = default;
    virtual int id() const = 0;
};

struct FixedPlugin : Plugin {
    int id() const override { return 7; }
};

int main() {
    TypeRegistry registry;
    registry.registerType<Shape>(makeShape);

    {
        std::unique_ptr<Shape> s;
        Check(DecodeSucceeds(s, R"({"kind":"circle","r":2})", options::types(registry)), "constructor picks Circle");
        Check(s && s->kindName() == "circle" && s->area() == 12.0, "decoded into the implementation");
    }
    {
        std::shared_ptr<Shape> s;
        Check(DecodeSucceeds(s, R"({"kind":"square","side":3})", options::types(registry)) && s
              && s->area() == 9.0, "shared_ptr handle");
        Check(DecodeSucceeds(s, "null", options::types(registry)) && !s, "null resets the handle");
    }
    {
        Drawing d;
        Check(DecodeSucceeds(d, R"({
            "title": "t",
            "shapes": [{"kind":"circle","r":1}, {"kind":"square","side":2}],
            "background": {"kind":"square","side":10}
        })", options::types(registry)), "abstract handles inside records and sequences");
        Check(d.shapes.size() == 2 && d.shapes[0]->kindName() == "circle" && d.shapes[1]->kindName() == "square",
              "each element picks its own implementation");
        Check(d.background && d.background->area() == 100.0, "abstract record field");
    }

    // ============================================================================
    // Failures
    // ============================================================================

    {
        std::unique_ptr<Shape> s;
        auto res = JsonTree::Unmarshal(R"({"kind":"hexagon"})", s, options::types(registry));
        Check(!res && res.decodeResult().error() == DecodeError::USER_TYPE_ERROR, "constructor failure is wrapped");
        Check(res.decodeResult().cause() == DecodeError::USER_ERROR, "constructor's code is the cause");
        Check(res.decodeResult().message() == "unknown kind 'hexagon'", "constructor's message kept");
        Check(!s, "destination untouched");
    }
    {
        Drawing d;
        auto res = JsonTree::Unmarshal(R"({"shapes":[{"kind":"circle","r":"big"}]})", d, options::types(registry));
        Check(!res && res.decodeResult().error() == DecodeError::USER_TYPE_ERROR
              && res.decodeResult().cause() == DecodeError::CANNOT_CONVERT_STRING,
              "nested decode failure inside the constructor");
        Check(JsonTree::JsonPathToString(res.decodeResult().errorPath()) == "$.shapes[0].r", "path runs through it");
    }
    {
        std::unique_ptr<Shape> s;
        Check(DecodeFailsWith(s, R"({"kind":"circle","r":1,"extra":0})", DecodeError::USER_TYPE_ERROR,
                              options::types(registry), options::disallow_unknown_fields),
              "strict mode reaches the constructor");
        Check(DecodeFailsWith(s, R"({"kind":"circle"})", DecodeError::INCOMPATIBLE_TYPES),
              "global registry knows nothing about Shape");
    }
    {
        TypeRegistry local;
        local.registerType<Plugin>([](const Node &, const Context &, std::unique_ptr<Plugin> &) {
            return DecodeResult();
        });
        std::unique_ptr<Plugin> p;
        Check(DecodeFailsWith(p, "{}", DecodeError::USER_TYPE_ERROR, options::types(local)),
              "constructor that produces nothing");
    }

    // ============================================================================
    // Registration
    // ============================================================================

    {
        bool threw = false;
        try {
            registry.registerType<Shape>(makeShape);
        } catch(const std::logic_error &) {
            threw = true;
        }
        Check(threw, "second constructor for the same type is rejected");
    }
    {
        TypeRegistry local;
        bool threw = false;
        try {
            local.registerType<Plugin>(static_cast<DecodeResult (*)(const Node &, const Context &, std::unique_ptr<Plugin> &)>(nullptr));
        } catch(const std::logic_error &) {
            threw = true;
        }
        Check(threw, "null constructor is rejected");
        Check(local.lookup<Plugin>() == nullptr, "nothing registered");

        local.registerType<Plugin>([](const Node &, const Context &, std::unique_ptr<Plugin> & out) {
            out = std::make_unique<FixedPlugin>();
            return DecodeResult();
        });
        std::unique_ptr<Plugin> p;
        Check(DecodeSucceeds(p, "true", options::types(local)) && p && p->id() == 7, "lambda constructor");
    }
    {
        TypeRegistry::global().registerType<Plugin>([](const Node &, const Context &, std::unique_ptr<Plugin> & out) {
            out = std::make_unique<FixedPlugin>();
            return DecodeResult();
        });
        std::unique_ptr<Plugin> p;
        Check(DecodeSucceeds(p, "{}") && p, "global registry is the default");
    }

    return Report();
}

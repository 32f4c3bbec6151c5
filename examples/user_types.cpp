// Abstract destinations resolved at runtime through the type registry
// Compile: g++ -std=c++23 -I../include user_types.cpp -o user_types

#include <JsonTree/jsontree.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace JsonTree;

struct UserType {
    virtual ~UserType() = default;
    virtual std::string implKind() const = 0;
    virtual std::string describe() const = 0;
};

struct UserTypeInt : UserType {
    std::string kind;
    int value = 0;

    std::string implKind() const override { return "int"; }
    std::string describe() const override { return std::to_string(value); }
};

struct UserTypeStr : UserType {
    std::string kind;
    std::string value;

    std::string implKind() const override { return "string"; }
    std::string describe() const override { return value; }
};

template<>
struct JsonTree::StructMeta<UserTypeInt> {
    using Fields = StructFields<Field<&UserTypeInt::kind, "kind">, Field<&UserTypeInt::value, "int">>;
};

template<>
struct JsonTree::StructMeta<UserTypeStr> {
    using Fields = StructFields<Field<&UserTypeStr::kind, "kind">, Field<&UserTypeStr::value, "string">>;
};

DecodeResult makeUserType(const Node & node, const Context & ctx, std::unique_ptr<UserType> & out) {
    const Object * obj = node.asObject();
    if (obj == nullptr) {
        return DecodeResult::Failure("object expected");
    }
    NodePtr kind = obj->fieldByName("kind");
    if (!kind || kind->asString() == nullptr) {
        return DecodeResult::Failure("malformed object");
    }

    if (*kind->asString() == "int") {
        auto dst = std::make_unique<UserTypeInt>();
        if (auto r = node.decode(*dst, options::context(ctx)); !r) return r;
        out = std::move(dst);
    } else if (*kind->asString() == "string") {
        auto dst = std::make_unique<UserTypeStr>();
        if (auto r = node.decode(*dst, options::context(ctx)); !r) return r;
        out = std::move(dst);
    } else {
        return DecodeResult::Failure("unknown kind '" + *kind->asString() + "'");
    }
    return {};
}

int main() {
    TypeRegistry::global().registerType(makeUserType);

    const std::string_view src = R"([
        {"kind": "int", "int": 123},
        {"kind": "string", "string": "text"},
    ])";

    std::vector<std::unique_ptr<UserType>> dest;
    auto res = Unmarshal(src, dest);
    if (!res) {
        if (!res.parseResult()) {
            std::cout << ParseResultToString(res.parseResult(), src) << std::endl;
        } else {
            std::cout << DecodeResultToString(res.decodeResult()) << std::endl;
        }
        return 1;
    }

    for (const auto & v : dest) {
        std::cout << v->implKind() << ": " << v->describe() << std::endl;
    }

    // Constructor failures name the element and keep the constructor's message
    std::vector<std::unique_ptr<UserType>> bad;
    auto failed = Unmarshal(R"([{"kind": "int", "int": 1}, {"kind": "float"}])", bad);
    std::cout << DecodeResultToString(failed.decodeResult()) << std::endl;

    return 0;
}

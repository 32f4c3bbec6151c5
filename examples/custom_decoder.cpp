// Types that decode themselves, deferred decoding and newline delimited input
// Compile: g++ -std=c++23 -I../include custom_decoder.cpp -o custom_decoder

#include <JsonTree/jsontree.hpp>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace JsonTree;

// Decodes itself from a name
struct Cutie {
    enum Kind { Snek, Pupper, Froggo } kind = Snek;

    DecodeResult decodeJson(const Node & node) {
        const std::string * name = node.asString();
        if (name == nullptr) {
            return DecodeResult::Failure("string expected");
        }
        if (*name == "snek") {
            kind = Snek;
        } else if (*name == "pupper") {
            kind = Pupper;
        } else if (*name == "froggo") {
            kind = Froggo;
        } else {
            return DecodeResult::Failure("unknown kind of cutie: " + *name);
        }
        return {};
    }
};

// Decodes itself from "#rrggbb"
struct Rgb {
    std::uint8_t r, g, b;

    DecodeResult decodeText(std::string_view text) {
        if (text.size() != 7 || text[0] != '#') {
            return DecodeResult::Failure("expected #rrggbb");
        }
        std::uint8_t * parts[] = {&r, &g, &b};
        for (int i = 0; i < 3; i++) {
            const char * from = text.data() + 1 + 2 * i;
            auto [ptr, ec] = std::from_chars(from, from + 2, *parts[i], 16);
            if (ec != std::errc{} || ptr != from + 2) {
                return DecodeResult::Failure("bad color digits in " + std::string(text));
            }
        }
        return {};
    }
};

// The payload's type depends on "type", so it is kept as a tree until then
struct Message {
    std::string type;
    NodePtr payload;
};

struct Paint {
    std::string name;
    Rgb color;
};

int main() {
    std::vector<Cutie> cuties;
    if (auto res = Unmarshal(R"(["snek","pupper","froggo"])", cuties); !res) {
        std::cout << DecodeResultToString(res.decodeResult()) << std::endl;
        return 1;
    }
    for (const auto & c : cuties) {
        std::cout << c.kind << " ";
    }
    std::cout << std::endl;

    std::istringstream in(
        "{\"type\":\"paint\",\"payload\":{\"name\":\"sky\",\"color\":\"#87ceeb\"}}\n"
        "{\"type\":\"counts\",\"payload\":{\"a\":1,\"b\":2}}\n"
        "{\"type\":\"paint\",\"payload\":{\"name\":\"mud\",\"color\":\"brown\"}}\n");

    StreamDecoder stream(in);
    stream.disallowUnknownFields();
    while (true) {
        Message msg;
        auto res = stream.decode(msg);
        if (res.atEnd()) {
            break;
        }
        if (!res) {
            std::cout << DecodeResultToString(res.decodeResult()) << std::endl;
            return 1;
        }

        DecodeResult payload;
        if (msg.type == "paint") {
            Paint p{};
            payload = msg.payload->decode(p);
            if (payload) {
                std::cout << p.name << ": " << int(p.color.r) << "," << int(p.color.g) << "," << int(p.color.b) << std::endl;
            }
        } else {
            std::map<std::string, int> counts;
            payload = msg.payload->decode(counts);
            if (payload) {
                std::cout << "counts: " << counts.size() << std::endl;
            }
        }
        if (!payload) {
            std::cout << DecodeResultToString(payload) << std::endl;
        }
    }

    return 0;
}

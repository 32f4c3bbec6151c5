// Basic JsonTree usage: parse once, decode into a struct, look at the tree
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <JsonTree/jsontree.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace JsonTree;

struct Config {
    std::string app_name;
    int version;
    bool debug_mode;

    struct Server {
        std::string host;
        int port;
    };
    Server server;
    std::vector<std::string> plugins;
    std::optional<int> workers;
    Annotated<std::vector<std::uint8_t>, options::json<"secret,hex">> secret;
};

int main() {
    const std::string_view json = R"({
        "app_name": "MyApp",
        "version": 1,
        "debug_mode": true,
        "server": {
            "host": "localhost",
            "port": 8080,
        },
        "plugins": ["auth", "metrics",],
        "secret": "c0ffee"
    })";

    auto parsed = Parse(json);
    if (!parsed) {
        std::cout << ParseResultToString(parsed, json) << std::endl;
        return 1;
    }

    Config config{};
    auto decoded = parsed.node()->decode(config, options::disallow_unknown_fields);
    if (!decoded) {
        std::cout << DecodeResultToString(decoded) << std::endl;
        return 1;
    }

    std::cout << "App: " << config.app_name << std::endl;
    std::cout << "Version: " << config.version << std::endl;
    std::cout << "Debug: " << (config.debug_mode ? "ON" : "OFF") << std::endl;
    std::cout << "Server: " << config.server.host << ":" << config.server.port << std::endl;
    std::cout << "Plugins: " << config.plugins.size() << std::endl;
    std::cout << "Workers: " << (config.workers ? std::to_string(*config.workers) : "default") << std::endl;
    std::cout << "Secret bytes: " << config.secret->size() << std::endl;

    // The tree itself
    const Object & root = *parsed.node()->asObject();
    for (const auto & [key, node] : root) {
        std::cout << "  " << key << ": " << node->type() << std::endl;
    }

    // A typo in the input shows where things went wrong
    const std::string_view broken = R"({"server": {"host": "localhost" "port": 8080}})";
    std::cout << ParseResultToString(Parse(broken), broken) << std::endl;

    Config other{};
    auto res = Unmarshal(R"({"server": {"port": "eighty"}})", other);
    std::cout << DecodeResultToString(res.decodeResult()) << std::endl;

    return 0;
}

#include "test_helpers.hpp"

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace TestHelpers;
using JsonTree::Annotated;
using JsonTree::DecodeError;
namespace options = JsonTree::options;

struct Url {
    std::string display;
    int clicks;
};

struct User {
    int id;
    Annotated<std::string, options::json<"screen_name">> screenName;
    std::optional<Url> homepage;
};

struct Status {
    int id;
    User user;
    std::array<Url, 2> urls;
    std::map<std::string, std::vector<int>> counters;
};

struct Feed {
    std::vector<Status> statuses;
    std::unique_ptr<Status> pinned;
};

struct Meta {
    int version;
};

struct Envelope {
    Annotated<Meta, options::embedded> meta;
    std::vector<std::vector<int>> rows;
};

int main() {
    Feed f;

    Check(DecodeFailsAt(f, R"({"statuses":[{"id":"one"}]})", DecodeError::CANNOT_CONVERT_STRING, "$.statuses[0].id"),
          "field in a sequence element");
    Check(DecodeFailsAt(f, R"({"statuses":[{"id":1},{"user":{"id":2,"screen_name":[]}}]})",
                        DecodeError::SEQUENCE_EXPECTED, "$.statuses[1].user.screen_name"),
          "tagged names appear in the path");
    Check(DecodeFailsAt(f, R"({"statuses":[{"user":{"homepage":{"clicks":"many","display":[]}}}]})",
                        DecodeError::CANNOT_CONVERT_STRING, "$.statuses[0].user.homepage.clicks"),
          "first failing key in source order wins");
    Check(DecodeFailsAt(f, R"({"statuses":[{"user":{"homepage":{"display":[]}}}]})",
                        DecodeError::SEQUENCE_EXPECTED, "$.statuses[0].user.homepage.display"),
          "array into text");
    Check(DecodeFailsAt(f, R"({"statuses":[{"urls":[{"clicks":1},{"clicks":"x"}]}]})",
                        DecodeError::CANNOT_CONVERT_STRING, "$.statuses[0].urls[1].clicks"),
          "fixed sequence index");
    Check(DecodeFailsAt(f, R"({"statuses":[{"counters":{"likes":[1,2,"3"]}}]})",
                        DecodeError::CANNOT_CONVERT_STRING, "$.statuses[0].counters.likes[2]"),
          "map key in the path");
    Check(DecodeFailsAt(f, R"({"pinned":{"user":{"id":[]}}})", DecodeError::SEQUENCE_EXPECTED, "$.pinned.user.id"),
          "through a pointer");
    Check(DecodeFailsAt(f, R"({"pinned":{"user":{"id":{}}}})", DecodeError::STRUCT_OR_MAP_EXPECTED, "$.pinned.user.id"),
          "object into a number");
    Check(DecodeFailsAt(f, R"({"statuses":{}})", DecodeError::STRUCT_OR_MAP_EXPECTED, "$.statuses"),
          "object into a sequence");
    Check(DecodeFailsAt(f, R"({"statuses":"none"})", DecodeError::CANNOT_CONVERT_STRING, "$.statuses"),
          "text into a sequence");
    Check(DecodeFailsAt(f, R"({"statuses":true})", DecodeError::CANNOT_CONVERT_BOOLEAN, "$.statuses"),
          "boolean into a sequence");

    {
        Envelope e;
        Check(DecodeFailsAt(e, R"({"version":"2"})", DecodeError::CANNOT_CONVERT_STRING, "$.version"),
              "promoted field uses its own name");
        Check(DecodeFailsAt(e, R"({"rows":[[1],[2,false,"x"]]})", DecodeError::CANNOT_CONVERT_STRING, "$.rows[1][2]"),
              "nested sequences");
    }
    {
        std::map<int, int> m;
        Check(DecodeFailsAt(m, R"({"1":2})", DecodeError::MAP_KEY_MUST_BE_STRING, "$"), "non-text map key");
        std::vector<std::map<int, int>> v;
        Check(DecodeFailsAt(v, R"([{"1":2}])", DecodeError::MAP_KEY_MUST_BE_STRING, "$[0]"), "non-text map key below");
    }

    // ============================================================================
    // Depth limit
    // ============================================================================

    {
        std::vector<std::vector<std::vector<int>>> v;
        Check(DecodeSucceeds(v, "[[[1]]]", options::max_depth(3)), "leaf at the limit");
        Check(DecodeFailsAt(v, "[[[1]]]", DecodeError::NESTING_TOO_DEEP, "$[0][0][0]", options::max_depth(2)),
              "leaf past the limit");
        Check(DecodeSucceeds(v, "[[[]]]", options::max_depth(2)), "empty containers add no depth");
    }

    return Report();
}

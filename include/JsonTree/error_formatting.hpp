#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "parse_result.hpp"

namespace JsonTree {

namespace error_formatting_detail {

inline constexpr const char * ws = " \t\n\r\f\v";

inline std::string & rtrim(std::string & s, const char * t = ws) {
    s.erase(s.find_last_not_of(t) + 1);
    return s;
}

inline std::string & ltrim(std::string & s, const char * t = ws) {
    s.erase(0, s.find_first_not_of(t));
    return s;
}

inline std::string & trim(std::string & s, const char * t = ws) {
    return ltrim(rtrim(s, t), t);
}

// Parse positions count code points; the fragment is cut in bytes.
inline std::size_t byteOffset(std::string_view text, std::size_t codePoints) {
    std::size_t i = 0;
    std::size_t seen = 0;
    for(; i < text.size(); i ++) {
        if((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) continue;
        if(seen == codePoints) break;
        seen ++;
    }
    return i;
}

// Widens [from, to) to whole UTF-8 sequences.
inline std::size_t sequenceStart(std::string_view text, std::size_t i) {
    while(i > 0 && i < text.size() && (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) i --;
    return i;
}

} // namespace error_formatting_detail

// "$", "$.items[2].name"
inline std::string JsonPathToString(const std::vector<PathElement> & path) {
    std::string jsonPath = "$";
    for(const auto & el : path) {
        if(el.isIndex()) {
            jsonPath += "[" + std::to_string(el.array_index) + "]";
        } else {
            jsonPath += "." + el.field_name;
        }
    }
    return jsonPath;
}

inline std::string ParseResultToString(const ParseResult & res, std::string_view input, std::size_t window = 40) {
    using namespace error_formatting_detail;
    if(res) {
        return "No error";
    }
    const std::size_t pos = byteOffset(input, res.pos());
    const std::size_t stop = pos < input.size() ? byteOffset(input, res.pos() + 1) : input.size();
    const std::size_t from = sequenceStart(input, stop > window ? stop - window : 0);
    const std::size_t to = sequenceStart(input, stop + window < input.size() ? stop + window : input.size());

    std::string before(input.substr(from, stop - from));
    std::string after(input.substr(stop, to - stop));
    trim(before);
    trim(after);

    std::string out = "Parsing error '" + std::string(error_to_string(res.error())) + "' at " + std::to_string(res.pos());
    if(!res.token().empty()) {
        out += " near '" + res.token() + "'";
    }
    out += ": '..." + before + "😖" + after + "...'";
    return out;
}

inline std::string DecodeResultToString(const DecodeResult & res) {
    if(res) {
        return "No error";
    }
    std::string out = "When decoding " + JsonPathToString(res.errorPath())
                      + ", decoding error '" + std::string(error_to_string(res.error())) + "'";
    if(res.cause() != DecodeError::NO_ERROR) {
        out += " caused by '" + std::string(error_to_string(res.cause())) + "'";
    }
    if(!res.message().empty()) {
        out += ": " + res.message();
    }
    return out;
}

} // namespace JsonTree

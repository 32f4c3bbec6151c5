#pragma once

#include <istream>
#include <iterator>
#include <string_view>
#include <utility>

#include "decoder.hpp"
#include "errors.hpp"
#include "parse_result.hpp"
#include "parser.hpp"

namespace JsonTree {

// Outcome of a parse followed by a decode. When parsing fails the decode
// part is left empty (successful).
class UnmarshalResult {
    ParseResult m_parse;
    DecodeResult m_decode;

public:
    UnmarshalResult(ParseResult parse, DecodeResult decode = {}):
        m_parse(std::move(parse)), m_decode(std::move(decode))
    {}

    explicit operator bool() const {
        return static_cast<bool>(m_parse) && static_cast<bool>(m_decode);
    }
    // Stream exhausted before another value began.
    bool atEnd() const {
        return m_parse.atEnd();
    }
    const ParseResult & parseResult() const {
        return m_parse;
    }
    const DecodeResult & decodeResult() const {
        return m_decode;
    }
};

// Parses text (one value, whitespace around it allowed) and decodes it
// into dst.
template<class T, class... Opts>
UnmarshalResult Unmarshal(std::string_view text, T && dst, Opts && ... opts) {
    ParseResult parsed = Parse(text);
    if(!parsed) {
        return UnmarshalResult(std::move(parsed));
    }
    DecodeResult decoded = parsed.node()->decode(std::forward<T>(dst), std::forward<Opts>(opts)...);
    return UnmarshalResult(std::move(parsed), std::move(decoded));
}

// Reads consecutive top-level values from a stream, e.g. newline
// delimited JSON. The stream is consumed character by character; nothing
// past the current value is read ahead except one character.
class StreamDecoder {
public:
    using Iterator = std::istreambuf_iterator<char>;

    explicit StreamDecoder(std::istream & in, ParserOptions opts = {})
        : m_in(in), m_parser(Iterator(in), Iterator(), opts) {}

    // Rejects object keys the destination record does not declare, for
    // every later decode() call.
    void disallowUnknownFields() {
        m_disallowUnknownFields = true;
    }

    // The next value as a tree. atEnd() once the stream is exhausted.
    ParseResult next() {
        ParseResult res = m_parser.parse();
        if(!res && !res.atEnd() && m_in.bad()) {
            return ParseResult(ParseError::READER_ERROR, res.pos(), {});
        }
        return res;
    }

    template<class T, class... Opts>
    UnmarshalResult decode(T && dst, Opts && ... opts) {
        ParseResult parsed = next();
        if(!parsed) {
            return UnmarshalResult(std::move(parsed));
        }
        DecodeResult decoded = m_disallowUnknownFields
            ? parsed.node()->decode(std::forward<T>(dst), options::disallow_unknown_fields, std::forward<Opts>(opts)...)
            : parsed.node()->decode(std::forward<T>(dst), std::forward<Opts>(opts)...);
        return UnmarshalResult(std::move(parsed), std::move(decoded));
    }

private:
    std::istream & m_in;
    Parser<Iterator, Iterator> m_parser;
    bool m_disallowUnknownFields = false;
};

} // namespace JsonTree

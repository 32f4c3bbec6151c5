#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "node.hpp"
#include "parse_result.hpp"
#include "tokenizer.hpp"

#ifndef JSONTREE_DEFAULT_MAX_DEPTH
#define JSONTREE_DEFAULT_MAX_DEPTH 512
#endif

namespace JsonTree {

struct ParserOptions {
    std::size_t maxDepth = JSONTREE_DEFAULT_MAX_DEPTH;
};

// Recursive-descent parser building one Node per parse() call. Keeps its
// tokenizer between calls so concatenated documents can be read one by one.
template<class It, class Sent>
    requires CharSentinelFor<It, Sent>
class Parser {
public:
    Parser(It first, Sent last, ParserOptions opts = {})
        : m_tokenizer(first, last), m_options(opts) {}

    ParseResult parse() {
        Token tok;
        switch(m_tokenizer.next(tok)) {
        case TokenStatus::end:
            return ParseResult(ParseError::END_OF_INPUT, m_tokenizer.offset(), {});
        case TokenStatus::error:
            return tokenizerFailure();
        case TokenStatus::value:
            break;
        }
        NodePtr out;
        if(!parseValue(tok, out, 0)) {
            return std::move(m_failure);
        }
        return ParseResult(std::move(out));
    }

    // Succeeds only if nothing but whitespace is left.
    ParseResult expectEnd() {
        Token tok;
        switch(m_tokenizer.next(tok)) {
        case TokenStatus::end:
            return ParseResult(Node::makeNull());
        case TokenStatus::error:
            return tokenizerFailure();
        case TokenStatus::value:
            break;
        }
        return ParseResult(ParseError::UNEXPECTED_TOKEN, tok.offset, std::move(tok.text));
    }

private:
    Tokenizer<It, Sent> m_tokenizer;
    ParserOptions m_options;
    ParseResult m_failure;

    ParseResult tokenizerFailure() const {
        return ParseResult(m_tokenizer.getError(), m_tokenizer.errorOffset(), m_tokenizer.errorText());
    }

    bool fail(ParseError err, std::size_t offset, std::string text) {
        m_failure = ParseResult(err, offset, std::move(text));
        return false;
    }

    // Inside a structure running out of input is an error.
    bool readToken(Token & tok) {
        switch(m_tokenizer.next(tok)) {
        case TokenStatus::value:
            return true;
        case TokenStatus::end:
            return fail(ParseError::UNEXPECTED_END_OF_DATA, m_tokenizer.offset(), {});
        case TokenStatus::error:
            m_failure = tokenizerFailure();
            return false;
        }
        return false;
    }

    bool parseValue(Token & tok, NodePtr & out, std::size_t depth) {
        switch(tok.kind) {
        case TokenKind::Delimiter:
            if(tok.isDelimiter('[')) return parseArray(tok, out, depth + 1);
            if(tok.isDelimiter('{')) return parseObject(tok, out, depth + 1);
            return fail(ParseError::UNEXPECTED_TOKEN, tok.offset, std::move(tok.text));
        case TokenKind::String:
            out = Node::makeString(std::move(tok.text));
            return true;
        case TokenKind::Number: {
            auto d = Decimal::parse(tok.text);
            if(!d) {
                return fail(ParseError::ILLFORMED_NUMBER, tok.offset, std::move(tok.text));
            }
            out = Node::makeNumber(std::move(*d));
            return true;
        }
        case TokenKind::Keyword:
            if(tok.text == "true") {
                out = Node::makeBool(true);
            } else if(tok.text == "false") {
                out = Node::makeBool(false);
            } else if(tok.text == "null") {
                out = Node::makeNull();
            } else {
                return fail(ParseError::UNDEFINED_KEYWORD, tok.offset, std::move(tok.text));
            }
            return true;
        }
        return fail(ParseError::UNEXPECTED_TOKEN, tok.offset, std::move(tok.text));
    }

    bool parseArray(const Token & open, NodePtr & out, std::size_t depth) {
        if(depth > m_options.maxDepth) {
            return fail(ParseError::NESTING_TOO_DEEP, open.offset, open.text);
        }
        Array items;
        Token tok;
        while(true) {
            if(!readToken(tok)) return false;
            // empty array or trailing comma
            if(tok.isDelimiter(']')) break;

            NodePtr item;
            if(!parseValue(tok, item, depth)) return false;
            items.push_back(std::move(item));

            if(!readToken(tok)) return false;
            if(tok.isDelimiter(',')) continue;
            if(tok.isDelimiter(']')) break;
            return fail(ParseError::UNEXPECTED_TOKEN, tok.offset, std::move(tok.text));
        }
        out = Node::makeArray(std::move(items));
        return true;
    }

    bool parseObject(const Token & open, NodePtr & out, std::size_t depth) {
        if(depth > m_options.maxDepth) {
            return fail(ParseError::NESTING_TOO_DEEP, open.offset, open.text);
        }
        Object fields;
        Token tok;
        while(true) {
            if(!readToken(tok)) return false;
            // empty object or trailing comma
            if(tok.isDelimiter('}')) break;
            if(tok.kind != TokenKind::String) {
                return fail(ParseError::OBJECT_KEY_EXPECTED, tok.offset, std::move(tok.text));
            }
            std::string key = std::move(tok.text);

            if(!readToken(tok)) return false;
            if(!tok.isDelimiter(':')) {
                return fail(ParseError::COLON_EXPECTED, tok.offset, std::move(tok.text));
            }

            if(!readToken(tok)) return false;
            NodePtr value;
            if(!parseValue(tok, value, depth)) return false;
            fields.set(std::move(key), std::move(value));

            if(!readToken(tok)) return false;
            if(tok.isDelimiter(',')) continue;
            if(tok.isDelimiter('}')) break;
            return fail(ParseError::UNEXPECTED_TOKEN, tok.offset, std::move(tok.text));
        }
        out = Node::makeObject(std::move(fields));
        return true;
    }
};

template<class It, class Sent>
Parser(It, Sent) -> Parser<It, Sent>;

template<class It, class Sent>
Parser(It, Sent, ParserOptions) -> Parser<It, Sent>;

// Parses exactly one value; anything but whitespace after it is an error.
template<class It, class Sent>
    requires CharSentinelFor<It, Sent>
ParseResult Parse(It first, Sent last, ParserOptions opts = {}) {
    Parser<It, Sent> parser(first, last, opts);
    ParseResult res = parser.parse();
    if(!res) {
        return res;
    }
    ParseResult tail = parser.expectEnd();
    if(!tail) {
        return tail;
    }
    return res;
}

inline ParseResult Parse(std::string_view text, ParserOptions opts = {}) {
    return Parse(text.data(), text.data() + text.size(), opts);
}

} // namespace JsonTree

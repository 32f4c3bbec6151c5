#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "io.hpp"

namespace JsonTree {

enum class TokenKind {
    Delimiter,   // one of { } [ ] , :
    String,      // fully unescaped text
    Number,      // raw text, validated by the parser
    Keyword      // run of lowercase letters
};

constexpr std::string_view kind_to_string(TokenKind k) {
    switch(k) {
    case TokenKind::Delimiter: return "delimiter"; break;
    case TokenKind::String: return "string"; break;
    case TokenKind::Number: return "number"; break;
    case TokenKind::Keyword: return "keyword"; break;
    }
    return "N/A";
}

struct Token {
    TokenKind kind = TokenKind::Delimiter;
    std::string text;
    std::size_t offset = 0;   // code points from the start of input

    bool isDelimiter(char c) const {
        return kind == TokenKind::Delimiter && text.size() == 1 && text[0] == c;
    }
};

enum class TokenStatus {
    value,
    end,
    error
};

// Lazily splits a character stream into positioned tokens.
// Holds at most one character of pushback; offsets count Unicode code points,
// so UTF-8 continuation bytes do not advance them.
template<class It, class Sent>
    requires CharSentinelFor<It, Sent>
class Tokenizer {
public:
    using iterator_type = It;

    constexpr Tokenizer(It first, Sent last)
        : current_(first), end_(last) {}

    TokenStatus next(Token & tok) {
        char c = 0;
        do {
            if(!read(c)) {
                return TokenStatus::end;
            }
        } while(isSpace(c));

        tok.text.clear();
        tok.offset = isContinuation(c) ? consumed_ : consumed_ - 1;

        switch(c) {
        case '{': case '}': case '[': case ']': case ',': case ':':
            tok.kind = TokenKind::Delimiter;
            tok.text.push_back(c);
            return TokenStatus::value;
        case '"':
            tok.kind = TokenKind::String;
            return readString(tok.text) ? TokenStatus::value : TokenStatus::error;
        default:
            break;
        }

        if(isDigit(c) || c == '-' || c == '.') {
            tok.kind = TokenKind::Number;
            tok.text.push_back(c);
            readRun(tok.text, [](char ch) {
                return isDigit(ch) || ch == '+' || ch == '-' || ch == '.' || ch == 'e' || ch == 'E';
            });
            return TokenStatus::value;
        }
        if(isLower(c)) {
            tok.kind = TokenKind::Keyword;
            tok.text.push_back(c);
            readRun(tok.text, [](char ch) { return isLower(ch); });
            return TokenStatus::value;
        }

        std::string bad(1, c);
        if(static_cast<unsigned char>(c) >= 0x80) {
            readRun(bad, [](char ch) { return isContinuation(ch); });
        }
        setError(ParseError::UNEXPECTED_CHARACTER, tok.offset, std::move(bad));
        return TokenStatus::error;
    }

    ParseError getError() const { return m_error; }
    std::size_t errorOffset() const { return m_errorOffset; }
    const std::string & errorText() const { return m_errorText; }
    std::size_t offset() const { return consumed_; }

private:
    It current_;
    Sent end_;
    char pushback_ = 0;
    bool hasPushback_ = false;
    std::size_t consumed_ = 0;

    ParseError m_error = ParseError::NO_ERROR;
    std::size_t m_errorOffset = 0;
    std::string m_errorText;

    static constexpr bool isSpace(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }
    static constexpr bool isDigit(char c) { return c >= '0' && c <= '9'; }
    static constexpr bool isLower(char c) { return c >= 'a' && c <= 'z'; }
    static constexpr bool isContinuation(char c) {
        return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
    }

    bool read(char & c) {
        if(hasPushback_) {
            hasPushback_ = false;
            c = pushback_;
        } else {
            if(current_ == end_) return false;
            c = static_cast<char>(*current_);
            ++current_;
        }
        if(!isContinuation(c)) ++consumed_;
        return true;
    }

    void unread(char c) {
        pushback_ = c;
        hasPushback_ = true;
        if(!isContinuation(c)) --consumed_;
    }

    template<class Pred>
    void readRun(std::string & out, Pred pred) {
        char c = 0;
        while(read(c)) {
            if(!pred(c)) {
                unread(c);
                return;
            }
            out.push_back(c);
        }
    }

    void setError(ParseError err, std::size_t offset, std::string text) {
        m_error = err;
        m_errorOffset = offset;
        m_errorText = std::move(text);
    }

    bool hexValue(char c, std::uint32_t & v) const {
        if(c >= '0' && c <= '9') { v = std::uint32_t(c - '0'); return true; }
        if(c >= 'a' && c <= 'f') { v = std::uint32_t(c - 'a' + 10); return true; }
        if(c >= 'A' && c <= 'F') { v = std::uint32_t(c - 'A' + 10); return true; }
        return false;
    }

    bool readHex(std::size_t digits, std::uint32_t & out) {
        out = 0;
        for(std::size_t i = 0; i < digits; i ++) {
            char c = 0;
            if(!read(c)) {
                setError(ParseError::UNEXPECTED_END_OF_DATA, consumed_, {});
                return false;
            }
            std::uint32_t v = 0;
            if(!hexValue(c, v)) {
                setError(ParseError::INVALID_HEX_DIGIT, consumed_ - 1, std::string(1, c));
                return false;
            }
            out = (out << 4) | v;
        }
        return true;
    }

    static void appendUtf8(std::string & out, std::uint32_t codepoint) {
        if (codepoint <= 0x7Fu) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FFu) {
            out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFFu) {
            out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else { // up to 0x10FFFF
            out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    // \uXXXX already consumed up to the digits
    bool readUnicodeEscape(std::string & out) {
        const std::size_t escOffset = consumed_ - 2;
        std::uint32_t u1 = 0;
        if(!readHex(4, u1)) return false;

        if(u1 >= 0xDC00u && u1 <= 0xDFFFu) {
            // Lone low surrogate
            setError(ParseError::INVALID_SURROGATE_PAIR, escOffset, "\\u" + hex4(u1));
            return false;
        }
        if(u1 < 0xD800u || u1 > 0xDBFFu) {
            appendUtf8(out, u1);
            return true;
        }

        // High surrogate, expect a second \uXXXX
        char c = 0;
        if(!read(c)) {
            setError(ParseError::UNEXPECTED_END_OF_DATA, consumed_, {});
            return false;
        }
        if(c != '\\') {
            unread(c);
            setError(ParseError::INVALID_SURROGATE_PAIR, escOffset, "\\u" + hex4(u1));
            return false;
        }
        if(!read(c)) {
            setError(ParseError::UNEXPECTED_END_OF_DATA, consumed_, {});
            return false;
        }
        if(c != 'u') {
            setError(ParseError::INVALID_SURROGATE_PAIR, escOffset, "\\u" + hex4(u1));
            return false;
        }
        std::uint32_t u2 = 0;
        if(!readHex(4, u2)) return false;
        if(u2 < 0xDC00u || u2 > 0xDFFFu) {
            setError(ParseError::INVALID_SURROGATE_PAIR, escOffset, "\\u" + hex4(u1) + "\\u" + hex4(u2));
            return false;
        }
        appendUtf8(out, 0x10000u + ((u1 - 0xD800u) << 10) + (u2 - 0xDC00u));
        return true;
    }

    static std::string hex4(std::uint32_t v) {
        static constexpr char digits[] = "0123456789ABCDEF";
        std::string s(4, '0');
        for(int i = 3; i >= 0; i --) {
            s[std::size_t(i)] = digits[v & 0xF];
            v >>= 4;
        }
        return s;
    }

    // Opening quote already consumed.
    bool readString(std::string & out) {
        char c = 0;
        while(true) {
            if(!read(c)) {
                setError(ParseError::UNEXPECTED_END_OF_DATA, consumed_, out);
                return false;
            }
            if(c == '"') return true;
            if(c != '\\') {
                out.push_back(c);
                continue;
            }
            if(!read(c)) {
                setError(ParseError::UNEXPECTED_END_OF_DATA, consumed_, out);
                return false;
            }
            switch(c) {
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'x': {
                std::uint32_t code = 0;
                if(!readHex(2, code)) return false;
                appendUtf8(out, code);
                break;
            }
            case 'u':
                if(!readUnicodeEscape(out)) return false;
                break;
            default:
                // \" \\ \/ and anything else stand for themselves
                out.push_back(c);
                break;
            }
        }
    }
};

template<class It, class Sent>
Tokenizer(It, Sent) -> Tokenizer<It, Sent>;

} // namespace JsonTree

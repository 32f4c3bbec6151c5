#include "test_helpers.hpp"

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace TestHelpers;
using JsonTree::ParseError;
using JsonTree::Token;
using JsonTree::TokenKind;
using JsonTree::TokenStatus;

namespace {

struct Expected {
    TokenKind kind;
    std::string text;
    std::size_t offset;
};

std::vector<Token> Tokenize(std::string_view src) {
    JsonTree::Tokenizer tokenizer(src.begin(), src.end());
    std::vector<Token> out;
    Token tok;
    while(tokenizer.next(tok) == TokenStatus::value) {
        out.push_back(tok);
    }
    return out;
}

bool TokensAre(const std::vector<Token> & actual, const std::vector<Expected> & expected) {
    if(actual.size() != expected.size()) return false;
    for(std::size_t i = 0; i < actual.size(); i ++) {
        if(actual[i].kind != expected[i].kind
           || actual[i].text != expected[i].text
           || actual[i].offset != expected[i].offset) {
            std::cerr << "  token " << i << ": " << kind_to_string(actual[i].kind)
                      << " '" << actual[i].text << "' @" << actual[i].offset << std::endl;
            return false;
        }
    }
    return true;
}

// First failure of the tokenizer over src
struct Failure {
    ParseError error = ParseError::NO_ERROR;
    std::size_t offset = 0;
    std::string text;
};

Failure TokenizeFailure(std::string_view src) {
    JsonTree::Tokenizer tokenizer(src.begin(), src.end());
    Token tok;
    TokenStatus st;
    while((st = tokenizer.next(tok)) == TokenStatus::value) {}
    if(st == TokenStatus::end) return {};
    return {tokenizer.getError(), tokenizer.errorOffset(), tokenizer.errorText()};
}

} // namespace

int main() {
    // ============================================================================
    // Token stream with positions
    // ============================================================================

    {
        constexpr std::string_view src =
            R"({"str":"\\z\zz\t\n\"xxx\uD834\uDD1Efff\u1234привет","num":-0.123e-5,"bool":false})";
        Check(TokensAre(Tokenize(src), {
            {TokenKind::Delimiter, "{", 0},
            {TokenKind::String, "str", 1},
            {TokenKind::Delimiter, ":", 6},
            {TokenKind::String, "\\zzz\t\n\"xxx\U0001D11Efff\u1234привет", 7},
            {TokenKind::Delimiter, ",", 51},
            {TokenKind::String, "num", 52},
            {TokenKind::Delimiter, ":", 57},
            {TokenKind::Number, "-0.123e-5", 58},
            {TokenKind::Delimiter, ",", 67},
            {TokenKind::String, "bool", 68},
            {TokenKind::Delimiter, ":", 74},
            {TokenKind::Keyword, "false", 75},
            {TokenKind::Delimiter, "}", 80},
        }), "Tokens carry unescaped text and code point offsets");
    }

    Check(TokensAre(Tokenize(" \t\r\n[ 1 ,\n2 ] "), {
        {TokenKind::Delimiter, "[", 4},
        {TokenKind::Number, "1", 6},
        {TokenKind::Delimiter, ",", 8},
        {TokenKind::Number, "2", 10},
        {TokenKind::Delimiter, "]", 12},
    }), "Whitespace separates tokens and is skipped");

    Check(TokensAre(Tokenize("12,true null"), {
        {TokenKind::Number, "12", 0},
        {TokenKind::Delimiter, ",", 2},
        {TokenKind::Keyword, "true", 3},
        {TokenKind::Keyword, "null", 8},
    }), "Number and keyword runs stop at the first foreign character");

    Check(TokensAre(Tokenize("1.5e+10 -7 .5 1-2"), {
        {TokenKind::Number, "1.5e+10", 0},
        {TokenKind::Number, "-7", 8},
        {TokenKind::Number, ".5", 11},
        {TokenKind::Number, "1-2", 14},
    }), "Number tokens are raw runs; validation is the parser's job");

    // ============================================================================
    // Escapes
    // ============================================================================

    Check(TokensAre(Tokenize(R"("a\/b\b\f\x41\x7e")"), {
        {TokenKind::String, "a/b\b\fA~", 0},
    }), "Simple escapes and \\xHH");

    Check(TokensAre(Tokenize(R"("\xe9")"), {
        {TokenKind::String, "\u00e9", 0},
    }), "\\xHH is a code point, encoded as UTF-8");

    Check(TokensAre(Tokenize(R"("\u00e9\u20AC")"), {
        {TokenKind::String, "\u00e9\u20ac", 0},
    }), "\\uXXXX accepts either hex case");

    Check(TokensAre(Tokenize(R"("\uD834\uDD1E")"), {
        {TokenKind::String, "\U0001D11E", 0},
    }), "Surrogate pair combines into one scalar");

    Check(TokensAre(Tokenize("\"привет\" 1"), {
        {TokenKind::String, "привет", 0},
        {TokenKind::Number, "1", 9},
    }), "Multi-byte characters advance offsets by one");

    // ============================================================================
    // Lexical errors
    // ============================================================================

    {
        auto f = TokenizeFailure(R"(["ab", @])");
        Check(f.error == ParseError::UNEXPECTED_CHARACTER && f.offset == 7 && f.text == "@",
              "Unexpected character reports its offset");
    }
    {
        auto f = TokenizeFailure("[1, ж]");
        Check(f.error == ParseError::UNEXPECTED_CHARACTER && f.offset == 4 && f.text == "ж",
              "Unexpected multi-byte character is reported whole");
    }
    {
        auto f = TokenizeFailure("True");
        Check(f.error == ParseError::UNEXPECTED_CHARACTER && f.offset == 0, "Keywords are lowercase only");
    }
    {
        auto f = TokenizeFailure(R"("ab\u12G4")");
        Check(f.error == ParseError::INVALID_HEX_DIGIT && f.offset == 7 && f.text == "G",
              "Invalid hex digit in \\u escape");
    }
    {
        auto f = TokenizeFailure(R"("\xZ1")");
        Check(f.error == ParseError::INVALID_HEX_DIGIT && f.offset == 3, "Invalid hex digit in \\x escape");
    }
    {
        auto f = TokenizeFailure(R"("x\uDD1E")");
        Check(f.error == ParseError::INVALID_SURROGATE_PAIR && f.offset == 2, "Lone low surrogate");
    }
    {
        auto f = TokenizeFailure(R"("\uD834abc")");
        Check(f.error == ParseError::INVALID_SURROGATE_PAIR && f.offset == 1, "High surrogate without a partner");
    }
    {
        auto f = TokenizeFailure(R"("\uD834\n")");
        Check(f.error == ParseError::INVALID_SURROGATE_PAIR, "High surrogate followed by another escape");
    }
    {
        auto f = TokenizeFailure(R"("\uD834\u0041")");
        Check(f.error == ParseError::INVALID_SURROGATE_PAIR, "High surrogate followed by a non-surrogate");
    }
    {
        auto f = TokenizeFailure(R"("\uD834)");
        Check(f.error == ParseError::UNEXPECTED_END_OF_DATA, "Input ends inside a surrogate pair");
    }
    {
        auto f = TokenizeFailure(R"("\u12)");
        Check(f.error == ParseError::UNEXPECTED_END_OF_DATA, "Input ends inside \\u digits");
    }
    {
        auto f = TokenizeFailure(R"(["abc)");
        Check(f.error == ParseError::UNEXPECTED_END_OF_DATA && f.offset == 5, "Unterminated string");
    }

    // ============================================================================
    // Single-pass input
    // ============================================================================

    {
        std::istringstream in(R"({"a": [1, "b"]})");
        JsonTree::Tokenizer tokenizer{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        std::vector<Token> tokens;
        Token tok;
        while(tokenizer.next(tok) == TokenStatus::value) tokens.push_back(tok);
        Check(TokensAre(tokens, {
            {TokenKind::Delimiter, "{", 0},
            {TokenKind::String, "a", 1},
            {TokenKind::Delimiter, ":", 4},
            {TokenKind::Delimiter, "[", 6},
            {TokenKind::Number, "1", 7},
            {TokenKind::Delimiter, ",", 8},
            {TokenKind::String, "b", 10},
            {TokenKind::Delimiter, "]", 13},
            {TokenKind::Delimiter, "}", 14},
        }), "Tokenizer runs over istreambuf_iterator");
    }

    return Report();
}

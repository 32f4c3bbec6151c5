#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "errors.hpp"
#include "node.hpp"

namespace JsonTree {

class ParseResult {
    ParseError m_error = ParseError::NO_ERROR;
    std::size_t m_pos = 0;
    std::string m_token;
    NodePtr m_node;

public:
    ParseResult() = default;
    ParseResult(NodePtr node): m_node(std::move(node)) {}
    ParseResult(ParseError err, std::size_t pos, std::string token):
        m_error(err), m_pos(pos), m_token(std::move(token))
    {}

    explicit operator bool() const {
        return m_error == ParseError::NO_ERROR;
    }
    // Input ran out before a value started; not a syntax problem.
    bool atEnd() const {
        return m_error == ParseError::END_OF_INPUT;
    }

    ParseError error() const {
        return m_error;
    }
    // Code point offset of the offending token or character.
    std::size_t pos() const {
        return m_pos;
    }
    const std::string & token() const {
        return m_token;
    }
    const NodePtr & node() const {
        return m_node;
    }
};

} // namespace JsonTree

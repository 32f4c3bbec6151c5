#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace JsonTree {

// ============================================================================
// Parse Errors (tokenizer and parser)
// ============================================================================

enum class ParseError {
    NO_ERROR,

    END_OF_INPUT,
    UNEXPECTED_END_OF_DATA,

    UNEXPECTED_CHARACTER,
    INVALID_HEX_DIGIT,
    INVALID_SURROGATE_PAIR,
    ILLFORMED_NUMBER,

    UNDEFINED_KEYWORD,
    UNEXPECTED_TOKEN,
    OBJECT_KEY_EXPECTED,
    COLON_EXPECTED,
    NESTING_TOO_DEEP,

    READER_ERROR
};

constexpr std::string_view error_to_string(ParseError e) {
    switch(e) {
    case ParseError::NO_ERROR: return "NO_ERROR"; break;
    case ParseError::END_OF_INPUT: return "END_OF_INPUT"; break;
    case ParseError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA"; break;
    case ParseError::UNEXPECTED_CHARACTER: return "UNEXPECTED_CHARACTER"; break;
    case ParseError::INVALID_HEX_DIGIT: return "INVALID_HEX_DIGIT"; break;
    case ParseError::INVALID_SURROGATE_PAIR: return "INVALID_SURROGATE_PAIR"; break;
    case ParseError::ILLFORMED_NUMBER: return "ILLFORMED_NUMBER"; break;
    case ParseError::UNDEFINED_KEYWORD: return "UNDEFINED_KEYWORD"; break;
    case ParseError::UNEXPECTED_TOKEN: return "UNEXPECTED_TOKEN"; break;
    case ParseError::OBJECT_KEY_EXPECTED: return "OBJECT_KEY_EXPECTED"; break;
    case ParseError::COLON_EXPECTED: return "COLON_EXPECTED"; break;
    case ParseError::NESTING_TOO_DEEP: return "NESTING_TOO_DEEP"; break;
    case ParseError::READER_ERROR: return "READER_ERROR"; break;
    }
    return "N/A";
}

// ============================================================================
// Decode Errors (node -> destination)
// ============================================================================

enum class DecodeError {
    NO_ERROR,

    POINTER_EXPECTED,
    NIL_DESTINATION,
    INCOMPATIBLE_TYPES,

    CANNOT_CONVERT_NUMBER,
    CANNOT_CONVERT_STRING,
    CANNOT_CONVERT_BOOLEAN,
    STRUCT_OR_MAP_EXPECTED,
    MAP_KEY_MUST_BE_STRING,
    SEQUENCE_EXPECTED,
    UNDEFINED_FIELD,

    NUMBER_OUT_OF_RANGE,
    ILLFORMED_NUMBER,
    ILLFORMED_BOOL,

    UNKNOWN_ENCODING,
    ENCODING_ERROR,

    USER_TYPE_ERROR,
    DECODER_HOOK_ERROR,
    TEXT_DECODER_ERROR,
    USER_ERROR,

    NESTING_TOO_DEEP
};

constexpr std::string_view error_to_string(DecodeError e) {
    switch(e) {
    case DecodeError::NO_ERROR: return "NO_ERROR"; break;
    case DecodeError::POINTER_EXPECTED: return "POINTER_EXPECTED"; break;
    case DecodeError::NIL_DESTINATION: return "NIL_DESTINATION"; break;
    case DecodeError::INCOMPATIBLE_TYPES: return "INCOMPATIBLE_TYPES"; break;
    case DecodeError::CANNOT_CONVERT_NUMBER: return "CANNOT_CONVERT_NUMBER"; break;
    case DecodeError::CANNOT_CONVERT_STRING: return "CANNOT_CONVERT_STRING"; break;
    case DecodeError::CANNOT_CONVERT_BOOLEAN: return "CANNOT_CONVERT_BOOLEAN"; break;
    case DecodeError::STRUCT_OR_MAP_EXPECTED: return "STRUCT_OR_MAP_EXPECTED"; break;
    case DecodeError::MAP_KEY_MUST_BE_STRING: return "MAP_KEY_MUST_BE_STRING"; break;
    case DecodeError::SEQUENCE_EXPECTED: return "SEQUENCE_EXPECTED"; break;
    case DecodeError::UNDEFINED_FIELD: return "UNDEFINED_FIELD"; break;
    case DecodeError::NUMBER_OUT_OF_RANGE: return "NUMBER_OUT_OF_RANGE"; break;
    case DecodeError::ILLFORMED_NUMBER: return "ILLFORMED_NUMBER"; break;
    case DecodeError::ILLFORMED_BOOL: return "ILLFORMED_BOOL"; break;
    case DecodeError::UNKNOWN_ENCODING: return "UNKNOWN_ENCODING"; break;
    case DecodeError::ENCODING_ERROR: return "ENCODING_ERROR"; break;
    case DecodeError::USER_TYPE_ERROR: return "USER_TYPE_ERROR"; break;
    case DecodeError::DECODER_HOOK_ERROR: return "DECODER_HOOK_ERROR"; break;
    case DecodeError::TEXT_DECODER_ERROR: return "TEXT_DECODER_ERROR"; break;
    case DecodeError::USER_ERROR: return "USER_ERROR"; break;
    case DecodeError::NESTING_TOO_DEEP: return "NESTING_TOO_DEEP"; break;
    }
    return "N/A";
}

// One hop of the JSON path leading to a failed slot: either an array index
// or an object key.
struct PathElement {
    static constexpr std::size_t NotAnIndex = std::numeric_limits<std::size_t>::max();

    std::size_t array_index = NotAnIndex;
    std::string field_name;

    bool isIndex() const { return array_index != NotAnIndex; }
};

class DecodeResult {
    DecodeError m_error = DecodeError::NO_ERROR;
    DecodeError m_cause = DecodeError::NO_ERROR;
    std::string m_message;
    std::vector<PathElement> m_path;

public:
    DecodeResult() = default;
    DecodeResult(DecodeError err, std::string message):
        m_error(err), m_message(std::move(message))
    {}

    // Failure reported by user code: registered constructors and decode hooks.
    static DecodeResult Failure(std::string message) {
        return DecodeResult(DecodeError::USER_ERROR, std::move(message));
    }

    explicit operator bool() const {
        return m_error == DecodeError::NO_ERROR;
    }

    DecodeError error() const {
        return m_error;
    }
    // For extension failures: the code the extension itself reported.
    DecodeError cause() const {
        return m_cause;
    }
    const std::string & message() const {
        return m_message;
    }
    const std::vector<PathElement> & errorPath() const {
        return m_path;
    }

    // Re-labels an extension failure, keeping its message and path.
    DecodeResult && wrap(DecodeError err) && {
        if(m_error != DecodeError::NO_ERROR) {
            m_cause = m_error;
            m_error = err;
        }
        return std::move(*this);
    }

    // Paths are built while the failure unwinds, innermost hop first.
    DecodeResult && at(std::size_t index) && {
        m_path.insert(m_path.begin(), PathElement{index, {}});
        return std::move(*this);
    }
    DecodeResult && at(std::string_view key) && {
        m_path.insert(m_path.begin(), PathElement{PathElement::NotAnIndex, std::string(key)});
        return std::move(*this);
    }
};

} // namespace JsonTree

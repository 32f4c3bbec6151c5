#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace JsonTree {

// Reversible byte <-> text transform used when a JSON string carries
// binary data.
class Encoding {
public:
    virtual ~Encoding() = default;

    virtual std::string encode(std::span<const std::uint8_t> bytes) const = 0;
    virtual DecodeResult decode(std::string_view text, std::vector<std::uint8_t> & out) const = 0;
};

namespace detail {

inline constexpr std::string_view base64_alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline constexpr std::uint8_t base64_invalid = 255;
inline constexpr std::uint8_t base64_pad = 254;

constexpr std::array<std::uint8_t, 256> make_base64_decode_table() {
    std::array<std::uint8_t, 256> table{};
    for(auto & v : table) v = base64_invalid;
    for(std::size_t i = 0; i < base64_alphabet.size(); i ++) {
        table[static_cast<unsigned char>(base64_alphabet[i])] = static_cast<std::uint8_t>(i);
    }
    table[static_cast<unsigned char>('=')] = base64_pad;
    return table;
}

inline constexpr auto base64_decode_table = make_base64_decode_table();

inline std::string illegal_byte_message(std::string_view scheme, std::size_t at) {
    return "illegal " + std::string(scheme) + " data at input byte " + std::to_string(at);
}

} // namespace detail

// Standard alphabet, padded. CR and LF inside the text are ignored.
class Base64Encoding final : public Encoding {
public:
    std::string encode(std::span<const std::uint8_t> bytes) const override {
        std::string out;
        out.reserve((bytes.size() + 2) / 3 * 4);
        std::size_t i = 0;
        for(; i + 3 <= bytes.size(); i += 3) {
            std::uint32_t v = (std::uint32_t(bytes[i]) << 16) | (std::uint32_t(bytes[i+1]) << 8) | bytes[i+2];
            out.push_back(detail::base64_alphabet[(v >> 18) & 0x3F]);
            out.push_back(detail::base64_alphabet[(v >> 12) & 0x3F]);
            out.push_back(detail::base64_alphabet[(v >> 6) & 0x3F]);
            out.push_back(detail::base64_alphabet[v & 0x3F]);
        }
        const std::size_t rest = bytes.size() - i;
        if(rest > 0) {
            std::uint32_t v = std::uint32_t(bytes[i]) << 16;
            if(rest == 2) v |= std::uint32_t(bytes[i+1]) << 8;
            out.push_back(detail::base64_alphabet[(v >> 18) & 0x3F]);
            out.push_back(detail::base64_alphabet[(v >> 12) & 0x3F]);
            out.push_back(rest == 2 ? detail::base64_alphabet[(v >> 6) & 0x3F] : '=');
            out.push_back('=');
        }
        return out;
    }

    DecodeResult decode(std::string_view text, std::vector<std::uint8_t> & out) const override {
        out.clear();
        std::uint8_t quad[4];
        std::size_t quadPos[4];
        std::size_t n = 0;
        bool finished = false;

        for(std::size_t i = 0; i < text.size(); i ++) {
            const char c = text[i];
            if(c == '\r' || c == '\n') continue;
            if(finished) {
                return DecodeResult(DecodeError::ENCODING_ERROR, detail::illegal_byte_message("base64", i));
            }
            const std::uint8_t v = detail::base64_decode_table[static_cast<unsigned char>(c)];
            if(v == detail::base64_invalid) {
                return DecodeResult(DecodeError::ENCODING_ERROR, detail::illegal_byte_message("base64", i));
            }
            quad[n] = v;
            quadPos[n] = i;
            if(++n < 4) continue;
            n = 0;

            // Padding may only close the final quartet: "xx==" or "xxx=".
            if(quad[0] == detail::base64_pad || quad[1] == detail::base64_pad) {
                return DecodeResult(DecodeError::ENCODING_ERROR,
                    detail::illegal_byte_message("base64", quad[0] == detail::base64_pad ? quadPos[0] : quadPos[1]));
            }
            if(quad[2] == detail::base64_pad && quad[3] != detail::base64_pad) {
                return DecodeResult(DecodeError::ENCODING_ERROR, detail::illegal_byte_message("base64", quadPos[3]));
            }
            std::uint32_t v24 = (std::uint32_t(quad[0]) << 18) | (std::uint32_t(quad[1]) << 12);
            out.push_back(std::uint8_t(v24 >> 16));
            if(quad[2] == detail::base64_pad) {
                finished = true;
                continue;
            }
            v24 |= std::uint32_t(quad[2]) << 6;
            out.push_back(std::uint8_t(v24 >> 8));
            if(quad[3] == detail::base64_pad) {
                finished = true;
                continue;
            }
            v24 |= quad[3];
            out.push_back(std::uint8_t(v24));
        }
        if(n != 0) {
            return DecodeResult(DecodeError::ENCODING_ERROR, detail::illegal_byte_message("base64", text.size()));
        }
        return {};
    }
};

// Lowercase on output, either case accepted on input.
class HexEncoding final : public Encoding {
public:
    std::string encode(std::span<const std::uint8_t> bytes) const override {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(bytes.size() * 2);
        for(std::uint8_t b : bytes) {
            out.push_back(digits[b >> 4]);
            out.push_back(digits[b & 0x0F]);
        }
        return out;
    }

    DecodeResult decode(std::string_view text, std::vector<std::uint8_t> & out) const override {
        out.clear();
        out.reserve(text.size() / 2);
        for(std::size_t i = 0; i < text.size(); i += 2) {
            int hi = nibble(text[i]);
            if(hi < 0) {
                return DecodeResult(DecodeError::ENCODING_ERROR, detail::illegal_byte_message("hex", i));
            }
            if(i + 1 == text.size()) {
                return DecodeResult(DecodeError::ENCODING_ERROR, "odd length hex string");
            }
            int lo = nibble(text[i + 1]);
            if(lo < 0) {
                return DecodeResult(DecodeError::ENCODING_ERROR, detail::illegal_byte_message("hex", i + 1));
            }
            out.push_back(std::uint8_t((hi << 4) | lo));
        }
        return {};
    }

private:
    static int nibble(char c) {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

namespace encodings {

inline const std::shared_ptr<const Encoding> & base64() {
    static const std::shared_ptr<const Encoding> scheme = std::make_shared<const Base64Encoding>();
    return scheme;
}

inline const std::shared_ptr<const Encoding> & hex() {
    static const std::shared_ptr<const Encoding> scheme = std::make_shared<const HexEncoding>();
    return scheme;
}

} // namespace encodings

// Name -> scheme table. Meant to be filled at startup and read from many
// decoding threads afterwards.
class EncodingRegistry {
public:
    // Starts with "base64" and "hex".
    EncodingRegistry() {
        m_schemes.emplace("base64", encodings::base64());
        m_schemes.emplace("hex", encodings::hex());
    }
    EncodingRegistry(const EncodingRegistry &) = delete;
    EncodingRegistry & operator=(const EncodingRegistry &) = delete;

    static EncodingRegistry & global() {
        static EncodingRegistry instance;
        return instance;
    }

    // Throws std::logic_error on an empty name, a null scheme or a name
    // that is already taken.
    void registerEncoding(std::string name, std::shared_ptr<const Encoding> scheme) {
        if(name.empty()) {
            throw std::logic_error("JsonTree: encoding name must not be empty");
        }
        if(!scheme) {
            throw std::logic_error("JsonTree: encoding '" + name + "' has no implementation");
        }
        std::unique_lock lock(m_mutex);
        auto [it, inserted] = m_schemes.try_emplace(name, std::move(scheme));
        if(!inserted) {
            throw std::logic_error("JsonTree: encoding '" + name + "' is already registered");
        }
    }

    // nullptr when unknown
    std::shared_ptr<const Encoding> lookup(std::string_view name) const {
        std::shared_lock lock(m_mutex);
        auto it = m_schemes.find(name);
        if(it == m_schemes.end()) return nullptr;
        return it->second;
    }

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, std::shared_ptr<const Encoding>, std::less<>> m_schemes;
};

} // namespace JsonTree

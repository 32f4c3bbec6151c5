#pragma once

#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifndef JSONTREE_MAX_INTEGER_DIGITS
#define JSONTREE_MAX_INTEGER_DIGITS 10000
#endif

namespace JsonTree {

// Arbitrary-precision signed integer: little-endian base-1e9 limbs plus sign.
class BigInt {
    static constexpr std::uint32_t BASE = 1000000000u;
    std::vector<std::uint32_t> m_limbs;
    bool m_negative = false;

    void trim() {
        while (!m_limbs.empty() && m_limbs.back() == 0) m_limbs.pop_back();
        if (m_limbs.empty()) m_negative = false;
    }

    // n = n*10 + d
    void mul10_add(std::uint32_t d) {
        std::uint64_t carry = d;
        for (auto& x : m_limbs) {
            std::uint64_t v = std::uint64_t(x) * 10u + carry;
            x = std::uint32_t(v % BASE);
            carry = v / BASE;
        }
        if (carry) m_limbs.push_back(std::uint32_t(carry));
    }

    // Divides the magnitude by m, returns the remainder.
    std::uint32_t div_small(std::uint32_t m) {
        std::uint64_t rem = 0;
        for (std::size_t i = m_limbs.size(); i-- > 0;) {
            std::uint64_t cur = m_limbs[i] + rem * BASE;
            m_limbs[i] = std::uint32_t(cur / m);
            rem = cur % m;
        }
        bool neg = m_negative;
        trim();
        m_negative = neg && !m_limbs.empty();
        return std::uint32_t(rem);
    }

public:
    BigInt() = default;
    explicit BigInt(std::int64_t v) {
        m_negative = v < 0;
        // magnitude without overflowing on INT64_MIN
        std::uint64_t mag = m_negative ? std::uint64_t(0) - std::uint64_t(v) : std::uint64_t(v);
        while (mag) {
            m_limbs.push_back(std::uint32_t(mag % BASE));
            mag /= BASE;
        }
    }

    // Digits only, no sign.
    static BigInt fromDecimalDigits(std::string_view digits, bool negative = false) {
        BigInt n;
        for (char c : digits) {
            n.mul10_add(std::uint32_t(c - '0'));
        }
        n.m_negative = negative;
        n.trim();
        return n;
    }

    // Decimal integer text with an optional leading sign.
    static std::optional<BigInt> parse(std::string_view text) {
        bool neg = false;
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            neg = text.front() == '-';
            text.remove_prefix(1);
        }
        if (text.empty()) return std::nullopt;
        for (char c : text) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        return fromDecimalDigits(text, neg);
    }

    bool isZero() const { return m_limbs.empty(); }
    bool negative() const { return m_negative; }

    std::string toString() const {
        if (isZero()) return "0";
        BigInt tmp = *this;
        std::vector<std::uint32_t> parts;
        while (!tmp.isZero()) parts.push_back(tmp.div_small(BASE));
        std::string s = m_negative ? "-" : "";
        s += std::to_string(parts.back());
        for (std::size_t i = parts.size() - 1; i-- > 0;) {
            std::string chunk = std::to_string(parts[i]);
            s.append(9 - chunk.size(), '0');
            s += chunk;
        }
        return s;
    }

    // false when the value does not fit
    bool toInt64(std::int64_t& out) const {
        std::uint64_t mag = 0;
        for (std::size_t i = m_limbs.size(); i-- > 0;) {
            if (mag > (std::numeric_limits<std::uint64_t>::max() - m_limbs[i]) / BASE) return false;
            mag = mag * BASE + m_limbs[i];
        }
        if (m_negative) {
            if (mag > std::uint64_t(std::numeric_limits<std::int64_t>::max()) + 1) return false;
            out = static_cast<std::int64_t>(std::uint64_t(0) - mag);
        } else {
            if (mag > std::uint64_t(std::numeric_limits<std::int64_t>::max())) return false;
            out = static_cast<std::int64_t>(mag);
        }
        return true;
    }

    friend bool operator==(const BigInt& a, const BigInt& b) {
        return a.m_negative == b.m_negative && a.m_limbs == b.m_limbs;
    }
};

// Exact decimal: value = (-1)^negative * digits * 10^exponent.
// Digits carry no leading or trailing zeros; zero has no digits.
class Decimal {
    bool m_negative = false;
    std::string m_digits;
    std::int64_t m_exponent = 0;

    static constexpr std::int64_t MaxExponent = std::int64_t(1) << 40;

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }

    void normalize() {
        std::size_t lead = m_digits.find_first_not_of('0');
        if (lead == std::string::npos) {
            m_digits.clear();
            m_exponent = 0;
            m_negative = false;
            return;
        }
        m_digits.erase(0, lead);
        std::size_t tz = 0;
        while (m_digits.back() == '0') { m_digits.pop_back(); ++tz; }
        m_exponent += std::int64_t(tz);
    }

    // Exponent of the leading digit in scientific notation.
    std::int64_t adjustedExponent() const {
        return std::int64_t(m_digits.size()) - 1 + m_exponent;
    }

    // Integer part digits; nullopt when they would exceed the digit limit.
    std::optional<std::string> integerDigits() const {
        if (isZero()) return std::string("0");
        if (m_exponent >= 0) {
            if (adjustedExponent() >= JSONTREE_MAX_INTEGER_DIGITS) return std::nullopt;
            std::string s = m_digits;
            s.append(std::size_t(m_exponent), '0');
            return s;
        }
        std::int64_t keep = std::int64_t(m_digits.size()) + m_exponent;
        if (keep <= 0) return std::string("0");
        return m_digits.substr(0, std::size_t(keep));
    }

public:
    Decimal() = default;

    // Accepts [+-]? (digits [. digits?] | . digits) ([eE] [+-]? digits)?
    static std::optional<Decimal> parse(std::string_view text) {
        Decimal d;
        std::size_t i = 0;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
            d.m_negative = text[i] == '-';
            ++i;
        }
        std::size_t intDigits = 0, fracDigits = 0;
        while (i < text.size() && isDigit(text[i])) { d.m_digits.push_back(text[i++]); ++intDigits; }
        if (i < text.size() && text[i] == '.') {
            ++i;
            while (i < text.size() && isDigit(text[i])) { d.m_digits.push_back(text[i++]); ++fracDigits; }
        }
        if (intDigits + fracDigits == 0) return std::nullopt;

        std::int64_t exp = 0;
        if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
            ++i;
            bool expNeg = false;
            if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
                expNeg = text[i] == '-';
                ++i;
            }
            if (i == text.size()) return std::nullopt;
            while (i < text.size() && isDigit(text[i])) {
                exp = exp * 10 + (text[i++] - '0');
                if (exp > MaxExponent) return std::nullopt;
            }
            if (expNeg) exp = -exp;
        }
        if (i != text.size()) return std::nullopt;

        d.m_exponent = exp - std::int64_t(fracDigits);
        d.normalize();
        return d;
    }

    static Decimal fromInt64(std::int64_t v) {
        Decimal d;
        d.m_negative = v < 0;
        std::uint64_t mag = d.m_negative ? std::uint64_t(0) - std::uint64_t(v) : std::uint64_t(v);
        d.m_digits = std::to_string(mag);
        d.normalize();
        return d;
    }

    bool isZero() const { return m_digits.empty(); }
    bool negative() const { return m_negative; }
    const std::string & digits() const { return m_digits; }
    std::int64_t exponent() const { return m_exponent; }

    // Plain notation for moderate magnitudes, d.ddde+N otherwise. Exact.
    std::string toString() const {
        if (isZero()) return "0";
        std::string out = m_negative ? "-" : "";
        const std::int64_t adj = adjustedExponent();
        if (adj >= -7 && adj < 21) {
            if (m_exponent >= 0) {
                out += m_digits;
                out.append(std::size_t(m_exponent), '0');
            } else {
                std::int64_t pos = std::int64_t(m_digits.size()) + m_exponent;
                if (pos > 0) {
                    out.append(m_digits, 0, std::size_t(pos));
                    out.push_back('.');
                    out.append(m_digits, std::size_t(pos));
                } else {
                    out += "0.";
                    out.append(std::size_t(-pos), '0');
                    out += m_digits;
                }
            }
            return out;
        }
        out.push_back(m_digits[0]);
        if (m_digits.size() > 1) {
            out.push_back('.');
            out.append(m_digits, 1);
        }
        out += adj < 0 ? "e-" : "e+";
        out += std::to_string(adj < 0 ? -adj : adj);
        return out;
    }

    // Truncates toward zero; nullopt when the integer is unreasonably large.
    std::optional<BigInt> toBigInt() const {
        auto digits = integerDigits();
        if (!digits) return std::nullopt;
        return BigInt::fromDecimalDigits(*digits, m_negative);
    }

    // Truncates toward zero and saturates at the int64 bounds.
    std::int64_t toInt64() const {
        constexpr auto hi = std::numeric_limits<std::int64_t>::max();
        constexpr auto lo = std::numeric_limits<std::int64_t>::min();
        if (!isZero() && adjustedExponent() > 19) return m_negative ? lo : hi;
        std::uint64_t mag = 0;
        auto digits = integerDigits();
        auto [ptr, ec] = std::from_chars(digits->data(), digits->data() + digits->size(), mag);
        if (ec != std::errc{}) return m_negative ? lo : hi;
        if (m_negative) {
            return mag > std::uint64_t(hi) ? lo : -static_cast<std::int64_t>(mag);
        }
        return mag > std::uint64_t(hi) ? hi : static_cast<std::int64_t>(mag);
    }

    // Truncates toward zero; negative values give 0, large ones saturate.
    std::uint64_t toUint64() const {
        constexpr auto hi = std::numeric_limits<std::uint64_t>::max();
        if (m_negative) return 0;
        if (!isZero() && adjustedExponent() > 19) return hi;
        std::uint64_t mag = 0;
        auto digits = integerDigits();
        auto [ptr, ec] = std::from_chars(digits->data(), digits->data() + digits->size(), mag);
        if (ec != std::errc{}) return hi;
        return mag;
    }

    // Nearest double.
    double toDouble() const {
        if (isZero()) return 0.0;
        std::string sci = m_digits + "e" + std::to_string(m_exponent);
        double v = 0.0;
        auto [ptr, ec] = std::from_chars(sci.data(), sci.data() + sci.size(), v);
        if (ec == std::errc::result_out_of_range) {
            v = adjustedExponent() > 0 ? std::numeric_limits<double>::infinity() : 0.0;
        }
        return m_negative ? -v : v;
    }

    friend bool operator==(const Decimal& a, const Decimal& b) {
        return a.m_negative == b.m_negative && a.m_exponent == b.m_exponent && a.m_digits == b.m_digits;
    }
};

} // namespace JsonTree

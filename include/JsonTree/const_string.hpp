#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace JsonTree {

// Structural string usable as a template argument: field tags are written as
// Field<&T::m, "name,string"> or options::json<"name,[hex]">.
template <typename CharT, std::size_t N> struct ConstString
{
    constexpr ConstString(const CharT (&str)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = str[i];
        }
    }

    // Tags are single-line ASCII-ish text; control characters are a typo.
    constexpr bool check() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(std::uint8_t(m_data[i]) < 32) return false;
        }
        return true;
    }

    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
    constexpr bool empty() const { return N == 0; }

    CharT m_data[N+1];
    static constexpr std::size_t Length = N;
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

} // namespace JsonTree

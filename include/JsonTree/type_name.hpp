#pragma once

#include <string_view>

namespace JsonTree {

// Human readable type name for diagnostics, e.g. "Config" or
// "std::vector<int>". Compiler specific text, not meant for parsing.
template<class T>
constexpr std::string_view type_name() {
#if defined(__clang__) || defined(__GNUC__)
    constexpr std::string_view fn = __PRETTY_FUNCTION__;
    constexpr std::string_view marker = "T = ";
    constexpr std::size_t start = fn.find(marker) + marker.size();
    constexpr std::size_t stop = fn.find_first_of(";]", start);
    return fn.substr(start, stop - start);
#elif defined(_MSC_VER)
    constexpr std::string_view fn = __FUNCSIG__;
    constexpr std::string_view marker = "type_name<";
    constexpr std::size_t start = fn.find(marker) + marker.size();
    constexpr std::size_t stop = fn.rfind(">(void)");
    return fn.substr(start, stop - start);
#else
    return "?";
#endif
}

} // namespace JsonTree

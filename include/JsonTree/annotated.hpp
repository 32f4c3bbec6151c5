#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include "const_string.hpp"
#include "options.hpp"

namespace JsonTree {

template <class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

// Wraps a struct member to attach compile-time field options:
//
//   struct Packet {
//       Annotated<std::vector<std::uint8_t>, options::json<"data,hex">> data;
//       Annotated<Header, options::embedded> header;
//   };
template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;

    constexpr Annotated() = default;
    constexpr Annotated(const Annotated&) = default;
    constexpr Annotated(Annotated&&) = default;
    constexpr Annotated& operator=(const Annotated&) = default;
    constexpr Annotated& operator=(Annotated&&) = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }
};

template<class T, class... OptsL, class... OptsR>
constexpr bool operator==(const Annotated<T, OptsL...>& lhs, const Annotated<T, OptsR...>& rhs) {
    return lhs.value == rhs.value;
}

template<class T, class... Opts, class U>
    requires requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Annotated<T, Opts...>& lhs, const U& rhs) {
    return lhs.value == rhs;
}

namespace options {

namespace detail {
struct json_tag{};
struct embedded_tag{};
}

// Field tag in the "name,opt1,opt2" mini-language.
template<ConstString Desc>
struct json {
    static_assert(Desc.check(), "[[[ JsonTree ]]] field tag contains control characters");
    using tag = detail::json_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "json";
    }
};

// Merges the member's own fields into the enclosing record when the member
// has no explicit name. Works on records and on nullable handles to records.
struct embedded {
    using tag = detail::embedded_tag;
    static constexpr std::string_view to_string() {
        return "embedded";
    }
};

namespace detail {

template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};

template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        typename find_option_by_tag<Tag, Rest...>::type
        >;
};

template<class Field>
struct annotation_meta {
    using value_t = Field;
    static constexpr std::string_view tag = {};
    static constexpr bool embedded = false;

    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ JsonTree ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ JsonTree ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t = T;

    using json_option = typename find_option_by_tag<json_tag, Opts...>::type;
    static constexpr std::string_view tag = [] {
        if constexpr (std::is_void_v<json_option>) {
            return std::string_view{};
        } else {
            return json_option::desc.toStringView();
        }
    }();
    static constexpr bool embedded = !std::is_void_v<typename find_option_by_tag<embedded_tag, Opts...>::type>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    // StructMeta fields: the member is a plain T, the annotation is virtual
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

} // namespace detail

} // namespace options

template<class T>
struct is_annotated : std::false_type {};

template<class U, class... Opts>
struct is_annotated<Annotated<U, Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_annotated_v = is_annotated<std::remove_cvref_t<T>>::value;

} // namespace JsonTree

#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "annotated.hpp"

namespace JsonTree {

// Explicit field list for types PFR cannot see through (non-aggregates,
// classes with private members) or that should carry tags without
// Annotated<> wrappers:
//
//   template<> struct JsonTree::StructMeta<Account> {
//       using Fields = StructFields<
//           Field<&Account::id, "id,string">,
//           Embedded<&Account::audit>
//       >;
//   };
template <class T>
struct StructMeta {

};

template <auto MPtr, ConstString tag, class ... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString tag, class ... Opts>
struct Field<MPtr, tag, Opts...>{
    using ClassT = C;
    using ValueT = T;
    using OptionsP = OptionsPack<options::json<tag>, Opts...>;
    static constexpr ConstString Tag = tag;
    static constexpr T C::* MemberP = MPtr;
};

template <auto MPtr, ConstString tag = "">
using Embedded = Field<MPtr, tag, options::embedded>;

template <class ... F>
struct StructFields{
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {

template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();
};

template<class T>
struct is_fields_pack : std::false_type {};

template<class... F>
struct is_fields_pack<StructFields<F...>> : std::true_type {};

template<class T>
inline constexpr bool is_fields_pack_v = is_fields_pack<T>::value;


template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T,
                                          std::void_t<typename StructMeta<T>::Fields>
                                          > : std::bool_constant<
                                                  is_fields_pack_v<typename StructMeta<T>::Fields>
                                                  > {};

template <class T, class OptPack> struct AnnotationFiller;
template <class T, class ...Opts> struct AnnotationFiller<T, OptionsPack<Opts...>> {
    using type = Annotated<T, Opts...>;
};

} // namespace detail

template<class T>
inline constexpr bool has_struct_meta_specialization =
    detail::has_struct_meta_specialization_impl<std::remove_cv_t<T>>::value;

namespace detail {

// StructMeta fields have no declared name of their own: the element type is
// a virtual Annotated<> carrying the tag, and the name comes from the tag.
template <class T>
    requires (has_struct_meta_specialization<T>)
struct IntrospectionImpl<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;
    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;

    template<std::size_t Index, class StructT>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        using F = std::tuple_element_t<Index, Fields>;
        return (s.*(F::MemberP));
    }

    template<std::size_t Index>
    using structureElementTypeByIndex = typename AnnotationFiller<
                                        typename std::tuple_element_t<Index, Fields>::ValueT,
                                        typename std::tuple_element_t<Index, Fields>::OptionsP
                                        >::type;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = {};
};

} // namespace detail

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

// Declared member name; empty for StructMeta fields.
template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;

} // namespace introspection

} // namespace JsonTree

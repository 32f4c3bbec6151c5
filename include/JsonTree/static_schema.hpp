#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "annotated.hpp"
#include "decimal.hpp"
#include "errors.hpp"
#include "node.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "value.hpp"

namespace JsonTree {

// Destination shapes. The decoder picks its rule from the first shape a type
// matches, in the order the dispatcher checks them; the shapes themselves may
// overlap (a byte vector is also a sequence).
namespace static_schema {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;

template<class T>
struct is_std_array : std::false_type {};

template<class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template<class T>
struct is_system_time_point : std::false_type {};

template<class Duration>
struct is_system_time_point<std::chrono::time_point<std::chrono::system_clock, Duration>> : std::true_type {};

template<class T>
struct smart_pointer_traits {
    static constexpr bool value = false;
};

template<class U>
struct smart_pointer_traits<std::unique_ptr<U>> {
    static constexpr bool value = true;
    using element_type = U;
};

template<class U>
struct smart_pointer_traits<std::shared_ptr<U>> {
    static constexpr bool value = true;
    using element_type = U;
};


using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;

template<class T>
concept BoolDestination = std::same_as<T, bool>;

template<class T>
concept EnumDestination = std::is_enum_v<T>;

template<class T>
concept IntegerDestination = std::is_integral_v<T> && !std::same_as<T, bool>;

template<class T>
concept FloatDestination = std::is_floating_point_v<T>;

template<class T>
concept TextDestination = std::same_as<T, std::string>;

template<class T>
concept ByteSequenceDestination =
    std::same_as<T, std::vector<std::uint8_t>>
    || std::same_as<T, std::vector<std::byte>>;

template<class T>
concept BigIntDestination = std::same_as<T, BigInt>;

template<class T>
concept DecimalDestination = std::same_as<T, Decimal>;

template<class T>
concept TimestampDestination = is_system_time_point<T>::value;

template<class T>
concept NodeDestination = std::same_as<T, NodePtr>;

template<class T>
concept ValueDestination = std::same_as<T, Value>;

// unique_ptr/shared_ptr to an abstract class: built through TypeRegistry.
template<class T>
concept AbstractHandle = smart_pointer_traits<T>::value
    && std::is_abstract_v<typename smart_pointer_traits<T>::element_type>;

// Absent-or-present slots; decoding a non-null node allocates the target.
template<class T>
concept NullableDestination =
    is_specialization_of_v<T, std::optional>
    || (smart_pointer_traits<T>::value
        && !AbstractHandle<T>
        && !NodeDestination<T>
        && !std::is_array_v<typename smart_pointer_traits<T>::element_type>
        && !std::is_const_v<typename smart_pointer_traits<T>::element_type>);

template<class T>
struct nullable_traits;

template<class U>
struct nullable_traits<std::optional<U>> {
    using element_type = U;
};

template<class U>
struct nullable_traits<std::unique_ptr<U>> {
    using element_type = U;
};

template<class U>
struct nullable_traits<std::shared_ptr<U>> {
    using element_type = U;
};

// decodeJson takes over the whole node; the optional Context argument lets
// the hook decode nested values under the caller's registries.
template<class T>
concept NodeDecodableWithContext = requires(T & t, const Node & n, const Context & ctx) {
    { t.decodeJson(n, ctx) } -> std::same_as<DecodeResult>;
};

template<class T>
concept NodeDecodable = NodeDecodableWithContext<T> || requires(T & t, const Node & n) {
    { t.decodeJson(n) } -> std::same_as<DecodeResult>;
};

// decodeText is offered String nodes only.
template<class T>
concept TextDecodable = requires(T & t, std::string_view s) {
    { t.decodeText(s) } -> std::same_as<DecodeResult>;
};

template<class T>
concept FixedSequenceDestination = is_std_array<T>::value;

template <typename T>
concept SequenceDestination = !TextDestination<T> && requires (T v) {
    typename T::value_type;
    v.push_back(std::declval<typename T::value_type>());
    v.clear();
};

template<class T>
concept MapDestination = requires (T m) {
    typename T::key_type;
    typename T::mapped_type;
    m.insert_or_assign(std::declval<typename T::key_type>(), std::declval<typename T::mapped_type>());
};

template<class T>
concept RecordDestination = std::is_class_v<T>
    && (introspection::has_struct_meta_specialization<T>
        || (std::is_aggregate_v<T>
            && !is_annotated<T>::value
            && !FixedSequenceDestination<T>
            && !SequenceDestination<T>
            && !MapDestination<T>));

// Records reachable through an embedded field: the record itself or a
// nullable handle to one.
template<class T>
struct embedded_record {
    static constexpr bool value = RecordDestination<T>;
    using type = T;
};

template<class T>
    requires NullableDestination<T>
struct embedded_record<T> {
    using type = typename nullable_traits<T>::element_type;
    static constexpr bool value = RecordDestination<type>;
};

} // namespace static_schema

} // namespace JsonTree

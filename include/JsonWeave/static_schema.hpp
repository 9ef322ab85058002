#pragma once
#include <array>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <type_traits>
#include <variant>

#include "options.hpp"
#include "struct_introspection.hpp"
#include "enum_meta.hpp"
#include "uuid.hpp"
#include "datetime.hpp"

namespace JsonWeave {

namespace static_schema {

// Schema construct a C++ type denotes; ValueKind is derived from it by the classifier
enum class Shape : std::uint8_t {
    Record,
    Optional,
    Union,
    Sequence,
    Mapping,
    Enum,
    Identifier,
    Timestamp,
    CalendarDate,
    String,
    Integer,
    Float,
    Boolean,
    Null,
    Unsupported
};

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;

/* ######## Leaf detection ######## */

template<class T>
concept JsonNull = std::same_as<T, std::monostate>;

template<class T>
concept JsonBool = std::same_as<T, bool>;

// Character types have no JSON spelling and stay Unsupported
template<class T>
concept CharacterType = std::same_as<T, char> || std::same_as<T, wchar_t> || std::same_as<T, char8_t>
                        || std::same_as<T, char16_t> || std::same_as<T, char32_t>;

template<class T>
concept JsonInteger = std::integral<T> && !JsonBool<T> && !CharacterType<T>;

template<class T>
concept JsonFloat = std::floating_point<T>;

template<class T>
concept JsonString = std::same_as<T, std::string>;

template<class T>
concept IdentifierValue = std::same_as<T, Uuid>;

template<class T>
concept TimestampValue = std::same_as<T, DateTime>;

template<class T>
concept CalendarDateValue = std::same_as<T, std::chrono::year_month_day>;

template<class T>
concept EnumMemberValue = enum_meta::has_enum_meta<T>;

/* ######## Optional detection ######## */

template<class T>
struct optional_traits {
    static constexpr bool is_optional = false;
};

template<class U>
struct optional_traits<std::optional<U>> {
    static constexpr bool is_optional = true;
    using inner_type = U;
};

// std::variant spelling of "T or null", monostate on either side
template<class U>
    requires (!std::same_as<U, std::monostate>)
struct optional_traits<std::variant<std::monostate, U>> {
    static constexpr bool is_optional = true;
    using inner_type = U;
};

template<class U>
    requires (!std::same_as<U, std::monostate>)
struct optional_traits<std::variant<U, std::monostate>> {
    static constexpr bool is_optional = true;
    using inner_type = U;
};

template<class T>
concept OptionalValue = optional_traits<T>::is_optional;

template<class T>
concept UnionValue = is_specialization_of<T, std::variant>::value && !OptionalValue<T>;

/* ######## Container detection ######## */

template<class T>
concept MappingValue =
    !JsonString<T> &&
    requires(T& m, const T& cm) {
        typename T::key_type;
        typename T::mapped_type;
        requires std::same_as<typename T::key_type, std::string>;
        m.try_emplace(std::declval<typename T::key_type>(), std::declval<typename T::mapped_type>());
        cm.begin();
        cm.end();
    };

template<class T>
concept SequenceValue =
    !JsonString<T> && !MappingValue<T> &&
    std::ranges::range<const T> &&
    std::is_lvalue_reference_v<std::ranges::range_reference_t<const T>> &&
    requires(T& c) {
        typename T::value_type;
        c.push_back(std::declval<typename T::value_type>());
        c.clear();
    };

template<class T>
struct is_std_array : std::false_type {};

template<class V, std::size_t N>
struct is_std_array<std::array<V, N>> : std::true_type {};

// Fixed-size arrays are aggregates too; they stay Unsupported instead of reaching pfr
template<class T>
concept RecordValue =
    !SequenceValue<T> && !MappingValue<T> && !OptionalValue<T> && !UnionValue<T> &&
    !IdentifierValue<T> && !TimestampValue<T> && !CalendarDateValue<T> && !JsonNull<T> &&
    std::is_class_v<T> && !is_std_array<T>::value &&
    (introspection::has_struct_meta<T> || std::is_aggregate_v<T>);

template<class T>
consteval Shape shape_of() {
    using U = std::remove_cvref_t<T>;
    if constexpr (JsonNull<U>)                 return Shape::Null;
    else if constexpr (JsonBool<U>)            return Shape::Boolean;
    else if constexpr (JsonInteger<U>)         return Shape::Integer;
    else if constexpr (JsonFloat<U>)           return Shape::Float;
    else if constexpr (JsonString<U>)          return Shape::String;
    else if constexpr (IdentifierValue<U>)     return Shape::Identifier;
    else if constexpr (TimestampValue<U>)      return Shape::Timestamp;
    else if constexpr (CalendarDateValue<U>)   return Shape::CalendarDate;
    else if constexpr (EnumMemberValue<U>)     return Shape::Enum;
    else if constexpr (OptionalValue<U>)       return Shape::Optional;
    else if constexpr (UnionValue<U>)          return Shape::Union;
    else if constexpr (MappingValue<U>)        return Shape::Mapping;
    else if constexpr (SequenceValue<U>)       return Shape::Sequence;
    else if constexpr (RecordValue<U>)         return Shape::Record;
    else                                       return Shape::Unsupported;
}

/* ######## Record field helpers ######## */

template<class T, std::size_t I>
using field_type = introspection::structureElementTypeByIndex<I, T>;

template<class T, std::size_t I>
using field_options = typename annotation_meta_getter<field_type<T, I>>::options;

template<class T, std::size_t I>
using field_value_type = AnnotatedValue<field_type<T, I>>;

template<class T, std::size_t I>
inline constexpr bool is_json_field = !field_options<T, I>::template has_option<options::detail::not_json_tag>;

template<class T>
consteval std::size_t json_fields_count() {
    return []<std::size_t... Is>(std::index_sequence<Is...>) {
        return (std::size_t(0) + ... + std::size_t(is_json_field<T, Is>));
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

// Member indices of the fields that take part in JSON, in declared order
template<class T>
consteval auto json_field_indices() {
    std::array<std::size_t, json_fields_count<T>()> out{};
    constexpr std::array<bool, introspection::structureElementsCount<T>> included =
        []<std::size_t... Is>(std::index_sequence<Is...>) {
            return std::array<bool, sizeof...(Is)>{ is_json_field<T, Is>... };
        }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
    std::size_t n = 0;
    for(std::size_t i = 0; i < included.size(); i ++) {
        if(included[i]) out[n++] = i;
    }
    return out;
}

/* ######## Whole-schema check ######## */

template<class T> struct is_marshallable;

template<class T>
struct is_marshallable {
    static constexpr bool value = [] {
        constexpr Shape s = shape_of<T>();
        if constexpr (s == Shape::Unsupported || s == Shape::Union) {
            return false;
        } else if constexpr (s == Shape::Optional) {
            using Inner = typename optional_traits<T>::inner_type;
            return shape_of<Inner>() != Shape::Optional && is_marshallable<Inner>::value;
        } else if constexpr (s == Shape::Sequence) {
            return is_marshallable<typename T::value_type>::value;
        } else if constexpr (s == Shape::Mapping) {
            return is_marshallable<typename T::mapped_type>::value;
        } else if constexpr (s == Shape::Record) {
            return []<std::size_t... Is>(std::index_sequence<Is...>) {
                return (true && ... && (!is_json_field<T, Is> || is_marshallable<field_value_type<T, Is>>::value));
            }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
        } else {
            return true;
        }
    }();
};

// Compile-time counterpart of the runtime SchemaError / MarshalError checks.
// Not usable on self-recursive records.
template<class T>
concept Marshallable = is_marshallable<std::remove_cvref_t<T>>::value;

} // namespace static_schema

} // namespace JsonWeave

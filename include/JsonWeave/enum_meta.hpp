#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "const_string.hpp"

namespace JsonWeave {

// Legal external values of an enum:
//   template<> struct EnumMeta<Size> {
//       using Values = EnumValues<EnumValue<Size::Small, "SMALL">, EnumValue<Size::Large, "LARGE">>;
//   };
template <class E>
struct EnumMeta {

};

// Enumerator written as a JSON string
template <auto V, ConstString External>
struct EnumValue {
    static_assert(std::is_enum_v<decltype(V)>, "[[[ JsonWeave ]]] EnumValue expects an enumerator");
    static_assert(!External.empty() && External.check(), "[[[ JsonWeave ]]] invalid external enum value");
    using enum_type = decltype(V);
    static constexpr enum_type value = V;
    static constexpr bool is_string = true;
    static constexpr std::string_view external = External.toStringView();
};

// Enumerator written as its underlying integer
template <auto V>
struct EnumOrdinal {
    static_assert(std::is_enum_v<decltype(V)>, "[[[ JsonWeave ]]] EnumOrdinal expects an enumerator");
    using enum_type = decltype(V);
    static constexpr enum_type value = V;
    static constexpr bool is_string = false;
    static constexpr std::string_view external = {};
};

template <class ... V>
struct EnumValues {
    static constexpr std::size_t Count = sizeof...(V);
};

namespace enum_meta {

struct Entry {
    std::int64_t ordinal;
    std::string_view external;  // empty for ordinal-valued entries
    bool is_string;
};

template<class E, class = void>
struct has_enum_meta_impl : std::false_type {};

template<class E>
struct has_enum_meta_impl<E, std::void_t<typename EnumMeta<E>::Values>> : std::true_type {};

template<class E>
inline constexpr bool has_enum_meta = std::is_enum_v<E> && has_enum_meta_impl<E>::value;

template<class E>
constexpr std::int64_t ordinal(E e) {
    return static_cast<std::int64_t>(static_cast<std::underlying_type_t<E>>(e));
}

template<class Values> struct table_builder;
template<class... V>
struct table_builder<EnumValues<V...>> {
    static constexpr std::array<Entry, sizeof...(V)> entries {
        Entry{ordinal(V::value), V::external, V::is_string}...
    };
};

template<class E>
    requires has_enum_meta<E>
constexpr const auto& table() {
    return table_builder<typename EnumMeta<E>::Values>::entries;
}

} // namespace enum_meta

} // namespace JsonWeave

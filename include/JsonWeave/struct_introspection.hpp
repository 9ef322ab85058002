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

namespace JsonWeave {

// Non-intrusive field declaration for types that cannot carry Annotated members:
//   template<> struct StructMeta<Point> {
//       using Fields = StructFields<Field<&Point::x, "x", options::key<"X">>>;
//   };
template <class T>
struct StructMeta {

};

template <auto MPtr, ConstString name, class ... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString name, class ... Opts>
struct Field<MPtr, name, Opts...>{
    using ClassT = C;
    using ValueT = T;
    using OptionsP = OptionsPack<Opts...>;
    static constexpr ConstString Name  = name;
    static constexpr T C::* MemberP = MPtr;
};

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

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
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

template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T, std::void_t<typename StructMeta<T>::Fields>>
    : std::bool_constant<is_fields_pack<typename StructMeta<T>::Fields>::value> {};

template <class T, class OptPack> struct AnnotationFiller;
template <class T, class ...Opts> struct AnnotationFiller<T, OptionsPack<Opts...>> {
    using type = Annotated<T, Opts...>;
};

template <class T>
    requires (has_struct_meta_specialization_impl<T>::value)
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
    static constexpr std::string_view structureElementNameByIndex =
        std::tuple_element_t<Index, Fields>::Name.toStringView();
};

} // namespace detail

template<class T>
inline constexpr bool has_struct_meta = detail::has_struct_meta_specialization_impl<std::remove_cv_t<T>>::value;

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;

} // namespace introspection
} // namespace JsonWeave

#pragma once
#include <cstddef>
#include <type_traits>
#include <optional>
#include "annotated.hpp"
#include "const_string.hpp"

namespace JsonWeave {

namespace options {

namespace detail {

struct not_json_tag{};
struct key_tag{};
struct omit_empty_tag{};
struct description_tag{};

}

// Field is invisible to both directions; it keeps its default value when unmarshalling
struct not_json {
    using tag = detail::not_json_tag;
};

template<ConstString Desc>
struct key {
    static_assert(!Desc.empty(), "[[[ JsonWeave ]]] external key must not be empty");
    static_assert(Desc.check(), "[[[ JsonWeave ]]] external key contains control or escape characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
};

// Absent optional value drops the key from marshalled output instead of writing null
struct omit_empty {
    using tag = detail::omit_empty_tag;
};

template<ConstString Desc>
struct description {
    static_assert(Desc.check(), "[[[ JsonWeave ]]] description contains control characters");
    using tag = detail::description_tag;
    static constexpr auto desc = Desc;
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
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
    static_assert((requires { typename Opts::tag; } && ...),
                  "[[[ JsonWeave ]]] every field option must declare a tag");

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;
};

template<class Field>
struct annotation_meta {
    using value_t  = Field;
    using options  = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ JsonWeave ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;
    using value_t  = T;
    using options  = field_options<OptionsPack<Opts...>>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }

    // StructMeta fields arrive as plain member references with a virtual annotation
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

} // namespace detail

} // namespace options

} // namespace JsonWeave

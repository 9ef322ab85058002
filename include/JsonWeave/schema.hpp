#pragma once

#include <any>
#include <cmath>
#include <cstdlib>
#include <cxxabi.h>
#include <format>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "format_options.hpp"
#include "static_schema.hpp"
#include "yyjson.hpp"

namespace JsonWeave {

namespace schema {

using static_schema::Shape;

struct TypeDescriptor;
using DescriptorRef = const TypeDescriptor& (*)();

struct FieldDescriptor {
    std::string_view name;          // member name in the host record
    std::string_view external_key;  // key in JSON, defaults to name
    std::string_view description;   // options::description<>, empty when absent
    DescriptorRef type;
    bool omit_if_empty = false;
    const void* (*read)(const void* record) = nullptr;
};

struct MappingEntry {
    std::string_view key;
    const void* value;
};

// Scratch state for one leaf conversion in Marshal
struct WriteContext {
    yyjson_mut_doc* doc;
    const FormatOptions& options;
    MarshalError error = MarshalError::NO_ERROR;
    std::string message;
};

// Scratch state for one leaf conversion in Unmarshal
struct ReadContext {
    const FormatOptions& options;
    UnmarshalError error = UnmarshalError::NO_ERROR;
    std::string message;
};

// Runtime view of one C++ type, generated at compile time by describe<T>().
// Only the entries relevant to `shape` are set.
struct TypeDescriptor {
    Shape shape = Shape::Unsupported;
    std::string_view type_name;
    DescriptorRef inner = nullptr;                       // Optional: T, Sequence: element, Mapping: mapped value
    std::span<const FieldDescriptor> fields;             // Record
    std::span<const enum_meta::Entry> enumerators;       // Enum

    bool (*is_null)(const void* value) = nullptr;
    const void* (*deref)(const void* value) = nullptr;
    void (*elements)(const void* value, std::vector<const void*>& out) = nullptr;
    void (*entries)(const void* value, std::vector<MappingEntry>& out) = nullptr;
    yyjson_mut_val* (*write_leaf)(const void* value, WriteContext& ctx) = nullptr;

    bool (*read_leaf)(yyjson_val* json, std::any& out, ReadContext& ctx) = nullptr;
    std::any (*make_null)() = nullptr;
    std::any (*wrap)(std::any&& inner) = nullptr;
    std::any (*build)(std::vector<std::any>& slots) = nullptr;
    std::any (*build_mapping)(std::vector<std::string>& keys, std::vector<std::any>& values) = nullptr;
};

template<class T>
const TypeDescriptor& describe();

namespace detail {

using namespace static_schema;
using options::detail::annotation_meta_getter;
using yyjson_details::excerpt;

inline std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void(*)(void*)> name(abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    return status == 0 && name ? std::string(name.get()) : std::string(mangled);
}

template<class T>
std::string_view display_name() {
    static const std::string name = [] {
        constexpr Shape s = shape_of<T>();
        if constexpr (s == Shape::Null) {
            return std::string("null");
        } else if constexpr (s == Shape::String) {
            return std::string("string");
        } else if constexpr (s == Shape::Identifier) {
            return std::string("Uuid");
        } else if constexpr (s == Shape::Timestamp) {
            return std::string("DateTime");
        } else if constexpr (s == Shape::CalendarDate) {
            return std::string("date");
        } else if constexpr (s == Shape::Optional) {
            return "optional<" + std::string(display_name<typename optional_traits<T>::inner_type>()) + ">";
        } else if constexpr (s == Shape::Sequence) {
            return "sequence<" + std::string(display_name<typename T::value_type>()) + ">";
        } else if constexpr (s == Shape::Mapping) {
            return "mapping<string, " + std::string(display_name<typename T::mapped_type>()) + ">";
        } else {
            return demangle(typeid(T).name());
        }
    }();
    return name;
}

template<class V>
V take(std::any& slot) {
    return std::move(*std::any_cast<V>(&slot));
}

inline yyjson_mut_val* checked(yyjson_mut_val* v, WriteContext& ctx) {
    if(!v) {
        ctx.error = MarshalError::WRITER_ERROR;
        ctx.message = "yyjson failed to allocate an output value";
    }
    return v;
}

inline std::string mismatch_message(yyjson_val* json, std::string_view schemaName) {
    return std::format("Invalid schema. schema = {}, data = '{}' ({})",
                       schemaName, excerpt(json), yyjson_details::type_name(json));
}

inline bool mismatch(yyjson_val* json, std::string_view schemaName, ReadContext& ctx) {
    ctx.error = UnmarshalError::SCHEMA_MISMATCH;
    ctx.message = mismatch_message(json, schemaName);
    return false;
}

/* ######## Leaf codecs ######## */

template<class T>
struct LeafCodec;

template<class T>
    requires JsonNull<T>
struct LeafCodec<T> {
    static yyjson_mut_val* write(const void*, WriteContext& ctx) {
        return checked(yyjson_mut_null(ctx.doc), ctx);
    }
    static bool read(yyjson_val* json, std::any& out, ReadContext& ctx) {
        if(!yyjson_is_null(json)) return mismatch(json, display_name<T>(), ctx);
        out = std::monostate{};
        return true;
    }
};

template<class T>
    requires JsonBool<T>
struct LeafCodec<T> {
    static yyjson_mut_val* write(const void* value, WriteContext& ctx) {
        return checked(yyjson_mut_bool(ctx.doc, *static_cast<const bool*>(value)), ctx);
    }
    static bool read(yyjson_val* json, std::any& out, ReadContext& ctx) {
        if(!yyjson_is_bool(json)) return mismatch(json, display_name<T>(), ctx);
        out = bool(yyjson_get_bool(json));
        return true;
    }
};

template<class T>
    requires JsonInteger<T>
struct LeafCodec<T> {
    static yyjson_mut_val* write(const void* value, WriteContext& ctx) {
        const T v = *static_cast<const T*>(value);
        if constexpr (std::is_signed_v<T>) {
            return checked(yyjson_mut_sint(ctx.doc, static_cast<std::int64_t>(v)), ctx);
        } else {
            return checked(yyjson_mut_uint(ctx.doc, static_cast<std::uint64_t>(v)), ctx);
        }
    }
    static bool read(yyjson_val* json, std::any& out, ReadContext& ctx) {
        if(!yyjson_is_int(json)) return mismatch(json, display_name<T>(), ctx);
        bool fits = false;
        if(yyjson_is_sint(json)) {
            const std::int64_t v = yyjson_get_sint(json);
            fits = std::in_range<T>(v);
            if(fits) out = static_cast<T>(v);
        } else {
            const std::uint64_t v = yyjson_get_uint(json);
            fits = std::in_range<T>(v);
            if(fits) out = static_cast<T>(v);
        }
        if(!fits) {
            ctx.error = UnmarshalError::NUMBER_OUT_OF_RANGE;
            ctx.message = std::format("Data value '{}' does not fit into {}", excerpt(json), display_name<T>());
        }
        return fits;
    }
};

template<class T>
    requires JsonFloat<T>
struct LeafCodec<T> {
    static yyjson_mut_val* write(const void* value, WriteContext& ctx) {
        const T v = *static_cast<const T*>(value);
        if(!std::isfinite(v)) {
            ctx.error = MarshalError::NON_FINITE_NUMBER;
            ctx.message = std::format("Unable to marshal non-finite number {} ({})", v, display_name<T>());
            return nullptr;
        }
        return checked(yyjson_mut_real(ctx.doc, static_cast<double>(v)), ctx);
    }
    // Any JSON number is accepted; integers convert
    static bool read(yyjson_val* json, std::any& out, ReadContext& ctx) {
        if(!yyjson_is_num(json)) return mismatch(json, display_name<T>(), ctx);
        double v;
        if(yyjson_is_real(json)) {
            v = yyjson_get_real(json);
        } else if(yyjson_is_sint(json)) {
            v = static_cast<double>(yyjson_get_sint(json));
        } else {
            v = static_cast<double>(yyjson_get_uint(json));
        }
        if(std::isfinite(v) && std::abs(v) > double(std::numeric_limits<T>::max())) {
            ctx.error = UnmarshalError::NUMBER_OUT_OF_RANGE;
            ctx.message = std::format("Data value '{}' does not fit into {}", excerpt(json), display_name<T>());
            return false;
        }
        out = static_cast<T>(v);
        return true;
    }
};

template<class T>
    requires JsonString<T>
struct LeafCodec<T> {
    static yyjson_mut_val* write(const void* value, WriteContext& ctx) {
        const std::string& s = *static_cast<const std::string*>(value);
        return checked(yyjson_mut_strncpy(ctx.doc, s.data(), s.size()), ctx);
    }
    static bool read(yyjson_val* json, std::any& out, ReadContext& ctx) {
        if(!yyjson_is_str(json)) return mismatch(json, display_name<T>(), ctx);
        out = std::string(yyjson_details::string_view_of(json));
        return true;
    }
};

template<class T>
    requires IdentifierValue<T>
struct LeafCodec<T> {
    static yyjson_mut_val* write(const void* value, WriteContext& ctx) {
        const std::string s = static_cast<const Uuid*>(value)->toString();
        return checked(yyjson_mut_strncpy(ctx.doc, s.data(), s.size()), ctx);
    }
    static bool read(yyjson_val* json, std::any& out, ReadContext& ctx) {
        std::optional<Uuid> id;
        if(yyjson_is_str(json)) id = Uuid::parse(yyjson_details::string_view_of(json));
        if(!id) {
            ctx.error = UnmarshalError::INVALID_IDENTIFIER;
            ctx.message = std::format("Unable to use data value '{}' as Uuid", excerpt(json));
            return false;
        }
        out = *id;
        return true;
    }
};

template<class T>
    requires EnumMemberValue<T>
struct LeafCodec<T> {
    static yyjson_mut_val* write(const void* value, WriteContext& ctx) {
        const std::int64_t ord = enum_meta::ordinal(*static_cast<const T*>(value));
        for(const auto& e : enum_meta::table<T>()) {
            if(e.ordinal != ord) continue;
            if(e.is_string) return checked(yyjson_mut_strn(ctx.doc, e.external.data(), e.external.size()), ctx);
            return checked(yyjson_mut_sint(ctx.doc, ord), ctx);
        }
        ctx.error = MarshalError::UNMAPPED_ENUM_VALUE;
        ctx.message = std::format("Enum value {} of {} has no external value", ord, display_name<T>());
        return nullptr;
    }
    static bool read(yyjson_val* json, std::any& out, ReadContext& ctx) {
        for(const auto& e : enum_meta::table<T>()) {
            bool match = false;
            if(e.is_string) {
                match = yyjson_is_str(json) && yyjson_details::string_view_of(json) == e.external;
            } else if(yyjson_is_sint(json)) {
                match = yyjson_get_sint(json) == e.ordinal;
            } else if(yyjson_is_uint(json)) {
                match = e.ordinal >= 0 && yyjson_get_uint(json) == static_cast<std::uint64_t>(e.ordinal);
            }
            if(match) {
                out = static_cast<T>(static_cast<std::underlying_type_t<T>>(e.ordinal));
                return true;
            }
        }
        ctx.error = UnmarshalError::INVALID_ENUM_VALUE;
        ctx.message = std::format("Unable to use data value '{}' as Enum {}", excerpt(json), display_name<T>());
        return false;
    }
};

template<class T>
    requires TimestampValue<T>
struct LeafCodec<T> {
    static yyjson_mut_val* write(const void* value, WriteContext& ctx) {
        const DateTime& dt = *static_cast<const DateTime*>(value);
        std::optional<std::string> text = ctx.options.datetime_format
                                              ? temporal::formatDateTime(dt, *ctx.options.datetime_format)
                                              : temporal::formatIsoDateTime(dt);
        if(!text) {
            ctx.error = MarshalError::TEMPORAL_FORMAT_ERROR;
            ctx.message = std::format("Unable to format DateTime {} with pattern '{}'",
                                      temporal::formatIsoDateTime(dt), *ctx.options.datetime_format);
            return nullptr;
        }
        return checked(yyjson_mut_strncpy(ctx.doc, text->data(), text->size()), ctx);
    }
    static bool read(yyjson_val* json, std::any& out, ReadContext& ctx) {
        std::optional<DateTime> dt;
        if(yyjson_is_str(json)) {
            auto s = yyjson_details::string_view_of(json);
            dt = ctx.options.datetime_format ? temporal::parseDateTime(s, *ctx.options.datetime_format)
                                             : temporal::parseIsoDateTime(s);
        }
        if(!dt) {
            ctx.error = UnmarshalError::INVALID_TIMESTAMP;
            ctx.message = std::format("Unable to use data value '{}' as DateTime (pattern {})", excerpt(json),
                                      ctx.options.datetime_format ? "'" + *ctx.options.datetime_format + "'" : std::string("ISO-8601"));
            return false;
        }
        out = *dt;
        return true;
    }
};

template<class T>
    requires CalendarDateValue<T>
struct LeafCodec<T> {
    static yyjson_mut_val* write(const void* value, WriteContext& ctx) {
        const auto& d = *static_cast<const std::chrono::year_month_day*>(value);
        std::optional<std::string> text = ctx.options.date_format
                                              ? temporal::formatDate(d, *ctx.options.date_format)
                                              : temporal::formatIsoDate(d);
        if(!text) {
            ctx.error = MarshalError::TEMPORAL_FORMAT_ERROR;
            ctx.message = std::format("Unable to format date {} with pattern '{}'",
                                      temporal::formatIsoDate(d), *ctx.options.date_format);
            return nullptr;
        }
        return checked(yyjson_mut_strncpy(ctx.doc, text->data(), text->size()), ctx);
    }
    static bool read(yyjson_val* json, std::any& out, ReadContext& ctx) {
        std::optional<std::chrono::year_month_day> d;
        if(yyjson_is_str(json)) {
            auto s = yyjson_details::string_view_of(json);
            d = ctx.options.date_format ? temporal::parseDate(s, *ctx.options.date_format)
                                        : temporal::parseIsoDate(s);
        }
        if(!d) {
            ctx.error = UnmarshalError::INVALID_DATE;
            ctx.message = std::format("Unable to use data value '{}' as date (pattern {})", excerpt(json),
                                      ctx.options.date_format ? "'" + *ctx.options.date_format + "'" : std::string("ISO-8601"));
            return false;
        }
        out = *d;
        return true;
    }
};

/* ######## Records ######## */

template<class T, std::size_t I>
const void* read_field(const void* record) {
    using F = field_type<T, I>;
    const T& obj = *static_cast<const T*>(record);
    return std::addressof(annotation_meta_getter<F>::getRef(introspection::getStructElementByIndex<I>(obj)));
}

template<class T, std::size_t I>
void assign_field(T& obj, std::any& slot) {
    using F = field_type<T, I>;
    annotation_meta_getter<F>::getRef(introspection::getStructElementByIndex<I>(obj)) = take<field_value_type<T, I>>(slot);
}

template<class T, std::size_t I>
FieldDescriptor make_field() {
    using Opts = field_options<T, I>;
    using V    = field_value_type<T, I>;
    constexpr bool omit = Opts::template has_option<options::detail::omit_empty_tag>;
    static_assert(!omit || OptionalValue<V>,
                  "[[[ JsonWeave ]]] omit_empty can only be applied to std::optional<T> or std::variant<std::monostate, T> fields");

    FieldDescriptor f;
    f.name = introspection::structureElementNameByIndex<I, T>;
    if constexpr (Opts::template has_option<options::detail::key_tag>) {
        f.external_key = Opts::template get_option<options::detail::key_tag>::desc.toStringView();
    } else {
        f.external_key = f.name;
    }
    if constexpr (Opts::template has_option<options::detail::description_tag>) {
        f.description = Opts::template get_option<options::detail::description_tag>::desc.toStringView();
    }
    f.type = &describe<V>;
    f.omit_if_empty = omit;
    f.read = &read_field<T, I>;
    return f;
}

template<class T>
std::span<const FieldDescriptor> record_fields() {
    static constexpr auto indices = json_field_indices<T>();
    static const auto fields = []<std::size_t... Ks>(std::index_sequence<Ks...>) {
        return std::array<FieldDescriptor, sizeof...(Ks)>{ make_field<T, indices[Ks]>()... };
    }(std::make_index_sequence<indices.size()>{});
    return fields;
}

// Slots arrive in the order of record_fields<T>()
template<class T>
std::any build_record(std::vector<std::any>& slots) {
    static constexpr auto indices = json_field_indices<T>();
    T obj{};
    [&]<std::size_t... Ks>(std::index_sequence<Ks...>) {
        (assign_field<T, indices[Ks]>(obj, slots[Ks]), ...);
    }(std::make_index_sequence<indices.size()>{});
    return std::any(std::move(obj));
}

/* ######## Descriptor assembly ######## */

template<class T>
TypeDescriptor make_descriptor() {
    constexpr Shape s = shape_of<T>();
    TypeDescriptor d;
    d.shape = s;
    d.type_name = display_name<T>();

    if constexpr (s == Shape::Record) {
        d.fields = record_fields<T>();
        d.build = &build_record<T>;
    } else if constexpr (s == Shape::Optional) {
        using Inner = typename optional_traits<T>::inner_type;
        constexpr bool std_optional = is_specialization_of<T, std::optional>::value;
        d.inner = &describe<Inner>;
        d.is_null = [](const void* value) {
            const T& v = *static_cast<const T*>(value);
            if constexpr (std_optional) return !v.has_value();
            else return std::holds_alternative<std::monostate>(v);
        };
        d.deref = [](const void* value) -> const void* {
            const T& v = *static_cast<const T*>(value);
            if constexpr (std_optional) return std::addressof(*v);
            else return std::addressof(std::get<Inner>(v));
        };
        d.make_null = [] {
            if constexpr (std_optional) return std::any(T{});
            else return std::any(T{std::in_place_type<std::monostate>});
        };
        d.wrap = [](std::any&& inner) {
            if constexpr (std_optional) return std::any(T{take<Inner>(inner)});
            else return std::any(T{std::in_place_type<Inner>, take<Inner>(inner)});
        };
    } else if constexpr (s == Shape::Sequence) {
        using E = typename T::value_type;
        d.inner = &describe<E>;
        d.elements = [](const void* value, std::vector<const void*>& out) {
            const T& c = *static_cast<const T*>(value);
            out.clear();
            for(const auto& e : c) out.push_back(std::addressof(e));
        };
        d.build = [](std::vector<std::any>& slots) {
            T c;
            if constexpr (requires { c.reserve(slots.size()); }) c.reserve(slots.size());
            for(auto& slot : slots) c.push_back(take<E>(slot));
            return std::any(std::move(c));
        };
    } else if constexpr (s == Shape::Mapping) {
        using V = typename T::mapped_type;
        d.inner = &describe<V>;
        d.entries = [](const void* value, std::vector<MappingEntry>& out) {
            const T& m = *static_cast<const T*>(value);
            out.clear();
            for(const auto& [k, v] : m) out.push_back(MappingEntry{k, std::addressof(v)});
        };
        d.build_mapping = [](std::vector<std::string>& keys, std::vector<std::any>& values) {
            T m;
            for(std::size_t i = 0; i < keys.size(); i ++) {
                m.insert_or_assign(std::move(keys[i]), take<V>(values[i]));
            }
            return std::any(std::move(m));
        };
    } else if constexpr (s == Shape::Enum || s == Shape::Identifier || s == Shape::Timestamp
                         || s == Shape::CalendarDate || s == Shape::String || s == Shape::Integer
                         || s == Shape::Float || s == Shape::Boolean || s == Shape::Null) {
        if constexpr (s == Shape::Enum) {
            d.enumerators = enum_meta::table<T>();
        }
        d.write_leaf = &LeafCodec<T>::write;
        d.read_leaf = &LeafCodec<T>::read;
    }
    // Union and Unsupported carry only their name; the classifier rejects them
    return d;
}

} // namespace detail

template<class T>
const TypeDescriptor& describe() {
    static const TypeDescriptor descriptor = detail::make_descriptor<std::remove_cvref_t<T>>();
    return descriptor;
}

} // namespace schema

} // namespace JsonWeave

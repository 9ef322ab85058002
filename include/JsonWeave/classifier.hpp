#pragma once

#include <format>
#include <string>

#include "errors.hpp"
#include "schema.hpp"

namespace JsonWeave {

namespace classifier {

using schema::TypeDescriptor;
using static_schema::Shape;

struct ClassifyResult {
    ValueKind kind = ValueKind::Null;
    SchemaError error = SchemaError::none;
    // Descriptor the kind was derived from, the optional already unwrapped.
    // On failure it names the offending type.
    const TypeDescriptor* descriptor = nullptr;
    // Host value matching `descriptor`; only set by the host-value overload
    const void* value = nullptr;

    constexpr explicit operator bool() const {
        return error == SchemaError::none;
    }
};

namespace detail {

enum class Nullness {
    Unknown,
    Null,
    Present
};

inline ClassifyResult success(ValueKind k, const TypeDescriptor& d, const void* value) {
    return ClassifyResult{k, SchemaError::none, &d, value};
}

inline ClassifyResult failure(SchemaError e, const TypeDescriptor& d) {
    return ClassifyResult{ValueKind::Null, e, &d, nullptr};
}

inline ClassifyResult classify(const TypeDescriptor& d, Nullness nullness, const void* value) {
    switch(d.shape) {
    case Shape::Record:       return success(ValueKind::Record, d, value);
    case Shape::Enum:         return success(ValueKind::EnumMember, d, value);
    case Shape::Timestamp:    return success(ValueKind::Timestamp, d, value);
    case Shape::CalendarDate: return success(ValueKind::CalendarDate, d, value);
    case Shape::Optional: {
        const TypeDescriptor& inner = d.inner();
        if(inner.shape == Shape::Optional) return failure(SchemaError::ambiguous_union, d);
        if(nullness == Nullness::Null)     return success(ValueKind::Null, d, value);
        if(nullness == Nullness::Unknown)  return failure(SchemaError::unresolved_optional, d);
        return classify(inner, Nullness::Present, value ? d.deref(value) : nullptr);
    }
    case Shape::Sequence:     return success(ValueKind::Sequence, d, value);
    case Shape::Mapping:      return success(ValueKind::Mapping, d, value);
    case Shape::Identifier:   return success(ValueKind::Identifier, d, value);
    case Shape::String:       return success(ValueKind::String, d, value);
    case Shape::Integer:      return success(ValueKind::Integer, d, value);
    case Shape::Float:        return success(ValueKind::Float, d, value);
    case Shape::Boolean:      return success(ValueKind::Boolean, d, value);
    case Shape::Null:         return success(ValueKind::Null, d, value);
    case Shape::Union:        return failure(SchemaError::unsupported_union, d);
    case Shape::Unsupported:  break;
    }
    return failure(SchemaError::unsupported_type, d);
}

} // namespace detail

// Kind from the schema alone; an optional cannot be resolved this way
inline ClassifyResult classify(const TypeDescriptor& d) {
    return detail::classify(d, detail::Nullness::Unknown, nullptr);
}

// Kind for an input JSON node governed by `d`
inline ClassifyResult classify(const TypeDescriptor& d, yyjson_val* json) {
    const auto nullness = json == nullptr     ? detail::Nullness::Unknown
                          : yyjson_is_null(json) ? detail::Nullness::Null
                                                 : detail::Nullness::Present;
    return detail::classify(d, nullness, nullptr);
}

// Kind of a host value of the type `d` describes
inline ClassifyResult classify(const TypeDescriptor& d, const void* host) {
    auto nullness = detail::Nullness::Present;
    if(d.shape == Shape::Optional && d.is_null(host)) {
        nullness = detail::Nullness::Null;
    }
    return detail::classify(d, nullness, host);
}

inline std::string schema_error_message(const ClassifyResult& r) {
    const std::string_view type = r.descriptor ? r.descriptor->type_name : std::string_view("<unknown>");
    switch(r.error) {
    case SchemaError::none:
        return {};
    case SchemaError::unresolved_optional:
        return std::format("Unable to resolve optional type '{}' without a value", type);
    case SchemaError::ambiguous_union:
        return std::format("Optional of optional '{}' is ambiguous", type);
    case SchemaError::unsupported_union:
        return std::format("Union type '{}' is not supported, only an optional of one type is", type);
    case SchemaError::unsupported_type:
        return std::format("Type '{}' has no known kind", type);
    }
    return {};
}

} // namespace classifier

} // namespace JsonWeave

#pragma once

#include <cstdint>
#include <string_view>

namespace JsonWeave {

enum class ValueKind : std::uint8_t {
    Record,
    Sequence,
    Mapping,
    EnumMember,
    Identifier,
    Timestamp,
    CalendarDate,
    String,
    Integer,
    Float,
    Boolean,
    Null
};

constexpr std::string_view kind_to_string(ValueKind k) {
    switch(k) {
    case ValueKind::Record:       return "Record"; break;
    case ValueKind::Sequence:     return "Sequence"; break;
    case ValueKind::Mapping:      return "Mapping"; break;
    case ValueKind::EnumMember:   return "EnumMember"; break;
    case ValueKind::Identifier:   return "Identifier"; break;
    case ValueKind::Timestamp:    return "Timestamp"; break;
    case ValueKind::CalendarDate: return "CalendarDate"; break;
    case ValueKind::String:       return "String"; break;
    case ValueKind::Integer:      return "Integer"; break;
    case ValueKind::Float:        return "Float"; break;
    case ValueKind::Boolean:      return "Boolean"; break;
    case ValueKind::Null:         return "Null"; break;
    }
    return "N/A";
}

// Kinds written inline by the parent instead of getting their own work item
constexpr bool is_primitive(ValueKind k) {
    return k == ValueKind::String || k == ValueKind::Integer || k == ValueKind::Float
           || k == ValueKind::Boolean || k == ValueKind::Null;
}

constexpr bool is_container(ValueKind k) {
    return k == ValueKind::Record || k == ValueKind::Sequence || k == ValueKind::Mapping;
}

enum class MarshalError {
    NO_ERROR,
    UNSUPPORTED_VALUE,
    UNMAPPED_ENUM_VALUE,
    NON_FINITE_NUMBER,
    TEMPORAL_FORMAT_ERROR,
    SCHEMA_ERROR,
    WRITER_ERROR
};

constexpr std::string_view error_to_string(MarshalError e) {
    switch(e) {
    case MarshalError::NO_ERROR: return "NO_ERROR"; break;
    case MarshalError::UNSUPPORTED_VALUE: return "UNSUPPORTED_VALUE"; break;
    case MarshalError::UNMAPPED_ENUM_VALUE: return "UNMAPPED_ENUM_VALUE"; break;
    case MarshalError::NON_FINITE_NUMBER: return "NON_FINITE_NUMBER"; break;
    case MarshalError::TEMPORAL_FORMAT_ERROR: return "TEMPORAL_FORMAT_ERROR"; break;
    case MarshalError::SCHEMA_ERROR: return "SCHEMA_ERROR"; break;
    case MarshalError::WRITER_ERROR: return "WRITER_ERROR"; break;
    }
    return "N/A";
}

enum class UnmarshalError {
    NO_ERROR,
    SCHEMA_MISMATCH,
    MISSING_KEY,
    INVALID_ENUM_VALUE,
    INVALID_IDENTIFIER,
    INVALID_TIMESTAMP,
    INVALID_DATE,
    NUMBER_OUT_OF_RANGE,
    SCHEMA_ERROR,
    READER_ERROR
};

constexpr std::string_view error_to_string(UnmarshalError e) {
    switch(e) {
    case UnmarshalError::NO_ERROR: return "NO_ERROR"; break;
    case UnmarshalError::SCHEMA_MISMATCH: return "SCHEMA_MISMATCH"; break;
    case UnmarshalError::MISSING_KEY: return "MISSING_KEY"; break;
    case UnmarshalError::INVALID_ENUM_VALUE: return "INVALID_ENUM_VALUE"; break;
    case UnmarshalError::INVALID_IDENTIFIER: return "INVALID_IDENTIFIER"; break;
    case UnmarshalError::INVALID_TIMESTAMP: return "INVALID_TIMESTAMP"; break;
    case UnmarshalError::INVALID_DATE: return "INVALID_DATE"; break;
    case UnmarshalError::NUMBER_OUT_OF_RANGE: return "NUMBER_OUT_OF_RANGE"; break;
    case UnmarshalError::SCHEMA_ERROR: return "SCHEMA_ERROR"; break;
    case UnmarshalError::READER_ERROR: return "READER_ERROR"; break;
    }
    return "N/A";
}

// ============================================================================
// Schema Errors
// ============================================================================

enum class SchemaError {
    none,
    unresolved_optional,
    ambiguous_union,
    unsupported_union,
    unsupported_type
};

constexpr std::string_view schema_error_to_string(SchemaError e) {
    switch(e) {
    case SchemaError::none               : return "none"; break;
    case SchemaError::unresolved_optional: return "unresolved_optional"; break;
    case SchemaError::ambiguous_union    : return "ambiguous_union"; break;
    case SchemaError::unsupported_union  : return "unsupported_union"; break;
    case SchemaError::unsupported_type   : return "unsupported_type"; break;
    }
    return "N/A";
}

} // namespace JsonWeave

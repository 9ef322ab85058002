#pragma once

#include <format>
#include <string>

#include "result.hpp"

namespace JsonWeave {

namespace error_formatting_detail {

// JSONPath spelling of a location: $.items[2].date_key
inline std::string json_path(const path::Path& p) {
    std::string jsonPath = "$";
    for(std::size_t i = 0; i < p.length(); i ++) {
        if(p[i].isIndex()) {
            jsonPath += "[" + std::to_string(p[i].array_index) + "]";
        } else {
            jsonPath += "." + p[i].field_name;
        }
    }
    return jsonPath;
}

}

inline std::string ResultToString(const MarshalResult& res) {
    if(res) return "OK";
    return std::format("When marshalling at {}, error '{}': {}",
                       error_formatting_detail::json_path(res.errorLocation()), error_to_string(res.error()), res.message());
}

inline std::string ResultToString(const UnmarshalResult& res) {
    if(res) return "OK";
    if(res.error() == UnmarshalError::SCHEMA_ERROR) {
        return std::format("When unmarshalling at {}, error '{}' ({}): {}",
                           error_formatting_detail::json_path(res.errorLocation()), error_to_string(res.error()),
                           schema_error_to_string(res.schemaError()), res.message());
    }
    return std::format("When unmarshalling at {}, error '{}': {}",
                       error_formatting_detail::json_path(res.errorLocation()), error_to_string(res.error()), res.message());
}

} // namespace JsonWeave

#pragma once

#include <string>
#include <utility>

#include "errors.hpp"
#include "path.hpp"
#include "yyjson.hpp"

namespace JsonWeave {

class MarshalResult {
    MarshalError m_error = MarshalError::NO_ERROR;
    SchemaError m_schemaError = SchemaError::none;
    path::Path m_path;
    std::string m_message;
    MutableDocument m_doc;

public:
    explicit MarshalResult(MutableDocument doc)
        : m_doc(std::move(doc))
    {}
    MarshalResult(MarshalError err, SchemaError schemaErr, path::Path where, std::string message)
        : m_error(err)
        , m_schemaError(schemaErr)
        , m_path(std::move(where))
        , m_message(std::move(message))
    {}

    explicit operator bool() const {
        return m_error == MarshalError::NO_ERROR;
    }

    MarshalError error() const {
        return m_error;
    }
    SchemaError schemaError() const {
        return m_schemaError;
    }
    // Dotted location of the failing value, empty for the root
    std::string errorPath() const {
        return m_path.toString();
    }
    const path::Path& errorLocation() const {
        return m_path;
    }
    const std::string& message() const {
        return m_message;
    }

    yyjson_mut_doc* doc() const {
        return m_doc.get();
    }
    yyjson_mut_val* root() const {
        return m_doc ? yyjson_mut_doc_get_root(m_doc.get()) : nullptr;
    }
    MutableDocument releaseDoc() {
        return std::move(m_doc);
    }

    // Compact JSON text of the output; empty when marshalling failed
    std::string toString() const {
        std::string out;
        if(m_doc && !yyjson_details::write_to_string(m_doc.get(), out)) {
            out.clear();
        }
        return out;
    }
};

class UnmarshalResult {
    UnmarshalError m_error = UnmarshalError::NO_ERROR;
    SchemaError m_schemaError = SchemaError::none;
    path::Path m_path;
    std::string m_message;

public:
    UnmarshalResult() = default;
    UnmarshalResult(UnmarshalError err, SchemaError schemaErr, path::Path where, std::string message)
        : m_error(err)
        , m_schemaError(schemaErr)
        , m_path(std::move(where))
        , m_message(std::move(message))
    {}

    explicit operator bool() const {
        return m_error == UnmarshalError::NO_ERROR;
    }

    UnmarshalError error() const {
        return m_error;
    }
    SchemaError schemaError() const {
        return m_schemaError;
    }
    std::string errorPath() const {
        return m_path.toString();
    }
    const path::Path& errorLocation() const {
        return m_path;
    }
    const std::string& message() const {
        return m_message;
    }
};

} // namespace JsonWeave

#pragma once

#include <format>
#include <string>
#include <string_view>

#include "marshaller.hpp"
#include "unmarshaller.hpp"

namespace JsonWeave {

// Marshal straight to compact JSON text; `out` is left untouched on failure
template<class T>
MarshalResult MarshalToString(const T& value, std::string& out, const FormatOptions& options = {}) {
    MarshalResult res = Marshal(value, options);
    if(!res) return res;
    std::string text;
    if(!yyjson_details::write_to_string(res.doc(), text)) {
        return MarshalResult(MarshalError::WRITER_ERROR, SchemaError::none, path::Path{},
                             "yyjson failed to write the document");
    }
    out = std::move(text);
    return res;
}

// Parses a whole JSON document with yyjson and unmarshals its root
template<class T>
UnmarshalResult UnmarshalFromString(T& out, std::string_view text, const FormatOptions& options = {}) {
    yyjson_read_err err{};
    // Without YYJSON_READ_INSITU yyjson copies the input and never writes to it
    Document doc(yyjson_read_opts(const_cast<char*>(text.data()), text.size(), YYJSON_READ_NOFLAG, nullptr, &err));
    if(!doc) {
        return UnmarshalResult(UnmarshalError::READER_ERROR, SchemaError::none, path::Path{},
                               std::format("Malformed JSON: {} at byte {}", err.msg ? err.msg : "unknown error", err.pos));
    }
    return Unmarshal(out, yyjson_doc_get_root(doc.get()), options);
}

} // namespace JsonWeave

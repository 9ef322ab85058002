#pragma once
#include <yyjson.h>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

namespace JsonWeave {

struct YyjsonDocDeleter {
    void operator()(yyjson_doc* doc) const noexcept { yyjson_doc_free(doc); }
};
struct YyjsonMutDocDeleter {
    void operator()(yyjson_mut_doc* doc) const noexcept { yyjson_mut_doc_free(doc); }
};

// Immutable input tree and mutable output tree, owned
using Document        = std::unique_ptr<yyjson_doc, YyjsonDocDeleter>;
using MutableDocument = std::unique_ptr<yyjson_mut_doc, YyjsonMutDocDeleter>;

namespace yyjson_details {

struct FreeDeleter {
    void operator()(char* p) const noexcept { std::free(p); }
};

inline std::string_view type_name(yyjson_val* v) {
    if(!v) return "missing";
    switch(yyjson_get_type(v)) {
    case YYJSON_TYPE_NULL: return "null";
    case YYJSON_TYPE_BOOL: return "boolean";
    case YYJSON_TYPE_NUM:  return yyjson_is_real(v) ? "real" : "integer";
    case YYJSON_TYPE_STR:  return "string";
    case YYJSON_TYPE_ARR:  return "array";
    case YYJSON_TYPE_OBJ:  return "object";
    default: break;
    }
    return "unknown";
}

// Compact JSON rendering of an input node for error messages, shortened past MaxLength
inline std::string excerpt(yyjson_val* v, std::size_t MaxLength = 64) {
    if(!v) return "<missing>";
    std::size_t len = 0;
    std::unique_ptr<char, FreeDeleter> text(yyjson_val_write(v, YYJSON_WRITE_NOFLAG, &len));
    if(!text) return "<unprintable>";
    std::string out(text.get(), len);
    if(out.size() > MaxLength) {
        // Cut on a UTF-8 character boundary
        std::size_t cut = MaxLength;
        while(cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) cut --;
        out.resize(cut);
        out += "...";
    }
    return out;
}

inline std::string_view string_view_of(yyjson_val* v) {
    return std::string_view(yyjson_get_str(v), yyjson_get_len(v));
}

inline bool write_to_string(const yyjson_mut_doc* doc, std::string& out) {
    std::size_t len = 0;
    std::unique_ptr<char, FreeDeleter> text(yyjson_mut_write(doc, YYJSON_WRITE_NOFLAG, &len));
    if(!text) return false;
    out.assign(text.get(), len);
    return true;
}

} // namespace yyjson_details

} // namespace JsonWeave

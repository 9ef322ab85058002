#pragma once

#include <any>
#include <format>
#include <string>
#include <vector>

#include "classifier.hpp"
#include "format_options.hpp"
#include "result.hpp"
#include "schema.hpp"
#include "work_list.hpp"

namespace JsonWeave {

namespace unmarshaller_details {

using schema::TypeDescriptor;
using static_schema::Shape;

struct Item : work_list::ItemBase {
    yyjson_val* json = nullptr;
    const TypeDescriptor* declared = nullptr;     // as written in the schema, may be optional
    const TypeDescriptor* descriptor = nullptr;   // governs `kind`, optional unwrapped
    ValueKind kind = ValueKind::Null;
    std::vector<std::any> slots;
    std::vector<std::string> keys;                // mappings only, parallel to slots
    std::any value;                               // instance of *declared once finalized
};

inline std::string available_keys(yyjson_val* obj) {
    std::string out;
    yyjson_obj_iter it{};
    yyjson_obj_iter_init(obj, &it);
    while(yyjson_val* key = yyjson_obj_iter_next(&it)) {
        if(!out.empty()) out += ", ";
        out += yyjson_details::string_view_of(key);
    }
    return out.empty() ? std::string("none") : out;
}

class Engine {
    const FormatOptions& m_options;
    work_list::WorkList<Item, Engine> m_work;

    UnmarshalError m_error = UnmarshalError::NO_ERROR;
    SchemaError m_schemaError = SchemaError::none;
    path::Path m_path;
    std::string m_message;

    friend class work_list::WorkList<Item, Engine>;

public:
    explicit Engine(const FormatOptions& options)
        : m_options(options)
        , m_work(*this)
    {}

    bool run(const TypeDescriptor& rootType, yyjson_val* json) {
        const auto cr = classifier::classify(rootType, json);
        if(!cr) return failClassify(cr, path::Path{});
        Item root;
        root.json = json;
        root.declared = &rootType;
        root.descriptor = cr.descriptor;
        root.kind = cr.kind;
        return m_work.run(std::move(root));
    }

    std::any& result() {
        return m_work[0].value;
    }

    UnmarshalResult failure() {
        return UnmarshalResult(m_error, m_schemaError, std::move(m_path), std::move(m_message));
    }

private:
    bool fail(UnmarshalError err, path::Path where, std::string message) {
        m_error = err;
        m_message = std::format("{} at location = {}", message, where.toDisplayString());
        m_path = std::move(where);
        return false;
    }

    bool failClassify(const classifier::ClassifyResult& cr, path::Path where) {
        m_schemaError = cr.error;
        return fail(UnmarshalError::SCHEMA_ERROR, std::move(where), classifier::schema_error_message(cr));
    }

    bool failMismatch(std::size_t id) {
        const Item& item = m_work[id];
        return fail(UnmarshalError::SCHEMA_MISMATCH, m_work.pathTo(id),
                    schema::detail::mismatch_message(item.json, item.declared->type_name));
    }

    path::Path childPath(std::size_t parent, const path::PathElement& where) const {
        path::Path p = m_work.pathTo(parent);
        p.push_child(where);
        return p;
    }

    // Value of the declared type for a primitive or null node
    bool readInline(const TypeDescriptor& declared, const classifier::ClassifyResult& cr,
                    yyjson_val* json, std::any& out, schema::ReadContext& ctx) {
        if(cr.kind == ValueKind::Null && declared.shape == Shape::Optional) {
            out = declared.make_null();
            return true;
        }
        if(!cr.descriptor->read_leaf(json, out, ctx)) return false;
        if(declared.shape == Shape::Optional) {
            out = declared.wrap(std::move(out));
        }
        return true;
    }

    bool place(std::size_t parent, std::size_t slot, path::PathElement where,
               const TypeDescriptor& d, yyjson_val* json) {
        const auto cr = classifier::classify(d, json);
        if(!cr) return failClassify(cr, childPath(parent, where));
        if(is_primitive(cr.kind)) {
            schema::ReadContext ctx{m_options};
            if(!readInline(d, cr, json, m_work[parent].slots[slot], ctx)) {
                return fail(ctx.error, childPath(parent, where), std::move(ctx.message));
            }
            return true;
        }
        Item child;
        child.json = json;
        child.declared = &d;
        child.descriptor = cr.descriptor;
        child.kind = cr.kind;
        m_work.spawn(parent, slot, std::move(where), std::move(child));
        return true;
    }

    bool process(std::size_t id) {
        Item& item = m_work[id];
        const TypeDescriptor& d = *item.descriptor;

        switch(item.kind) {
        case ValueKind::Record: {
            if(!yyjson_is_obj(item.json)) return failMismatch(id);
            item.slots.resize(d.fields.size());
            for(std::size_t i = 0; i < d.fields.size(); i ++) {
                const auto& f = d.fields[i];
                const TypeDescriptor& fd = f.type();
                yyjson_val* fieldJson = yyjson_obj_getn(item.json, f.external_key.data(), f.external_key.size());
                if(!fieldJson) {
                    if(fd.shape == Shape::Optional) {
                        item.slots[i] = fd.make_null();
                        continue;
                    }
                    return fail(UnmarshalError::MISSING_KEY, m_work.pathTo(id),
                                std::format("Missing required key '{}' for field '{}', available keys: {}",
                                            f.external_key, f.name, available_keys(item.json)));
                }
                if(!place(id, i, path::PathElement(f.external_key), fd, fieldJson)) return false;
            }
            return true;
        }
        case ValueKind::Sequence: {
            if(!yyjson_is_arr(item.json)) return failMismatch(id);
            item.slots.resize(yyjson_arr_size(item.json));
            const TypeDescriptor& ed = d.inner();
            std::size_t i = 0;
            yyjson_arr_iter it{};
            yyjson_arr_iter_init(item.json, &it);
            while(yyjson_val* element = yyjson_arr_iter_next(&it)) {
                if(!place(id, i, path::PathElement(i), ed, element)) return false;
                i ++;
            }
            return true;
        }
        case ValueKind::Mapping: {
            if(!yyjson_is_obj(item.json)) return failMismatch(id);
            const std::size_t n = yyjson_obj_size(item.json);
            item.keys.reserve(n);
            item.slots.resize(n);
            const TypeDescriptor& vd = d.inner();
            std::size_t i = 0;
            yyjson_obj_iter it{};
            yyjson_obj_iter_init(item.json, &it);
            while(yyjson_val* key = yyjson_obj_iter_next(&it)) {
                item.keys.emplace_back(yyjson_details::string_view_of(key));
                if(!place(id, i, path::PathElement(item.keys.back()), vd, yyjson_obj_iter_get_val(key))) return false;
                i ++;
            }
            return true;
        }
        default: {
            schema::ReadContext ctx{m_options};
            classifier::ClassifyResult cr;
            cr.kind = item.kind;
            cr.descriptor = item.descriptor;
            if(!readInline(*item.declared, cr, item.json, item.value, ctx)) {
                return fail(ctx.error, m_work.pathTo(id), std::move(ctx.message));
            }
            return true;
        }
        }
    }

    void attach(std::size_t parent, std::size_t child) {
        Item& c = m_work[child];
        m_work[parent].slots[c.slot] = std::move(c.value);
    }

    bool finalize(std::size_t id) {
        Item& item = m_work[id];
        const TypeDescriptor& d = *item.descriptor;
        switch(item.kind) {
        case ValueKind::Record:
        case ValueKind::Sequence:
            item.value = d.build(item.slots);
            break;
        case ValueKind::Mapping:
            item.value = d.build_mapping(item.keys, item.slots);
            break;
        default:
            // Leaves already hold a value of the declared type
            return true;
        }
        if(item.declared->shape == Shape::Optional) {
            item.value = item.declared->wrap(std::move(item.value));
        }
        item.slots.clear();
        item.keys.clear();
        return true;
    }

};

} // namespace unmarshaller_details

// Builds a T from `json`; `out` is assigned only when the whole tree converts
template<class T>
UnmarshalResult Unmarshal(T& out, yyjson_val* json, const FormatOptions& options = {}) {
    if(!json) {
        return UnmarshalResult(UnmarshalError::READER_ERROR, SchemaError::none, path::Path{},
                               "No JSON value to unmarshal");
    }
    unmarshaller_details::Engine engine(options);
    if(!engine.run(schema::describe<T>(), json)) {
        return engine.failure();
    }
    out = std::move(*std::any_cast<T>(&engine.result()));
    return {};
}

} // namespace JsonWeave

#pragma once

#include <format>
#include <memory>
#include <string>
#include <vector>

#include "classifier.hpp"
#include "format_options.hpp"
#include "result.hpp"
#include "schema.hpp"
#include "work_list.hpp"

namespace JsonWeave {

namespace marshaller_details {

using schema::TypeDescriptor;

// Key/value pair of an output container under construction; key is null for sequences
struct OutputSlot {
    yyjson_mut_val* key = nullptr;
    yyjson_mut_val* value = nullptr;
};

struct Item : work_list::ItemBase {
    const void* value = nullptr;
    const TypeDescriptor* descriptor = nullptr;
    ValueKind kind = ValueKind::Null;
    std::vector<OutputSlot> slots;
    yyjson_mut_val* out = nullptr;
};

class Engine {
    yyjson_mut_doc* m_doc;
    const FormatOptions& m_options;
    work_list::WorkList<Item, Engine> m_work;

    MarshalError m_error = MarshalError::NO_ERROR;
    SchemaError m_schemaError = SchemaError::none;
    path::Path m_path;
    std::string m_message;

    friend class work_list::WorkList<Item, Engine>;

public:
    Engine(yyjson_mut_doc* doc, const FormatOptions& options)
        : m_doc(doc)
        , m_options(options)
        , m_work(*this)
    {}

    bool run(const TypeDescriptor& rootType, const void* rootValue) {
        const auto cr = classifier::classify(rootType, rootValue);
        if(!cr) return failClassify(cr, path::Path{});
        Item root;
        root.value = cr.value;
        root.descriptor = cr.descriptor;
        root.kind = cr.kind;
        return m_work.run(std::move(root));
    }

    yyjson_mut_val* result() const {
        return m_work[0].out;
    }

    MarshalResult failure() {
        return MarshalResult(m_error, m_schemaError, std::move(m_path), std::move(m_message));
    }

private:
    bool fail(MarshalError err, path::Path where, std::string message) {
        m_error = err;
        m_message = std::format("{} at location = {}", message, where.toDisplayString());
        m_path = std::move(where);
        return false;
    }

    bool failClassify(const classifier::ClassifyResult& cr, path::Path where) {
        m_schemaError = cr.error;
        if(cr.error == SchemaError::unsupported_type) {
            return fail(MarshalError::UNSUPPORTED_VALUE, std::move(where),
                        std::format("Unable to marshal value of type '{}' to a known kind", cr.descriptor->type_name));
        }
        return fail(MarshalError::SCHEMA_ERROR, std::move(where), classifier::schema_error_message(cr));
    }

    path::Path childPath(std::size_t parent, const path::PathElement& where) const {
        path::Path p = m_work.pathTo(parent);
        p.push_child(where);
        return p;
    }

    yyjson_mut_val* writeLeaf(std::size_t owner, const path::PathElement* where,
                              ValueKind kind, const TypeDescriptor& d, const void* value) {
        if(kind == ValueKind::Null) {
            yyjson_mut_val* v = yyjson_mut_null(m_doc);
            if(!v) fail(MarshalError::WRITER_ERROR, m_work.pathTo(owner), "yyjson failed to allocate an output value");
            return v;
        }
        schema::WriteContext ctx{m_doc, m_options};
        yyjson_mut_val* v = d.write_leaf(value, ctx);
        if(!v) {
            fail(ctx.error, where ? childPath(owner, *where) : m_work.pathTo(owner), std::move(ctx.message));
        }
        return v;
    }

    // Primitives land in the parent's slot directly, everything else becomes a child item
    bool place(std::size_t parent, std::size_t slot, path::PathElement where,
               const TypeDescriptor& d, const void* value) {
        const auto cr = classifier::classify(d, value);
        if(!cr) return failClassify(cr, childPath(parent, where));
        if(is_primitive(cr.kind)) {
            yyjson_mut_val* v = writeLeaf(parent, &where, cr.kind, *cr.descriptor, cr.value);
            if(!v) return false;
            m_work[parent].slots[slot].value = v;
            return true;
        }
        Item child;
        child.value = cr.value;
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
            for(const auto& f : d.fields) {
                const void* fieldValue = f.read(item.value);
                const TypeDescriptor& fd = f.type();
                if(f.omit_if_empty && fd.is_null(fieldValue)) continue;

                yyjson_mut_val* key = yyjson_mut_strn(m_doc, f.external_key.data(), f.external_key.size());
                if(!key) return fail(MarshalError::WRITER_ERROR, m_work.pathTo(id), "yyjson failed to allocate a key");
                const std::size_t slot = item.slots.size();
                item.slots.push_back(OutputSlot{key, nullptr});
                if(!place(id, slot, path::PathElement(f.external_key), fd, fieldValue)) return false;
            }
            return true;
        }
        case ValueKind::Sequence: {
            std::vector<const void*> elements;
            d.elements(item.value, elements);
            item.slots.resize(elements.size());
            const TypeDescriptor& ed = d.inner();
            for(std::size_t i = 0; i < elements.size(); i ++) {
                if(!place(id, i, path::PathElement(i), ed, elements[i])) return false;
            }
            return true;
        }
        case ValueKind::Mapping: {
            std::vector<schema::MappingEntry> entries;
            d.entries(item.value, entries);
            const TypeDescriptor& vd = d.inner();
            for(std::size_t i = 0; i < entries.size(); i ++) {
                yyjson_mut_val* key = yyjson_mut_strncpy(m_doc, entries[i].key.data(), entries[i].key.size());
                if(!key) return fail(MarshalError::WRITER_ERROR, m_work.pathTo(id), "yyjson failed to allocate a key");
                item.slots.push_back(OutputSlot{key, nullptr});
                if(!place(id, i, path::PathElement(entries[i].key), vd, entries[i].value)) return false;
            }
            return true;
        }
        default:
            item.out = writeLeaf(id, nullptr, item.kind, d, item.value);
            return item.out != nullptr;
        }
    }

    void attach(std::size_t parent, std::size_t child) {
        const Item& c = m_work[child];
        m_work[parent].slots[c.slot].value = c.out;
    }

    bool finalize(std::size_t id) {
        Item& item = m_work[id];
        bool ok = true;
        switch(item.kind) {
        case ValueKind::Record:
        case ValueKind::Mapping:
            item.out = yyjson_mut_obj(m_doc);
            ok = item.out != nullptr;
            for(std::size_t i = 0; ok && i < item.slots.size(); i ++) {
                ok = yyjson_mut_obj_add(item.out, item.slots[i].key, item.slots[i].value);
            }
            break;
        case ValueKind::Sequence:
            item.out = yyjson_mut_arr(m_doc);
            ok = item.out != nullptr;
            for(std::size_t i = 0; ok && i < item.slots.size(); i ++) {
                ok = yyjson_mut_arr_append(item.out, item.slots[i].value);
            }
            break;
        default:
            break;
        }
        if(!ok) return fail(MarshalError::WRITER_ERROR, m_work.pathTo(id), "yyjson failed to build a container");
        item.slots.clear();
        return true;
    }
};

} // namespace marshaller_details

// Converts a host value into a freshly allocated yyjson document owned by the result
template<class T>
MarshalResult Marshal(const T& value, const FormatOptions& options = {}) {
    MutableDocument doc(yyjson_mut_doc_new(nullptr));
    if(!doc) {
        return MarshalResult(MarshalError::WRITER_ERROR, SchemaError::none, path::Path{},
                             "yyjson failed to allocate a document");
    }
    marshaller_details::Engine engine(doc.get(), options);
    if(!engine.run(schema::describe<T>(), std::addressof(value))) {
        return engine.failure();
    }
    yyjson_mut_doc_set_root(doc.get(), engine.result());
    return MarshalResult(std::move(doc));
}

} // namespace JsonWeave

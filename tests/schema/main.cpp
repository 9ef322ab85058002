#include <cassert>
#include <deque>
#include <list>
#include <map>
#include <unordered_map>
#include <iostream>

#include "../test_model.hpp"
#include "../test_helpers.hpp"

using namespace JsonWeave;
using namespace jsonweave_test_models;
using namespace TestHelpers;

void shape_tests() {
    using namespace JsonWeave::static_schema;
    using std::string, std::vector, std::list, std::optional, std::variant, std::monostate;

    static_assert(shape_of<bool>() == Shape::Boolean);
    static_assert(shape_of<int>() == Shape::Integer);
    static_assert(shape_of<std::uint64_t>() == Shape::Integer);
    static_assert(shape_of<std::int8_t>() == Shape::Integer);
    static_assert(shape_of<char>() == Shape::Unsupported);
    static_assert(shape_of<char16_t>() == Shape::Unsupported);
    static_assert(shape_of<float>() == Shape::Float);
    static_assert(shape_of<double>() == Shape::Float);
    static_assert(shape_of<string>() == Shape::String);
    static_assert(shape_of<monostate>() == Shape::Null);
    static_assert(shape_of<Uuid>() == Shape::Identifier);
    static_assert(shape_of<DateTime>() == Shape::Timestamp);
    static_assert(shape_of<Date>() == Shape::CalendarDate);
    static_assert(shape_of<Size>() == Shape::Enum);
    static_assert(shape_of<Priority>() == Shape::Enum);

    static_assert(shape_of<optional<int>>() == Shape::Optional);
    static_assert(shape_of<variant<monostate, int>>() == Shape::Optional);
    static_assert(shape_of<variant<string, monostate>>() == Shape::Optional);
    static_assert(shape_of<variant<int, string>>() == Shape::Union);
    static_assert(shape_of<variant<monostate, int, string>>() == Shape::Union);

    static_assert(shape_of<vector<int>>() == Shape::Sequence);
    static_assert(shape_of<list<Event>>() == Shape::Sequence);
    static_assert(shape_of<std::deque<string>>() == Shape::Sequence);
    static_assert(shape_of<vector<bool>>() == Shape::Unsupported);
    static_assert(shape_of<std::map<string, int>>() == Shape::Mapping);
    static_assert(shape_of<std::unordered_map<string, Event>>() == Shape::Mapping);
    static_assert(shape_of<std::map<int, int>>() != Shape::Mapping);

    static_assert(shape_of<Item>() == Shape::Record);
    static_assert(shape_of<Point>() == Shape::Record);
    static_assert(shape_of<const int*>() == Shape::Unsupported);
    static_assert(shape_of<std::array<int, 3>>() == Shape::Unsupported);
    static_assert(shape_of<int[3]>() == Shape::Unsupported);

    static_assert(Marshallable<Item>);
    static_assert(Marshallable<Wrapper>);
    static_assert(Marshallable<Response>);
    static_assert(Marshallable<Counters>);
    static_assert(Marshallable<Geometry>);
    static_assert(Marshallable<Sparse>);
    static_assert(Marshallable<Settings>);
    static_assert(!Marshallable<WithUnion>);
    static_assert(!Marshallable<WithChar>);
    static_assert(!Marshallable<WithPointer>);
    static_assert(!Marshallable<WithFixedArray>);
    static_assert(!Marshallable<optional<optional<int>>>);
    static_assert(!Marshallable<vector<variant<int, string>>>);

    static_assert(json_fields_count<Settings>() == 2);
    static_assert(json_field_indices<Settings>()[0] == 0);
    static_assert(json_field_indices<Settings>()[1] == 2);
}

void descriptor_tests() {
    const schema::TypeDescriptor& item = schema::describe<Item>();
    assert(item.shape == static_schema::Shape::Record);
    assert(item.fields.size() == 9);
    assert(item.fields[0].name == "int_key");
    assert(item.fields[0].external_key == "intKey");
    assert(item.fields[6].external_key == "optionalIntKey");
    assert(item.fields[6].type().shape == static_schema::Shape::Optional);
    assert(item.fields[6].type().inner().shape == static_schema::Shape::Integer);
    assert(!item.fields[6].omit_if_empty);
    assert(&schema::describe<Item>() == &item && "descriptors are built once");

    const schema::TypeDescriptor& sparse = schema::describe<Sparse>();
    assert(sparse.fields.size() == 4);
    assert(sparse.fields[0].external_key == "id");
    assert(sparse.fields[1].omit_if_empty);
    assert(!sparse.fields[2].omit_if_empty);
    assert(sparse.fields[3].external_key == "score");

    // not_json members take no part
    const schema::TypeDescriptor& settings = schema::describe<Settings>();
    assert(settings.fields.size() == 2);
    assert(settings.fields[1].name == "level");
    assert(settings.fields[1].description == "0-255 verbosity");
    assert(settings.fields[0].description.empty());

    const schema::TypeDescriptor& point = schema::describe<Point>();
    assert(point.fields.size() == 3);
    assert(point.fields[0].name == "x");
    assert(point.fields[0].external_key == "X");
    assert(point.fields[2].external_key == "tag");
    assert(point.fields[2].omit_if_empty);

    const schema::TypeDescriptor& size = schema::describe<Size>();
    assert(size.enumerators.size() == 3);
    assert(size.enumerators[1].external == "MEDIUM");
    assert(size.enumerators[1].is_string);
    const schema::TypeDescriptor& prio = schema::describe<Priority>();
    assert(prio.enumerators[1].ordinal == 5);
    assert(!prio.enumerators[1].is_string);

    assert(schema::describe<std::vector<int>>().type_name == "sequence<int>");
    assert(schema::describe<std::optional<std::string>>().type_name == "optional<string>");
    assert(schema::describe<std::map<std::string, Date>>().type_name == "mapping<string, date>");
    assert(Contains(schema::describe<Item>().type_name, "Item"));

    // Reading through a record descriptor
    Point p{1.5, -2.0, std::string("corner")};
    const void* y = point.fields[1].read(&p);
    assert(*static_cast<const double*>(y) == -2.0);
}

void classifier_tests() {
    using classifier::classify;

    assert(classify(schema::describe<Item>()).kind == ValueKind::Record);
    assert(classify(schema::describe<Size>()).kind == ValueKind::EnumMember);
    assert(classify(schema::describe<DateTime>()).kind == ValueKind::Timestamp);
    assert(classify(schema::describe<Date>()).kind == ValueKind::CalendarDate);
    assert(classify(schema::describe<std::vector<Event>>()).kind == ValueKind::Sequence);
    assert(classify(schema::describe<std::map<std::string, int>>()).kind == ValueKind::Mapping);
    assert(classify(schema::describe<Uuid>()).kind == ValueKind::Identifier);
    assert(classify(schema::describe<std::string>()).kind == ValueKind::String);
    assert(classify(schema::describe<long>()).kind == ValueKind::Integer);
    assert(classify(schema::describe<float>()).kind == ValueKind::Float);
    assert(classify(schema::describe<bool>()).kind == ValueKind::Boolean);
    assert(classify(schema::describe<std::monostate>()).kind == ValueKind::Null);

    // An optional needs data to resolve
    {
        auto r = classify(schema::describe<std::optional<int>>());
        assert(!r);
        assert(r.error == SchemaError::unresolved_optional);
    }
    {
        auto r = classify(schema::describe<std::optional<std::optional<int>>>());
        assert(r.error == SchemaError::ambiguous_union);
    }
    {
        auto r = classify(schema::describe<std::variant<int, std::string>>());
        assert(r.error == SchemaError::unsupported_union);
        assert(Contains(classifier::schema_error_message(r), "not supported"));
    }
    {
        auto r = classify(schema::describe<char>());
        assert(r.error == SchemaError::unsupported_type);
        assert(Contains(classifier::schema_error_message(r), "char"));
    }

    // Host values
    {
        std::optional<int> absent;
        auto r = classify(schema::describe<std::optional<int>>(), static_cast<const void*>(&absent));
        assert(r && r.kind == ValueKind::Null);

        std::optional<int> present = 7;
        r = classify(schema::describe<std::optional<int>>(), static_cast<const void*>(&present));
        assert(r && r.kind == ValueKind::Integer);
        assert(*static_cast<const int*>(r.value) == 7);
        assert(r.descriptor == &schema::describe<int>());

        std::variant<std::monostate, Size> v = Size::Large;
        r = classify(schema::describe<decltype(v)>(), static_cast<const void*>(&v));
        assert(r && r.kind == ValueKind::EnumMember);
    }

    // JSON values
    {
        constexpr std::string_view text = R"([null, 3, "x"])";
        Document doc(yyjson_read(text.data(), text.size(), 0));
        assert(doc);
        yyjson_val* arr = yyjson_doc_get_root(doc.get());
        const auto& d = schema::describe<std::optional<int>>();
        assert(classify(d, yyjson_arr_get(arr, 0)).kind == ValueKind::Null);
        assert(classify(d, yyjson_arr_get(arr, 1)).kind == ValueKind::Integer);
        // Shape checks happen later; the schema alone decides the kind
        assert(classify(d, yyjson_arr_get(arr, 2)).kind == ValueKind::Integer);
        assert(classify(schema::describe<int>(), yyjson_arr_get(arr, 0)).kind == ValueKind::Integer);
    }
}

int main() {
    shape_tests();
    descriptor_tests();
    classifier_tests();
    std::cout << "schema tests passed\n";
    return 0;
}

#include <cassert>
#include <deque>
#include <iostream>

#include "../test_model.hpp"
#include "../test_helpers.hpp"

using namespace JsonWeave;
using namespace TestHelpers;
using namespace jsonweave_test_models;
using namespace std::chrono;

void record_tests() {
    Item item;
    assert(UnmarshalSucceeds(item, R"({
        "intKey": 1, "floatKey": 2, "strKey": "one",
        "datetimeKey": "2020-06-22T08:55:05.5+01:00", "dateKey": "2020-06-22", "enumKey": "MEDIUM",
        "optionalIntKey": null, "optionalStrKey": "x", "optionalEnumKey": "LARGE"
    })"));
    assert(item.int_key == 1);
    assert(item.float_key == 2.0);
    assert(item.str_key.get() == "one");
    assert(item.datetime_key.get() == DateTime(2020y / June / 22, hours{8}, minutes{55}, seconds{5},
                                               microseconds{500000}, minutes{60}));
    assert(item.date_key.get() == 2020y / June / 22);
    assert(item.enum_key.get() == Size::Medium);
    assert(!item.optional_int_key.get());
    assert(item.optional_str_key.get() == "x");
    assert(item.optional_enum_key.get() == Size::Large);
}

void missing_optional_tests() {
    // Absent optional keys become empty values
    Item item;
    item.optional_int_key = 5;
    assert(UnmarshalSucceeds(item, R"({
        "intKey": 1, "floatKey": 2.5, "strKey": "one",
        "datetimeKey": "2020-06-22T08:55:05", "dateKey": "2020-06-22", "enumKey": "SMALL"
    })"));
    assert(!item.optional_int_key.get());
    assert(!item.optional_str_key.get());
    assert(!item.optional_enum_key.get());
    assert(!item.datetime_key.get().isAware());

    Sparse s;
    assert(UnmarshalSucceeds(s, R"({"id": 3})"));
    assert(s.id == 3);
    assert(!s.nickname.get() && !s.note.get());
    assert(std::holds_alternative<std::monostate>(s.score.get()));

    assert(UnmarshalSucceeds(s, R"({"id": 3, "score": 9, "nickname": null})"));
    assert(std::get<int>(s.score.get()) == 9);
    assert(!s.nickname.get());
}

void optional_null_scenario() {
    OptionalValue v;
    v.value = 1;
    assert(UnmarshalSucceeds(v, R"({"value": null})"));
    assert(!v.value);
    assert(MarshalsTo(v, R"({"value":null})"));
}

void unknown_keys_tests() {
    Identified id;
    assert(UnmarshalSucceeds(id, R"({"extra": [1, 2, {"deep": true}], "id": "12345678-1234-5678-1234-567812345678", "more": null})"));
    assert(id.id.toString() == "12345678-1234-5678-1234-567812345678");
}

void uuid_and_timestamp_scenarios() {
    Identified id;
    assert(UnmarshalFailsWith(id, R"({"id": "not-a-uuid"})", UnmarshalError::INVALID_IDENTIFIER, "id"));
    assert(UnmarshalMessageMentions(id, R"({"id": "not-a-uuid"})", "not-a-uuid", "Uuid"));
    assert(UnmarshalFailsWith(id, R"({"id": 12})", UnmarshalError::INVALID_IDENTIFIER, "id"));

    Timed t;
    assert(UnmarshalSucceeds(t, R"({"when": "2020-06-22T08:55:05Z"})"));
    assert(t.when == DateTime(2020y / June / 22, hours{8}, minutes{55}, seconds{5}, microseconds{0}, minutes{0}));
    assert(MarshalsTo(t, R"({"when":"2020-06-22T08:55:05+00:00"})"));

    assert(UnmarshalFailsWith(t, R"({"when": "22/06/2020"})", UnmarshalError::INVALID_TIMESTAMP, "when"));
    assert(UnmarshalFailsWith(t, R"({"when": 1592816105})", UnmarshalError::INVALID_TIMESTAMP, "when"));

    Dated d;
    assert(UnmarshalSucceeds(d, R"({"day": "2024-02-29"})"));
    assert(d.day == 2024y / February / 29);
    assert(UnmarshalFailsWith(d, R"({"day": "2023-02-29"})", UnmarshalError::INVALID_DATE, "day"));
}

void enum_tests() {
    Ticket t;
    assert(UnmarshalSucceeds(t, R"({"title": "t", "priority": 5})"));
    assert(t.priority == Priority::High);
    assert(UnmarshalFailsWith(t, R"({"title": "t", "priority": 3})", UnmarshalError::INVALID_ENUM_VALUE, "priority"));
    assert(UnmarshalFailsWith(t, R"({"title": "t", "priority": "HIGH"})", UnmarshalError::INVALID_ENUM_VALUE, "priority"));

    Size s = Size::Small;
    assert(UnmarshalSucceeds(s, R"("LARGE")"));
    assert(s == Size::Large);
    assert(UnmarshalFailsWith(s, R"("large")", UnmarshalError::INVALID_ENUM_VALUE, ""));
    assert(UnmarshalMessageMentions(s, R"("HUGE")", "HUGE", "Size"));
}

void number_tests() {
    Bounded b;
    assert(UnmarshalSucceeds(b, R"({"small": -128, "medium": 65535, "ratio": 0.5})"));
    assert(b.small == -128 && b.medium == 65535 && b.ratio == 0.5f);
    assert(UnmarshalSucceeds(b, R"({"small": 1, "medium": 2, "ratio": 3})"));
    assert(b.ratio == 3.0f);

    assert(UnmarshalFailsWith(b, R"({"small": 128, "medium": 0, "ratio": 0})", UnmarshalError::NUMBER_OUT_OF_RANGE, "small"));
    assert(UnmarshalFailsWith(b, R"({"small": 0, "medium": -1, "ratio": 0})", UnmarshalError::NUMBER_OUT_OF_RANGE, "medium"));
    assert(UnmarshalFailsWith(b, R"({"small": 0, "medium": 1, "ratio": 1e300})", UnmarshalError::NUMBER_OUT_OF_RANGE, "ratio"));
    assert(UnmarshalFailsWith(b, R"({"small": 1.5, "medium": 1, "ratio": 0})", UnmarshalError::SCHEMA_MISMATCH, "small"));
    assert(UnmarshalFailsWith(b, R"({"small": "1", "medium": 1, "ratio": 0})", UnmarshalError::SCHEMA_MISMATCH, "small"));
    assert(UnmarshalFailsWith(b, R"({"small": 1, "medium": 1, "ratio": true})", UnmarshalError::SCHEMA_MISMATCH, "ratio"));

    std::uint64_t big = 0;
    assert(UnmarshalSucceeds(big, "18446744073709551615"));
    assert(big == 18446744073709551615ull);
    std::int64_t neg = 0;
    assert(UnmarshalFailsWith(neg, "18446744073709551615", UnmarshalError::NUMBER_OUT_OF_RANGE, ""));
}

void root_value_tests() {
    int i = 0;
    assert(UnmarshalSucceeds(i, "42") && i == 42);
    bool flag = false;
    assert(UnmarshalSucceeds(flag, "true") && flag);
    assert(UnmarshalFailsWith(flag, "1", UnmarshalError::SCHEMA_MISMATCH, ""));
    std::string s;
    assert(UnmarshalSucceeds(s, R"("text")") && s == "text");
    std::optional<std::string> maybe = "keep";
    assert(UnmarshalSucceeds(maybe, "null") && !maybe);
    assert(UnmarshalSucceeds(maybe, R"("back")") && maybe == "back");
    std::monostate nothing;
    assert(UnmarshalSucceeds(nothing, "null"));
    assert(UnmarshalFailsWith(nothing, "0", UnmarshalError::SCHEMA_MISMATCH, ""));
    std::optional<Event> event;
    assert(UnmarshalSucceeds(event, R"({"name": "e", "at": "2021-03-03T12:00:00"})"));
    assert(event && event->name == "e");
    std::vector<std::optional<int>> xs;
    assert(UnmarshalSucceeds(xs, "[1, null, 3]"));
    assert(xs.size() == 3 && xs[0] == 1 && !xs[1] && xs[2] == 3);
}

void sequence_order_tests() {
    std::vector<std::string> v{"stale"};
    assert(UnmarshalSucceeds(v, "[]") && v.empty());
    assert(UnmarshalSucceeds(v, R"(["only"])") && v == std::vector<std::string>{"only"});
    assert(UnmarshalSucceeds(v, R"(["e", "d", "c", "b", "a"])"));
    assert((v == std::vector<std::string>{"e", "d", "c", "b", "a"}));

    std::deque<Event> events;
    assert(UnmarshalSucceeds(events, R"([
        {"name": "3", "at": "2021-03-03T00:00:00"},
        {"name": "1", "at": "2021-03-01T00:00:00"},
        {"name": "2", "at": "2021-03-02T00:00:00"}
    ])"));
    assert(events.size() == 3);
    assert(events[0].name == "3" && events[1].name == "1" && events[2].name == "2");
    assert(events[1].at.get().date() == 2021y / March / 1);
}

void mapping_tests() {
    Counters c;
    assert(UnmarshalSucceeds(c, R"({
        "totals": {"z": 26, "a": 1},
        "history": {"h": [{"name": "e", "at": "2021-03-03T12:00:00Z"}], "empty": []},
        "deadlines": {"soon": "2020-01-01", "never": null}
    })"));
    assert(c.totals.size() == 2 && c.totals["z"] == 26 && c.totals["a"] == 1);
    assert(c.history["h"].size() == 1 && c.history["h"][0].name == "e");
    assert(c.history["empty"].empty());
    assert(c.deadlines["soon"] == Date{2020y / January / 1});
    assert(c.deadlines.contains("never") && !c.deadlines["never"]);

    assert(UnmarshalFailsWith(c, R"({"totals": [], "history": {}, "deadlines": {}})",
                              UnmarshalError::SCHEMA_MISMATCH, "totals"));
    assert(UnmarshalFailsWith(c, R"({"totals": {"a": "1"}, "history": {}, "deadlines": {}})",
                              UnmarshalError::SCHEMA_MISMATCH, "totals.a"));
}

void struct_meta_and_options_tests() {
    Geometry g;
    assert(UnmarshalSucceeds(g, R"({"points": [{"X": 1, "Y": 2.5, "tag": "a"}, {"X": -1, "Y": 0}]})"));
    assert(g.points.size() == 2);
    assert(g.points[0].x == 1.0 && g.points[0].y == 2.5 && g.points[0].tag == "a");
    assert(g.points[1].x == -1.0 && !g.points[1].tag);
    assert(UnmarshalFailsWith(g, R"({"points": [{"x": 1, "y": 2}]})", UnmarshalError::MISSING_KEY, "points.0"));

    Settings s;
    s.cached_hash = 77;
    assert(UnmarshalSucceeds(s, R"({"name": "n", "level": 200, "cached_hash": 1})"));
    assert(s.name == "n" && s.level == 200);
    assert(s.cached_hash == 0 && "not_json members keep their default");
    assert(UnmarshalFailsWith(s, R"({"name": "n", "level": 256})", UnmarshalError::NUMBER_OUT_OF_RANGE, "level"));
}

void recursive_tests() {
    Node root;
    assert(UnmarshalSucceeds(root, R"({"label": "r", "children": [
        {"label": "a", "children": []},
        {"label": "b", "children": [{"label": "c", "children": []}]}
    ]})"));
    assert(root.children.size() == 2);
    assert(root.children.back().children.front().label == "c");
}

void format_option_tests() {
    FormatOptions opts;
    opts.datetime_format = "%d/%m/%Y %H:%M";
    opts.date_format = "%d.%m.%Y";

    Timed t;
    assert(UnmarshalSucceeds(t, R"({"when": "22/06/2020 08:55"})", opts));
    assert(t.when == DateTime(2020y / June / 22, hours{8}, minutes{55}, seconds{0}));
    assert(UnmarshalFailsWith(t, R"({"when": "2020-06-22T08:55:00"})", UnmarshalError::INVALID_TIMESTAMP, "when", opts));

    Dated d;
    assert(UnmarshalSucceeds(d, R"({"day": "22.06.2020"})", opts));
    assert(d.day == 2020y / June / 22);
    assert(UnmarshalFailsWith(d, R"({"day": "2020-06-22"})", UnmarshalError::INVALID_DATE, "day", opts));
}

void unsupported_schema_tests() {
    WithUnion u;
    auto res = UnmarshalFromString(u, R"({"either": 1})");
    assert(!res);
    assert(res.error() == UnmarshalError::SCHEMA_ERROR);
    assert(res.schemaError() == SchemaError::unsupported_union);
    assert(res.errorPath() == "either");

    WithChar c;
    res = UnmarshalFromString(c, R"({"initial": "x"})");
    assert(res.error() == UnmarshalError::SCHEMA_ERROR);
    assert(res.schemaError() == SchemaError::unsupported_type);
    assert(Contains(res.message(), "char"));

    WithFixedArray a;
    res = UnmarshalFromString(a, R"({"values": [1, 2, 3]})");
    assert(res.error() == UnmarshalError::SCHEMA_ERROR);
    assert(res.schemaError() == SchemaError::unsupported_type);
    assert(res.errorPath() == "values");
}

void reader_tests() {
    Item item;
    auto res = UnmarshalFromString(item, R"({"intKey": 1,)");
    assert(!res);
    assert(res.error() == UnmarshalError::READER_ERROR);
    assert(Contains(res.message(), "Malformed JSON"));

    int i = 0;
    assert(Unmarshal(i, nullptr).error() == UnmarshalError::READER_ERROR);
}

void yyjson_tree_tests() {
    constexpr std::string_view text = R"({"people": [{"fullName": "ann", "events": []}]})";
    Document doc(yyjson_read(text.data(), text.size(), 0));
    assert(doc);
    Response r;
    assert(Unmarshal(r, yyjson_doc_get_root(doc.get())));
    assert(r.people.size() == 1 && r.people[0].full_name.get() == "ann");

    // The input tree is untouched and can be read again
    Response again;
    assert(Unmarshal(again, yyjson_doc_get_root(doc.get())));
    assert(again.people.size() == 1);
    assert(yyjson_obj_size(yyjson_doc_get_root(doc.get())) == 1);
}

int main() {
    record_tests();
    missing_optional_tests();
    optional_null_scenario();
    unknown_keys_tests();
    uuid_and_timestamp_scenarios();
    enum_tests();
    number_tests();
    root_value_tests();
    sequence_order_tests();
    mapping_tests();
    struct_meta_and_options_tests();
    recursive_tests();
    format_option_tests();
    unsupported_schema_tests();
    reader_tests();
    yyjson_tree_tests();
    std::cout << "unmarshal tests passed\n";
    return 0;
}

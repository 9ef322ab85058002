// Types that cannot carry Annotated members are described from outside
#include <JsonWeave/JsonWeave.hpp>
using JsonWeave::StructMeta, JsonWeave::StructFields, JsonWeave::Field;
using JsonWeave::options::key, JsonWeave::options::omit_empty;
#include <iostream>
#include <format>
using std::cout;
using std::endl;
using std::format;

struct Vec {
    float x = 1, y = 2, z = 3;
    std::optional<std::string> label;
};

template<> struct JsonWeave::StructMeta<Vec> {
    using Fields = StructFields<
        Field<&Vec::x, "x", key<"X">>,
        Field<&Vec::y, "y", key<"Y">>,
        Field<&Vec::z, "z", key<"Z">>,
        Field<&Vec::label, "label", omit_empty>
    >;
};

int main() {
    std::string out;
    auto written = JsonWeave::MarshalToString(std::vector<Vec>{Vec{}, Vec{4, 5, 6, "top"}}, out);
    if(!written) {
        cout << JsonWeave::ResultToString(written) << endl;
        return 1;
    }
    cout << out << endl;
    /* [{"X":1.0,"Y":2.0,"Z":3.0},{"X":4.0,"Y":5.0,"Z":6.0,"label":"top"}] */
    std::vector<Vec> v;
    auto res = JsonWeave::UnmarshalFromString(v, out);
    if(!res) {
        cout << JsonWeave::ResultToString(res) << endl;
        return 1;
    }
    cout << format("v[1]: ({}, {}, {}) {}", v[1].x, v[1].y, v[1].z, v[1].label.value_or("-")) << endl;
    /* v[1]: (4, 5, 6) top */
}

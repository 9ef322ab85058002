#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace JsonWeave {
namespace path {

struct PathElement {
    static constexpr std::size_t NotAnIndex = std::numeric_limits<std::size_t>::max();

    std::size_t array_index = NotAnIndex;   // sequences
    std::string field_name;                 // external key for records, entry key for mappings

    PathElement() = default;
    explicit PathElement(std::size_t index)
        : array_index(index)
    {}
    explicit PathElement(std::string_view key)
        : field_name(key)
    {}

    bool isIndex() const {
        return array_index != NotAnIndex;
    }
};

// Location of a node relative to the root, rendered as items.2.date_key
class Path {
    std::vector<PathElement> m_elements;

public:
    Path() = default;

    void push_child(PathElement el) {
        m_elements.push_back(std::move(el));
    }
    void pop() {
        m_elements.pop_back();
    }

    std::size_t length() const {
        return m_elements.size();
    }
    bool empty() const {
        return m_elements.empty();
    }
    const PathElement& operator[](std::size_t i) const {
        return m_elements[i];
    }

    std::string toString() const {
        std::string out;
        for(std::size_t i = 0; i < m_elements.size(); i ++) {
            if(i != 0) out += '.';
            const PathElement& el = m_elements[i];
            if(el.isIndex()) {
                out += std::to_string(el.array_index);
            } else {
                out += el.field_name;
            }
        }
        return out;
    }

    // Root is spelled out so messages never show an empty location
    std::string toDisplayString() const {
        return m_elements.empty() ? std::string("<root>") : toString();
    }
};

} // namespace path
} // namespace JsonWeave

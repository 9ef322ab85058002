#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace JsonWeave {

class Uuid {
public:
    using bytes_type = std::array<std::uint8_t, 16>;

    constexpr Uuid() = default;
    constexpr explicit Uuid(const bytes_type& bytes) : m_bytes(bytes) {}

    // Accepts 32 hex digits, optionally hyphenated, in braces or with a urn:uuid: prefix
    static constexpr std::optional<Uuid> parse(std::string_view s) {
        constexpr std::string_view urn = "urn:uuid:";
        if(s.size() >= urn.size() && s.substr(0, urn.size()) == urn) {
            s.remove_prefix(urn.size());
        }
        if(!s.empty() && s.front() == '{') {
            if(s.back() != '}') return std::nullopt;
            s = s.substr(1, s.size() - 2);
        }

        bytes_type bytes{};
        std::size_t digits = 0;
        for(char c : s) {
            if(c == '-') continue;
            int v = hexValue(c);
            if(v < 0 || digits >= 32) return std::nullopt;
            bytes[digits / 2] = static_cast<std::uint8_t>(bytes[digits / 2] | (digits % 2 == 0 ? v << 4 : v));
            digits ++;
        }
        if(digits != 32) return std::nullopt;
        return Uuid(bytes);
    }

    // Canonical lowercase 8-4-4-4-12 form
    std::string toString() const {
        constexpr char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for(std::size_t i = 0; i < m_bytes.size(); i ++) {
            if(i == 4 || i == 6 || i == 8 || i == 10) out += '-';
            out += hex[m_bytes[i] >> 4];
            out += hex[m_bytes[i] & 0x0f];
        }
        return out;
    }

    constexpr const bytes_type& bytes() const { return m_bytes; }

    constexpr bool isNil() const {
        for(auto b : m_bytes) {
            if(b != 0) return false;
        }
        return true;
    }

    friend constexpr bool operator==(const Uuid&, const Uuid&) = default;

private:
    static constexpr int hexValue(char c) {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    bytes_type m_bytes{};
};

} // namespace JsonWeave

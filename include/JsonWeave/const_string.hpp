#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace JsonWeave {

// Compile-time string usable as a non-type template parameter: key<"name">, EnumValue<E::x, "X">
template <typename CharT, std::size_t N> struct ConstString
{
    // External keys and enum values end up verbatim in JSON output
    constexpr bool check() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(std::uint8_t(m_data[i]) < 32 || m_data[i] == '"' || m_data[i] == '\\') return false;
        }
        return true;
    }
    constexpr bool empty() const {
        return N == 0;
    }
    constexpr ConstString(const CharT (&foo)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = foo[i];
        }
    }
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;
    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

} // namespace JsonWeave

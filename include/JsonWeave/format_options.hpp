#pragma once

#include <optional>
#include <string>

namespace JsonWeave {

// Per-call options shared by Marshal and Unmarshal.
// Patterns follow strftime/strptime; an absent pattern means ISO-8601.
struct FormatOptions {
    std::optional<std::string> datetime_format;
    std::optional<std::string> date_format;
};

} // namespace JsonWeave

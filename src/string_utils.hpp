#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace specvis::detail {

/// Lowercases a name and drops '-', '_' and spaces so "Led-Meter", "led_meter"
/// and "ledmeter" compare equal.
inline std::string normalize_token(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        if (c == '-' || c == '_' || c == ' ') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

}  // namespace specvis::detail

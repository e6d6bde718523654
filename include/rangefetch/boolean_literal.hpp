#pragma once

#include <optional>
#include <string_view>

namespace rangefetch {

// Accepts (case-insensitive, surrounding whitespace ignored)
//   true:  "true", "t", "yes", "y", "1", "succeeded", "succeed", "enabled", "on"
//   false: "false", "f", "no", "n", "0", "-1", "failed", "fail", "disabled", "off"
[[nodiscard]] std::optional<bool> parseBooleanLiteral(std::string_view text);

[[nodiscard]] inline bool isBooleanLiteral(std::string_view text) {
    return parseBooleanLiteral(text).has_value();
}

} // namespace rangefetch

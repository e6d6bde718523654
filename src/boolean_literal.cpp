#include "rangefetch/boolean_literal.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace rangefetch {

namespace {

constexpr std::array<std::string_view, 9> kTrueLiterals{
    "true", "t", "yes", "y", "1", "succeeded", "succeed", "enabled", "on"};
constexpr std::array<std::string_view, 10> kFalseLiterals{
    "false", "f", "no", "n", "0", "-1", "failed", "fail", "disabled", "off"};

template <typename Literals>
bool contains(const Literals& literals, std::string_view value) {
    return std::find(literals.begin(), literals.end(), value) != literals.end();
}

} // namespace

std::optional<bool> parseBooleanLiteral(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }

    std::string value{text};
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (contains(kTrueLiterals, value)) {
        return true;
    }
    if (contains(kFalseLiterals, value)) {
        return false;
    }
    return std::nullopt;
}

} // namespace rangefetch

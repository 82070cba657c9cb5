#pragma once

#include <string>
#include <string_view>

namespace sift::common {

// ASCII whitespace as understood by line trimming: space, \t, \n, \v, \f, \r
[[nodiscard]] inline constexpr bool is_space(char c) noexcept {
    return c == ' ' || (c >= '\t' && c <= '\r');
}

/**
 * Trim helpers for std::string_view (no allocation).
 */
[[nodiscard]] inline std::string_view ltrim(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size() && is_space(s[i]))
        ++i;
    return s.substr(i);
}

[[nodiscard]] inline std::string_view rtrim(std::string_view s) noexcept {
    size_t i = s.size();
    while (i > 0 && is_space(s[i - 1]))
        --i;
    return s.substr(0, i);
}

[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    return rtrim(ltrim(s));
}

/**
 * Returns true if the pattern contains any glob wildcard metacharacters.
 */
[[nodiscard]] inline constexpr bool has_wildcards(std::string_view pattern) noexcept {
    for (char c : pattern) {
        if (c == '*' || c == '?')
            return true;
    }
    return false;
}

/**
 * True when `name` ends with `suffix`. Empty suffix always matches.
 */
[[nodiscard]] inline constexpr bool ends_with(std::string_view name,
                                              std::string_view suffix) noexcept {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace sift::common

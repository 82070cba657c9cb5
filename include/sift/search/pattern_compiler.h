#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <boost/regex.hpp>

#include <sift/core/types.h>

namespace sift::search {

// How a translated glob is applied to a file name.
//  - Prefix: the regex must match at the start of the name but may stop early, so
//    "*.py" also accepts "main.py.bak".
//  - Full: the regex must consume the whole name.
enum class GlobAnchor { Prefix, Full };

using NamePredicate = std::function<bool(std::string_view)>;

// Patterns use Perl syntax and compile to boost::wregex. They always run over decoded
// text, one wchar_t per code point, so '.' consumes a whole character. '^' and '$' anchor
// to the whole subject and '.' does not match a newline.

/**
 * Translate a shell glob into a regex. Regex metacharacters are escaped before the
 * wildcards are expanded: '*' -> ".*", '?' -> ".".
 */
std::string globToRegex(std::string_view glob);

// Compile a user regex into an unanchored file-name predicate (regex_search semantics).
Result<NamePredicate> compileNamePattern(const std::string& pattern);

// Compile a glob into a file-name predicate using the given anchoring policy.
Result<NamePredicate> compileGlob(const std::string& glob, GlobAnchor anchor = GlobAnchor::Prefix);

// Compile a regex applied to decoded file content (single lines or whole files).
Result<boost::wregex> compileContentPattern(const std::string& pattern);

std::optional<GlobAnchor> parseGlobAnchor(std::string_view value);
const char* globAnchorName(GlobAnchor anchor) noexcept;

} // namespace sift::search

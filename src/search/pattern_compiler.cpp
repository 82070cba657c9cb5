#include <sift/common/pattern_utils.h>
#include <sift/common/utf8_utils.h>
#include <sift/search/pattern_compiler.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace sift::search {

namespace {

// Regex metacharacters other than the glob wildcards
static constexpr std::string_view kRegexSpecialChars = "\\^$.|+()[]{}";

const auto toLower = [](unsigned char c) noexcept {
    return static_cast<char>(std::tolower(c));
};

Result<boost::wregex> compileWide(const std::string& pattern) {
    try {
        return boost::wregex(common::decodeUtf8(pattern),
                             boost::regex::perl | boost::regex::no_mod_m | boost::regex::no_mod_s);
    } catch (const boost::regex_error& e) {
        spdlog::debug("[PatternCompiler] rejected pattern '{}': {}", pattern, e.what());
        return Error{ErrorCode::InvalidPattern,
                     "Failed to compile pattern '" + pattern + "': " + e.what()};
    }
}

Result<std::shared_ptr<const boost::wregex>> compileShared(const std::string& pattern) {
    auto re = compileWide(pattern);
    if (!re)
        return re.error();
    return std::make_shared<const boost::wregex>(std::move(re).value());
}

} // namespace

std::string globToRegex(std::string_view glob) {
    std::string escaped;
    escaped.reserve(glob.size() * 2);
    for (char c : glob) {
        if (kRegexSpecialChars.find(c) != std::string_view::npos) {
            escaped += '\\';
        }
        escaped += c;
    }

    std::string out;
    out.reserve(escaped.size() + 8);
    for (char c : escaped) {
        if (c == '*') {
            out += ".*";
        } else if (c == '?') {
            out += '.';
        } else {
            out += c;
        }
    }
    return out;
}

Result<NamePredicate> compileNamePattern(const std::string& pattern) {
    auto re = compileShared(pattern);
    if (!re)
        return re.error();
    auto shared = std::move(re).value();
    return NamePredicate{[shared](std::string_view name) {
        const std::wstring wide = common::decodeUtf8(name);
        return boost::regex_search(wide.begin(), wide.end(), *shared);
    }};
}

Result<NamePredicate> compileGlob(const std::string& glob, GlobAnchor anchor) {
    if (glob == "*") {
        return NamePredicate{[](std::string_view) { return true; }};
    }
    if (anchor == GlobAnchor::Full && !common::has_wildcards(glob)) {
        return NamePredicate{[glob](std::string_view name) { return name == glob; }};
    }

    const std::string translated = globToRegex(glob);
    spdlog::debug("[PatternCompiler] glob '{}' -> regex '{}' ({})", glob, translated,
                  globAnchorName(anchor));
    auto re = compileShared(translated);
    if (!re)
        return re.error();
    auto shared = std::move(re).value();
    if (anchor == GlobAnchor::Full) {
        return NamePredicate{[shared](std::string_view name) {
            const std::wstring wide = common::decodeUtf8(name);
            return boost::regex_match(wide.begin(), wide.end(), *shared);
        }};
    }
    return NamePredicate{[shared](std::string_view name) {
        const std::wstring wide = common::decodeUtf8(name);
        return boost::regex_search(wide.begin(), wide.end(), *shared, boost::match_continuous);
    }};
}

Result<boost::wregex> compileContentPattern(const std::string& pattern) {
    return compileWide(pattern);
}

std::optional<GlobAnchor> parseGlobAnchor(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), toLower);
    if (lower == "prefix")
        return GlobAnchor::Prefix;
    if (lower == "full")
        return GlobAnchor::Full;
    return std::nullopt;
}

const char* globAnchorName(GlobAnchor anchor) noexcept {
    switch (anchor) {
        case GlobAnchor::Prefix: return "prefix";
        case GlobAnchor::Full: return "full";
    }
    return "prefix";
}

} // namespace sift::search

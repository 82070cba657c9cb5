#pragma once

#include <optional>
#include <string>
#include <variant>

namespace sift::search {

// Match file names against a regex
struct SearchFilesRequest {
    std::string path{"."};
    std::string pattern;
    bool recursive{true};
};

// Line-by-line content search with a context window
struct SearchContentRequest {
    std::string path{"."};
    std::string text;
    std::string filePattern{"*"};
    std::optional<int> contextLines; // unset: engine default
};

// Whole-file regex search reporting offsets and capture groups
struct FindPatternRequest {
    std::string path{"."};
    std::string pattern;
    std::string filePattern{"*"};
};

// File name suffix filter
struct SearchByExtensionRequest {
    std::string path{"."};
    std::string extension;
};

using SearchRequest = std::variant<SearchFilesRequest, SearchContentRequest, FindPatternRequest,
                                   SearchByExtensionRequest>;

} // namespace sift::search

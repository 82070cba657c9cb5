#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sift::search {

// A file whose name matched (search_files, search_by_extension)
struct PathMatch {
    std::string file;
};

// One matching line with its surrounding context window (search_content)
struct LineMatch {
    std::string file;
    std::size_t lineNumber{0}; // 1-based
    std::string content;       // trimmed matching line
    std::string context;       // window joined with '\n', trimmed
};

// One whole-file regex match (find_pattern). Offsets count Unicode code points of the
// decoded, newline-normalized text.
struct SpanMatch {
    std::string file;
    std::size_t start{0};
    std::size_t end{0};
    std::string match;
    std::vector<std::optional<std::string>> groups; // nullopt: group did not participate
};

using MatchRecord = std::variant<PathMatch, LineMatch, SpanMatch>;

// Path of the file a record was produced from
inline const std::string& recordFile(const MatchRecord& record) {
    return std::visit([](const auto& r) -> const std::string& { return r.file; }, record);
}

// A candidate that produced no records because it could not be read
struct SkippedFile {
    std::string file;
    std::string reason;
};

struct SearchResult {
    std::vector<MatchRecord> matches; // completion order across files
    std::vector<SkippedFile> skipped;
    std::size_t filesScanned{0};
};

} // namespace sift::search

#include <sift/common/pattern_utils.h>
#include <sift/common/utf8_utils.h>
#include <sift/search/pattern_compiler.h>
#include <sift/search/search_engine.h>
#include <sift/search/tree_walker.h>
#include <sift/search/worker_pool.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sift::search {

namespace fs = std::filesystem;

namespace {

// Python-style universal newlines: "\r\n" and lone "\r" become "\n".
std::string normalizeNewlines(std::string text) {
    if (text.find('\r') == std::string::npos)
        return text;
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Length in bytes of the longest line, terminators excluded.
std::size_t longestLine(std::string_view text) {
    std::size_t longest = 0;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto nl = text.find('\n', start);
        auto end = nl == std::string_view::npos ? text.size() : nl;
        longest = std::max(longest, end - start);
        if (nl == std::string_view::npos)
            break;
        start = nl + 1;
    }
    return longest;
}

// Read a whole file as UTF-8 text. Every failure here becomes a per-file skip.
Result<std::string> readText(const fs::path& file, const SearchEngineConfig& limits) {
    std::error_code ec;
    if (limits.maxFileBytes > 0) {
        auto size = fs::file_size(file, ec);
        if (!ec && size > limits.maxFileBytes) {
            return Error{ErrorCode::IoError, "file exceeds max_file_bytes (" +
                                                 std::to_string(size) + " bytes)"};
        }
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot open file"};
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "read failed"};
    }
    if (!common::isValidUtf8(data)) {
        return Error{ErrorCode::DecodeError, "invalid UTF-8"};
    }
    auto text = normalizeNewlines(std::move(data));
    if (limits.maxLineBytes > 0) {
        if (auto longest = longestLine(text); longest > limits.maxLineBytes) {
            return Error{ErrorCode::IoError, "line exceeds max_line_bytes (" +
                                                 std::to_string(longest) + " bytes)"};
        }
    }
    return text;
}

// Lines without terminators; a trailing newline does not start an extra line.
std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string joinWindow(const std::vector<std::string_view>& lines, std::size_t first,
                       std::size_t last) {
    std::string out;
    for (std::size_t i = first; i < last; ++i) {
        if (i > first)
            out.push_back('\n');
        out.append(lines[i]);
    }
    return std::string(common::trim(out));
}

std::vector<MatchRecord> scanLines(const std::string& file, const std::string& text,
                                   const boost::wregex& re, std::size_t contextLines) {
    std::vector<MatchRecord> out;
    auto lines = splitLines(text);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        const std::wstring wide = common::decodeUtf8(line);
        if (!boost::regex_search(wide, re))
            continue;
        std::size_t first = i >= contextLines ? i - contextLines : 0;
        std::size_t last = std::min(lines.size(), i + contextLines + 1);

        LineMatch m;
        m.file = file;
        m.lineNumber = i + 1;
        m.content = std::string(common::trim(line));
        m.context = joinWindow(lines, first, last);
        out.emplace_back(std::move(m));
    }
    return out;
}

// Offsets index the decoded text, so they count code points.
std::vector<MatchRecord> scanSpans(const std::string& file, const std::string& text,
                                   const boost::wregex& re) {
    std::vector<MatchRecord> out;
    const std::wstring wide = common::decodeUtf8(text);
    for (boost::wsregex_iterator it(wide.begin(), wide.end(), re), end; it != end; ++it) {
        const auto& m = *it;

        SpanMatch span;
        span.file = file;
        span.start = static_cast<std::size_t>(m.position(std::size_t{0}));
        span.end = span.start + static_cast<std::size_t>(m.length(0));
        span.match = common::encodeUtf8(m.str(0));
        span.groups.reserve(m.size() > 0 ? m.size() - 1 : 0);
        for (std::size_t g = 1; g < m.size(); ++g) {
            if (m[g].matched)
                span.groups.emplace_back(common::encodeUtf8(m.str(g)));
            else
                span.groups.emplace_back(std::nullopt);
        }
        out.emplace_back(std::move(span));
    }
    return out;
}

Result<SearchResult> runPool(TreeWalker walker, std::size_t workers, const FileTask& task) {
    BatchResult batch;
    {
        WorkerPool pool(workers);
        batch = pool.runAll([&walker]() { return walker.next(); }, task);
    }
    SearchResult result;
    result.matches = std::move(batch.records);
    result.skipped = std::move(batch.skipped);
    result.filesScanned = batch.submitted;
    return result;
}

Error missing(const char* what, const char* field) {
    return Error{ErrorCode::MissingParameter,
                 std::string(what) + ": '" + field + "' is required"};
}

long long elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - since)
        .count();
}

} // namespace

SearchEngine::SearchEngine(SearchEngineConfig config) : config_(std::move(config)) {
    config_.workers =
        std::clamp<std::size_t>(config_.workers, 1, SearchEngineConfig::kMaxWorkers);
    config_.contextLines =
        std::clamp(config_.contextLines, 0, SearchEngineConfig::kMaxContextLines);
}

Result<SearchResult> SearchEngine::searchFiles(const SearchFilesRequest& req) const {
    if (req.pattern.empty())
        return missing("No search pattern specified", "pattern");

    auto predicate = compileNamePattern(req.pattern);
    if (!predicate)
        return predicate.error();

    auto started = std::chrono::steady_clock::now();
    auto walker = TreeWalker::open(req.path, req.recursive, std::move(predicate).value());
    if (!walker)
        return walker.error();

    SearchResult result;
    while (auto file = walker.value().next()) {
        ++result.filesScanned;
        result.matches.emplace_back(PathMatch{file->string()});
    }
    spdlog::debug("[SearchEngine] search_files '{}' under '{}': {} matches in {}ms", req.pattern,
                  req.path, result.matches.size(), elapsedMs(started));
    return result;
}

Result<SearchResult> SearchEngine::searchContent(const SearchContentRequest& req) const {
    if (req.text.empty())
        return missing("No search text specified", "text");
    int contextLines = req.contextLines.value_or(config_.contextLines);
    if (contextLines < 0 || contextLines > SearchEngineConfig::kMaxContextLines)
        return Error{ErrorCode::InvalidArgument,
                     "context_lines must be between 0 and " +
                         std::to_string(SearchEngineConfig::kMaxContextLines)};

    auto fileFilter = compileGlob(req.filePattern, config_.globAnchor);
    if (!fileFilter)
        return fileFilter.error();
    auto textRegex = compileContentPattern(req.text);
    if (!textRegex)
        return textRegex.error();

    auto started = std::chrono::steady_clock::now();
    auto walker = TreeWalker::open(req.path, true, std::move(fileFilter).value());
    if (!walker)
        return walker.error();

    auto re = std::make_shared<const boost::wregex>(std::move(textRegex).value());
    const auto window = static_cast<std::size_t>(contextLines);
    FileTask task = [re, window, limits = config_](const fs::path& file) -> FileOutcome {
        auto text = readText(file, limits);
        if (!text)
            return text.error();
        return scanLines(file.string(), text.value(), *re, window);
    };

    auto result = runPool(std::move(walker).value(), config_.workers, task);
    if (result) {
        spdlog::debug("[SearchEngine] search_content '{}' under '{}': files={} matches={} "
                      "skipped={} in {}ms",
                      req.text, req.path, result.value().filesScanned,
                      result.value().matches.size(), result.value().skipped.size(),
                      elapsedMs(started));
    }
    return result;
}

Result<SearchResult> SearchEngine::findPattern(const FindPatternRequest& req) const {
    if (req.pattern.empty())
        return missing("No regex pattern specified", "pattern");

    auto patternRegex = compileContentPattern(req.pattern);
    if (!patternRegex)
        return patternRegex.error();
    auto fileFilter = compileGlob(req.filePattern, config_.globAnchor);
    if (!fileFilter)
        return fileFilter.error();

    auto started = std::chrono::steady_clock::now();
    auto walker = TreeWalker::open(req.path, true, std::move(fileFilter).value());
    if (!walker)
        return walker.error();

    auto re = std::make_shared<const boost::wregex>(std::move(patternRegex).value());
    FileTask task = [re, limits = config_](const fs::path& file) -> FileOutcome {
        auto text = readText(file, limits);
        if (!text)
            return text.error();
        return scanSpans(file.string(), text.value(), *re);
    };

    auto result = runPool(std::move(walker).value(), config_.workers, task);
    if (result) {
        spdlog::debug("[SearchEngine] find_pattern '{}' under '{}': files={} matches={} "
                      "skipped={} in {}ms",
                      req.pattern, req.path, result.value().filesScanned,
                      result.value().matches.size(), result.value().skipped.size(),
                      elapsedMs(started));
    }
    return result;
}

Result<SearchResult> SearchEngine::searchByExtension(const SearchByExtensionRequest& req) const {
    if (req.extension.empty())
        return missing("No file extension specified", "extension");

    std::string extension = req.extension;
    if (extension.front() != '.')
        extension.insert(extension.begin(), '.');

    NamePredicate bySuffix = [extension](std::string_view name) {
        return common::ends_with(name, extension);
    };
    auto walker = TreeWalker::open(req.path, true, std::move(bySuffix));
    if (!walker)
        return walker.error();

    SearchResult result;
    while (auto file = walker.value().next()) {
        ++result.filesScanned;
        result.matches.emplace_back(PathMatch{file->string()});
    }
    spdlog::debug("[SearchEngine] search_by_extension '{}' under '{}': {} matches", extension,
                  req.path, result.matches.size());
    return result;
}

Result<SearchResult> SearchEngine::run(const SearchRequest& req) const {
    return std::visit(
        [this](const auto& r) -> Result<SearchResult> {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SearchFilesRequest>) {
                return searchFiles(r);
            } else if constexpr (std::is_same_v<T, SearchContentRequest>) {
                return searchContent(r);
            } else if constexpr (std::is_same_v<T, FindPatternRequest>) {
                return findPattern(r);
            } else {
                return searchByExtension(r);
            }
        },
        req);
}

} // namespace sift::search

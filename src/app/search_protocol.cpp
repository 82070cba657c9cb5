#include <sift/app/search_protocol.h>

#include <array>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>

namespace sift::app {

namespace {

struct ActionEntry {
    std::string_view tag;
    SearchAction action;
};

constexpr std::array<ActionEntry, 4> kActions{{
    {"search_files", SearchAction::SearchFiles},
    {"search_content", SearchAction::SearchContent},
    {"find_pattern", SearchAction::FindPattern},
    {"search_by_extension", SearchAction::SearchByExtension},
}};

Error wrongType(const char* key, const char* expected) {
    return Error{ErrorCode::InvalidArgument,
                 std::string("Field '") + key + "' must be " + expected};
}

Result<std::string> readString(const json& data, const char* key, std::string fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null())
        return fallback;
    if (!it->is_string())
        return wrongType(key, "a string");
    return it->get<std::string>();
}

Result<bool> readBool(const json& data, const char* key, bool fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null())
        return fallback;
    if (!it->is_boolean())
        return wrongType(key, "a boolean");
    return it->get<bool>();
}

Result<std::optional<int>> readOptionalInt(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null())
        return std::optional<int>{};
    if (!it->is_number_integer())
        return wrongType(key, "an integer");
    bool inRange = false;
    if (it->is_number_unsigned()) {
        inRange = it->get<std::uint64_t>() <=
                  static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    } else {
        const auto v = it->get<std::int64_t>();
        inRange = v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
    }
    if (!inRange)
        return Error{ErrorCode::InvalidArgument, std::string("Field '") + key + "' is out of range"};
    return std::optional<int>{it->get<int>()};
}

} // namespace

Result<SearchAction> parseAction(std::string_view tag) {
    for (const auto& entry : kActions) {
        if (entry.tag == tag)
            return entry.action;
    }
    return Error{ErrorCode::UnsupportedAction, "Unsupported action: " + std::string(tag)};
}

const char* actionName(SearchAction action) noexcept {
    for (const auto& entry : kActions) {
        if (entry.action == action)
            return entry.tag.data();
    }
    return "unknown";
}

Result<search::SearchRequest> parseSearchRequest(SearchAction action, const json& data) {
    if (!data.is_object())
        return Error{ErrorCode::InvalidRequest, "Request 'data' must be an object"};

    auto path = readString(data, "path", ".");
    if (!path)
        return path.error();

    switch (action) {
        case SearchAction::SearchFiles: {
            auto pattern = readString(data, "pattern", "");
            if (!pattern)
                return pattern.error();
            auto recursive = readBool(data, "recursive", true);
            if (!recursive)
                return recursive.error();
            return search::SearchRequest{search::SearchFilesRequest{
                path.value(), pattern.value(), recursive.value()}};
        }
        case SearchAction::SearchContent: {
            auto text = readString(data, "text", "");
            if (!text)
                return text.error();
            auto filePattern = readString(data, "file_pattern", "*");
            if (!filePattern)
                return filePattern.error();
            auto contextLines = readOptionalInt(data, "context_lines");
            if (!contextLines)
                return contextLines.error();
            return search::SearchRequest{search::SearchContentRequest{
                path.value(), text.value(), filePattern.value(), contextLines.value()}};
        }
        case SearchAction::FindPattern: {
            auto pattern = readString(data, "pattern", "");
            if (!pattern)
                return pattern.error();
            auto filePattern = readString(data, "file_pattern", "*");
            if (!filePattern)
                return filePattern.error();
            return search::SearchRequest{search::FindPatternRequest{
                path.value(), pattern.value(), filePattern.value()}};
        }
        case SearchAction::SearchByExtension: {
            auto extension = readString(data, "extension", "");
            if (!extension)
                return extension.error();
            return search::SearchRequest{
                search::SearchByExtensionRequest{path.value(), extension.value()}};
        }
    }
    return Error{ErrorCode::UnsupportedAction, "Unsupported action"};
}

json toJson(const search::MatchRecord& record) {
    return std::visit(
        [](const auto& r) -> json {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, search::PathMatch>) {
                return r.file;
            } else if constexpr (std::is_same_v<T, search::LineMatch>) {
                return json{{"file", r.file},
                            {"line_number", r.lineNumber},
                            {"content", r.content},
                            {"context", r.context}};
            } else {
                json groups = json::array();
                for (const auto& g : r.groups) {
                    if (g)
                        groups.push_back(*g);
                    else
                        groups.push_back(nullptr);
                }
                return json{{"file", r.file},
                            {"start", r.start},
                            {"end", r.end},
                            {"match", r.match},
                            {"groups", std::move(groups)}};
            }
        },
        record);
}

json toJson(const search::SearchResult& result) {
    json matches = json::array();
    for (const auto& m : result.matches)
        matches.push_back(toJson(m));
    json skipped = json::array();
    for (const auto& s : result.skipped)
        skipped.push_back(json{{"file", s.file}, {"reason", s.reason}});
    return json{{"matches", std::move(matches)},
                {"files_scanned", result.filesScanned},
                {"skipped", std::move(skipped)}};
}

json makeSuccessResponse(json data, const std::optional<std::string>& id) {
    return json{{"success", true},
                {"data", std::move(data)},
                {"error", nullptr},
                {"error_code", nullptr},
                {"id", id ? json(*id) : json(nullptr)}};
}

json makeErrorResponse(const Error& error, const std::optional<std::string>& id) {
    return json{{"success", false},
                {"data", nullptr},
                {"error", error.message},
                {"error_code", errorKindName(error.code)},
                {"id", id ? json(*id) : json(nullptr)}};
}

} // namespace sift::app

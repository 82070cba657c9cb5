#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include <sift/core/types.h>
#include <sift/search/match_record.h>
#include <sift/search/search_request.h>

namespace sift::app {

using json = nlohmann::json;

enum class SearchAction { SearchFiles, SearchContent, FindPattern, SearchByExtension };

// Wire tag <-> action. Unknown tags yield UnsupportedAction.
Result<SearchAction> parseAction(std::string_view tag);
const char* actionName(SearchAction action) noexcept;

// Build the typed request for `action` from the request's "data" object. Absent or null
// fields take their defaults; a field of the wrong JSON type is InvalidArgument.
Result<search::SearchRequest> parseSearchRequest(SearchAction action, const json& data);

json toJson(const search::MatchRecord& record);
json toJson(const search::SearchResult& result);

// {"success", "data", "error", "error_code", "id"}
json makeSuccessResponse(json data, const std::optional<std::string>& id = std::nullopt);
json makeErrorResponse(const Error& error, const std::optional<std::string>& id = std::nullopt);

} // namespace sift::app

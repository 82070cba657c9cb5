#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include <sift/app/search_protocol.h>
#include <sift/search/search_engine.h>

namespace sift::app {

/**
 * Entry point for tagged search requests:
 *   {"action": "<tag>", "data": {...}, "id": "<optional>"}
 *
 * Every outcome, including malformed requests and exceptions raised while searching, comes
 * back in the uniform response shape. Unexpected exceptions become InternalError.
 */
class RequestDispatcher {
public:
    explicit RequestDispatcher(search::SearchEngineConfig config = {});

    json dispatch(const json& request) const;

    // Module-handler form so the dispatcher can be registered with a ModuleRouter
    json operator()(const json& request) const { return dispatch(request); }

    const search::SearchEngine& engine() const noexcept { return engine_; }

private:
    // One handler for each action
    Result<search::SearchResult> handleSearchFiles(const json& data) const;
    Result<search::SearchResult> handleSearchContent(const json& data) const;
    Result<search::SearchResult> handleFindPattern(const json& data) const;
    Result<search::SearchResult> handleSearchByExtension(const json& data) const;

    using Handler = Result<search::SearchResult> (RequestDispatcher::*)(const json&) const;
    static Handler handlerFor(SearchAction action) noexcept;

    Result<search::SearchResult> runParsed(SearchAction action, const json& data) const;

    search::SearchEngine engine_;
};

// Request id as echoed in responses; non-string ids are ignored.
std::optional<std::string> requestId(const json& request);

} // namespace sift::app

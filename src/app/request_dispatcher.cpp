#include <sift/app/request_dispatcher.h>

#include <spdlog/spdlog.h>
#include <array>
#include <chrono>
#include <exception>

namespace sift::app {

std::optional<std::string> requestId(const json& request) {
    if (!request.is_object())
        return std::nullopt;
    auto it = request.find("id");
    if (it == request.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

RequestDispatcher::RequestDispatcher(search::SearchEngineConfig config)
    : engine_(std::move(config)) {}

RequestDispatcher::Handler RequestDispatcher::handlerFor(SearchAction action) noexcept {
    static const std::array<std::pair<SearchAction, Handler>, 4> kHandlers{{
        {SearchAction::SearchFiles, &RequestDispatcher::handleSearchFiles},
        {SearchAction::SearchContent, &RequestDispatcher::handleSearchContent},
        {SearchAction::FindPattern, &RequestDispatcher::handleFindPattern},
        {SearchAction::SearchByExtension, &RequestDispatcher::handleSearchByExtension},
    }};
    for (const auto& [a, h] : kHandlers) {
        if (a == action)
            return h;
    }
    return nullptr;
}

json RequestDispatcher::dispatch(const json& request) const {
    auto id = requestId(request);
    if (!request.is_object()) {
        return makeErrorResponse(Error{ErrorCode::InvalidRequest, "Request must be a JSON object"},
                                 id);
    }

    auto actionIt = request.find("action");
    if (actionIt == request.end() || !actionIt->is_string() ||
        actionIt->get_ref<const std::string&>().empty()) {
        return makeErrorResponse(Error{ErrorCode::MissingParameter, "No action specified"}, id);
    }
    const auto& tag = actionIt->get_ref<const std::string&>();

    auto action = parseAction(tag);
    if (!action) {
        spdlog::debug("[Dispatcher] rejected action '{}'", tag);
        return makeErrorResponse(action.error(), id);
    }

    static const json kEmpty = json::object();
    auto dataIt = request.find("data");
    const json& data = (dataIt == request.end() || dataIt->is_null()) ? kEmpty : *dataIt;

    auto started = std::chrono::steady_clock::now();
    auto result = runParsed(action.value(), data);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::steady_clock::now() - started)
                  .count();
    if (!result) {
        spdlog::debug("[Dispatcher] {} failed after {}ms: {} ({})", tag, ms,
                      result.error().message, result.error().code);
        return makeErrorResponse(result.error(), id);
    }
    spdlog::debug("[Dispatcher] {} ok: {} matches in {}ms", tag, result.value().matches.size(),
                  ms);
    return makeSuccessResponse(toJson(result.value()), id);
}

Result<search::SearchResult> RequestDispatcher::runParsed(SearchAction action,
                                                          const json& data) const {
    auto handler = handlerFor(action);
    if (!handler)
        return Error{ErrorCode::UnsupportedAction,
                     std::string("Unsupported action: ") + actionName(action)};
    try {
        return (this->*handler)(data);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidRequest, std::string("Malformed request data: ") + e.what()};
    } catch (const std::exception& e) {
        spdlog::error("[Dispatcher] {} aborted: {}", actionName(action), e.what());
        return Error{ErrorCode::InternalError,
                     std::string("Search failed: ") + e.what()};
    }
}

Result<search::SearchResult> RequestDispatcher::handleSearchFiles(const json& data) const {
    auto req = parseSearchRequest(SearchAction::SearchFiles, data);
    if (!req)
        return req.error();
    return engine_.searchFiles(std::get<search::SearchFilesRequest>(req.value()));
}

Result<search::SearchResult> RequestDispatcher::handleSearchContent(const json& data) const {
    auto req = parseSearchRequest(SearchAction::SearchContent, data);
    if (!req)
        return req.error();
    return engine_.searchContent(std::get<search::SearchContentRequest>(req.value()));
}

Result<search::SearchResult> RequestDispatcher::handleFindPattern(const json& data) const {
    auto req = parseSearchRequest(SearchAction::FindPattern, data);
    if (!req)
        return req.error();
    return engine_.findPattern(std::get<search::FindPatternRequest>(req.value()));
}

Result<search::SearchResult> RequestDispatcher::handleSearchByExtension(const json& data) const {
    auto req = parseSearchRequest(SearchAction::SearchByExtension, data);
    if (!req)
        return req.error();
    return engine_.searchByExtension(std::get<search::SearchByExtensionRequest>(req.value()));
}

} // namespace sift::app

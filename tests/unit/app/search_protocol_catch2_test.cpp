// Tests for request parsing and response shaping.

#include <catch2/catch_test_macros.hpp>

#include <string>

#include <sift/app/search_protocol.h>

using namespace sift;
using namespace sift::app;

TEST_CASE("action tags round-trip", "[app][protocol][catch2]") {
    for (const char* tag :
         {"search_files", "search_content", "find_pattern", "search_by_extension"}) {
        auto action = parseAction(tag);
        REQUIRE(action);
        CHECK(std::string(actionName(action.value())) == tag);
    }
    auto bad = parseAction("Search_Files");
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::UnsupportedAction);
}

TEST_CASE("parseSearchRequest applies defaults", "[app][protocol][catch2]") {
    SECTION("search_files") {
        auto req = parseSearchRequest(SearchAction::SearchFiles, json{{"pattern", "x"}});
        REQUIRE(req);
        const auto& r = std::get<search::SearchFilesRequest>(req.value());
        CHECK(r.path == ".");
        CHECK(r.pattern == "x");
        CHECK(r.recursive);
    }

    SECTION("search_content with null fields") {
        auto req = parseSearchRequest(
            SearchAction::SearchContent,
            json{{"text", "TODO"}, {"file_pattern", nullptr}, {"context_lines", nullptr}});
        REQUIRE(req);
        const auto& r = std::get<search::SearchContentRequest>(req.value());
        CHECK(r.filePattern == "*");
        CHECK_FALSE(r.contextLines.has_value());
    }

    SECTION("find_pattern") {
        auto req = parseSearchRequest(SearchAction::FindPattern,
                                      json{{"pattern", "a+"}, {"file_pattern", "*.md"}});
        REQUIRE(req);
        const auto& r = std::get<search::FindPatternRequest>(req.value());
        CHECK(r.filePattern == "*.md");
    }

    SECTION("missing values stay empty for the engine to reject") {
        auto req = parseSearchRequest(SearchAction::SearchByExtension, json::object());
        REQUIRE(req);
        CHECK(std::get<search::SearchByExtensionRequest>(req.value()).extension.empty());
    }
}

TEST_CASE("parseSearchRequest rejects mistyped fields", "[app][protocol][errors][catch2]") {
    auto badBool = parseSearchRequest(SearchAction::SearchFiles,
                                      json{{"pattern", "x"}, {"recursive", "yes"}});
    REQUIRE_FALSE(badBool);
    CHECK(badBool.error().code == ErrorCode::InvalidArgument);
    CHECK(badBool.error().message == "Field 'recursive' must be a boolean");

    auto badPath = parseSearchRequest(SearchAction::SearchByExtension, json{{"path", 3}});
    REQUIRE_FALSE(badPath);
    CHECK(badPath.error().message == "Field 'path' must be a string");

    auto badData = parseSearchRequest(SearchAction::FindPattern, json::array());
    REQUIRE_FALSE(badData);
    CHECK(badData.error().code == ErrorCode::InvalidRequest);
}

TEST_CASE("records serialize per mode", "[app][protocol][catch2]") {
    CHECK(toJson(search::MatchRecord{search::PathMatch{"src/a.py"}}) == "src/a.py");

    auto line = toJson(search::MatchRecord{search::LineMatch{"a.py", 3, "TODO", "x\nTODO"}});
    CHECK(line == json{{"file", "a.py"}, {"line_number", 3}, {"content", "TODO"},
                       {"context", "x\nTODO"}});

    search::SpanMatch span{"b.py", 2, 5, "abc", {std::string("a"), std::nullopt}};
    auto spanJson = toJson(search::MatchRecord{span});
    CHECK(spanJson["start"] == 2);
    CHECK(spanJson["end"] == 5);
    CHECK(spanJson["groups"] == json{"a", nullptr});
}

TEST_CASE("responses carry the uniform envelope", "[app][protocol][catch2]") {
    search::SearchResult result;
    result.filesScanned = 2;
    result.skipped.push_back({"bin.dat", "invalid UTF-8"});
    auto ok = makeSuccessResponse(toJson(result), std::string("id-1"));
    CHECK(ok["success"] == true);
    CHECK(ok["error"].is_null());
    CHECK(ok["id"] == "id-1");
    CHECK(ok["data"]["matches"].empty());
    CHECK(ok["data"]["files_scanned"] == 2);
    CHECK(ok["data"]["skipped"][0]["reason"] == "invalid UTF-8");

    auto err = makeErrorResponse(Error{ErrorCode::PathNotFound, "Path not found: /x"});
    CHECK(err["success"] == false);
    CHECK(err["data"].is_null());
    CHECK(err["error"] == "Path not found: /x");
    CHECK(err["error_code"] == "PathNotFound");
    CHECK(err["id"].is_null());
}

TEST_CASE("parseSearchRequest range-checks integers", "[app][protocol][errors][catch2]") {
    auto tooBig = parseSearchRequest(SearchAction::SearchContent,
                                     json{{"text", "x"}, {"context_lines", 4294967297ULL}});
    REQUIRE_FALSE(tooBig);
    CHECK(tooBig.error().code == ErrorCode::InvalidArgument);

    auto tooSmall = parseSearchRequest(SearchAction::SearchContent,
                                       json{{"text", "x"}, {"context_lines", -4294967297LL}});
    REQUIRE_FALSE(tooSmall);
    CHECK(tooSmall.error().code == ErrorCode::InvalidArgument);

    auto fits = parseSearchRequest(SearchAction::SearchContent,
                                   json{{"text", "x"}, {"context_lines", 3}});
    REQUIRE(fits);
    CHECK(std::get<search::SearchContentRequest>(fits.value()).contextLines == 3);
}

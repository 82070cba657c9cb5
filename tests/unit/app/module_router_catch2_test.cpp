// Tests for module routing in front of the search dispatcher.

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

#include <sift/app/module_router.h>
#include <sift/app/request_dispatcher.h>

using sift::app::json;
using sift::app::ModuleRouter;
using sift::app::RequestDispatcher;

TEST_CASE("createRequest builds an envelope with a fresh id", "[app][router][catch2]") {
    auto a = ModuleRouter::createRequest("search", "search_files", {{"pattern", "x"}});
    auto b = ModuleRouter::createRequest("search", "search_files", {{"pattern", "x"}});

    CHECK(a["module"] == "search");
    CHECK(a["action"] == "search_files");
    CHECK(a["data"]["pattern"] == "x");
    REQUIRE(a["id"].is_string());
    CHECK(a["id"].get<std::string>().size() == 36);
    CHECK(a["id"] != b["id"]);
}

TEST_CASE("route forwards to the registered module", "[app][router][catch2]") {
    RequestDispatcher dispatcher;
    ModuleRouter router;
    router.registerModule("search", [&dispatcher](const json& req) { return dispatcher(req); });
    CHECK(router.hasModule("search"));
    CHECK_FALSE(router.hasModule("index"));
    CHECK(router.modules() == std::vector<std::string>{"search"});

    auto req = ModuleRouter::createRequest("search", "search_by_extension", json::object());
    auto response = router.route(req);
    CHECK(response["success"] == false);
    CHECK(response["error_code"] == "MissingParameter");
    CHECK(response["id"] == req["id"]);
}

TEST_CASE("route reports missing and unknown modules", "[app][router][errors][catch2]") {
    ModuleRouter router;

    auto noModule = router.route(json{{"action", "search_files"}, {"id", "abc"}});
    CHECK(noModule["success"] == false);
    CHECK(noModule["error"] == "No module specified");
    CHECK(noModule["id"] == "abc");

    auto unknown = router.route(json{{"module", "vector"}, {"action", "x"}});
    CHECK(unknown["success"] == false);
    CHECK(unknown["error"] == "Module vector not found");
    CHECK(unknown["error_code"] == "NotFound");
    CHECK(unknown["id"] == "unknown");

    auto notObject = router.route(json("search"));
    CHECK(notObject["success"] == false);
    CHECK(notObject["error_code"] == "InvalidRequest");
}

TEST_CASE("route turns handler exceptions into error responses",
          "[app][router][errors][catch2]") {
    ModuleRouter router;
    router.registerModule("broken",
                          [](const json&) -> json { throw std::runtime_error("handler blew up"); });

    auto response = router.route(json{{"module", "broken"}, {"id", "r1"}});
    CHECK(response["success"] == false);
    CHECK(response["error"] == "handler blew up");
    CHECK(response["error_code"] == "InternalError");
    CHECK(response["id"] == "r1");
}

TEST_CASE("registerModule replaces an existing handler", "[app][router][catch2]") {
    ModuleRouter router;
    router.registerModule("m", [](const json&) { return json{{"v", 1}}; });
    router.registerModule("m", [](const json&) { return json{{"v", 2}}; });
    CHECK(router.route(json{{"module", "m"}})["v"] == 2);
    CHECK(router.modules().size() == 1);
}

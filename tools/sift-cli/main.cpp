#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include <sift/app/module_router.h>
#include <sift/app/request_dispatcher.h>
#include <sift/app/search_protocol.h>
#include <sift/config/config_helpers.h>
#include <sift/search/search_engine.h>
#include <sift/search/search_engine_config.h>

#include <cctype>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace {

using sift::app::json;

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

// Logs go to stderr so stdout carries only JSON responses.
void configureLogging(int verbosity) {
    auto logger = spdlog::stderr_color_mt("sift");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    // Precedence: env SIFT_LOG_LEVEL > -v count > warn
    if (const char* envLvl = std::getenv("SIFT_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (verbosity >= 2)
        spdlog::set_level(spdlog::level::debug);
    else if (verbosity == 1)
        spdlog::set_level(spdlog::level::info);
    else
        spdlog::set_level(spdlog::level::warn);
}

// Invalid UTF-8 (e.g. in file names) is replaced rather than throwing from dump().
void emit(const json& response, bool pretty) {
    std::cout << response.dump(pretty ? 2 : -1, ' ', false, json::error_handler_t::replace)
              << '\n';
    std::cout.flush();
}

// Requests carrying a "module" field go through the router; bare search requests go
// straight to the search dispatcher.
json handle(const sift::app::ModuleRouter& router, const sift::app::RequestDispatcher& dispatcher,
            const json& request) {
    if (request.is_object() && request.contains("module"))
        return router.route(request);
    return dispatcher.dispatch(request);
}

json invalidJson(const std::string& what) {
    return sift::app::makeErrorResponse(
        sift::Error{sift::ErrorCode::InvalidRequest, "Invalid JSON request: " + what});
}

// One request in, one response out; nothing thrown while answering escapes.
json answer(const sift::app::ModuleRouter& router, const sift::app::RequestDispatcher& dispatcher,
            const std::string& raw) {
    try {
        return handle(router, dispatcher, json::parse(raw));
    } catch (const json::parse_error& e) {
        return invalidJson(e.what());
    } catch (const std::exception& e) {
        spdlog::error("sift: request failed: {}", e.what());
        return sift::app::makeErrorResponse(
            sift::Error{sift::ErrorCode::InternalError, std::string("Request failed: ") + e.what()});
    }
}

int exitCode(const json& response) {
    return response.value("success", false) ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"sift - concurrent file and content search", "sift"};
    app.require_subcommand(1);

    int verbosity = 0;
    std::string configOverride;
    std::size_t workersOverride = 0;
    bool pretty = false;
    app.add_flag("-v,--verbose", verbosity, "Increase log verbosity (repeatable)");
    app.add_option("--config", configOverride, "Path to config.toml");
    auto* workersOpt =
        app.add_option("--workers", workersOverride, "Number of concurrent file workers")
            ->check(CLI::Range(std::size_t{1}, sift::search::SearchEngineConfig::kMaxWorkers));
    app.add_flag("--pretty", pretty, "Pretty-print JSON output");

    std::string path = ".";

    auto* filesCmd = app.add_subcommand("files", "Find files whose name matches a regex");
    std::string namePattern;
    bool noRecursive = false;
    filesCmd->add_option("pattern", namePattern, "Regex searched in file names")->required();
    filesCmd->add_option("-p,--path", path, "Root directory");
    filesCmd->add_flag("--no-recursive", noRecursive, "Only list direct children of the root");

    auto* contentCmd = app.add_subcommand("content", "Search file contents line by line");
    std::string text;
    std::string contentGlob = "*";
    int contextLines = 0;
    contentCmd->add_option("text", text, "Regex searched in each line")->required();
    contentCmd->add_option("-p,--path", path, "Root directory");
    contentCmd->add_option("-g,--glob", contentGlob, "File name glob");
    auto* contextOpt =
        contentCmd->add_option("-C,--context", contextLines, "Context lines before and after")
            ->check(CLI::Range(0, sift::search::SearchEngineConfig::kMaxContextLines));

    auto* patternCmd = app.add_subcommand("pattern", "Whole-file regex search with groups");
    std::string regex;
    std::string patternGlob = "*";
    patternCmd->add_option("regex", regex, "Regex searched in each file")->required();
    patternCmd->add_option("-p,--path", path, "Root directory");
    patternCmd->add_option("-g,--glob", patternGlob, "File name glob");

    auto* extCmd = app.add_subcommand("ext", "Find files by extension");
    std::string extension;
    extCmd->add_option("extension", extension, "Extension, with or without the dot")->required();
    extCmd->add_option("-p,--path", path, "Root directory");

    auto* requestCmd = app.add_subcommand("request", "Run one JSON request");
    std::string requestFile;
    requestCmd->add_option("-f,--file", requestFile, "Read the request from a file")
        ->check(CLI::ExistingFile);

    app.add_subcommand("serve", "Answer newline-delimited JSON requests from stdin");

    CLI11_PARSE(app, argc, argv);

    try {
        configureLogging(verbosity);
#ifndef _WIN32
        std::signal(SIGPIPE, SIG_IGN);
#endif

        auto configPath = sift::config::get_config_path(configOverride);
        auto engineConfig = sift::search::loadSearchEngineConfig(configPath);
        if (workersOpt->count() > 0)
            engineConfig.workers = workersOverride;
        spdlog::info("sift: workers={} glob_anchor={}", engineConfig.workers,
                     sift::search::globAnchorName(engineConfig.globAnchor));

        sift::app::RequestDispatcher dispatcher(engineConfig);
        sift::app::ModuleRouter router;
        router.registerModule("search",
                              [&dispatcher](const json& req) { return dispatcher.dispatch(req); });

        auto runTyped = [&](const sift::search::SearchRequest& req) {
            auto result = dispatcher.engine().run(req);
            json response = result ? sift::app::makeSuccessResponse(sift::app::toJson(result.value()))
                                   : sift::app::makeErrorResponse(result.error());
            emit(response, pretty);
            return exitCode(response);
        };

        if (filesCmd->parsed()) {
            return runTyped(sift::search::SearchFilesRequest{path, namePattern, !noRecursive});
        }
        if (contentCmd->parsed()) {
            std::optional<int> window;
            if (contextOpt->count() > 0)
                window = contextLines;
            return runTyped(sift::search::SearchContentRequest{path, text, contentGlob, window});
        }
        if (patternCmd->parsed()) {
            return runTyped(sift::search::FindPatternRequest{path, regex, patternGlob});
        }
        if (extCmd->parsed()) {
            return runTyped(sift::search::SearchByExtensionRequest{path, extension});
        }

        if (requestCmd->parsed()) {
            std::string raw;
            if (!requestFile.empty()) {
                std::ifstream in(requestFile);
                raw.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
            } else {
                raw.assign(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
            }
            json response = answer(router, dispatcher, raw);
            emit(response, pretty);
            return exitCode(response);
        }

        // serve
        spdlog::info("sift: serving JSON requests on stdin");
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos)
                continue;
            emit(answer(router, dispatcher, line), false);
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("sift: {}", e.what());
        return 1;
    }
}

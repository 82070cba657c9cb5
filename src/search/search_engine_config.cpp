#include <sift/config/config_helpers.h>
#include <sift/search/search_engine_config.h>

#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>

namespace sift::search {

namespace {

constexpr long long kNoUpperBound = std::numeric_limits<long long>::max();

std::optional<long long> parseInteger(std::string value, long long minValue, long long maxValue) {
    config::trim(value);
    long long out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc{} || ptr != value.data() + value.size() || out < minValue ||
        out > maxValue)
        return std::nullopt;
    return out;
}

// Apply one raw setting; `origin` only feeds the warning text.
void applySetting(SearchEngineConfig& cfg, const std::string& key, const std::string& raw,
                  const std::string& origin) {
    if (raw.empty())
        return;
    if (key == "workers") {
        if (auto v = parseInteger(raw, 1, static_cast<long long>(SearchEngineConfig::kMaxWorkers))) {
            cfg.workers = static_cast<std::size_t>(*v);
            return;
        }
    } else if (key == "context_lines") {
        if (auto v = parseInteger(raw, 0, SearchEngineConfig::kMaxContextLines)) {
            cfg.contextLines = static_cast<int>(*v);
            return;
        }
    } else if (key == "glob_anchor") {
        if (auto v = parseGlobAnchor(raw)) {
            cfg.globAnchor = *v;
            return;
        }
    } else if (key == "max_file_bytes") {
        if (auto v = parseInteger(raw, 0, kNoUpperBound)) {
            cfg.maxFileBytes = static_cast<std::uintmax_t>(*v);
            return;
        }
    } else if (key == "max_line_bytes") {
        if (auto v = parseInteger(raw, 0, kNoUpperBound)) {
            cfg.maxLineBytes = static_cast<std::size_t>(*v);
            return;
        }
    }
    spdlog::warn("[Config] ignoring invalid {} value '{}' from {}", key, raw, origin);
}

struct SettingKey {
    const char* key;
    const char* env;
};

constexpr SettingKey kSettings[] = {
    {"workers", "SIFT_SEARCH_WORKERS"},
    {"context_lines", "SIFT_CONTEXT_LINES"},
    {"glob_anchor", "SIFT_GLOB_ANCHOR"},
    {"max_file_bytes", "SIFT_MAX_FILE_BYTES"},
    {"max_line_bytes", "SIFT_MAX_LINE_BYTES"},
};

} // namespace

SearchEngineConfig loadSearchEngineConfig(const std::filesystem::path& configPath) {
    SearchEngineConfig cfg;

    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        for (const auto& s : kSettings) {
            applySetting(cfg, s.key, config::parse_config_value(configPath, "search", s.key),
                         configPath.string());
        }
    }

    for (const auto& s : kSettings) {
        if (const char* env = std::getenv(s.env); env && *env) {
            applySetting(cfg, s.key, env, s.env);
        }
    }

    spdlog::debug("[Config] search: workers={} context_lines={} glob_anchor={} max_file_bytes={} "
                  "max_line_bytes={}",
                  cfg.workers, cfg.contextLines, globAnchorName(cfg.globAnchor),
                  cfg.maxFileBytes, cfg.maxLineBytes);
    return cfg;
}

} // namespace sift::search

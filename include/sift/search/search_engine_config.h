#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

#include <sift/search/pattern_compiler.h>

namespace sift::search {

struct SearchEngineConfig {
    static constexpr std::size_t kMaxWorkers = 256;
    static constexpr int kMaxContextLines = 10000;

    std::size_t workers{4};
    int contextLines{2};
    GlobAnchor globAnchor{GlobAnchor::Prefix};
    std::uintmax_t maxFileBytes{0};     // 0 => no limit
    std::size_t maxLineBytes{64 * 1024}; // files with a longer line are skipped; 0 => no limit
};

/**
 * Resolve engine settings: built-in defaults, then the [search] section of the config file,
 * then SIFT_SEARCH_WORKERS / SIFT_CONTEXT_LINES / SIFT_GLOB_ANCHOR / SIFT_MAX_FILE_BYTES /
 * SIFT_MAX_LINE_BYTES. Invalid or out-of-range values are logged and ignored. An empty path skips the file layer.
 */
SearchEngineConfig loadSearchEngineConfig(const std::filesystem::path& configPath);

} // namespace sift::search

#pragma once

#include <sift/core/types.h>
#include <sift/search/match_record.h>
#include <sift/search/search_engine_config.h>
#include <sift/search/search_request.h>

namespace sift::search {

/**
 * Synchronous search over a directory tree.
 *
 * Every operation validates its request and compiles its patterns before touching the
 * filesystem, so MissingParameter and InvalidPattern never depend on the tree. A missing or
 * unreadable root is reported as PathNotFound / PermissionDenied. Files that cannot be read
 * or decoded are listed in SearchResult::skipped and never fail the call.
 *
 * searchContent() and findPattern() scan files on a WorkerPool created for the call and
 * joined before returning; record order across files follows worker completion. The name
 * based modes run on the calling thread.
 */
class SearchEngine {
public:
    explicit SearchEngine(SearchEngineConfig config = {});

    Result<SearchResult> searchFiles(const SearchFilesRequest& req) const;
    Result<SearchResult> searchContent(const SearchContentRequest& req) const;
    Result<SearchResult> findPattern(const FindPatternRequest& req) const;
    Result<SearchResult> searchByExtension(const SearchByExtensionRequest& req) const;

    // Route a request variant to the matching operation
    Result<SearchResult> run(const SearchRequest& req) const;

    const SearchEngineConfig& config() const noexcept { return config_; }

private:
    SearchEngineConfig config_;
};

} // namespace sift::search

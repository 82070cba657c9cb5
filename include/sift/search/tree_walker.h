#pragma once

#include <filesystem>
#include <optional>

#include <sift/core/types.h>
#include <sift/search/pattern_compiler.h>

namespace sift::search {

/**
 * Lazy enumeration of candidate files under a root.
 *
 * open() checks the root up front, so a missing root is PathNotFound and an unreadable
 * one is PermissionDenied instead of an empty walk. Entries are produced one at a time by
 * next(); directories are never yielded and the optional name filter is applied to the
 * file name only. Unreadable subdirectories are skipped. Nothing is cached: opening the
 * same root again walks it from scratch.
 */
class TreeWalker {
public:
    static Result<TreeWalker> open(std::filesystem::path root, bool recursive,
                                   NamePredicate filter = {});

    TreeWalker(TreeWalker&&) noexcept = default;
    TreeWalker& operator=(TreeWalker&&) noexcept = default;
    TreeWalker(const TreeWalker&) = delete;
    TreeWalker& operator=(const TreeWalker&) = delete;

    // Next candidate path, or nullopt once the walk is exhausted.
    std::optional<std::filesystem::path> next();

    const std::filesystem::path& root() const noexcept { return root_; }
    bool recursive() const noexcept { return recursive_; }

private:
    TreeWalker(std::filesystem::path root, bool recursive, NamePredicate filter);

    bool accept(const std::filesystem::directory_entry& entry) const;

    std::filesystem::path root_;
    bool recursive_{true};
    NamePredicate filter_;

    // Root that is itself a regular file yields exactly that file.
    bool singleFile_{false};
    bool singleDone_{false};

    std::filesystem::directory_iterator flat_;
    std::filesystem::recursive_directory_iterator deep_;
};

} // namespace sift::search

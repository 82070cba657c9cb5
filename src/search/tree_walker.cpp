#include <sift/search/tree_walker.h>

#include <spdlog/spdlog.h>
#include <system_error>

namespace sift::search {

namespace fs = std::filesystem;

namespace {

Error rootError(const fs::path& root, const std::error_code& ec) {
    if (ec == std::errc::permission_denied) {
        return Error{ErrorCode::PermissionDenied, "Permission denied: " + root.string()};
    }
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return Error{ErrorCode::PathNotFound, "Path not found: " + root.string()};
    }
    return Error{ErrorCode::PathNotFound,
                 "Cannot access path: " + root.string() + " (" + ec.message() + ")"};
}

} // namespace

TreeWalker::TreeWalker(fs::path root, bool recursive, NamePredicate filter)
    : root_(std::move(root)), recursive_(recursive), filter_(std::move(filter)) {}

Result<TreeWalker> TreeWalker::open(fs::path root, bool recursive, NamePredicate filter) {
    std::error_code ec;
    auto st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        if (!ec)
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return rootError(root, ec);
    }

    TreeWalker walker(std::move(root), recursive, std::move(filter));
    if (fs::is_regular_file(st)) {
        walker.singleFile_ = true;
        return walker;
    }
    if (!fs::is_directory(st)) {
        return Error{ErrorCode::PathNotFound,
                     "Path is not a file or directory: " + walker.root_.string()};
    }

    // skip_permission_denied would turn an unreadable root into an empty walk, so the root
    // is always opened once without it.
    walker.flat_ = fs::directory_iterator(walker.root_, ec);
    if (ec) {
        return rootError(walker.root_, ec);
    }
    if (recursive) {
        walker.flat_ = fs::directory_iterator{};
        walker.deep_ = fs::recursive_directory_iterator(
            walker.root_, fs::directory_options::skip_permission_denied, ec);
    }
    if (ec) {
        return rootError(walker.root_, ec);
    }
    spdlog::debug("[TreeWalker] opened '{}' recursive={}", walker.root_.string(), recursive);
    return walker;
}

bool TreeWalker::accept(const fs::directory_entry& entry) const {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec)
        return false;
    if (!filter_)
        return true;
    const std::string name = entry.path().filename().string();
    return filter_(name);
}

std::optional<fs::path> TreeWalker::next() {
    if (singleFile_) {
        if (singleDone_)
            return std::nullopt;
        singleDone_ = true;
        if (!filter_ || filter_(root_.filename().string()))
            return root_;
        return std::nullopt;
    }

    std::error_code ec;
    if (recursive_) {
        while (deep_ != fs::recursive_directory_iterator{}) {
            fs::directory_entry entry = *deep_;
            deep_.increment(ec);
            if (ec) {
                spdlog::debug("[TreeWalker] stopping walk under '{}': {}", root_.string(),
                              ec.message());
                deep_ = fs::recursive_directory_iterator{};
                ec.clear();
            }
            if (accept(entry))
                return entry.path();
        }
        return std::nullopt;
    }

    while (flat_ != fs::directory_iterator{}) {
        fs::directory_entry entry = *flat_;
        flat_.increment(ec);
        if (ec) {
            spdlog::debug("[TreeWalker] stopping listing of '{}': {}", root_.string(),
                          ec.message());
            flat_ = fs::directory_iterator{};
            ec.clear();
        }
        if (accept(entry))
            return entry.path();
    }
    return std::nullopt;
}

} // namespace sift::search

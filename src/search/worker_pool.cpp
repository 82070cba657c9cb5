#include <sift/search/worker_pool.h>

#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <boost/regex/pattern_except.hpp>
#include <algorithm>
#include <chrono>
#include <system_error>

namespace sift::search {

namespace fs = std::filesystem;

WorkerPool::WorkerPool(std::size_t concurrency)
    : concurrency_(std::max<std::size_t>(1, concurrency)), pool_(concurrency_) {
    spdlog::debug("[WorkerPool] started with {} workers", concurrency_);
}

WorkerPool::~WorkerPool() {
    pool_.join();
}

BatchResult WorkerPool::runAll(const CandidateSource& candidates, const FileTask& task) {
    auto started = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        batch_ = BatchResult{};
        fatal_ = nullptr;
    }

    while (true) {
        {
            std::unique_lock<std::mutex> lk(mutex_);
            slotFreed_.wait(lk, [this] { return inFlight_ < concurrency_ || fatal_; });
            if (fatal_)
                break;
        }

        // The walk itself runs outside the lock; workers keep appending meanwhile.
        auto next = candidates();
        if (!next)
            break;

        {
            std::lock_guard<std::mutex> lk(mutex_);
            ++inFlight_;
            ++batch_.submitted;
        }
        boost::asio::post(pool_, [this, file = std::move(*next), &task]() { runOne(file, task); });
    }

    std::unique_lock<std::mutex> lk(mutex_);
    slotFreed_.wait(lk, [this] { return inFlight_ == 0; });

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - started)
                       .count();
    spdlog::debug("[WorkerPool] batch done: files={} records={} skipped={} in {}ms",
                  batch_.submitted, batch_.records.size(), batch_.skipped.size(), elapsed);

    if (fatal_) {
        auto ex = fatal_;
        fatal_ = nullptr;
        std::rethrow_exception(ex);
    }
    return std::move(batch_);
}

void WorkerPool::runOne(const fs::path& file, const FileTask& task) {
    try {
        finish(file, task(file));
        return;
    } catch (const fs::filesystem_error& e) {
        finish(file, Error{ErrorCode::IoError, e.what()});
    } catch (const std::system_error& e) {
        // Also covers std::ios_base::failure
        finish(file, Error{ErrorCode::IoError, e.what()});
    } catch (const boost::regex_error& e) {
        // Raised when matching exceeds Boost.Regex complexity or memory bounds
        finish(file, Error{ErrorCode::InternalError, std::string("regex: ") + e.what()});
    } catch (...) {
        spdlog::error("[WorkerPool] fatal error while scanning '{}'", file.string());
        std::lock_guard<std::mutex> lk(mutex_);
        if (!fatal_)
            fatal_ = std::current_exception();
        --inFlight_;
        slotFreed_.notify_all();
    }
}

void WorkerPool::finish(const fs::path& file, FileOutcome outcome) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (outcome) {
        auto records = std::move(outcome).value();
        batch_.records.insert(batch_.records.end(), std::make_move_iterator(records.begin()),
                              std::make_move_iterator(records.end()));
    } else {
        spdlog::debug("[WorkerPool] skipped '{}': {}", file.string(), outcome.error().message);
        batch_.skipped.push_back(SkippedFile{file.string(), outcome.error().message});
    }
    --inFlight_;
    slotFreed_.notify_all();
}

} // namespace sift::search

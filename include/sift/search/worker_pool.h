#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>
#include <boost/asio/thread_pool.hpp>

#include <sift/core/types.h>
#include <sift/search/match_record.h>

namespace sift::search {

// Outcome of one per-file task: the file's records in file order, or why it was skipped.
using FileOutcome = Result<std::vector<MatchRecord>>;
using FileTask = std::function<FileOutcome(const std::filesystem::path&)>;

// Pulls the next candidate; nullopt ends the batch.
using CandidateSource = std::function<std::optional<std::filesystem::path>()>;

struct BatchResult {
    std::vector<MatchRecord> records; // completion order
    std::vector<SkippedFile> skipped;
    std::size_t submitted{0};
};

/**
 * Fixed-size pool that runs one task per candidate file.
 *
 * At most concurrency() tasks are in flight; the producer waits for a free slot before
 * pulling the next candidate, so the walk never runs ahead of the workers. A task that
 * returns an error, or throws an I/O, filesystem or boost::regex_error exception, is
 * recorded as skipped and does not affect its siblings. Any other exception is held until
 * every in-flight task has finished and is then rethrown from runAll().
 *
 * Instances are meant to live for a single request. The destructor joins all threads.
 */
class WorkerPool {
public:
    static constexpr std::size_t kDefaultConcurrency = 4;

    explicit WorkerPool(std::size_t concurrency = kDefaultConcurrency);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Blocks until every submitted task has completed or been absorbed.
    BatchResult runAll(const CandidateSource& candidates, const FileTask& task);

    std::size_t concurrency() const noexcept { return concurrency_; }

private:
    void runOne(const std::filesystem::path& file, const FileTask& task);
    void finish(const std::filesystem::path& file, FileOutcome outcome);

    std::size_t concurrency_;
    boost::asio::thread_pool pool_;

    std::mutex mutex_;
    std::condition_variable slotFreed_;
    std::size_t inFlight_{0};
    BatchResult batch_;
    std::exception_ptr fatal_;
};

} // namespace sift::search

// Tests for the bounded per-file worker pool.

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <ios>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sift/search/worker_pool.h>

namespace fs = std::filesystem;
using namespace sift;
using namespace sift::search;

namespace {

CandidateSource fromList(std::vector<fs::path> files) {
    auto index = std::make_shared<std::size_t>(0);
    auto list = std::make_shared<std::vector<fs::path>>(std::move(files));
    return [index, list]() -> std::optional<fs::path> {
        if (*index >= list->size())
            return std::nullopt;
        return (*list)[(*index)++];
    };
}

std::vector<fs::path> numbered(std::size_t n) {
    std::vector<fs::path> files;
    for (std::size_t i = 0; i < n; ++i)
        files.emplace_back("file" + std::to_string(i) + ".txt");
    return files;
}

} // namespace

TEST_CASE("WorkerPool runs every candidate exactly once", "[search][pool][catch2]") {
    WorkerPool pool(3);
    auto batch = pool.runAll(fromList(numbered(25)), [](const fs::path& p) -> FileOutcome {
        return std::vector<MatchRecord>{PathMatch{p.string()}};
    });

    CHECK(batch.submitted == 25);
    CHECK(batch.skipped.empty());
    REQUIRE(batch.records.size() == 25);
    std::set<std::string> seen;
    for (const auto& r : batch.records)
        seen.insert(recordFile(r));
    CHECK(seen.size() == 25);
}

TEST_CASE("WorkerPool never exceeds its concurrency", "[search][pool][catch2]") {
    constexpr std::size_t kLimit = 2;
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    WorkerPool pool(kLimit);
    auto batch = pool.runAll(fromList(numbered(12)), [&](const fs::path&) -> FileOutcome {
        int now = ++active;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --active;
        return std::vector<MatchRecord>{};
    });

    CHECK(batch.submitted == 12);
    CHECK(peak.load() >= 1);
    CHECK(peak.load() <= static_cast<int>(kLimit));
}

TEST_CASE("WorkerPool clamps zero concurrency to one", "[search][pool][catch2]") {
    WorkerPool pool(0);
    CHECK(pool.concurrency() == 1);
    auto batch = pool.runAll(fromList(numbered(3)), [](const fs::path& p) -> FileOutcome {
        return std::vector<MatchRecord>{PathMatch{p.string()}};
    });
    CHECK(batch.records.size() == 3);
}

TEST_CASE("WorkerPool keeps each file's records contiguous and ordered",
          "[search][pool][catch2]") {
    WorkerPool pool(4);
    auto batch = pool.runAll(fromList(numbered(8)), [](const fs::path& p) -> FileOutcome {
        std::vector<MatchRecord> out;
        for (std::size_t line = 1; line <= 3; ++line)
            out.emplace_back(LineMatch{p.string(), line, "x", "x"});
        return out;
    });

    REQUIRE(batch.records.size() == 24);
    for (std::size_t i = 0; i < batch.records.size(); i += 3) {
        const auto& first = std::get<LineMatch>(batch.records[i]);
        for (std::size_t k = 0; k < 3; ++k) {
            const auto& rec = std::get<LineMatch>(batch.records[i + k]);
            CHECK(rec.file == first.file);
            CHECK(rec.lineNumber == k + 1);
        }
    }
}

TEST_CASE("WorkerPool records failing files as skipped", "[search][pool][errors][catch2]") {
    WorkerPool pool(2);
    auto batch = pool.runAll(fromList({"ok.txt", "bad.txt", "io.txt", "ok2.txt"}),
                             [](const fs::path& p) -> FileOutcome {
                                 if (p == "bad.txt")
                                     return Error{ErrorCode::DecodeError, "invalid UTF-8"};
                                 if (p == "io.txt")
                                     throw std::ios_base::failure("read failed");
                                 return std::vector<MatchRecord>{PathMatch{p.string()}};
                             });

    CHECK(batch.submitted == 4);
    CHECK(batch.records.size() == 2);
    REQUIRE(batch.skipped.size() == 2);
    std::set<std::string> skipped;
    for (const auto& s : batch.skipped) {
        skipped.insert(s.file);
        CHECK_FALSE(s.reason.empty());
    }
    CHECK(skipped == std::set<std::string>{"bad.txt", "io.txt"});
}

TEST_CASE("WorkerPool rethrows unexpected exceptions after draining",
          "[search][pool][errors][catch2]") {
    WorkerPool pool(2);
    auto run = [&] {
        return pool.runAll(fromList(numbered(6)), [](const fs::path& p) -> FileOutcome {
            if (p == "file1.txt")
                throw std::logic_error("broken invariant");
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            return std::vector<MatchRecord>{};
        });
    };
    CHECK_THROWS_AS(run(), std::logic_error);

    // The pool is reusable once the failed batch has drained
    auto batch = pool.runAll(fromList(numbered(2)), [](const fs::path& p) -> FileOutcome {
        return std::vector<MatchRecord>{PathMatch{p.string()}};
    });
    CHECK(batch.records.size() == 2);
}

TEST_CASE("WorkerPool handles an empty candidate source", "[search][pool][catch2]") {
    WorkerPool pool;
    auto batch = pool.runAll(fromList({}), [](const fs::path&) -> FileOutcome {
        return std::vector<MatchRecord>{};
    });
    CHECK(batch.submitted == 0);
    CHECK(batch.records.empty());
    CHECK(batch.skipped.empty());
}

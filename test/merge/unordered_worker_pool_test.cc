#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <map>
#include <mutex>
#include "../../src/merge/unordered_worker_pool.h"
#include "../../src/merge/record_filter.h"
#include "../../src/io/line_reader.h"
#include "../../src/io/record_sink.h"
#include "../common/test_util.h"

using namespace Braid;
using ::testing::IsSubsetOf;
using ::testing::UnorderedElementsAreArray;

namespace {

// Sink that runs a hook after every written record
class HookedSink : public StringRecordSink {
public:
    explicit HookedSink(std::function<void(size_t)> hook) : hook_(std::move(hook)) {}

    void WriteRecord(const std::string& record) override {
        StringRecordSink::WriteRecord(record);
        hook_(++written_);
    }

private:
    std::function<void(size_t)> hook_;
    size_t written_ = 0;
};

} // namespace

class UnorderedWorkerPoolTest : public ::testing::Test {
protected:
    // `count` sources of `lines` records each, "<source> <n>"
    void MakeSources(int count, int lines) {
        for (int s = 0; s < count; ++s) {
            std::string label = "src" + std::to_string(s);
            std::string content;
            for (int i = 0; i < lines; ++i) {
                std::string record = label + " " + std::to_string(i);
                content += record + "\n";
                expected_.push_back(record);
            }
            sources_.push_back(StringSource(label, content));
        }
    }

    ErrorCallback Collector() {
        return [this](const MergeError& error) {
            std::lock_guard<std::mutex> lock(mu_);
            errors_.push_back({error.source(), error.kind()});
        };
    }

    std::vector<MergeSource> sources_;
    std::vector<std::string> expected_;
    std::mutex mu_;
    std::vector<std::pair<std::string, MergeError::Kind>> errors_;
};

TEST_F(UnorderedWorkerPoolTest, WritesEveryRecord) {
    MakeSources(10, 200);
    StringRecordSink sink;
    UnorderedWorkerPool pool(nullptr, 4, 16);
    auto result = pool.Run(sources_, sink, nullptr, Collector());

    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.records_written, expected_.size());
    EXPECT_THAT(test::SplitLines(sink.contents()), UnorderedElementsAreArray(expected_));
    EXPECT_TRUE(errors_.empty());
}

TEST_F(UnorderedWorkerPoolTest, KeepsOrderWithinSource) {
    MakeSources(6, 300);
    StringRecordSink sink;
    UnorderedWorkerPool pool(nullptr, 3, 8);
    pool.Run(sources_, sink, nullptr, Collector());

    std::map<std::string, int> last;
    for (const std::string& line : test::SplitLines(sink.contents())) {
        size_t space = line.find(' ');
        ASSERT_NE(space, std::string::npos);
        std::string label = line.substr(0, space);
        int n = std::stoi(line.substr(space + 1));
        auto it = last.find(label);
        if (it != last.end()) {
            EXPECT_EQ(n, it->second + 1) << line;
        } else {
            EXPECT_EQ(n, 0) << line;
        }
        last[label] = n;
    }
    EXPECT_EQ(last.size(), 6u);
}

TEST_F(UnorderedWorkerPoolTest, MoreWorkersThanSources) {
    MakeSources(2, 10);
    StringRecordSink sink;
    UnorderedWorkerPool pool(nullptr, 8);
    auto result = pool.Run(sources_, sink, nullptr, Collector());
    EXPECT_EQ(result.records_written, 20u);
}

TEST_F(UnorderedWorkerPoolTest, ZeroSources) {
    StringRecordSink sink;
    UnorderedWorkerPool pool(nullptr, 2);
    auto result = pool.Run({}, sink, nullptr, Collector());
    EXPECT_EQ(result.records_written, 0u);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(sink.contents(), "");
}

TEST_F(UnorderedWorkerPoolTest, FilterSkipsAndRewrites) {
    MakeSources(3, 10);
    FilterChain chain;
    chain.Then(std::make_unique<PatternFilter>(" [0-4]$"))
         .Then(std::make_unique<SourceTagFilter>());
    StringRecordSink sink;
    UnorderedWorkerPool pool(&chain, 2);
    auto result = pool.Run(sources_, sink, nullptr, Collector());

    EXPECT_EQ(result.records_written, 15u);
    for (const std::string& line : test::SplitLines(sink.contents())) {
        EXPECT_EQ(line.front(), '[') << line;
    }
}

TEST_F(UnorderedWorkerPoolTest, FilterStopOnlyEndsItsSource) {
    MakeSources(4, 50);
    FunctionRecordFilter filter([](const std::string& source, std::string& record, std::string& error) {
        if (source == "src2" && record == "src2 10") {
            error = "refused";
            return Action::kStop;
        }
        return Action::kAccept;
    });
    StringRecordSink sink;
    UnorderedWorkerPool pool(&filter, 3, 4);
    auto result = pool.Run(sources_, sink, nullptr, Collector());

    EXPECT_FALSE(result.cancelled);
    // src2 contributes records 0..9 only
    EXPECT_EQ(result.records_written, 3u * 50 + 10);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].first, "src2");
    EXPECT_EQ(errors_[0].second, MergeError::Kind::kHandlerAbort);

    std::vector<std::string> lines = test::SplitLines(sink.contents());
    EXPECT_THAT(lines, IsSubsetOf(expected_));
    EXPECT_EQ(std::count(lines.begin(), lines.end(), "src2 10"), 0);
}

TEST_F(UnorderedWorkerPoolTest, UnreadableSourceIsReported) {
    test::TempDir dir;
    MakeSources(2, 5);
    sources_.push_back(FileSource(dir.File("absent.log"), false));
    StringRecordSink sink;
    UnorderedWorkerPool pool(nullptr, 2);
    auto result = pool.Run(sources_, sink, nullptr, Collector());

    EXPECT_EQ(result.records_written, 10u);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].first, "absent.log");
    EXPECT_EQ(errors_[0].second, MergeError::Kind::kSourceAccess);
}

TEST_F(UnorderedWorkerPoolTest, RequiresErrorCallback) {
    MakeSources(1, 1);
    StringRecordSink sink;
    UnorderedWorkerPool pool(nullptr, 1);
    EXPECT_THROW(pool.Run(sources_, sink, nullptr, ErrorCallback()), ConfigurationError);
}

TEST_F(UnorderedWorkerPoolTest, RejectsBadSizing) {
    EXPECT_THROW(UnorderedWorkerPool(nullptr, 0), ConfigurationError);
    EXPECT_THROW(UnorderedWorkerPool(nullptr, 2, 0), ConfigurationError);
}

TEST_F(UnorderedWorkerPoolTest, CancelledBeforeStart) {
    MakeSources(3, 100);
    CancellationToken cancel;
    cancel.Cancel();
    StringRecordSink sink;
    UnorderedWorkerPool pool(nullptr, 2, 4, std::chrono::milliseconds(1));
    auto result = pool.Run(sources_, sink, &cancel, Collector());
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.records_written, 0u);
    EXPECT_EQ(sink.contents(), "");
}

TEST_F(UnorderedWorkerPoolTest, CancelledMidRunWritesSubset) {
    MakeSources(4, 1000);
    CancellationToken cancel;
    HookedSink sink([&cancel](size_t written) {
        if (written == 5) cancel.Cancel();
    });
    UnorderedWorkerPool pool(nullptr, 2, 2, std::chrono::milliseconds(1));
    auto result = pool.Run(sources_, sink, &cancel, Collector());

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.records_written, 5u);
    EXPECT_THAT(test::SplitLines(sink.contents()), IsSubsetOf(expected_));
    EXPECT_TRUE(errors_.empty());
}

TEST_F(UnorderedWorkerPoolTest, BackpressureWithSingleSlot) {
    MakeSources(5, 200);
    StringRecordSink sink;
    UnorderedWorkerPool pool(nullptr, 4, 1, std::chrono::milliseconds(1));
    auto result = pool.Run(sources_, sink, nullptr, Collector());
    EXPECT_EQ(result.records_written, expected_.size());
    EXPECT_THAT(test::SplitLines(sink.contents()), UnorderedElementsAreArray(expected_));
}

TEST_F(UnorderedWorkerPoolTest, DestinationFailureStopsWorkers) {
    MakeSources(4, 1000);
    HookedSink sink([](size_t written) {
        if (written == 3) throw DestinationError("out", "disk full");
    });
    UnorderedWorkerPool pool(nullptr, 4, 1, std::chrono::milliseconds(1));
    // Workers blocked on the full queue are released and joined before the error surfaces
    EXPECT_THROW(pool.Run(sources_, sink, nullptr, Collector()), DestinationError);
}

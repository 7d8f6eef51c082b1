#include <gtest/gtest.h>
#include <regex>
#include "../../src/merge/record_filter.h"

using namespace Braid;

TEST(SourceTagFilterTest, PrefixesLabel) {
    SourceTagFilter filter;
    std::string record = "2020/01/18 12:20:30 [error] x";
    std::string error;
    EXPECT_EQ(filter.Filter("nginx.log", record, error), Action::kAccept);
    EXPECT_EQ(record, "[nginx.log] 2020/01/18 12:20:30 [error] x");
}

TEST(PatternFilterTest, KeepsMatches) {
    PatternFilter filter("recv\\(\\) failed");
    std::string error;

    std::string hit = "2020/01/18 12:20:30 [error] recv() failed (104)";
    EXPECT_EQ(filter.Filter("s", hit, error), Action::kAccept);
    EXPECT_EQ(hit, "2020/01/18 12:20:30 [error] recv() failed (104)");

    std::string miss = "2020/01/18 12:24:38 [error] [lua] heartbeat.lua:107";
    EXPECT_EQ(filter.Filter("s", miss, error), Action::kSkip);
}

TEST(PatternFilterTest, MalformedPatternThrows) {
    EXPECT_THROW(PatternFilter("(unbalanced"), std::regex_error);
}

class FilterChainTest : public ::testing::Test {
protected:
    std::unique_ptr<RecordFilter> Counting(int& counter, Action action) {
        return std::make_unique<FunctionRecordFilter>(
            [&counter, action](const std::string&, std::string& record, std::string& error) {
                counter++;
                record += "+";
                if (action == Action::kStop) error = "halt";
                return action;
            });
    }
};

TEST_F(FilterChainTest, EmptyChainAccepts) {
    FilterChain chain;
    EXPECT_TRUE(chain.empty());
    std::string record = "r";
    std::string error;
    EXPECT_EQ(chain.Filter("s", record, error), Action::kAccept);
    EXPECT_EQ(record, "r");
}

TEST_F(FilterChainTest, AppliesFiltersInOrder) {
    FilterChain chain;
    chain.Then(std::make_unique<PatternFilter>("^keep"))
         .Then(std::make_unique<SourceTagFilter>());
    EXPECT_FALSE(chain.empty());

    std::string error;
    std::string kept = "keep me";
    EXPECT_EQ(chain.Filter("a.log", kept, error), Action::kAccept);
    EXPECT_EQ(kept, "[a.log] keep me");

    std::string dropped = "drop me";
    EXPECT_EQ(chain.Filter("a.log", dropped, error), Action::kSkip);
    EXPECT_EQ(dropped, "drop me");
}

TEST_F(FilterChainTest, FirstNonAcceptWins) {
    int first = 0, second = 0, third = 0;
    FilterChain chain;
    chain.Then(Counting(first, Action::kAccept))
         .Then(Counting(second, Action::kStop))
         .Then(Counting(third, Action::kAccept));

    std::string record = "r";
    std::string error;
    EXPECT_EQ(chain.Filter("s", record, error), Action::kStop);
    EXPECT_EQ(error, "halt");
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
    EXPECT_EQ(third, 0);
}

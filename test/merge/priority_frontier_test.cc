#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <stdexcept>
#include "../../src/merge/priority_frontier.h"
#include "../../src/merge/time_handler.h"
#include "../../src/io/line_reader.h"
#include "../common/test_util.h"

using namespace Braid;
using ::testing::ElementsAre;

class PriorityFrontierTest : public ::testing::Test {
protected:
    // Primed cursor over `content`
    std::unique_ptr<RecordCursor> Cursor(size_t index, const std::string& content) {
        auto cursor = std::make_unique<RecordCursor>(
            "s" + std::to_string(index), index,
            std::make_unique<StringLineReader>(content, "s" + std::to_string(index)),
            &time_handler_, nullptr);
        cursor->Advance();
        return cursor;
    }

    std::vector<std::string> Drain() {
        std::vector<std::string> out;
        while (!frontier_.empty()) {
            out.push_back(frontier_.ExtractMin()->record());
        }
        return out;
    }

    FunctionTimeHandler time_handler_{test::LeadingNumberTime};
    PriorityFrontier frontier_;
};

TEST_F(PriorityFrontierTest, ExtractsInKeyOrder) {
    frontier_.Insert(Cursor(0, "50 e\n"));
    frontier_.Insert(Cursor(1, "10 a\n"));
    frontier_.Insert(Cursor(2, "40 d\n"));
    frontier_.Insert(Cursor(3, "20 b\n"));
    frontier_.Insert(Cursor(4, "30 c\n"));
    EXPECT_EQ(frontier_.size(), 5u);
    EXPECT_THAT(Drain(), ElementsAre("10 a", "20 b", "30 c", "40 d", "50 e"));
}

TEST_F(PriorityFrontierTest, EqualKeysComeOutInSourceOrder) {
    frontier_.Insert(Cursor(2, "7 from-2\n"));
    frontier_.Insert(Cursor(0, "7 from-0\n"));
    frontier_.Insert(Cursor(3, "6 from-3\n"));
    frontier_.Insert(Cursor(1, "7 from-1\n"));
    EXPECT_THAT(Drain(), ElementsAre("6 from-3", "7 from-0", "7 from-1", "7 from-2"));
}

TEST_F(PriorityFrontierTest, NegativeKeys) {
    frontier_.Insert(Cursor(0, "0 zero\n"));
    frontier_.Insert(Cursor(1, "-5 minus\n"));
    EXPECT_THAT(Drain(), ElementsAre("-5 minus", "0 zero"));
}

TEST_F(PriorityFrontierTest, RejectsExhaustedCursor) {
    EXPECT_THROW(frontier_.Insert(Cursor(0, "")), std::logic_error);
    EXPECT_THROW(frontier_.Insert(nullptr), std::logic_error);
    EXPECT_TRUE(frontier_.empty());
}

TEST_F(PriorityFrontierTest, ExtractFromEmptyThrows) {
    EXPECT_THROW(frontier_.ExtractMin(), std::logic_error);
}

TEST_F(PriorityFrontierTest, ReinsertAfterAdvance) {
    frontier_.Insert(Cursor(0, "1 a\n4 d\n"));
    frontier_.Insert(Cursor(1, "2 b\n3 c\n"));

    std::vector<std::string> out;
    while (!frontier_.empty()) {
        auto cursor = frontier_.ExtractMin();
        out.push_back(cursor->record());
        cursor->Advance();
        if (!cursor->exhausted()) frontier_.Insert(std::move(cursor));
    }
    EXPECT_THAT(out, ElementsAre("1 a", "2 b", "3 c", "4 d"));
}
